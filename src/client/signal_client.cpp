#include "client/signal_client.hpp"

#include "audit/logger.hpp"
#include "codec/abi_word.hpp"
#include "core/hex.hpp"
#include "core/time_utils.hpp"
#include "core/uint256.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>

namespace augur::client {

namespace {

constexpr size_t kDumpRowSize = 64;
constexpr unsigned kWeiDecimals = 18;

std::string describe(const core::SignalResult& signal) {
    return std::string("action=") + core::decision_to_string(signal.decision) +
           " confidence=" + signal.confidence.to_string() + "%" +
           " forecast=" + signal.forecast_value.to_string() + " wei (" +
           core::format_units(signal.forecast_value, kWeiDecimals, 2) + " ETH)";
}

} // namespace

SignalClient::SignalClient(std::shared_ptr<settlement::ProverMarket> market,
                           std::shared_ptr<settlement::SignalLedger> ledger,
                           SignalClientConfig config)
    : market_(std::move(market)), ledger_(std::move(ledger)), config_(std::move(config)) {
    if (!market_ || !ledger_) {
        throw std::invalid_argument("signal client needs a prover market and a ledger");
    }
    if (config_.poll_interval_ms == 0) config_.poll_interval_ms = 1;
}

AugurStatus SignalClient::run(uint64_t observed_amount, SignalOutcome* out) {
    if (!out) return AUGUR_ERR_INVALID;
    auto& log = audit::Logger::instance();
    *out = SignalOutcome{};

    log.log(audit::LogLevel::INFO,
        "[Client] Observed amount: " + std::to_string(observed_amount) + " wei (" +
        core::format_units(core::Uint256(observed_amount), kWeiDecimals, 2) + " ETH)");

    settlement::SubmittedRequest request{};
    AugurStatus status = market_->submit(codec::encode_observed_amount(observed_amount), &request);
    if (status != AUGUR_OK) {
        log.log(audit::LogLevel::ERR, std::string("[Client] Submit failed: ") +
                core::error_to_string(core::to_error(status)));
        return status;
    }
    out->request_id = request.request_id;
    log.log(audit::LogLevel::INFO,
        "[Client] Waiting for request " + std::to_string(request.request_id) + " to be fulfilled");

    settlement::Fulfillment fulfillment{};
    status = wait_for_fulfillment(request, &fulfillment);
    if (status != AUGUR_OK) {
        log.log(audit::LogLevel::ERR,
            "[Client] Request " + std::to_string(request.request_id) + " not fulfilled: " +
            core::error_to_string(core::to_error(status)));
        return status;
    }
    log.log(audit::LogLevel::INFO, "[Client] Request " + std::to_string(request.request_id) + " fulfilled");

    status = resolve_signal(fulfillment.data, out);
    if (status != AUGUR_OK) return status;
    log.log(audit::LogLevel::INFO, "[Client] Trading signal: " + describe(out->signal));

    status = ledger_->set_signal(out->signal, fulfillment.seal, &out->ledger_receipt);
    if (status != AUGUR_OK) {
        log.log(audit::LogLevel::ERR, std::string("[Client] Ledger rejected signal: ") +
                core::error_to_string(core::to_error(status)));
        return status;
    }

    const auto latest = ledger_->latest_signal();
    if (!latest || latest->receipt != out->ledger_receipt || latest->signal != out->signal) {
        log.log(audit::LogLevel::ERR, "[Client] Ledger read-back does not match the published signal");
        return AUGUR_ERR_PROTO;
    }
    log.log(audit::LogLevel::INFO,
        "[Client] Ledger updated: " + describe(latest->signal) +
        " at " + core::to_utc(latest->timestamp_ns));
    return AUGUR_OK;
}

AugurStatus SignalClient::wait_for_fulfillment(const settlement::SubmittedRequest& request,
                                               settlement::Fulfillment* out) {
    if (!out) return AUGUR_ERR_INVALID;
    const uint64_t deadline_ns = core::deadline_after_ms(config_.timeout_ms);

    for (;;) {
        settlement::RequestState state = settlement::RequestState::Unknown;
        const AugurStatus status = market_->poll(request.request_id, &state, out);
        if (status != AUGUR_OK) return status;
        if (state == settlement::RequestState::Fulfilled) return AUGUR_OK;

        if (core::unix_now_ns() >= request.expires_at_ns) return AUGUR_ERR_TIMEOUT;
        const uint64_t left_ms = core::remaining_ms(deadline_ns);
        if (left_ms == 0) return AUGUR_ERR_TIMEOUT;

        audit::Logger::instance().log(audit::LogLevel::DEBUG,
            "[Client] Request " + std::to_string(request.request_id) + " is " +
            settlement::request_state_to_string(state) + ", polling again");
        const uint64_t sleep_ms = std::min<uint64_t>(config_.poll_interval_ms, left_ms);
        std::this_thread::sleep_for(std::chrono::milliseconds(sleep_ms));
    }
}

AugurStatus SignalClient::resolve_signal(const std::vector<uint8_t>& payload, SignalOutcome* out) const {
    if (!out) return AUGUR_ERR_INVALID;
    auto& log = audit::Logger::instance();

    out->payload_size = payload.size();
    log.log(audit::LogLevel::INFO, "[Client] Raw fulfillment data length: " + std::to_string(payload.size()) + " bytes");
    log_payload_dump(payload);

    size_t offset = 0;
    auto recovered = codec::recover_signal(payload.data(), payload.size(), config_.recovery, &offset);
    if (recovered) {
        out->signal = recovered.value();
        out->recovered_offset = offset;
        out->recovery_error = core::ErrorCode::Ok;
        out->used_fallback = false;
        log.log(audit::LogLevel::INFO, "[Client] Found valid tuple at offset " + std::to_string(offset));
        return AUGUR_OK;
    }

    out->recovery_error = recovered.error();
    if (config_.fallback_policy != FallbackPolicy::SubstituteLogged) {
        log.log(audit::LogLevel::ERR,
            std::string("[Client] Could not recover signal: ") + core::error_to_string(recovered.error()));
        return core::to_status(recovered.error());
    }

    out->signal = config_.fallback_signal;
    out->used_fallback = true;
    log.log(audit::LogLevel::WARN,
        std::string("[Client] Could not recover signal (") + core::error_to_string(recovered.error()) +
        "); substituting configured fallback " + describe(out->signal));
    return AUGUR_OK;
}

void log_payload_dump(const std::vector<uint8_t>& payload) {
    auto& log = audit::Logger::instance();
    if (log.min_level() > audit::LogLevel::DEBUG) return;
    for (size_t row = 0; row < payload.size(); row += kDumpRowSize) {
        const size_t len = std::min(kDumpRowSize, payload.size() - row);
        log.log(audit::LogLevel::DEBUG,
            "[Client] Bytes " + std::to_string(row) + "-" + std::to_string(row + len) + ": " +
            core::to_hex(payload.data() + row, len));
    }
}

} // namespace augur::client
