#include "settlement/prover_market.hpp"

#include "audit/logger.hpp"
#include "codec/envelope.hpp"
#include "core/error.hpp"
#include "core/hex.hpp"
#include "core/time_utils.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <utility>

namespace augur::settlement {

const char* request_state_to_string(RequestState state) {
    switch (state) {
        case RequestState::Unknown: return "unknown";
        case RequestState::Pending: return "pending";
        case RequestState::Fulfilled: return "fulfilled";
        case RequestState::Expired: return "expired";
        case RequestState::Failed: return "failed";
        default: return "unknown";
    }
}

LocalProverMarket::LocalProverMarket(forecast::Forecaster forecaster, LocalProverConfig config)
    : forecaster_(std::move(forecaster)), config_(std::move(config)) {}

AugurStatus LocalProverMarket::submit(const std::vector<uint8_t>& input, SubmittedRequest* out) {
    if (!out) return AUGUR_ERR_INVALID;

    const uint64_t now = core::unix_now_ns();
    const uint64_t max_ttl_ms = (std::numeric_limits<uint64_t>::max() - now) / core::kNanosPerMilli;
    const uint64_t ttl_ms = std::min(config_.request_ttl_ms, max_ttl_ms);

    RequestRecord record;
    record.input = input;
    record.expires_at_ns = now + ttl_ms * core::kNanosPerMilli;

    std::lock_guard<std::mutex> lock(mutex_);
    out->request_id = next_request_id_++;
    out->expires_at_ns = record.expires_at_ns;
    requests_.emplace(out->request_id, std::move(record));

    audit::Logger::instance().log(audit::LogLevel::DEBUG,
        "[Market] Accepted request " + std::to_string(out->request_id) +
        " (" + std::to_string(input.size()) + " input bytes)");
    return AUGUR_OK;
}

AugurStatus LocalProverMarket::poll(uint64_t request_id, RequestState* state, Fulfillment* out) {
    if (!state) return AUGUR_ERR_INVALID;

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = requests_.find(request_id);
    if (it == requests_.end()) {
        *state = RequestState::Unknown;
        return AUGUR_ERR_INVALID;
    }

    RequestRecord& record = it->second;
    if (record.state == RequestState::Pending) {
        if (core::unix_now_ns() >= record.expires_at_ns) {
            record.state = RequestState::Expired;
        } else if (record.polls++ >= config_.polls_until_fulfilled) {
            record.failure = execute(request_id, record);
            record.state = (record.failure == AUGUR_OK) ? RequestState::Fulfilled : RequestState::Failed;
        }
    }

    *state = record.state;
    switch (record.state) {
        case RequestState::Fulfilled:
            if (out) *out = record.fulfillment;
            return AUGUR_OK;
        case RequestState::Expired:
            return AUGUR_ERR_TIMEOUT;
        case RequestState::Failed:
            return record.failure;
        default:
            return AUGUR_OK;
    }
}

size_t LocalProverMarket::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(std::count_if(requests_.begin(), requests_.end(), [](const auto& entry) {
        return entry.second.state == RequestState::Pending;
    }));
}

AugurStatus LocalProverMarket::execute(uint64_t request_id, RequestRecord& record) {
    auto journal = forecast::run_guest(forecaster_, record.input.data(), record.input.size());
    if (!journal) {
        audit::Logger::instance().log(audit::LogLevel::WARN,
            "[Market] Guest rejected request " + std::to_string(request_id) +
            ": " + core::error_to_string(journal.error()));
        return core::to_status(journal.error());
    }

    record.fulfillment.request_id = request_id;
    record.fulfillment.seal = config_.seal;
    if (config_.wrap_in_envelope) {
        record.fulfillment.data = codec::wrap_fulfillment(journal.value(), core::Uint256(request_id), config_.seal);
    } else {
        record.fulfillment.data.assign(journal.value().begin(), journal.value().end());
    }

    audit::Logger::instance().log(audit::LogLevel::AUDIT,
        "[Market] Request " + std::to_string(request_id) + " committed journal " +
        core::to_hex(journal.value().data(), journal.value().size()));
    return AUGUR_OK;
}

std::shared_ptr<ProverMarket> create_local_prover_market(LocalProverConfig config) {
    return std::make_shared<LocalProverMarket>(forecast::Forecaster{}, std::move(config));
}

} // namespace augur::settlement
