#include "audit/logger.hpp"
#include "client/signal_client.hpp"
#include "codec/abi_word.hpp"
#include "codec/signal_codec.hpp"
#include "core/time_utils.hpp"
#include "forecast/forecaster.hpp"
#include "settlement/prover_market.hpp"
#include "settlement/signal_ledger.hpp"

#include <cassert>
#include <cstdint>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

using augur::client::FallbackPolicy;
using augur::client::SignalClient;
using augur::client::SignalClientConfig;
using augur::client::SignalOutcome;
using augur::core::ErrorCode;
using augur::core::SignalResult;
using augur::core::Uint256;
using augur::settlement::Fulfillment;
using augur::settlement::RequestState;
using augur::settlement::SubmittedRequest;

namespace {

constexpr uint64_t kObserved = 3'600'000'000'000'000'000ULL;

// Answers Pending a fixed number of times, then hands back a canned payload.
class ScriptedMarket : public augur::settlement::ProverMarket {
public:
    ScriptedMarket(std::vector<uint8_t> payload, uint32_t pending_polls, AugurStatus poll_status = AUGUR_OK)
        : payload_(std::move(payload)), pending_polls_(pending_polls), poll_status_(poll_status) {}

    AugurStatus submit(const std::vector<uint8_t>& input, SubmittedRequest* out) override {
        last_input = input;
        out->request_id = 77;
        out->expires_at_ns = augur::core::unix_now_ns() + 600'000 * augur::core::kNanosPerMilli;
        return AUGUR_OK;
    }

    AugurStatus poll(uint64_t request_id, RequestState* state, Fulfillment* out) override {
        ++polls;
        if (poll_status_ != AUGUR_OK) {
            *state = RequestState::Failed;
            return poll_status_;
        }
        if (polls <= pending_polls_) {
            *state = RequestState::Pending;
            return AUGUR_OK;
        }
        *state = RequestState::Fulfilled;
        out->request_id = request_id;
        out->data = payload_;
        out->seal = {0x5E, 0xA1};
        return AUGUR_OK;
    }

    std::vector<uint8_t> last_input;
    uint32_t polls = 0;

private:
    std::vector<uint8_t> payload_;
    uint32_t pending_polls_;
    AugurStatus poll_status_;
};

// Accepts every write but reports a different signal on read-back.
class ForgetfulLedger : public augur::settlement::SignalLedger {
public:
    AugurStatus set_signal(const SignalResult&, const std::vector<uint8_t>&, uint64_t* out_receipt) override {
        if (out_receipt) *out_receipt = 1;
        return AUGUR_OK;
    }

    std::optional<augur::settlement::LedgerEntry> latest_signal() const override {
        augur::settlement::LedgerEntry entry;
        entry.receipt = 1;
        entry.signal.decision = DECISION_SELL;
        return entry;
    }
};

SignalClientConfig fast_config() {
    SignalClientConfig config{};
    config.poll_interval_ms = 1;
    config.timeout_ms = 5000;
    return config;
}

std::vector<uint8_t> garbage(size_t size) {
    return std::vector<uint8_t>(size, 0xFF);
}

void test_end_to_end_local() {
    augur::settlement::LocalProverConfig market_config{};
    market_config.polls_until_fulfilled = 2;
    auto market = std::make_shared<augur::settlement::LocalProverMarket>(augur::forecast::Forecaster{}, market_config);
    auto ledger = std::make_shared<augur::settlement::InMemorySignalLedger>();
    SignalClient client(market, ledger, fast_config());

    SignalOutcome outcome{};
    assert(client.run(kObserved, &outcome) == AUGUR_OK);
    assert(outcome.request_id == 1);
    assert(!outcome.used_fallback);
    assert(outcome.recovery_error == ErrorCode::Ok);
    assert(outcome.payload_size == 256);
    assert(outcome.recovered_offset == 128);
    assert(outcome.ledger_receipt == 1);

    const SignalResult expected = augur::forecast::Forecaster{}.run(kObserved);
    assert(outcome.signal == expected);
    assert(outcome.signal.decision == DECISION_BUY);
    assert(outcome.signal.confidence == Uint256(97));

    auto latest = ledger->latest_signal();
    assert(latest.has_value());
    assert(latest->signal == expected);
    assert(ledger->history_size() == 1);
}

void test_bare_journal_payload() {
    const auto journal = augur::codec::encode_signal(augur::forecast::Forecaster{}.run(kObserved));
    auto market = std::make_shared<ScriptedMarket>(std::vector<uint8_t>(journal.begin(), journal.end()), 3);
    auto ledger = std::make_shared<augur::settlement::InMemorySignalLedger>();
    SignalClient client(market, ledger, fast_config());

    SignalOutcome outcome{};
    assert(client.run(kObserved, &outcome) == AUGUR_OK);
    assert(market->polls == 4);
    assert(market->last_input == augur::codec::encode_observed_amount(kObserved));
    assert(outcome.request_id == 77);
    assert(outcome.recovered_offset == 0);
    assert(outcome.payload_size == 96);

    auto latest = ledger->latest_signal();
    assert(latest && (latest->seal == std::vector<uint8_t>{0x5E, 0xA1}));
}

void test_unrecoverable_payload_propagates() {
    auto market = std::make_shared<ScriptedMarket>(garbage(320), 0);
    auto ledger = std::make_shared<augur::settlement::InMemorySignalLedger>();
    SignalClient client(market, ledger, fast_config());

    SignalOutcome outcome{};
    assert(client.run(kObserved, &outcome) == AUGUR_ERR_NO_VALID_TUPLE);
    assert(outcome.recovery_error == ErrorCode::NoValidTuple);
    assert(!outcome.used_fallback);
    assert(ledger->history_size() == 0);

    auto short_market = std::make_shared<ScriptedMarket>(garbage(10), 0);
    SignalClient short_client(short_market, ledger, fast_config());
    assert(short_client.run(kObserved, &outcome) == AUGUR_ERR_TOO_SHORT);
    assert(outcome.recovery_error == ErrorCode::TooShort);
    assert(!ledger->latest_signal());
}

void test_fallback_substitution() {
    auto market = std::make_shared<ScriptedMarket>(garbage(320), 0);
    auto ledger = std::make_shared<augur::settlement::InMemorySignalLedger>();
    SignalClientConfig config = fast_config();
    config.fallback_policy = FallbackPolicy::SubstituteLogged;
    SignalClient client(market, ledger, config);

    SignalOutcome outcome{};
    assert(client.run(kObserved, &outcome) == AUGUR_OK);
    assert(outcome.used_fallback);
    assert(outcome.recovery_error == ErrorCode::NoValidTuple);
    assert(outcome.signal.decision == DECISION_SELL);
    assert(outcome.signal.confidence == Uint256(32));
    assert(outcome.signal.forecast_value == Uint256(3'735'000'000'000'000'000ULL));

    auto latest = ledger->latest_signal();
    assert(latest && latest->signal == config.fallback_signal);

    // A recoverable payload never takes the fallback, whatever the policy.
    const auto journal = augur::codec::encode_signal(augur::forecast::Forecaster{}.run(kObserved));
    SignalOutcome resolved{};
    assert(client.resolve_signal(std::vector<uint8_t>(journal.begin(), journal.end()), &resolved) == AUGUR_OK);
    assert(!resolved.used_fallback);
    assert(resolved.signal.decision == DECISION_BUY);
}

void test_market_errors() {
    auto failing = std::make_shared<ScriptedMarket>(std::vector<uint8_t>{}, 0, AUGUR_ERR_IO);
    auto ledger = std::make_shared<augur::settlement::InMemorySignalLedger>();
    SignalClient client(failing, ledger, fast_config());
    SignalOutcome outcome{};
    assert(client.run(kObserved, &outcome) == AUGUR_ERR_IO);
    assert(outcome.request_id == 77);
    assert(ledger->history_size() == 0);

    // Never fulfilled: the client gives up at its own deadline.
    auto stalled = std::make_shared<ScriptedMarket>(garbage(96), UINT32_MAX);
    SignalClientConfig config = fast_config();
    config.poll_interval_ms = 5;
    config.timeout_ms = 30;
    SignalClient impatient(stalled, ledger, config);
    assert(impatient.run(kObserved, &outcome) == AUGUR_ERR_TIMEOUT);
    assert(stalled->polls >= 2);

    // Expired at the market.
    augur::settlement::LocalProverConfig instant{};
    instant.request_ttl_ms = 0;
    auto expiring = std::make_shared<augur::settlement::LocalProverMarket>(augur::forecast::Forecaster{}, instant);
    SignalClient late(expiring, ledger, fast_config());
    assert(late.run(kObserved, &outcome) == AUGUR_ERR_TIMEOUT);

    assert(client.run(kObserved, nullptr) == AUGUR_ERR_INVALID);
}

void test_ledger_readback_mismatch() {
    const auto journal = augur::codec::encode_signal(augur::forecast::Forecaster{}.run(kObserved));
    auto market = std::make_shared<ScriptedMarket>(std::vector<uint8_t>(journal.begin(), journal.end()), 0);
    SignalClient client(market, std::make_shared<ForgetfulLedger>(), fast_config());
    SignalOutcome outcome{};
    assert(client.run(kObserved, &outcome) == AUGUR_ERR_PROTO);
}

void test_construction() {
    auto ledger = augur::settlement::create_in_memory_ledger();
    bool threw = false;
    try {
        SignalClient client(nullptr, ledger);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        SignalClient client(augur::settlement::create_local_prover_market(), nullptr);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    SignalClientConfig config{};
    config.poll_interval_ms = 0;
    SignalClient client(augur::settlement::create_local_prover_market(), ledger, config);
    assert(client.config().poll_interval_ms == 1);
    assert(client.config().fallback_policy == FallbackPolicy::Propagate);
}

}

int main() {
    auto& logger = augur::audit::Logger::instance();
    logger.set_console(false);
    logger.set_min_level(augur::audit::LogLevel::DEBUG);

    test_end_to_end_local();
    test_bare_journal_payload();
    test_unrecoverable_payload_propagates();
    test_fallback_substitution();
    test_market_errors();
    test_ledger_readback_mismatch();
    test_construction();

    logger.flush();
    return 0;
}
