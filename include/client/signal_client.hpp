#pragma once

#include "codec/signal_recovery.hpp"
#include "core/error.hpp"
#include "core/errors.h"
#include "core/signal_result.hpp"
#include "settlement/prover_market.hpp"
#include "settlement/signal_ledger.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace augur::client {

enum class FallbackPolicy {
    Propagate = 0,        // recovery failure fails the run
    SubstituteLogged = 1  // substitute fallback_signal and log a warning
};

struct SignalClientConfig {
    uint32_t poll_interval_ms = 5000;
    uint32_t timeout_ms = 60000;
    FallbackPolicy fallback_policy = FallbackPolicy::Propagate;
    core::SignalResult fallback_signal{DECISION_SELL, core::Uint256(32), core::Uint256(3'735'000'000'000'000'000ULL)};
    codec::RecoveryOptions recovery{};
};

struct SignalOutcome {
    uint64_t request_id = 0;
    core::SignalResult signal{};
    bool used_fallback = false;
    core::ErrorCode recovery_error = core::ErrorCode::Ok;
    size_t recovered_offset = 0;
    size_t payload_size = 0;
    uint64_t ledger_receipt = 0;
};

/**
 * @class SignalClient
 * @brief Drives one signal from observed amount to ledger entry.
 * submit -> wait for fulfillment -> recover the journal -> publish -> read back.
 */
class SignalClient {
public:
    /**
     * @throws std::invalid_argument if either collaborator is null.
     */
    SignalClient(std::shared_ptr<settlement::ProverMarket> market,
                 std::shared_ptr<settlement::SignalLedger> ledger,
                 SignalClientConfig config = {});

    AugurStatus run(uint64_t observed_amount, SignalOutcome* out);

    /**
     * @brief Poll until fulfilled, the request expires, or timeout_ms elapses.
     * @return AUGUR_ERR_TIMEOUT on either deadline.
     */
    AugurStatus wait_for_fulfillment(const settlement::SubmittedRequest& request,
                                     settlement::Fulfillment* out);

    /**
     * @brief Recover the signal from fulfillment data, applying the fallback policy.
     * Only SubstituteLogged ever returns a value the payload did not contain, and it marks
     * the outcome as such.
     */
    AugurStatus resolve_signal(const std::vector<uint8_t>& payload, SignalOutcome* out) const;

    const SignalClientConfig& config() const { return config_; }

private:
    std::shared_ptr<settlement::ProverMarket> market_;
    std::shared_ptr<settlement::SignalLedger> ledger_;
    SignalClientConfig config_;
};

// DEBUG log of a payload in 64-byte hex rows.
void log_payload_dump(const std::vector<uint8_t>& payload);

} // namespace augur::client
