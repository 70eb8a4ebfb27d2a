#pragma once

#include "core/errors.h"
#include "forecast/forecaster.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace augur::settlement {

enum class RequestState {
    Unknown = 0,
    Pending = 1,
    Fulfilled = 2,
    Expired = 3,
    Failed = 4
};

const char* request_state_to_string(RequestState state);

struct SubmittedRequest {
    uint64_t request_id = 0;
    uint64_t expires_at_ns = 0; // wall clock
};

/**
 * @struct Fulfillment
 * @brief What the market hands back: opaque data of market-defined framing, plus the seal.
 */
struct Fulfillment {
    uint64_t request_id = 0;
    std::vector<uint8_t> data;
    std::vector<uint8_t> seal;
};

/**
 * @class ProverMarket
 * @brief Abstract interface to the proving marketplace that runs the forecaster remotely.
 */
class ProverMarket {
public:
    virtual ~ProverMarket() = default;

    /**
     * @brief Submit the forecaster input.
     * @param input ABI-encoded observed amount.
     */
    virtual AugurStatus submit(const std::vector<uint8_t>& input, SubmittedRequest* out) = 0;

    /**
     * @brief Check a request once without blocking.
     * @param out Filled only when the state is Fulfilled.
     * @return AUGUR_ERR_INVALID for an unknown id, AUGUR_ERR_TIMEOUT once expired, or the
     *         execution error for a failed request.
     */
    virtual AugurStatus poll(uint64_t request_id, RequestState* state, Fulfillment* out) = 0;
};

struct LocalProverConfig {
    uint32_t polls_until_fulfilled = 0; // Pending answers before the guest runs.
    uint64_t request_ttl_ms = 600'000;
    bool wrap_in_envelope = true;       // false returns the bare 96-byte journal
    std::vector<uint8_t> seal;          // Opaque; no proof is produced locally.
};

/**
 * @class LocalProverMarket
 * @brief In-process market that executes the guest on poll and frames the journal like the
 * real settlement layer.
 */
class LocalProverMarket : public ProverMarket {
public:
    explicit LocalProverMarket(forecast::Forecaster forecaster, LocalProverConfig config = {});

    AugurStatus submit(const std::vector<uint8_t>& input, SubmittedRequest* out) override;
    AugurStatus poll(uint64_t request_id, RequestState* state, Fulfillment* out) override;

    size_t pending_count() const;

private:
    struct RequestRecord {
        std::vector<uint8_t> input;
        uint64_t expires_at_ns = 0;
        uint32_t polls = 0;
        RequestState state = RequestState::Pending;
        AugurStatus failure = AUGUR_OK;
        Fulfillment fulfillment;
    };

    AugurStatus execute(uint64_t request_id, RequestRecord& record);

    forecast::Forecaster forecaster_;
    LocalProverConfig config_;
    mutable std::mutex mutex_;
    uint64_t next_request_id_ = 1;
    std::unordered_map<uint64_t, RequestRecord> requests_;
};

std::shared_ptr<ProverMarket> create_local_prover_market(LocalProverConfig config = {});

} // namespace augur::settlement
