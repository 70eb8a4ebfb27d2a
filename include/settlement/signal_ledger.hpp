#pragma once

#include "core/errors.h"
#include "core/signal_result.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace augur::settlement {

struct LedgerEntry {
    core::SignalResult signal{};
    std::vector<uint8_t> seal;
    uint64_t timestamp_ns = 0;
    uint64_t receipt = 0;
};

/**
 * @class SignalLedger
 * @brief Abstract interface to the contract that stores the latest verified signal.
 */
class SignalLedger {
public:
    virtual ~SignalLedger() = default;

    /**
     * @brief Record a signal with its seal.
     * @param out_receipt Receives the transaction receipt number on success.
     * @return AUGUR_ERR_RANGE if the signal violates the contract's bounds.
     */
    virtual AugurStatus set_signal(const core::SignalResult& signal,
                                   const std::vector<uint8_t>& seal,
                                   uint64_t* out_receipt) = 0;

    virtual std::optional<LedgerEntry> latest_signal() const = 0;
};

/**
 * @class InMemorySignalLedger
 * @brief Process-local ledger enforcing the same bounds as the on-chain contract.
 */
class InMemorySignalLedger : public SignalLedger {
public:
    AugurStatus set_signal(const core::SignalResult& signal,
                           const std::vector<uint8_t>& seal,
                           uint64_t* out_receipt) override;
    std::optional<LedgerEntry> latest_signal() const override;

    size_t history_size() const;

private:
    mutable std::mutex mutex_;
    std::vector<LedgerEntry> history_;
    uint64_t next_receipt_ = 1;
};

std::shared_ptr<SignalLedger> create_in_memory_ledger();

} // namespace augur::settlement
