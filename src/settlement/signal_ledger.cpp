#include "settlement/signal_ledger.hpp"

#include "audit/logger.hpp"
#include "core/time_utils.hpp"

#include <string>

namespace augur::settlement {

AugurStatus InMemorySignalLedger::set_signal(const core::SignalResult& signal,
                                             const std::vector<uint8_t>& seal,
                                             uint64_t* out_receipt) {
    if (signal.decision != DECISION_SELL && signal.decision != DECISION_BUY) return AUGUR_ERR_RANGE;
    if (signal.confidence > core::Uint256(core::kMaxConfidence)) return AUGUR_ERR_RANGE;

    LedgerEntry entry;
    entry.signal = signal;
    entry.seal = seal;
    entry.timestamp_ns = core::unix_now_ns();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry.receipt = next_receipt_++;
        history_.push_back(entry);
    }
    if (out_receipt) *out_receipt = entry.receipt;

    audit::Logger::instance().log(audit::LogLevel::AUDIT,
        "[Ledger] Stored signal receipt=" + std::to_string(entry.receipt) +
        " action=" + core::decision_to_string(signal.decision) +
        " confidence=" + signal.confidence.to_string() +
        " forecast=" + signal.forecast_value.to_string());
    return AUGUR_OK;
}

std::optional<LedgerEntry> InMemorySignalLedger::latest_signal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (history_.empty()) return std::nullopt;
    return history_.back();
}

size_t InMemorySignalLedger::history_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return history_.size();
}

std::shared_ptr<SignalLedger> create_in_memory_ledger() {
    return std::make_shared<InMemorySignalLedger>();
}

} // namespace augur::settlement
