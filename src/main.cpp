#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "audit/logger.hpp"
#include "client/signal_client.hpp"
#include "codec/signal_codec.hpp"
#include "codec/signal_recovery.hpp"
#include "core/config.hpp"
#include "core/error.hpp"
#include "core/hex.hpp"
#include "core/uint256.hpp"
#include "forecast/forecaster.hpp"
#include "settlement/prover_market.hpp"
#include "settlement/signal_ledger.hpp"

namespace {

void print_usage() {
    std::cout << "usage: augur [run | forecast [amount_wei] | recover <hex>]\n"
              << "  run       submit, await fulfillment, recover and publish (default)\n"
              << "  forecast  compute the signal locally and print the canonical journal\n"
              << "  recover   decode a signal from fulfillment bytes of unknown framing\n";
}

int exit_code(AugurStatus status) {
    return static_cast<int>(status);
}

int cmd_forecast(uint64_t observed_amount) {
    const augur::forecast::Forecaster forecaster;
    const auto report = forecaster.forecast(observed_amount);
    const auto journal = augur::codec::encode_signal(report.signal);

    augur::audit::Logger::instance().log(augur::audit::LogLevel::AUDIT,
        "[Forecast] Committed journal " + augur::core::to_hex(journal.data(), journal.size()));

    std::cout << "slope=" << report.trend.slope
              << " intercept=" << report.trend.intercept
              << " confidence=" << report.trend.confidence << "%\n"
              << "forecast day " << report.next_index << ": $" << report.forecast_native
              << " (threshold $" << report.threshold << ")\n"
              << "signal: " << augur::core::decision_to_string(report.signal.decision)
              << " forecast=" << report.signal.forecast_value.to_string() << " wei ("
              << augur::core::format_units(report.signal.forecast_value, 18, 2) << " ETH)\n"
              << "journal: " << augur::core::to_hex(journal.data(), journal.size()) << std::endl;
    return 0;
}

int cmd_recover(const std::string& hex) {
    std::vector<uint8_t> blob;
    const AugurStatus parsed = augur::core::from_hex(hex, &blob);
    if (parsed != AUGUR_OK) {
        std::cerr << "recover: input is not valid hex" << std::endl;
        return exit_code(parsed);
    }

    size_t offset = 0;
    auto recovered = augur::codec::recover_signal(blob.data(), blob.size(), {}, &offset);
    if (!recovered) {
        std::cerr << "recover: " << augur::core::error_to_string(recovered.error())
                  << " (" << blob.size() << " bytes)" << std::endl;
        return exit_code(augur::core::to_status(recovered.error()));
    }

    const auto& signal = recovered.value();
    std::cout << "offset=" << offset
              << " action=" << augur::core::decision_to_string(signal.decision)
              << " confidence=" << signal.confidence.to_string()
              << " forecast=" << signal.forecast_value.to_string() << std::endl;
    return 0;
}

int cmd_run(const augur::core::AppConfig& config) {
    augur::client::SignalClientConfig client_config{};
    client_config.poll_interval_ms = config.poll_interval_ms;
    client_config.timeout_ms = config.fulfillment_timeout_ms;
    client_config.fallback_policy = config.allow_fallback
        ? augur::client::FallbackPolicy::SubstituteLogged
        : augur::client::FallbackPolicy::Propagate;

    augur::client::SignalClient client(
        augur::settlement::create_local_prover_market(),
        augur::settlement::create_in_memory_ledger(),
        client_config);

    augur::client::SignalOutcome outcome{};
    const AugurStatus status = client.run(config.observed_amount, &outcome);
    if (status != AUGUR_OK) {
        std::cerr << "run: " << augur::core::error_to_string(augur::core::to_error(status)) << std::endl;
        return exit_code(status);
    }

    std::cout << "request " << outcome.request_id << ": "
              << augur::core::decision_to_string(outcome.signal.decision)
              << " confidence=" << outcome.signal.confidence.to_string() << "%"
              << " forecast=" << outcome.signal.forecast_value.to_string() << " wei"
              << (outcome.used_fallback ? " [FALLBACK]" : "")
              << " receipt=" << outcome.ledger_receipt << std::endl;
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    const augur::core::AppConfig config = augur::core::load_config_from_env();

    auto& logger = augur::audit::Logger::instance();
    logger.set_min_level(config.log_level);
    if (!logger.set_file_path(config.audit_log_path)) {
        std::cerr << "[Audit] Cannot open " << config.audit_log_path << ", logging to console only" << std::endl;
    }

    const std::string command = (argc > 1) ? argv[1] : "run";
    int rc = 0;
    try {
        if (command == "run") {
            rc = cmd_run(config);
        } else if (command == "forecast") {
            uint64_t amount = config.observed_amount;
            if (argc > 2 && !augur::core::parse_u64(argv[2], &amount)) {
                std::cerr << "forecast: amount must be an unsigned 64-bit integer" << std::endl;
                rc = exit_code(AUGUR_ERR_PARSE);
            } else {
                rc = cmd_forecast(amount);
            }
        } else if (command == "recover" && argc > 2) {
            rc = cmd_recover(argv[2]);
        } else {
            print_usage();
            rc = exit_code(AUGUR_ERR_INVALID);
        }
    } catch (const std::exception& e) {
        logger.log(augur::audit::LogLevel::ERR, std::string("[Main] ") + e.what());
        rc = exit_code(AUGUR_ERR_INVALID);
    }

    logger.flush();
    return rc;
}
