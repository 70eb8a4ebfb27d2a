#pragma once

#include "audit/logger.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace augur::core {

constexpr uint64_t kDefaultObservedAmount = 3'700'000'000'000'000'000ULL; // 3.7 ETH in wei

/**
 * @struct AppConfig
 * @brief Process settings read from AUGUR_* environment variables.
 */
struct AppConfig {
    uint64_t observed_amount = kDefaultObservedAmount;
    uint32_t poll_interval_ms = 5000;
    uint32_t fulfillment_timeout_ms = 60000;
    bool allow_fallback = false;
    audit::LogLevel log_level = audit::LogLevel::INFO;
    std::string audit_log_path = "audit.log";
};

using EnvLookup = std::function<const char*(const char* name)>;

/**
 * @brief Build a config from a variable lookup.
 * Unset or malformed values keep their defaults.
 */
AppConfig load_config(const EnvLookup& lookup);
AppConfig load_config_from_env();

bool parse_u64(const char* text, uint64_t* out);
bool parse_bool(const char* text, bool* out);

} // namespace augur::core
