#include "core/config.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <limits>

namespace augur::core {

bool parse_u64(const char* text, uint64_t* out) {
    if (!text || !out || *text == '\0') return false;
    // strtoull silently negates a leading minus sign.
    if (std::strchr(text, '-')) return false;
    errno = 0;
    char* end = nullptr;
    const unsigned long long parsed = std::strtoull(text, &end, 10);
    if (errno == ERANGE || end == text || *end != '\0') return false;
    *out = static_cast<uint64_t>(parsed);
    return true;
}

bool parse_bool(const char* text, bool* out) {
    if (!text || !out) return false;
    const std::string value(text);
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        *out = true;
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        *out = false;
        return true;
    }
    return false;
}

AppConfig load_config(const EnvLookup& lookup) {
    AppConfig config{};
    if (!lookup) return config;

    uint64_t parsed = 0;
    if (parse_u64(lookup("AUGUR_OBSERVED_AMOUNT"), &parsed)) {
        config.observed_amount = parsed;
    }
    if (parse_u64(lookup("AUGUR_POLL_INTERVAL_MS"), &parsed) &&
        parsed > 0 && parsed <= std::numeric_limits<uint32_t>::max()) {
        config.poll_interval_ms = static_cast<uint32_t>(parsed);
    }
    if (parse_u64(lookup("AUGUR_FULFILLMENT_TIMEOUT_MS"), &parsed) &&
        parsed > 0 && parsed <= std::numeric_limits<uint32_t>::max()) {
        config.fulfillment_timeout_ms = static_cast<uint32_t>(parsed);
    }

    bool flag = false;
    if (parse_bool(lookup("AUGUR_ALLOW_FALLBACK"), &flag)) {
        config.allow_fallback = flag;
    }

    audit::LogLevel level = config.log_level;
    if (const char* text = lookup("AUGUR_LOG_LEVEL"); text && audit::parse_log_level(text, &level)) {
        config.log_level = level;
    }
    if (const char* path = lookup("AUGUR_AUDIT_LOG")) {
        config.audit_log_path = path;
    }
    return config;
}

AppConfig load_config_from_env() {
    return load_config([](const char* name) { return std::getenv(name); });
}

} // namespace augur::core
