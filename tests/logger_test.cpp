#include "audit/logger.hpp"

#include <cassert>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <string>

using augur::audit::LogLevel;
using augur::audit::Logger;

namespace {

const char* kLogPath = "augur_logger_test.log";

std::string read_file(const char* path) {
    std::ifstream in(path);
    std::ostringstream contents;
    contents << in.rdbuf();
    return contents.str();
}

}

int main() {
    LogLevel level = LogLevel::INFO;
    assert(augur::audit::parse_log_level("WARN", &level) && level == LogLevel::WARN);
    assert(augur::audit::parse_log_level("error", &level) && level == LogLevel::ERR);
    assert(augur::audit::parse_log_level("Audit", &level) && level == LogLevel::AUDIT);
    assert(!augur::audit::parse_log_level("trace", &level));
    assert(level == LogLevel::AUDIT);
    assert(std::strcmp(augur::audit::level_tag(LogLevel::ERR), "[ERROR] ") == 0);

    std::remove(kLogPath);
    auto& logger = Logger::instance();
    logger.set_console(false);
    assert(logger.set_file_path(kLogPath));

    // Below the minimum level nothing is written; AUDIT always is.
    logger.set_min_level(LogLevel::WARN);
    assert(logger.min_level() == LogLevel::WARN);
    logger.log(LogLevel::INFO, "below-threshold");
    logger.log(LogLevel::WARN, "warn-line");
    logger.log(LogLevel::AUDIT, "audit-line");
    logger.flush();

    const std::string written = read_file(kLogPath);
    assert(written.find("below-threshold") == std::string::npos);
    assert(written.find("[WARN] warn-line") != std::string::npos);
    assert(written.find("[AUDIT] audit-line") != std::string::npos);
    assert(written.find("+00 [") != std::string::npos);

    // A full queue drops entries and counts them.
    const uint64_t dropped_before = logger.dropped_count();
    logger.set_queue_capacity(0);
    logger.log(LogLevel::ERR, "dropped-one");
    logger.log(LogLevel::AUDIT, "dropped-two");
    assert(logger.dropped_count() == dropped_before + 2);
    logger.set_queue_capacity(4096);
    logger.flush();
    assert(read_file(kLogPath).find("dropped-") == std::string::npos);

    // Empty path closes the sink.
    assert(logger.set_file_path(""));
    logger.log(LogLevel::ERR, "after-close");
    logger.flush();
    assert(read_file(kLogPath).find("after-close") == std::string::npos);

    assert(!logger.set_file_path("/nonexistent-dir/augur/audit.log"));

    std::remove(kLogPath);
    return 0;
}
