#pragma once

#include <cstdint>
#include <cstddef>
#include <string>

namespace augur::core {

constexpr uint64_t kNanosPerMilli = 1'000'000ULL;

// Monotonic clock; poll deadlines are measured against it.
uint64_t now_ns();

// Wall clock (UTC) in nanoseconds since epoch. Request expiry and ledger timestamps use it.
uint64_t unix_now_ns();

// Monotonic deadline `timeout_ms` from now. Saturates instead of wrapping.
uint64_t deadline_after_ms(uint64_t timeout_ms);

// Milliseconds left until `deadline_ns` on the monotonic clock, 0 once passed.
uint64_t remaining_ms(uint64_t deadline_ns);

// YYYY-MM-DD HH:MM:SS.nnnnnnnnn+00
void format_utc(uint64_t ts_ns, char* out, size_t out_len);
std::string to_utc(uint64_t ts_ns);

} // namespace augur::core
