#pragma once
#include <cstdint>
#include <string>

namespace labwright {

// 32 random bits from the kernel (getrandom, then /dev/urandom, then
// std::random_device).
uint32_t secure_rand32();

// Session identifier: 8 lowercase hex chars.
std::string gen_lab_id();

// Identifier for one self-test run, used in event log and diagnostics file
// names: "<yyyymmddThhmmss>-<8 hex>", so run files sort by start time.
std::string gen_run_id();

} // namespace labwright
