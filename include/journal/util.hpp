#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace journal {

using Timestamp = std::chrono::system_clock::time_point;

std::string trim(std::string value);

std::string to_upper_copy(std::string value);

// Exports KEY=VALUE pairs from a dotenv style file into the process environment.
// A missing file is not an error.
void load_env_file(const std::string& path);

std::string env_or(const char* name, const std::string& fallback);

int64_t to_epoch_ms(Timestamp timestamp);

Timestamp from_epoch_ms(int64_t epoch_ms);

} // namespace journal
