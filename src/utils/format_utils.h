#pragma once

#include <cstdint>
#include <string>

namespace utils {

// 1536 -> "1.50 KB". Steps of 1024 through B, KB, MB, GB, TB, then PB.
std::string human_readable_size(std::uintmax_t size_bytes);

// part / whole * 100 with two decimals; "0.00" when whole == 0
std::string format_percentage(std::uintmax_t part, std::uintmax_t whole);

} // namespace utils
