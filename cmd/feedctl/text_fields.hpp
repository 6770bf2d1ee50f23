#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace feedstore::cli {

// "a, b,,c " -> {"a","b","c"}. Items are trimmed, empty items dropped.
std::vector<std::string> SplitList(std::string_view text);

std::string JoinList(const std::vector<std::string>& items);

// true for "true", "1", "yes" in any case; everything else is false.
bool ParseBool(std::string_view text);

const char* FormatBool(bool value);

// Whole-string positive integer, nullopt otherwise.
std::optional<int64_t> ParseId(std::string_view text);

} // namespace feedstore::cli
