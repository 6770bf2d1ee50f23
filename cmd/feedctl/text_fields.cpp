#include "text_fields.hpp"

#include <cctype>
#include <charconv>
#include <cstddef>

namespace feedstore::cli {

namespace {

std::string_view Trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
  return text;
}

} // namespace

std::vector<std::string> SplitList(std::string_view text) {
  std::vector<std::string> out;
  while (true) {
    const auto comma = text.find(',');
    const auto item  = Trim(text.substr(0, comma));
    if (!item.empty()) {
      out.emplace_back(item);
    }
    if (comma == std::string_view::npos) {
      break;
    }
    text.remove_prefix(comma + 1);
  }
  return out;
}

std::string JoinList(const std::vector<std::string>& items) {
  std::string out;
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) out += ",";
    out += items[i];
  }
  return out;
}

bool ParseBool(std::string_view text) {
  std::string lowered;
  for (char c : Trim(text)) {
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return lowered == "true" || lowered == "1" || lowered == "yes";
}

const char* FormatBool(bool value) {
  return value ? "Yes" : "No";
}

std::optional<int64_t> ParseId(std::string_view text) {
  int64_t value = 0;
  const auto* first = text.data();
  const auto* last  = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, value);
  if (ec != std::errc() || ptr != last || value <= 0) {
    return std::nullopt;
  }
  return value;
}

} // namespace feedstore::cli
