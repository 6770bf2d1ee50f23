#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace feedstore::model {

// Listing category of a polled site. Stored as its literal name.
enum class SiteType : std::uint8_t {
  kAuto = 0,
  kRent = 1,
  kBuy  = 2,
  kFree = 3,
};

constexpr std::string_view ToString(SiteType type) {
  switch (type) {
    case SiteType::kAuto:
      return "AUTO";
    case SiteType::kRent:
      return "RENT";
    case SiteType::kBuy:
      return "BUY";
    case SiteType::kFree:
      return "FREE";
  }
  return "AUTO";
}

// Exact, case-sensitive match against the stored literals.
constexpr std::optional<SiteType> ParseSiteType(std::string_view value) {
  if (value == "AUTO") return SiteType::kAuto;
  if (value == "RENT") return SiteType::kRent;
  if (value == "BUY") return SiteType::kBuy;
  if (value == "FREE") return SiteType::kFree;
  return std::nullopt;
}

constexpr bool IsValidSiteType(std::string_view value) {
  return ParseSiteType(value).has_value();
}

} // namespace feedstore::model
