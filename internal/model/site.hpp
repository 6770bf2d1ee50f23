#pragma once

#include <cstdint>
#include <string>

#include "internal/model/site_type.hpp"

namespace feedstore::model {

/*
  Pollable endpoint owned by exactly one source.

  site_type carries the raw literal so that values outside SiteType reach
  the validation layers instead of being lost in a conversion.
*/

struct Site {
  int64_t id        = 0;
  int64_t source_id = 0;

  std::string site_url;
  std::string site_type = std::string(ToString(SiteType::kAuto));

  bool operator==(const Site&) const = default;
};

} // namespace feedstore::model
