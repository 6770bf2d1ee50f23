#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace feedstore::model {

// Scrape target owned by exactly one channel.
struct Source {
  int64_t id         = 0;
  int64_t channel_id = 0;

  std::string source_url;
  bool        parse_media = false;

  std::vector<std::string> forbidden_words;

  bool operator==(const Source&) const = default;
};

} // namespace feedstore::model
