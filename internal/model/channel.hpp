#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace feedstore::model {

/*
  Distribution destination (root of the hierarchy).

  name and url are required and unique across channels.
  post_times keeps caller order; forbidden_words is stored as given.
*/

struct Channel {
  int64_t id = 0; // 0 until inserted

  std::string name;
  std::string url;

  std::vector<std::string> post_times;
  std::vector<std::string> forbidden_words;

  bool operator==(const Channel&) const = default;
};

} // namespace feedstore::model
