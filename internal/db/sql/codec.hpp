#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace feedstore::db::sql {

/*
  Structured-to-scalar column encodings.

  string list -> JSON array text ("[]" for empty, never NULL)
  bool        -> INTEGER 0/1, any nonzero reads back as true

  The JSON side goes through google.protobuf.ListValue so that the text
  written here is ordinary JSON readable by any other tool.
*/

class CodecError : public std::runtime_error {
 public:
  explicit CodecError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Structural UTF-8 check applied to every list element before it is stored.
bool IsValidUtf8(std::string_view text);

// Throws CodecError when an element is not valid UTF-8.
std::string EncodeStringList(const std::vector<std::string>& values);

// NULL/blank text decodes to an empty list. Anything other than an array of
// strings throws CodecError.
std::vector<std::string> DecodeStringList(std::string_view text);

constexpr int EncodeBool(bool value) {
  return value ? 1 : 0;
}

constexpr bool DecodeBool(int64_t value) {
  return value != 0;
}

} // namespace feedstore::db::sql
