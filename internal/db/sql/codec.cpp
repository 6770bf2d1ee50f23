#include "internal/db/sql/codec.hpp"

#include <google/protobuf/stubs/common.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

namespace feedstore::db::sql {

namespace {

bool IsBlank(std::string_view text) {
  return text.find_first_not_of(" \t\r\n") == std::string_view::npos;
}

} // namespace

bool IsValidUtf8(std::string_view text) {
  return google::protobuf::internal::IsStructurallyValidUTF8(text.data(), static_cast<int>(text.size()));
}

std::string EncodeStringList(const std::vector<std::string>& values) {
  google::protobuf::ListValue list;
  for (size_t i = 0; i < values.size(); ++i) {
    if (!IsValidUtf8(values[i])) {
      throw CodecError("element " + std::to_string(i) + " of list is not valid UTF-8");
    }
    list.add_values()->set_string_value(values[i]);
  }

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(list, &json);
  if (!status.ok()) {
    throw CodecError("cannot encode string list: " + std::string(status.message()));
  }
  return json;
}

std::vector<std::string> DecodeStringList(std::string_view text) {
  if (IsBlank(text)) {
    return {};
  }

  google::protobuf::ListValue list;
  auto                        status = google::protobuf::util::JsonStringToMessage(std::string(text), &list);
  if (!status.ok()) {
    throw CodecError("stored value is not a JSON array: " + std::string(status.message()));
  }

  std::vector<std::string> out;
  out.reserve(static_cast<size_t>(list.values_size()));
  for (int i = 0; i < list.values_size(); ++i) {
    const auto& value = list.values(i);
    if (value.kind_case() != google::protobuf::Value::kStringValue) {
      throw CodecError("element " + std::to_string(i) + " of stored list is not a string");
    }
    out.push_back(value.string_value());
  }
  return out;
}

} // namespace feedstore::db::sql
