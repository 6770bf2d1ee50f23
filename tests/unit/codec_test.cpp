#include "internal/db/sql/codec.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using feedstore::db::sql::CodecError;
using feedstore::db::sql::DecodeBool;
using feedstore::db::sql::DecodeStringList;
using feedstore::db::sql::EncodeBool;
using feedstore::db::sql::EncodeStringList;

void TestStringListRoundTripKeepsOrderAndDuplicates() {
  const std::vector<std::vector<std::string>> cases = {
      {},
      {"09:00"},
      {"18:00", "09:00", "18:00"},
      {"", "with, comma", "quote \" and \\ backslash", "line\nbreak"},
      {"日本語", "☃"},
  };

  for (const auto& list : cases) {
    assert(DecodeStringList(EncodeStringList(list)) == list);
  }
}

void TestEmptyListEncodesAsEmptyArray() {
  assert(EncodeStringList({}) == "[]");
}

void TestEncodedListIsPlainJson() {
  assert(EncodeStringList({"spam", "ads"}) == R"(["spam","ads"])");
}

void TestBlankTextDecodesToEmptyList() {
  assert(DecodeStringList("").empty());
  assert(DecodeStringList("   ").empty());
}

void TestNonArrayTextIsRejected() {
  for (const char* bad : {"spam", "{\"a\":1}", "[1,2]", "[\"a\",null]", "[\"a\""}) {
    bool threw = false;
    try {
      (void)DecodeStringList(bad);
    } catch (const CodecError&) {
      threw = true;
    }
    assert(threw && "DecodeStringList must reject anything but an array of strings.");
  }
}

void TestInvalidUtf8IsRejectedOnEncode() {
  const std::vector<std::vector<std::string>> cases = {
      {"\xff\xfe"},
      {"ok", "caf\xe9"},
      {"\xc3"},
  };

  for (const auto& list : cases) {
    bool threw = false;
    try {
      (void)EncodeStringList(list);
    } catch (const CodecError&) {
      threw = true;
    }
    assert(threw && "EncodeStringList must not store a mangled element.");
  }

  assert(feedstore::db::sql::IsValidUtf8("caf\xc3\xa9"));
  assert(!feedstore::db::sql::IsValidUtf8("caf\xe9"));
}

void TestBoolEncoding() {
  static_assert(EncodeBool(true) == 1);
  static_assert(EncodeBool(false) == 0);

  assert(DecodeBool(EncodeBool(true)));
  assert(!DecodeBool(EncodeBool(false)));
  assert(DecodeBool(7));
  assert(DecodeBool(-1));
}

} // namespace

int main() {
  TestStringListRoundTripKeepsOrderAndDuplicates();
  TestEmptyListEncodesAsEmptyArray();
  TestEncodedListIsPlainJson();
  TestBlankTextDecodesToEmptyList();
  TestNonArrayTextIsRejected();
  TestInvalidUtf8IsRejectedOnEncode();
  TestBoolEncoding();

  std::cout << "feedstore_unit_codec: pass\n";
  return 0;
}
