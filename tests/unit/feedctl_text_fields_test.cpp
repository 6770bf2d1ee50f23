#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "cmd/feedctl/cli_error.hpp"
#include "cmd/feedctl/text_fields.hpp"
#include "internal/util/errors.hpp"

namespace {

using feedstore::cli::FormatBool;
using feedstore::cli::JoinList;
using feedstore::cli::ParseBool;
using feedstore::cli::ParseId;
using feedstore::cli::SplitList;

void TestSplitTrimsAndDropsEmptyItems() {
  assert((SplitList(" 09:00 , 18:00") == std::vector<std::string>{"09:00", "18:00"}));
  assert((SplitList("spam,,ads, ,") == std::vector<std::string>{"spam", "ads"}));
  assert((SplitList("one") == std::vector<std::string>{"one"}));
  assert(SplitList("").empty());
  assert(SplitList(" , ").empty());
}

void TestJoin() {
  assert(JoinList({}).empty());
  assert(JoinList({"09:00"}) == "09:00");
  assert(JoinList({"09:00", "18:00"}) == "09:00,18:00");
  assert((SplitList(JoinList({"a", "b", "a"})) == std::vector<std::string>{"a", "b", "a"}));
}

void TestParseBool() {
  for (const char* yes : {"true", "TRUE", "1", "yes", "Yes", " yes "}) {
    assert(ParseBool(yes));
  }
  for (const char* no : {"", "false", "0", "no", "y", "on"}) {
    assert(!ParseBool(no));
  }
  assert(std::string(FormatBool(true)) == "Yes");
  assert(std::string(FormatBool(false)) == "No");
}

void TestParseId() {
  assert(ParseId("42") == 42);
  assert(!ParseId("").has_value());
  assert(!ParseId("0").has_value());
  assert(!ParseId("-3").has_value());
  assert(!ParseId("12abc").has_value());
  assert(!ParseId(" 7").has_value());
}

void TestExitCodes() {
  using namespace feedstore::util;
  using feedstore::cli::ToExitCode;

  assert(ToExitCode(StorageUnavailable("x")) == feedstore::cli::kExitStorageUnavailable);
  assert(ToExitCode(NotFound("x")) == feedstore::cli::kExitNotFound);
  assert(ToExitCode(UniqueConstraintViolation("x")) == feedstore::cli::kExitConstraint);
  assert(ToExitCode(ForeignKeyViolation("x")) == feedstore::cli::kExitConstraint);
  assert(ToExitCode(InvalidEnum("x")) == feedstore::cli::kExitConstraint);
  assert(ToExitCode(InvalidArgument("x")) == feedstore::cli::kExitConstraint);
  assert(ToExitCode(LockContention("x")) == feedstore::cli::kExitLockContention);
  assert(ToExitCode(Corruption("x")) == feedstore::cli::kExitOther);
  assert(ToExitCode(std::runtime_error("x")) == feedstore::cli::kExitOther);
}

void TestDescribeNamesFieldAndId() {
  const auto text = feedstore::cli::Describe(feedstore::util::ForeignKeyViolation("no such channel", "channel_id", 7));
  assert(text.find("unknown parent") != std::string::npos);
  assert(text.find("[field=channel_id]") != std::string::npos);
  assert(text.find("[id=7]") != std::string::npos);
}

} // namespace

int main() {
  TestSplitTrimsAndDropsEmptyItems();
  TestJoin();
  TestParseBool();
  TestParseId();
  TestExitCodes();
  TestDescribeNamesFieldAndId();

  std::cout << "feedstore_unit_feedctl_text_fields: pass\n";
  return 0;
}
