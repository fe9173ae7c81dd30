#include <gtest/gtest.h>

#include <optional>
#include <set>
#include <string>

#include "lsconf/syntax/error_decoder.hpp"

using lsconf::DiagnosticBag;
using lsconf::Severity;
using lsconf::syntax::PegReportDecoder;

namespace
{

const std::string k_doc = "input {\n  stdin {\n}\nfilter { grok }\n";

DiagnosticBag decode(const std::string & report, std::optional<std::string> farthest = std::nullopt)
{
  std::optional<std::string_view> f;
  if (farthest) {
    f = *farthest;
  }
  return PegReportDecoder{}.decode(report, f, k_doc);
}

}  // namespace

TEST(SyntaxErrorDecoder, DecodesReportLines)
{
  const auto bag = decode(
    "3:1 (19): rule config: expected one of '}', plugin\n"
    "pipeline.conf:4:15 (33): rule plugin: expected '{'\n");

  ASSERT_EQ(bag.size(), 2U);
  EXPECT_EQ(bag.all()[0].from(), 19U);
  EXPECT_EQ(bag.all()[0].to(), 20U);
  EXPECT_EQ(bag.all()[0].message, "expected one of '}', plugin");
  EXPECT_EQ(bag.all()[0].severity, Severity::Error);
  EXPECT_EQ(bag.all()[0].code, "E001");

  EXPECT_EQ(bag.all()[1].from(), 33U);
  EXPECT_EQ(bag.all()[1].message, "expected '{'");
}

TEST(SyntaxErrorDecoder, KeepsFirstMessagePerOffset)
{
  const auto bag = decode(
    "1:9 (8): rule a: first\n"
    "1:9 (8): rule b: second\n"
    "2:3 (10): third\n");

  ASSERT_EQ(bag.size(), 2U);
  EXPECT_EQ(bag.all()[0].message, "first");
  EXPECT_EQ(bag.all()[1].message, "third");
}

TEST(SyntaxErrorDecoder, IsDeterministicWithUniqueStarts)
{
  const std::string report =
    "garbage line\n1:1 (0): x\n2:1 (8): y\n2:1 (8): z\n9:9 (999): far away\nmore garbage\n";

  const auto a = decode(report);
  const auto b = decode(report);
  EXPECT_EQ(a.all(), b.all());

  std::set<uint32_t> starts;
  for (const auto & d : a) {
    EXPECT_TRUE(starts.insert(d.from()).second) << "duplicate start " << d.from();
    EXPECT_LE(d.to(), k_doc.size());
  }
}

TEST(SyntaxErrorDecoder, OffsetsPastTheEndAreClamped)
{
  const auto bag = decode("9:9 (99999999999999999999999): oops");
  ASSERT_EQ(bag.size(), 1U);
  EXPECT_EQ(bag.all()[0].from(), k_doc.size() - 1);
  EXPECT_EQ(bag.all()[0].to(), k_doc.size());
}

TEST(SyntaxErrorDecoder, UnrecognisedTextAnchorsAtStart)
{
  const auto bag = decode("something went wrong\nand again");
  ASSERT_EQ(bag.size(), 1U);
  EXPECT_EQ(bag.all()[0].from(), 0U);
  EXPECT_EQ(bag.all()[0].to(), 1U);
  EXPECT_EQ(bag.all()[0].message, "something went wrong");
  EXPECT_EQ(bag.all()[0].code, "E002");
}

TEST(SyntaxErrorDecoder, EmptyReportStillYieldsAnError)
{
  const auto bag = decode("   \n");
  ASSERT_EQ(bag.size(), 1U);
  EXPECT_TRUE(bag.has_errors());
  EXPECT_EQ(bag.all()[0].message, "parser reported a failure without details");

  const auto on_empty_doc = PegReportDecoder{}.decode("", std::nullopt, "");
  ASSERT_EQ(on_empty_doc.size(), 1U);
  EXPECT_EQ(on_empty_doc.all()[0].from(), 0U);
  EXPECT_EQ(on_empty_doc.all()[0].to(), 0U);
}

TEST(SyntaxErrorDecoder, FarthestFailureAddsWarning)
{
  const auto bag = decode(
    "1:9 (8): rule config: expected plugin",
    "at pos 4:15 [33] and [33]\n  -> '{'\n  -> '=>'\n");

  ASSERT_EQ(bag.size(), 2U);
  const auto & w = bag.all()[1];
  EXPECT_EQ(w.severity, Severity::Warning);
  EXPECT_EQ(w.code, "W004");
  EXPECT_EQ(w.from(), 33U);
  EXPECT_EQ(w.message, "'{'; '=>'");
}

TEST(SyntaxErrorDecoder, FarthestFailureWithoutExpectations)
{
  const auto bag = decode("1:9 (8): x", "at pos 4:15 [33] and [33]");
  ASSERT_EQ(bag.size(), 2U);
  EXPECT_EQ(bag.all()[1].message, PegReportDecoder::k_farthest_fallback);
}

TEST(SyntaxErrorDecoder, FarthestFailureAtCoveredOffsetIsDropped)
{
  const auto bag = decode("1:9 (8): x", "at pos 1:9 [8] and [8]\n-> '}'");
  ASSERT_EQ(bag.size(), 1U);
  EXPECT_TRUE(bag.warnings().empty());
}

TEST(SyntaxErrorDecoder, UnparsableFarthestIsIgnored)
{
  const auto bag = decode("1:9 (8): x", "nothing useful");
  EXPECT_EQ(bag.size(), 1U);
}
