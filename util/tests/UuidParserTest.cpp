#include <gtest/gtest.h>

#include <boost/uuid/uuid_io.hpp>

#include "UuidParser.hpp"

using util::UuidFormat;
using util::UuidFormatter;
using util::UuidParser;

namespace {
const boost::uuids::uuid kSample = {
    0x55, 0x0e, 0x84, 0x00, 0xe2, 0x9b, 0x41, 0xd4,
    0xa7, 0x16, 0x44, 0x66, 0x55, 0x44, 0x00, 0x00
};
} // namespace

TEST(UuidParserTest, ParsesEveryEncoding) {
  EXPECT_EQ(UuidParser::Parse("550e8400e29b41d4a716446655440000"), kSample);
  EXPECT_EQ(UuidParser::Parse("550e8400-e29b-41d4-a716-446655440000"), kSample);
  EXPECT_EQ(UuidParser::Parse("{550e8400-e29b-41d4-a716-446655440000}"), kSample);
  EXPECT_EQ(UuidParser::Parse("urn:uuid:550e8400-e29b-41d4-a716-446655440000"), kSample);
}

TEST(UuidParserTest, UppercaseHex) {
  EXPECT_EQ(UuidParser::Parse("550E8400-E29B-41D4-A716-446655440000"), kSample);
}

TEST(UuidParserTest, RoundTrip) {
  const boost::uuids::uuid value = {
      0x10, 0x20, 0x30, 0x40, 0x50, 0x60, 0x70, 0x80,
      0x90, 0xA0, 0xB0, 0xC0, 0xD0, 0xE0, 0xF0, 0x00
  };
  for (auto format : {UuidFormat::Simple, UuidFormat::Hyphenated, UuidFormat::Braced, UuidFormat::Urn}) {
    EXPECT_EQ(UuidParser::Parse(UuidFormatter::ToString(value, format)), value);
  }
}

TEST(UuidParserTest, RejectsBadLength) {
  EXPECT_THROW(UuidParser::Parse(""), std::invalid_argument);
  EXPECT_THROW(UuidParser::Parse("550e8400-e29b-41d4-a716-44665544000"), std::invalid_argument);
  EXPECT_THROW(UuidParser::Parse("550e8400e29b41d4a7164466554400000"), std::invalid_argument);
}

TEST(UuidParserTest, RejectsMisplacedHyphen) {
  EXPECT_THROW(UuidParser::Parse("550e840-0e29b-41d4-a716-446655440000"), std::invalid_argument);
  EXPECT_THROW(UuidParser::Parse("550e8400e-29b-41d4-a716-446655440000"), std::invalid_argument);
}

TEST(UuidParserTest, RejectsNonHex) {
  EXPECT_THROW(UuidParser::Parse("550e8400e29b41d4a71644665544000g"), std::invalid_argument);
  EXPECT_THROW(UuidParser::Parse("550e8400-e29b-41d4-a716-44665544000z"), std::invalid_argument);
  EXPECT_THROW(UuidParser::Parse("550e8400-e29b-41d4-a716-4466554400\xc3\xa9"), std::invalid_argument);
}

TEST(UuidParserTest, RejectsBadWrappers) {
  EXPECT_THROW(UuidParser::Parse("(550e8400-e29b-41d4-a716-446655440000)"), std::invalid_argument);
  EXPECT_THROW(UuidParser::Parse("{550e8400-e29b-41d4-a716-446655440000"), std::invalid_argument);
  EXPECT_THROW(UuidParser::Parse("URN:UUID:550e8400-e29b-41d4-a716-446655440000"), std::invalid_argument);
  EXPECT_THROW(UuidParser::Parse("urn:uuid:{550e8400-e29b-41d4-a716-44665544}"), std::invalid_argument);
}
