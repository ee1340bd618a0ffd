#include <gtest/gtest.h>

#include <array>
#include <cstring>

#include "UuidFormat.hpp"

using util::FormatSelector;
using util::SipTag;
using util::UuidFormat;
using util::UuidFormatter;

namespace {
const boost::uuids::uuid kSample = {
    0x55, 0x0e, 0x84, 0x00, 0xe2, 0x9b, 0x41, 0xd4,
    0xa7, 0x16, 0x44, 0x66, 0x55, 0x44, 0x00, 0x00
};
} // namespace

TEST(UuidFormatTest, NilRendersZeros) {
  boost::uuids::uuid nil = {};
  EXPECT_EQ(UuidFormatter::ToString(nil, UuidFormat::Simple), "00000000000000000000000000000000");
  EXPECT_EQ(UuidFormatter::ToString(nil, UuidFormat::Hyphenated), "00000000-0000-0000-0000-000000000000");
}

TEST(UuidFormatTest, AllEncodings) {
  EXPECT_EQ(UuidFormatter::ToString(kSample, UuidFormat::Simple), "550e8400e29b41d4a716446655440000");
  EXPECT_EQ(UuidFormatter::ToString(kSample, UuidFormat::Hyphenated), "550e8400-e29b-41d4-a716-446655440000");
  EXPECT_EQ(UuidFormatter::ToString(kSample, UuidFormat::Braced), "{550e8400-e29b-41d4-a716-446655440000}");
  EXPECT_EQ(UuidFormatter::ToString(kSample, UuidFormat::Urn), "urn:uuid:550e8400-e29b-41d4-a716-446655440000");
}

TEST(UuidFormatTest, LengthsMatchRenderedText) {
  for (auto format : {UuidFormat::Simple, UuidFormat::Hyphenated, UuidFormat::Braced, UuidFormat::Urn}) {
    EXPECT_EQ(UuidFormatter::ToString(kSample, format).size(), UuidFormatter::Length(format));
  }
}

TEST(UuidFormatTest, LowercaseHex) {
  boost::uuids::uuid all_ff;
  std::memset(all_ff.data, 0xFF, 16);
  EXPECT_EQ(UuidFormatter::ToString(all_ff, UuidFormat::Simple), "ffffffffffffffffffffffffffffffff");
}

TEST(UuidFormatTest, CopyToExactBuffer) {
  std::array<char, UuidFormatter::kBracedLength> buffer;
  buffer.fill('x');
  ASSERT_EQ(UuidFormatter::CopyTo(kSample, UuidFormat::Braced, buffer.data(), buffer.size()), 38);
  EXPECT_EQ(std::string(buffer.data(), buffer.size()), "{550e8400-e29b-41d4-a716-446655440000}");
}

TEST(UuidFormatTest, CopyToShortBufferWritesNothing) {
  std::array<char, UuidFormatter::kUrnLength> buffer;
  buffer.fill('x');
  EXPECT_EQ(UuidFormatter::CopyTo(kSample, UuidFormat::Urn, buffer.data(), buffer.size() - 1), -1);
  EXPECT_EQ(std::string(buffer.data(), buffer.size()), std::string(buffer.size(), 'x'));
}

TEST(UuidFormatTest, ParseFormatName) {
  FormatSelector s = UuidFormatter::ParseFormatName("s");
  EXPECT_EQ(s.format, UuidFormat::Simple);
  EXPECT_EQ(s.tag, SipTag::None);

  EXPECT_EQ(UuidFormatter::ParseFormatName("U").format, UuidFormat::Urn);
  EXPECT_EQ(UuidFormatter::ParseFormatName("b").format, UuidFormat::Braced);
  EXPECT_EQ(UuidFormatter::ParseFormatName("h").format, UuidFormat::Hyphenated);
  EXPECT_EQ(UuidFormatter::ParseFormatName("x").format, UuidFormat::Hyphenated);

  FormatSelector bf = UuidFormatter::ParseFormatName("bf");
  EXPECT_EQ(bf.format, UuidFormat::Braced);
  EXPECT_EQ(bf.tag, SipTag::From);
  EXPECT_EQ(UuidFormatter::ParseFormatName("sT").tag, SipTag::To);
  EXPECT_EQ(UuidFormatter::ParseFormatName("sx").tag, SipTag::None);
}

TEST(UuidFormatTest, ParseFormatNameEmptyThrows) {
  EXPECT_THROW(UuidFormatter::ParseFormatName(""), std::invalid_argument);
}
