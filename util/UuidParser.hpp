#ifndef UUID_PARSER_H
#define UUID_PARSER_H

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <boost/uuid/uuid.hpp>             // For boost::uuids::uuid
#include <boost/uuid/string_generator.hpp> // For boost::uuids::string_generator

#include "UuidFormat.hpp"

namespace util {

class UuidParser {
public:
  /**
   * @brief Parses a UUID from any of its four textual encodings.
   *
   * Accepted inputs, hex digits in either case:
   *   simple      550e8400e29b41d4a716446655440000
   *   hyphenated  550e8400-e29b-41d4-a716-446655440000
   *   braced      {550e8400-e29b-41d4-a716-446655440000}
   *   urn         urn:uuid:550e8400-e29b-41d4-a716-446655440000
   *
   * boost::uuids::string_generator is lenient about dash placement and
   * mixed braces, so the layout is checked here before decoding.
   *
   * @param text The candidate string, without terminator.
   * @return boost::uuids::uuid The decoded value.
   * @throws std::invalid_argument if text matches none of the encodings.
   */
  static boost::uuids::uuid Parse(std::string_view text) {
    std::string_view body;
    switch (text.size()) {
    case UuidFormatter::kSimpleLength:
      if (!IsHexRun(text)) {
        throw std::invalid_argument("invalid simple uuid");
      }
      body = text;
      break;
    case UuidFormatter::kHyphenatedLength:
      body = text;
      break;
    case UuidFormatter::kBracedLength:
      if (text.front() != '{' || text.back() != '}') {
        throw std::invalid_argument("invalid braced uuid");
      }
      body = text.substr(1, UuidFormatter::kHyphenatedLength);
      break;
    case UuidFormatter::kUrnLength:
      if (text.substr(0, UuidFormatter::kUrnPrefixLength) != UuidFormatter::kUrnPrefix) {
        throw std::invalid_argument("invalid urn uuid prefix");
      }
      body = text.substr(UuidFormatter::kUrnPrefixLength);
      break;
    default:
      throw std::invalid_argument("invalid uuid length: " + std::to_string(text.size()));
    }

    if (body.size() == UuidFormatter::kHyphenatedLength && !IsHyphenated(body)) {
      throw std::invalid_argument("invalid hyphenated uuid");
    }

    // throws std::runtime_error, never reached after the checks above
    boost::uuids::string_generator gen;
    return gen(body.begin(), body.end());
  }

private:
  static bool IsHexDigit(char c) noexcept {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
  }

  static bool IsHexRun(std::string_view text) noexcept {
    for (char c : text) {
      if (!IsHexDigit(c)) {
        return false;
      }
    }
    return true;
  }

  // 8-4-4-4-12
  static bool IsHyphenated(std::string_view text) noexcept {
    for (std::size_t i = 0; i < text.size(); ++i) {
      const bool dash_position = (i == 8 || i == 13 || i == 18 || i == 23);
      if (dash_position ? text[i] != '-' : !IsHexDigit(text[i])) {
        return false;
      }
    }
    return true;
  }
};

} // namespace util

#endif // UUID_PARSER_H
