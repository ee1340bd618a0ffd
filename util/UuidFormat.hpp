#ifndef UUID_FORMAT_H
#define UUID_FORMAT_H

#include <cstddef>
#include <cstring>                // For memcpy
#include <stdexcept>
#include <string>
#include <boost/uuid/uuid.hpp>    // For boost::uuids::uuid
#include <boost/uuid/uuid_io.hpp> // For boost::uuids::to_string

namespace util {

// Textual encodings of a UUID. The values match sipuuid_format in the C API.
enum class UuidFormat : int {
  Simple     = 0,
  Hyphenated = 1,
  Braced     = 2,
  Urn        = 3
};

// Which SIP tag feeds a session name when a format name carries a suffix.
enum class SipTag {
  None,
  From,
  To
};

struct FormatSelector {
  UuidFormat format = UuidFormat::Hyphenated;
  SipTag     tag    = SipTag::None;
};

class UuidFormatter {
public:
  static constexpr std::size_t kSimpleLength     = 32;
  static constexpr std::size_t kHyphenatedLength = 36;
  static constexpr std::size_t kBracedLength     = 38;
  static constexpr std::size_t kUrnLength        = 45;
  static constexpr const char* kUrnPrefix        = "urn:uuid:";
  static constexpr std::size_t kUrnPrefixLength  = 9;

  /**
   * @brief Number of bytes the given encoding occupies.
   */
  static constexpr std::size_t Length(UuidFormat format) noexcept {
    switch (format) {
    case UuidFormat::Simple:
      return kSimpleLength;
    case UuidFormat::Braced:
      return kBracedLength;
    case UuidFormat::Urn:
      return kUrnLength;
    case UuidFormat::Hyphenated:
    default:
      return kHyphenatedLength;
    }
  }

  /**
   * @brief Renders a UUID in the requested encoding.
   *
   * @param uuid   The 16 byte value.
   * @param format Encoding to produce.
   * @return std::string of exactly Length(format) lowercase characters.
   */
  static std::string ToString(const boost::uuids::uuid& uuid, UuidFormat format) {
    std::string hyphenated = boost::uuids::to_string(uuid);
    switch (format) {
    case UuidFormat::Simple: {
      std::string simple;
      simple.reserve(kSimpleLength);
      for (char c : hyphenated) {
        if (c != '-') {
          simple.push_back(c);
        }
      }
      return simple;
    }
    case UuidFormat::Braced:
      return "{" + hyphenated + "}";
    case UuidFormat::Urn:
      return kUrnPrefix + hyphenated;
    case UuidFormat::Hyphenated:
    default:
      return hyphenated;
    }
  }

  /**
   * @brief Copies the rendered UUID into a caller-owned buffer.
   *
   * No terminator is written. The buffer is left untouched when it is too
   * small.
   *
   * @param uuid   The 16 byte value.
   * @param format Encoding to produce.
   * @param buffer Destination, must not be null.
   * @param length Capacity of buffer in bytes.
   * @return Bytes copied, or -1 if length is smaller than the encoding.
   */
  static int CopyTo(const boost::uuids::uuid& uuid, UuidFormat format, char* buffer, std::size_t length) {
    const std::size_t required = Length(format);
    if (length < required) {
      return -1;
    }
    const std::string text = ToString(uuid, format);
    std::memcpy(buffer, text.data(), text.size());
    return static_cast<int>(text.size());
  }

  /**
   * @brief Parses a short format name such as "s", "h", "bf" or "ut".
   *
   * The first letter picks the encoding (s simple, h hyphenated, b braced,
   * u urn, case-insensitive, anything else hyphenated). An optional second
   * letter f or t selects the From or To tag for session names.
   *
   * @throws std::invalid_argument if name is empty.
   */
  static FormatSelector ParseFormatName(const std::string& name) {
    if (name.empty()) {
      throw std::invalid_argument("empty uuid format name");
    }

    FormatSelector selector;
    switch (name[0]) {
    case 's':
    case 'S':
      selector.format = UuidFormat::Simple;
      break;
    case 'u':
    case 'U':
      selector.format = UuidFormat::Urn;
      break;
    case 'b':
    case 'B':
      selector.format = UuidFormat::Braced;
      break;
    default:
      selector.format = UuidFormat::Hyphenated;
    }

    if (name.size() == 2) {
      switch (name[1]) {
      case 'f':
      case 'F':
        selector.tag = SipTag::From;
        break;
      case 't':
      case 'T':
        selector.tag = SipTag::To;
        break;
      default:
        break;
      }
    }
    return selector;
  }
};

} // namespace util

#endif // UUID_FORMAT_H
