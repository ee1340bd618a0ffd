#ifndef UUID_GENERATOR_H
#define UUID_GENERATOR_H

#include <cstddef>
#include <string>
#include <boost/uuid/uuid.hpp>                // For boost::uuids::uuid
#include <boost/uuid/nil_generator.hpp>       // For boost::uuids::nil_uuid
#include <boost/uuid/random_generator.hpp>    // For boost::uuids::random_generator
#include <boost/uuid/name_generator_sha1.hpp> // For boost::uuids::name_generator_sha1

namespace util {

class UuidGenerator {
public:
  /**
   * @brief UUID namespace for SIP session identifiers.
   * @note RFC 7989 - Section 4.1. Constructing the Session Identifier
   */
  static const boost::uuids::uuid& SipNamespace() noexcept {
    // a58587da-c93d-11e2-ae90-f4ea67801e29
    static const boost::uuids::uuid kSipNamespace = {{
        0xa5, 0x85, 0x87, 0xda, 0xc9, 0x3d, 0x11, 0xe2,
        0xae, 0x90, 0xf4, 0xea, 0x67, 0x80, 0x1e, 0x29
    }};
    return kSipNamespace;
  }

  static boost::uuids::uuid Nil() noexcept {
    return boost::uuids::nil_uuid();
  }

  /**
   * @brief Version 4 UUID from the operating system entropy source.
   * @throws boost::uuids::entropy_error if the entropy source fails.
   */
  static boost::uuids::uuid Random() {
    boost::uuids::random_generator gen;
    return gen();
  }

  /**
   * @brief Version 5 UUID of the SIP namespace and the given bytes.
   *
   * @param name       Raw bytes, hashed as-is.
   * @param byte_count Number of bytes in name.
   */
  static boost::uuids::uuid NameBasedSip(const void* name, std::size_t byte_count) {
    boost::uuids::name_generator_sha1 gen(SipNamespace());
    return gen(name, byte_count);
  }

  static boost::uuids::uuid NameBasedSip(const std::string& name) {
    return NameBasedSip(name.data(), name.size());
  }

  /**
   * @brief Name input for a session UUID: the Call-ID followed by the From
   * or To tag.
   */
  static std::string SessionName(const std::string& call_id, const std::string& tag) {
    return call_id + tag;
  }
};

} // namespace util

#endif // UUID_GENERATOR_H
