#ifndef SIP_UUID_H
#define SIP_UUID_H

#include <memory>
#include <string>
#include <stdexcept>

#include <boost/uuid/uuid.hpp> // Boost UUID class for the raw 16 byte value

#include "SipUuidAPI.h" // C interface this class owns handles of
#include "UuidFormat.hpp"

namespace sip::uuid::api {

// Which generator GenerateFormatted() runs.
enum class UuidVersion {
  Nil,
  Version4,
  Version5Sip
};

// ============================================================
// SipUuid
// ------------------------------------------------------------
// Owns exactly one sipuuid handle and releases it with
// sipuuid_destroy() when it goes out of scope. Move-only, so
// a handle can never be destroyed twice through this class.
// ============================================================
class SipUuid {
public:
  // Factories, throw when the C constructor returns NULL
  static SipUuid Nil();
  static SipUuid Version4();
  static SipUuid Version5Sip(const std::string& name);
  static SipUuid Parse(const std::string& text);

  // Takes ownership of a handle returned by a sipuuid_* constructor
  explicit SipUuid(sipuuid* handle);

  SipUuid(SipUuid&&) noexcept            = default;
  SipUuid& operator=(SipUuid&&) noexcept = default;
  SipUuid(const SipUuid&)                = delete;
  SipUuid& operator=(const SipUuid&)     = delete;

  // Getters
  bool               IsNil() const;
  std::string        ToString(util::UuidFormat format = util::UuidFormat::Hyphenated) const;
  boost::uuids::uuid Value() const;
  const sipuuid*     get() const { return handle_.get(); }

private:
  struct Deleter {
    void operator()(sipuuid* handle) const noexcept { sipuuid_destroy(handle); }
  };

  std::unique_ptr<sipuuid, Deleter> handle_;
};

/**
 * @brief Generates a UUID and renders it in one call.
 *
 * @param version Generator to run.
 * @param format  Encoding of the result.
 * @param name    Name bytes, only read for UuidVersion::Version5Sip.
 * @return std::string The rendered UUID.
 * @throws std::runtime_error if generation or rendering fails.
 */
std::string GenerateFormatted(UuidVersion version, util::UuidFormat format, const std::string& name = "");

} // namespace sip::uuid::api

#endif // SIP_UUID_H
