#include "SipUuid.h"

#include <array>

#include <spdlog/spdlog.h> // spdlog core logging library

#include "UuidParser.hpp"

namespace sip::uuid::api {
SipUuid::SipUuid(sipuuid* handle) : handle_(handle) {
  if (!handle_) {
    throw std::invalid_argument("SipUuid requires a non-null handle");
  }
}

SipUuid SipUuid::Nil() {
  sipuuid* handle = sipuuid_generate_nil();
  if (!handle) {
    throw std::runtime_error("Failed to allocate nil uuid.");
  }
  return SipUuid(handle);
}

SipUuid SipUuid::Version4() {
  sipuuid* handle = sipuuid_generate_version_4();
  if (!handle) {
    throw std::runtime_error("Failed to generate version 4 uuid.");
  }
  return SipUuid(handle);
}

SipUuid SipUuid::Version5Sip(const std::string& name) {
  // the C interface stops at the first NUL
  if (name.find('\0') != std::string::npos) {
    throw std::invalid_argument("uuid name must not contain NUL bytes");
  }
  sipuuid* handle = sipuuid_generate_version_5_sip(name.c_str());
  if (!handle) {
    throw std::runtime_error("Failed to generate version 5 uuid.");
  }
  return SipUuid(handle);
}

SipUuid SipUuid::Parse(const std::string& text) {
  sipuuid* handle = sipuuid_parse(text.c_str());
  if (!handle) {
    throw std::invalid_argument(fmt::format("Invalid uuid string: \"{}\"", text));
  }
  return SipUuid(handle);
}

bool SipUuid::IsNil() const {
  int ret = sipuuid_is_nil(handle_.get());
  if (ret < 0) {
    throw std::runtime_error("uuid handle has been moved from");
  }
  return ret == 1;
}

std::string SipUuid::ToString(util::UuidFormat format) const {
  std::array<char, SIPUUID_FORMATTING_MAX_LENGTH> buffer{};
  int written = sipuuid_get_formatted(handle_.get(), static_cast<sipuuid_format>(format), buffer.data(), buffer.size());
  if (written < 0) {
    throw std::runtime_error("Failed to format uuid.");
  }
  return std::string(buffer.data(), static_cast<size_t>(written));
}

boost::uuids::uuid SipUuid::Value() const {
  // simple form carries the 16 bytes without separators
  return util::UuidParser::Parse(ToString(util::UuidFormat::Simple));
}

std::string GenerateFormatted(UuidVersion version, util::UuidFormat format, const std::string& name) {
  switch (version) {
  case UuidVersion::Nil:
    return SipUuid::Nil().ToString(format);
  case UuidVersion::Version4:
    return SipUuid::Version4().ToString(format);
  case UuidVersion::Version5Sip:
    spdlog::debug("Generating version 5 uuid for name={}", name);
    return SipUuid::Version5Sip(name).ToString(format);
  }
  throw std::runtime_error("not implemented uuid version");
}
} // namespace sip::uuid::api
