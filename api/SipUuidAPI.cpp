#include "SipUuidAPI.h"

#include <cstring>
#include <exception>
#include <mutex>
#include <new>
#include <stdexcept>

#include <spdlog/cfg/env.h> // for spdlog::cfg::load_env_levels()
#include <spdlog/spdlog.h>  // spdlog core logging library

#include <boost/uuid/entropy_error.hpp> // boost::uuids::entropy_error
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp> // to_string support for UUIDs

#include "UuidFormat.hpp"
#include "UuidGenerator.hpp"
#include "UuidParser.hpp"

// The value behind an opaque handle. Defined here only, so callers cannot
// look inside it.
struct sipuuid {
  boost::uuids::uuid value;
};

namespace {

// load log levels from env variable (SPDLOG_LEVEL=debug) info is default
void LoadLogLevels() {
  static std::once_flag once;
  std::call_once(once, [] { spdlog::cfg::load_env_levels(); });
}

sipuuid* MakeHandle(const boost::uuids::uuid& value) {
  sipuuid* handle = new sipuuid{value};
  spdlog::debug("sipuuid allocated {} = {}", static_cast<void*>(handle), boost::uuids::to_string(value));
  return handle;
}

int Render(const char* func, const sipuuid* uuid, util::UuidFormat format, char* buffer, size_t length) {
  if (uuid == nullptr || buffer == nullptr) {
    spdlog::debug("{}: null {} rejected", func, uuid == nullptr ? "uuid" : "buffer");
    return -1;
  }

  try {
    int written = util::UuidFormatter::CopyTo(uuid->value, format, buffer, length);
    if (written < 0) {
      spdlog::debug("{}: buffer of {} bytes too small, {} required", func, length, util::UuidFormatter::Length(format));
    }
    return written;
  } catch (const std::exception& e) {
    spdlog::error("{}: {}", func, e.what());
    return -1;
  }
}

} // namespace

extern "C" {

sipuuid* sipuuid_generate_nil(void) {
  LoadLogLevels();
  try {
    return MakeHandle(util::UuidGenerator::Nil());
  } catch (const std::bad_alloc& e) {
    spdlog::error("sipuuid_generate_nil: {}", e.what());
    return nullptr;
  }
}

sipuuid* sipuuid_generate_version_4(void) {
  LoadLogLevels();
  try {
    return MakeHandle(util::UuidGenerator::Random());
  } catch (const boost::uuids::entropy_error& e) {
    spdlog::critical("sipuuid_generate_version_4: entropy source failed: {}", e.what());
    return nullptr;
  } catch (const std::exception& e) {
    spdlog::error("sipuuid_generate_version_4: {}", e.what());
    return nullptr;
  }
}

sipuuid* sipuuid_generate_version_5_sip(const char* name) {
  LoadLogLevels();
  if (name == nullptr) {
    spdlog::debug("sipuuid_generate_version_5_sip: null name rejected");
    return nullptr;
  }

  try {
    return MakeHandle(util::UuidGenerator::NameBasedSip(name, std::strlen(name)));
  } catch (const std::exception& e) {
    spdlog::error("sipuuid_generate_version_5_sip: {}", e.what());
    return nullptr;
  }
}

sipuuid* sipuuid_parse(const char* uuid_string) {
  LoadLogLevels();
  if (uuid_string == nullptr) {
    spdlog::debug("sipuuid_parse: null string rejected");
    return nullptr;
  }

  try {
    return MakeHandle(util::UuidParser::Parse(uuid_string));
  } catch (const std::invalid_argument& e) {
    spdlog::debug("sipuuid_parse: \"{}\" rejected: {}", uuid_string, e.what());
    return nullptr;
  } catch (const std::exception& e) {
    spdlog::error("sipuuid_parse: {}", e.what());
    return nullptr;
  }
}

int sipuuid_is_nil(const sipuuid* uuid) {
  if (uuid == nullptr) {
    return -1;
  }
  return uuid->value.is_nil() ? 1 : 0;
}

int sipuuid_is_nil_string(const char* uuid_string) {
  sipuuid* uuid = sipuuid_parse(uuid_string);
  if (uuid == nullptr) {
    return -1;
  }
  int ret = sipuuid_is_nil(uuid);
  sipuuid_destroy(uuid);
  return ret;
}

int sipuuid_get_simple(const sipuuid* uuid, char* buffer, size_t length) {
  return Render(__func__, uuid, util::UuidFormat::Simple, buffer, length);
}

int sipuuid_get_hyphenated(const sipuuid* uuid, char* buffer, size_t length) {
  return Render(__func__, uuid, util::UuidFormat::Hyphenated, buffer, length);
}

int sipuuid_get_braced(const sipuuid* uuid, char* buffer, size_t length) {
  return Render(__func__, uuid, util::UuidFormat::Braced, buffer, length);
}

int sipuuid_get_urn(const sipuuid* uuid, char* buffer, size_t length) {
  return Render(__func__, uuid, util::UuidFormat::Urn, buffer, length);
}

int sipuuid_get_formatted(const sipuuid* uuid, sipuuid_format format, char* buffer, size_t length) {
  switch (format) {
  case SIPUUID_FORMAT_SIMPLE:
    return sipuuid_get_simple(uuid, buffer, length);
  case SIPUUID_FORMAT_BRACED:
    return sipuuid_get_braced(uuid, buffer, length);
  case SIPUUID_FORMAT_URN:
    return sipuuid_get_urn(uuid, buffer, length);
  case SIPUUID_FORMAT_HYPHENATED:
  default:
    return sipuuid_get_hyphenated(uuid, buffer, length);
  }
}

void sipuuid_destroy(sipuuid* uuid) {
  if (uuid != nullptr) {
    spdlog::debug("sipuuid released {}", static_cast<void*>(uuid));
    delete uuid;
  }
}

} // extern "C"
