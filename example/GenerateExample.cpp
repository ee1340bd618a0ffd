#include <iostream>
#include "SipUuid.h"

int main(int argc, char** argv) {
  // name for the version 5 uuid, defaults to an RFC 3261 style Call-ID
  std::string name = argc > 1 ? argv[1] : "a84b4c76e66710@pc33.atlanta.com";

  const util::UuidFormat formats[] = {util::UuidFormat::Simple, util::UuidFormat::Hyphenated,
                                      util::UuidFormat::Braced, util::UuidFormat::Urn};
  try {
    auto nil = sip::uuid::api::SipUuid::Nil();
    auto v4  = sip::uuid::api::SipUuid::Version4();
    auto v5  = sip::uuid::api::SipUuid::Version5Sip(name);

    for (auto format : formats) {
      std::cout << "nil: " << nil.ToString(format) << std::endl;
      std::cout << "v4:  " << v4.ToString(format) << std::endl;
      std::cout << "v5:  " << v5.ToString(format) << std::endl;
    }
  } catch (const std::exception& e) {
    // Print any exceptions that occur
    std::cerr << "Exception: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
