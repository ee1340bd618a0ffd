#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h> 				      // core spdlog library
#include <spdlog/cfg/env.h> 			      // for spdlog::cfg::load_env_levels()
#include <boost/program_options.hpp>

#include "SipUuid.h"
#include "UuidGenerator.hpp"

using sip::uuid::api::SipUuid;
using sip::uuid::api::UuidVersion;

static UuidVersion ParseVersion(const std::string& version) {
  if (version == "nil") {
    return UuidVersion::Nil;
  }
  if (version == "v4" || version == "4") {
    return UuidVersion::Version4;
  }
  if (version == "v5" || version == "5") {
    return UuidVersion::Version5Sip;
  }
  throw std::invalid_argument("unknown uuid version: " + version);
}

int main(int argc, char** argv) {
  // command line options
  std::string                                 generate;
  std::string                                 name;
  std::string                                 call_id;
  std::string                                 tag;
  std::string                                 parse;
  std::string                                 is_nil;
  std::string                                 format_name;
  boost::program_options::options_description desc("Options");
  desc.add_options()
      ("help,h", "Options related to the program.")
      ("generate,g", boost::program_options::value<std::string>(&generate), "Generate a uuid: nil, v4 or v5")
      ("name,n", boost::program_options::value<std::string>(&name), "Name for a v5 uuid")
      ("call-id", boost::program_options::value<std::string>(&call_id), "SIP Call-ID for a v5 session uuid")
      ("tag", boost::program_options::value<std::string>(&tag), "SIP From or To tag for a v5 session uuid")
      ("parse,p", boost::program_options::value<std::string>(&parse), "Parse a uuid string and print it")
      ("is-nil", boost::program_options::value<std::string>(&is_nil), "Exit 0 if the uuid string is nil")
      ("format,f", boost::program_options::value<std::string>(&format_name)->default_value("h"), "Output format: s, h, b or u");

  boost::program_options::variables_map vm;
  try {
    boost::program_options::store(parse_command_line(argc, argv, desc), vm);
    //print help
    if (vm.count("help")) {
      std::cout << desc << std::endl;
      return EXIT_SUCCESS;
    }
    boost::program_options::notify(vm);
  } catch (std::exception& e) {
    std::cout << e.what() << std::endl;
    return EXIT_FAILURE;
  }

  // load log levels from env variable (SPDLOG_LEVEL=debug) info is default
  spdlog::cfg::load_env_levels();

  try {
    const util::UuidFormat format = util::UuidFormatter::ParseFormatName(format_name).format;

    if (vm.count("is-nil")) {
      int ret = sipuuid_is_nil_string(is_nil.c_str());
      if (ret < 0) {
        spdlog::error("\"{}\" could not be parsed as UUID", is_nil);
      }
      return ret == 1 ? EXIT_SUCCESS : EXIT_FAILURE;
    }

    if (vm.count("parse")) {
      std::cout << SipUuid::Parse(parse).ToString(format) << std::endl;
      return EXIT_SUCCESS;
    }

    if (vm.count("generate")) {
      UuidVersion version = ParseVersion(generate);
      if (version == UuidVersion::Version5Sip && vm.count("call-id")) {
        name = util::UuidGenerator::SessionName(call_id, tag);
      } else if (version == UuidVersion::Version5Sip && !vm.count("name")) {
        throw std::invalid_argument("v5 requires --name or --call-id");
      }
      std::cout << sip::uuid::api::GenerateFormatted(version, format, name) << std::endl;
      return EXIT_SUCCESS;
    }
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return EXIT_FAILURE;
  }

  std::cout << desc << std::endl;
  return EXIT_FAILURE;
}
