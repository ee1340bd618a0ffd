#include <cstdio>
#include <cstring>
#include "SipUuidAPI.h"

int main(int argc, char** argv) {
  if (argc != 2) {
    fprintf(stderr, "Usage: %s <uuid>\n", argv[0]);
    return 1;
  }

  // parse the uuid given on the command line
  sipuuid* uuid = sipuuid_parse(argv[1]);
  if (!uuid) {
    fprintf(stderr, "ERROR: given string \"%s\" could not be parsed as UUID\n", argv[1]);
    return 1;
  }

  // render into a terminated buffer, the library writes no '\0'
  char uuid_string[SIPUUID_FORMATTING_MAX_LENGTH];
  memset(uuid_string, 0, sizeof(uuid_string));
  if (sipuuid_get_hyphenated(uuid, uuid_string, sizeof(uuid_string)) > 0) {
    fprintf(stdout, "%s\n", uuid_string);
  }

  int ret = sipuuid_is_nil(uuid);

  // exactly one destroy per handle
  sipuuid_destroy(uuid);

  return ret == 0 ? 0 : 1;
}
