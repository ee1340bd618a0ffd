#ifndef SIP_UUID_API_H
#define SIP_UUID_API_H

#include <stddef.h> // size_t

// ============================================================
// sipuuid
// ------------------------------------------------------------
// C interface for creating, parsing, inspecting and rendering
// UUIDs. Every constructor hands out an owned, opaque handle
// that must be released with exactly one sipuuid_destroy().
// The library keeps no reference to a handle after returning
// it and cannot detect use after destroy.
// ============================================================

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief Opaque UUID handle.
 */
typedef struct sipuuid sipuuid;

/**
 * @brief Lengths of the rendered encodings, without terminator.
 */
#define SIPUUID_SIMPLE_LENGTH 32
#define SIPUUID_HYPHENATED_LENGTH 36
#define SIPUUID_BRACED_LENGTH 38
#define SIPUUID_URN_LENGTH 45

/**
 * @brief Max length of a formatted UUID including '\0'
 */
#define SIPUUID_FORMATTING_MAX_LENGTH 46

/**
 * @brief Encodings accepted by sipuuid_get_formatted()
 */
typedef enum sipuuid_format {
  SIPUUID_FORMAT_SIMPLE     = 0,
  SIPUUID_FORMAT_HYPHENATED = 1,
  SIPUUID_FORMAT_BRACED     = 2,
  SIPUUID_FORMAT_URN        = 3
} sipuuid_format;

/**
 * @brief Generate a nil UUID
 * @return a pointer to a nil UUID or NULL on allocation failure
 */
sipuuid* sipuuid_generate_nil(void);

/**
 * @brief Generate a version 4 UUID
 * @return a pointer to a version 4 UUID or NULL if no entropy is available
 */
sipuuid* sipuuid_generate_version_4(void);

/**
 * @brief Generate a version 5 UUID with the SIP namespace
 * @note RFC 7989 - Section 4.1. Constructing the Session Identifier
 * @param name The name bytes, read up to the terminator
 * @return a pointer to a version 5 UUID or NULL on error
 */
sipuuid* sipuuid_generate_version_5_sip(const char* name);

/**
 * @brief Parse a simple, hyphenated, braced or urn UUID string
 * @param uuid_string The UUID string to be parsed
 * @return a pointer to a UUID or NULL on error
 */
sipuuid* sipuuid_parse(const char* uuid_string);

/**
 * @brief Test if the given UUID is nil UUID
 * @param uuid The UUID to tested
 * @retval -1 error in input
 * @retval 1 is a nil UUID
 * @retval 0 is not a nil UUID
 */
int sipuuid_is_nil(const sipuuid* uuid);

/**
 * @brief Parse a UUID string and test it for nil
 * @retval -1 NULL or unparsable input
 * @retval 1 is a nil UUID
 * @retval 0 is not a nil UUID
 */
int sipuuid_is_nil_string(const char* uuid_string);

/**
 * @brief Copy the formatted UUID into the given buffer
 *
 * No terminator is written. Nothing is written when the buffer is too
 * small.
 *
 * @param uuid The UUID to be formatted
 * @param buffer The buffer where the formatted UUID should be copied
 * @param length The size of the buffer
 * @return the number bytes copied or -1 on error
 */
int sipuuid_get_simple(const sipuuid* uuid, char* buffer, size_t length);
int sipuuid_get_hyphenated(const sipuuid* uuid, char* buffer, size_t length);
int sipuuid_get_braced(const sipuuid* uuid, char* buffer, size_t length);
int sipuuid_get_urn(const sipuuid* uuid, char* buffer, size_t length);

/**
 * @brief Same contract as the sipuuid_get_* family, encoding chosen by value.
 *        Unknown values render hyphenated.
 */
int sipuuid_get_formatted(const sipuuid* uuid, sipuuid_format format, char* buffer, size_t length);

/**
 * @brief Destroys a UUID. NULL is ignored.
 * @param uuid The UUID to destroy
 */
void sipuuid_destroy(sipuuid* uuid);

#ifdef __cplusplus
} // extern "C"
#endif

#endif // SIP_UUID_API_H
