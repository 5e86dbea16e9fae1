#pragma once

#include <array>
#include <string_view>

#include <base/types.h>
#include <openssl/sha.h>


namespace Gluid
{

using SHA256Digest = std::array<UInt8, SHA256_DIGEST_LENGTH>;

/// Hashes `text` and returns the raw digest.
SHA256Digest encodeSHA256(std::string_view text);

/// `out` must be at least 32 bytes long.
void encodeSHA256(const void * text, size_t size, unsigned char * out);

/// Returns concatenation of error strings for all errors that OpenSSL has recorded, emptying the error queue.
String getOpenSSLErrors();

}
