#pragma once

#include <string>
#include <string_view>

// Calculates the SHA256 hash of a buffer, lowercase hex encoded.
std::string calculate_sha256(std::string_view data);

// Checks `data` against a hex encoded SHA256 digest.
// Throws RvmException(ErrorKind::HexDecoding) if `expected_hex` is not a 32 byte hex string,
// ChecksumValidationError on mismatch.
void verify_sha256(std::string_view data, const std::string& expected_hex);
