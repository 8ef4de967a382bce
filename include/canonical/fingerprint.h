// include/canonical/fingerprint.h
#pragma once

#include "../registry_error/result.h"
#include <string>

namespace schemata {
namespace canonical {

/**
 * @brief SHA-256 of the input, rendered as 64 lowercase hex characters.
 * Fails with INTERNAL_ERROR only if the OpenSSL digest itself fails.
 */
registry::Result<std::string> sha256Hex(const std::string& data);

} // namespace canonical
} // namespace schemata
