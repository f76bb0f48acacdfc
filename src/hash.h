#pragma once

#include <string>

namespace peerq {

/**
 * SHA-1 digest of `input` as 40 lowercase hex characters.
 * Used to derive stable, collision-resistant names for incomplete files.
 */
std::string sha1_hex(const std::string& input);

} // namespace peerq
