#pragma once

#include <string>

namespace repostore {

// Encode bytes as standard base64 with padding and no line breaks.
std::string base64_encode(const std::string& data);

// Decode standard base64. Whitespace, including the line breaks inserted
// by the remote API, is ignored. Throws std::invalid_argument on any other
// character outside the alphabet or on truncated input.
std::string base64_decode(const std::string& encoded);

}  // namespace repostore
