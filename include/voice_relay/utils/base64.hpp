#pragma once

#include <string>

namespace voice_relay::utils {

std::string base64_encode(const std::string& bytes);

// Throws std::invalid_argument on characters outside the standard alphabet or
// on a length that is not a multiple of four.
std::string base64_decode(const std::string& encoded);

}
