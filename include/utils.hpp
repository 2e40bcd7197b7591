// utils.hpp - Common utility functions

#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace utils {
    std::string timestamp();

    // RFC 4648 standard alphabet, '=' padded, no line breaks
    std::string base64Encode(const std::vector<uint8_t>& data);
}
