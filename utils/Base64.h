#pragma once

#include <cstdint>
#include <string>

namespace utils
{
class Base64
{
public:
    enum class Alphabet
    {
        STANDARD, // '+' '/' and '=' padding
        URL // '-' '_' without padding
    };

    static std::string encode(const uint8_t* input, uint32_t inputLength, Alphabet alphabet = Alphabet::STANDARD);

    // Returns number of bytes written or 0 on invalid input. Accepts either
    // alphabet and tolerates missing padding.
    static size_t decode(const std::string& input, uint8_t* output, uint32_t outputLength);

    static uint32_t decodeLength(const std::string& input);
    static uint32_t encodeLength(uint32_t inputLength, Alphabet alphabet = Alphabet::STANDARD);
};
} // namespace utils
