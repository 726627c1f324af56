#include "utils/Base64.h"
#include <algorithm>
#include <cassert>
#include <cctype>

namespace utils
{

namespace
{
const char STANDARD_TABLE[65] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
const char URL_TABLE[65] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

// '+' and '-' map to 62, '/' and '_' map to 63
// clang-format off
const uint8_t REVERSE_TABLE[128] = {
    64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
    64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64,
    64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 64, 62, 64, 62, 64, 63,
    52, 53, 54, 55, 56, 57, 58, 59, 60, 61, 64, 64, 64, 64, 64, 64,
    64,  0,  1,  2,  3,  4,  5,  6,  7,  8,  9, 10, 11, 12, 13, 14,
    15, 16, 17, 18, 19, 20, 21, 22, 23, 24, 25, 64, 64, 64, 64, 63,
    64, 26, 27, 28, 29, 30, 31, 32, 33, 34, 35, 36, 37, 38, 39, 40,
    41, 42, 43, 44, 45, 46, 47, 48, 49, 50, 51, 64, 64, 64, 64, 64
};
// clang-format on
} // namespace

std::string Base64::encode(const uint8_t* input, const uint32_t length, const Alphabet alphabet)
{
    std::string encodedText;
    if (length == 0)
    {
        return encodedText;
    }

    const char* table = (alphabet == Alphabet::URL ? URL_TABLE : STANDARD_TABLE);
    const auto outputLength = encodeLength(length, alphabet);
    encodedText.reserve(outputLength);

    uint32_t bitsCollected = 0;
    uint32_t accumulator = 0;

    for (const uint8_t* p = input; p != input + length; ++p)
    {
        accumulator = (accumulator << 8) | (*p & 0xffu);
        bitsCollected += 8;
        while (bitsCollected >= 6)
        {
            bitsCollected -= 6;
            encodedText += table[(accumulator >> bitsCollected) & 0x3fu];
        }
    }

    if (bitsCollected > 0)
    {
        assert(bitsCollected < 6);
        accumulator <<= 6 - bitsCollected;
        encodedText += table[accumulator & 0x3fu];
    }

    while (encodedText.size() < outputLength)
    {
        encodedText += '=';
    }

    return encodedText;
}

size_t Base64::decode(const std::string& input, uint8_t* output, const uint32_t outputLength)
{
    uint32_t bitsCollected = 0;
    uint32_t accumulator = 0;
    uint32_t index = 0;

    for (auto i = input.begin(); i != input.end() && index < outputLength; ++i)
    {
        const auto ch = static_cast<unsigned char>(*i);
        if (std::isspace(ch) || ch == '=')
        {
            continue;
        }
        if (ch > 127 || REVERSE_TABLE[ch] > 63)
        {
            return 0;
        }
        accumulator = (accumulator << 6) | REVERSE_TABLE[ch];
        bitsCollected += 6;
        if (bitsCollected >= 8)
        {
            bitsCollected -= 8;
            output[index++] = static_cast<uint8_t>((accumulator >> bitsCollected) & 0xffu);
        }
    }

    return index;
}

uint32_t Base64::decodeLength(const std::string& input)
{
    const auto symbols = input.length() - std::count(input.begin(), input.end(), '=');
    return static_cast<uint32_t>(symbols * 6 / 8);
}

uint32_t Base64::encodeLength(const uint32_t inputLength, const Alphabet alphabet)
{
    if (alphabet == Alphabet::URL)
    {
        return (inputLength * 8 + 5) / 6;
    }
    return 4 * ((inputLength + 2) / 3);
}

} // namespace utils
