#pragma once

#include <cassert>
#include <cctype>
#include <cstring>
#include <stddef.h>
#include <string>
#include <strings.h>
namespace utils
{

namespace StringTokenizer
{

struct Token
{
    const char* start;
    size_t length;
    const char* next;
    size_t remainingLength;
    char delimiter;

    bool empty() const { return start == nullptr; }
    std::string str() const { return empty() ? std::string() : std::string(start, length); }
};

inline bool isDelimiter(char c, const char* delimiterList)
{
    return c != '\0' && std::strchr(delimiterList, c) != nullptr;
}

// Leading delimiters are skipped, so consecutive delimiters never yield empty tokens.
inline Token tokenize(const char* data, const size_t length, const char* delimiterList)
{
    assert(data);
    size_t offset = 0;
    while (offset < length && isDelimiter(data[offset], delimiterList))
    {
        ++offset;
    }
    if (offset == length)
    {
        return Token({nullptr, 0, nullptr, 0, 0});
    }

    const char* start = data + offset;
    const size_t remainingLength = length - offset;
    for (size_t i = 0; i < remainingLength; ++i)
    {
        if (!isDelimiter(start[i], delimiterList))
        {
            continue;
        }

        if (i == remainingLength - 1)
        {
            return Token({start, i, nullptr, 0, 0});
        }
        return Token({start, i, &(start[i + 1]), remainingLength - i - 1, start[i]});
    }

    return Token({start, remainingLength, nullptr, 0, 0});
}

inline Token tokenize(const Token& token, const char* delimiters)
{
    if (token.next == nullptr)
    {
        return Token({nullptr, 0, nullptr, 0, 0});
    }
    return tokenize(token.next, token.remainingLength, delimiters);
}

inline Token tokenize(const Token& token, const char delimiter)
{
    const char delimiters[] = {delimiter, 0};
    return tokenize(token, delimiters);
}

inline Token tokenize(const char* data, const size_t length, const char delimiter)
{
    const char delimiters[] = {delimiter, 0};
    return tokenize(data, length, delimiters);
}

inline bool isEqual(const Token& token, const char* other)
{
    const auto otherLength = strlen(other);
    if (token.length != otherLength)
    {
        return false;
    }
    return otherLength == 0 || strncmp(token.start, other, token.length) == 0;
}

inline bool isEqualIgnoreCase(const Token& token, const char* other)
{
    const auto otherLength = strlen(other);
    if (token.length != otherLength)
    {
        return false;
    }
    return otherLength == 0 || strncasecmp(token.start, other, token.length) == 0;
}

inline bool startsWith(const Token& token, const char* prefix)
{
    const auto prefixLength = strlen(prefix);
    return !token.empty() && token.length >= prefixLength && strncmp(token.start, prefix, prefixLength) == 0;
}

inline bool startsWithIgnoreCase(const Token& token, const char* prefix)
{
    const auto prefixLength = strlen(prefix);
    return !token.empty() && token.length >= prefixLength && strncasecmp(token.start, prefix, prefixLength) == 0;
}

inline bool isNumber(const Token& token)
{
    if (token.empty() || token.length == 0)
    {
        return false;
    }
    for (size_t i = 0; i < token.length; ++i)
    {
        if (!std::isdigit(static_cast<unsigned char>(token.start[i])))
        {
            return false;
        }
    }
    return true;
}

} // namespace StringTokenizer

} // namespace utils
