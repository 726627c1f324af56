#pragma once

#include <array>
#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <string>

namespace utils
{

__attribute__((format(printf, 1, 2))) inline std::string format(const char* format, ...)
{
    std::array<char, 512> buff;
    std::string formattedValue;
    va_list args;
    va_list retryArgs;
    va_start(args, format);
    va_copy(retryArgs, args);
    const auto stringLen = vsnprintf(buff.data(), buff.size(), format, args);
    if (stringLen >= 0 && static_cast<uint32_t>(stringLen) < buff.size())
    {
        formattedValue.append(buff.begin(), buff.begin() + stringLen);
    }
    else if (stringLen >= 0)
    {
        formattedValue.resize(stringLen);
        vsnprintf(&formattedValue.front(), stringLen + 1, format, retryArgs);
    }

    va_end(retryArgs);
    va_end(args);
    return formattedValue;
}

} // namespace utils
