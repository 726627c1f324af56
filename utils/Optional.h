#pragma once

#include <cassert>
#include <utility>

namespace utils
{

struct NullOptType
{
    constexpr explicit NullOptType() {}
};

inline constexpr NullOptType NullOpt{};

// Value holder for fields that may be absent, such as the tcp subtype of a
// udp candidate or the role before negotiation.
template <typename T>
class Optional
{
public:
    constexpr Optional() noexcept : _isSet(false), _data() {}

    constexpr Optional(NullOptType) noexcept : _isSet(false), _data() {}

    template <typename... U>
    explicit Optional(U&&... args) : _isSet(true),
                                     _data(std::forward<U>(args)...)
    {
    }

    // Non-const lvalues would otherwise bind to the forwarding constructor.
    Optional(Optional& other) : _isSet(other._isSet), _data(other._data) {}
    Optional(const Optional&) = default;
    Optional(Optional&&) = default;
    Optional& operator=(const Optional&) = default;
    Optional& operator=(Optional&&) = default;

    bool isSet() const { return _isSet; }
    explicit operator bool() const { return _isSet; }

    const T& get() const
    {
        assert(_isSet);
        return _data;
    }

    constexpr T valueOr(const T& defaultValue) const { return _isSet ? _data : defaultValue; }

    template <typename... U>
    T& set(U&&... args)
    {
        _data = T(std::forward<U>(args)...);
        _isSet = true;
        return _data;
    }

    bool operator==(const Optional<T>& other) const
    {
        if (_isSet != other._isSet)
        {
            return false;
        }
        return !_isSet || _data == other._data;
    }

    bool operator!=(const Optional<T>& other) const { return !(*this == other); }

    Optional<T>& operator=(NullOptType) noexcept
    {
        clear();
        return *this;
    }

    void clear() { _isSet = false; }

    using ValueType = T;

private:
    bool _isSet;
    T _data;
};

} // namespace utils
