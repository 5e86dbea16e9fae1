#pragma once

#include <functional>
#include <type_traits>
#include <utility>


template <typename T, typename Tag>
struct StrongTypedef
{
private:
    using Self = StrongTypedef;
    T t;

public:
    using UnderlyingType = T;
    constexpr explicit StrongTypedef(const T & t_) : t(t_) {}
    constexpr StrongTypedef() : t() {}

    constexpr StrongTypedef(const Self &) = default;
    constexpr StrongTypedef(Self &&) noexcept(std::is_nothrow_move_constructible_v<T>) = default; // NOLINT(performance-noexcept-move-constructor)

    Self & operator=(const Self &) = default;
    Self & operator=(Self &&) noexcept(std::is_nothrow_move_assignable_v<T>) = default; // NOLINT(performance-noexcept-move-constructor)

    Self & operator=(const T & rhs) { t = rhs; return *this; }

    constexpr bool operator==(const Self & rhs) const { return t == rhs.t; }
    constexpr bool operator!=(const Self & rhs) const { return t != rhs.t; }
    constexpr bool operator<(const Self & rhs) const { return t < rhs.t; }
    constexpr bool operator>(const Self & rhs) const { return t > rhs.t; }

    T & toUnderType() { return t; }
    constexpr const T & toUnderType() const { return t; }
};


namespace std
{
    template <typename T, typename Tag>
    struct hash<StrongTypedef<T, Tag>>
    {
        size_t operator()(const StrongTypedef<T, Tag> & x) const
        {
            return std::hash<T>()(x.toUnderType());
        }
    };
}
