#pragma once

#include "common.hpp"

#include <limits>
#include <optional>
#include <type_traits>

namespace monkeysim
{
    // Overflow-checked integer arithmetic. Returns nullopt when the exact result
    // does not fit in T; callers decide which error to raise.

    template <class T>
    inline std::optional<T> checked_add(T a, T b) noexcept
    {
        static_assert(std::is_integral_v<T>, "checked_add requires an integral type");
        if constexpr (std::is_signed_v<T>)
        {
            if ((b > 0 && a > std::numeric_limits<T>::max() - b) ||
                (b < 0 && a < std::numeric_limits<T>::min() - b))
            {
                return std::nullopt;
            }
        }
        else
        {
            if (a > std::numeric_limits<T>::max() - b)
            {
                return std::nullopt;
            }
        }
        return static_cast<T>(a + b);
    }

    template <class T>
    inline std::optional<T> checked_mul(T a, T b) noexcept
    {
        static_assert(std::is_integral_v<T>, "checked_mul requires an integral type");
        if (a == 0 || b == 0)
        {
            return T{0};
        }
        if constexpr (std::is_signed_v<T>)
        {
            constexpr T kMax = std::numeric_limits<T>::max();
            constexpr T kMin = std::numeric_limits<T>::min();
            if (a > 0)
            {
                if (b > 0 ? a > kMax / b : b < kMin / a)
                {
                    return std::nullopt;
                }
            }
            else
            {
                if (b > 0 ? a < kMin / b : a < kMax / b)
                {
                    return std::nullopt;
                }
            }
        }
        else
        {
            if (a > std::numeric_limits<T>::max() / b)
            {
                return std::nullopt;
            }
        }
        return static_cast<T>(a * b);
    }
}
