#pragma once

#include "common.hpp"

namespace monkeysim
{
    struct DivisibilityTest
    {
        // Positive; the loader rejects anything else.
        WorryLevel divisor = 1;
    };

    inline bool apply(const DivisibilityTest &test, WorryLevel value) noexcept
    {
        return value % test.divisor == 0;
    }

    struct RoutePreference
    {
        MonkeyId ifTrue = 0;
        MonkeyId ifFalse = 0;

        MonkeyId select(bool divisible) const noexcept { return divisible ? ifTrue : ifFalse; }
    };
}
