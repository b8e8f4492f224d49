#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <limits>
#include <string>
#include <vector>

namespace monkeysim
{
    using MonkeyId = std::uint32_t;
    using WorryLevel = std::int64_t;
    using RoundIndex = std::uint64_t;

    // Items waiting for a monkey, inspected front to back.
    using ItemQueue = std::deque<WorryLevel>;

    inline constexpr MonkeyId NoMonkey = std::numeric_limits<MonkeyId>::max();

    inline std::string monkey_name(MonkeyId id)
    {
        return "monkey " + std::to_string(id);
    }
}
