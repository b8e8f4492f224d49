#pragma once

#include "common.hpp"
#include "divisibility.hpp"
#include "errors.hpp"
#include "operation.hpp"

#include <map>
#include <utility>
#include <vector>

namespace monkeysim
{
    struct MonkeySpec
    {
        Operation operation{};
        DivisibilityTest test{};
        RoutePreference route{};
    };

    // Input to a simulation: one spec and one starting item list per monkey.
    struct Troop
    {
        std::map<MonkeyId, MonkeySpec> specs;
        std::map<MonkeyId, std::vector<WorryLevel>> items;

        void add(MonkeyId id, MonkeySpec spec, std::vector<WorryLevel> startingItems)
        {
            auto [it, inserted] = specs.emplace(id, spec);
            if (!inserted)
            {
                throw StateError("Troop::add: duplicate " + monkey_name(id));
            }
            items[id] = std::move(startingItems);
        }

        std::size_t size() const noexcept { return specs.size(); }

        std::size_t item_count() const noexcept
        {
            std::size_t n = 0;
            for (const auto &[id, list] : items)
            {
                n += list.size();
            }
            return n;
        }
    };
}
