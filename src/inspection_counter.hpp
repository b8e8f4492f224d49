#pragma once

#include "checked_math.hpp"
#include "common.hpp"
#include "errors.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace monkeysim
{
    struct InspectionRank
    {
        MonkeyId monkey = 0;
        std::uint64_t count = 0;
    };

    // Per-monkey tally of inspected items, indexed by MonkeyId.
    class InspectionCounter
    {
    public:
        InspectionCounter() = default;
        explicit InspectionCounter(std::size_t monkeys) : m_counts(monkeys, 0) {}

        void record(MonkeyId monkey)
        {
            if (monkey >= m_counts.size())
            {
                m_counts.resize(static_cast<std::size_t>(monkey) + 1, 0);
            }
            ++m_counts[monkey];
        }

        std::uint64_t count(MonkeyId monkey) const noexcept
        {
            return monkey < m_counts.size() ? m_counts[monkey] : 0;
        }

        const std::vector<std::uint64_t> &counts() const noexcept { return m_counts; }

        std::uint64_t total() const noexcept
        {
            std::uint64_t n = 0;
            for (const auto c : m_counts)
            {
                n += c;
            }
            return n;
        }

        // The two busiest monkeys, busiest first. Equal counts rank the lower
        // MonkeyId first. Throws InsufficientDataError unless at least two
        // monkeys have inspected something.
        std::pair<InspectionRank, InspectionRank> top() const
        {
            std::optional<InspectionRank> first;
            std::optional<InspectionRank> second;
            for (std::size_t i = 0; i < m_counts.size(); ++i)
            {
                const std::uint64_t c = m_counts[i];
                if (c == 0)
                {
                    continue;
                }
                const InspectionRank r{static_cast<MonkeyId>(i), c};
                if (!first || c > first->count)
                {
                    second = first;
                    first = r;
                }
                else if (!second || c > second->count)
                {
                    second = r;
                }
            }

            if (!first || !second)
            {
                std::size_t active = 0;
                for (const auto c : m_counts)
                {
                    active += (c != 0) ? 1u : 0u;
                }
                throw InsufficientDataError("inspection counter: need two monkeys with inspections, have " +
                                            std::to_string(active));
            }
            return {*first, *second};
        }

        // Product of the two highest counts.
        std::uint64_t monkey_business() const
        {
            const auto [a, b] = top();
            const auto product = checked_mul(a.count, b.count);
            if (!product)
            {
                throw OverflowError("monkey business overflow: " + std::to_string(a.count) + " * " + std::to_string(b.count));
            }
            return *product;
        }

    private:
        std::vector<std::uint64_t> m_counts;
    };
}
