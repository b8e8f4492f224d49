#pragma once

#include "checked_math.hpp"
#include "common.hpp"
#include "errors.hpp"
#include "monkey.hpp"

#include <set>
#include <string>

namespace monkeysim
{
    enum class ReliefMode : std::uint8_t
    {
        // value / 3, truncating toward zero.
        Divide = 0,

        // value mod M, M = product of every distinct divisor in the troop.
        Modulus = 1,
    };

    inline const char *relief_mode_name(ReliefMode mode) noexcept
    {
        switch (mode)
        {
        case ReliefMode::Divide:
            return "divide";
        case ReliefMode::Modulus:
            return "modulus";
        }
        return "unknown";
    }

    inline constexpr WorryLevel DefaultReliefDivisor = 3;

    // Bounds worry after each transform.
    //
    // Modulus mode is sound because transforms only add and multiply, both of
    // which commute with reduction mod M, and every test divisor divides M:
    // (x mod M) mod d == x mod d for each divisor d. Divisibility outcomes are
    // therefore identical to unbounded arithmetic.
    class ReliefPolicy
    {
    public:
        static ReliefPolicy divide(WorryLevel divisor = DefaultReliefDivisor)
        {
            if (divisor <= 0)
            {
                throw StateError("ReliefPolicy::divide: divisor must be positive");
            }
            return ReliefPolicy(ReliefMode::Divide, divisor);
        }

        // Throws OverflowError if the product of the distinct divisors does not fit.
        static ReliefPolicy modulus(const Troop &troop)
        {
            std::set<WorryLevel> distinct;
            for (const auto &[id, spec] : troop.specs)
            {
                if (spec.test.divisor <= 0)
                {
                    throw StateError("ReliefPolicy::modulus: non-positive divisor for " + monkey_name(id));
                }
                distinct.insert(spec.test.divisor);
            }

            WorryLevel m = 1;
            for (const WorryLevel d : distinct)
            {
                const auto next = checked_mul(m, d);
                if (!next)
                {
                    throw OverflowError("relief modulus overflow: product of " + std::to_string(distinct.size()) +
                                        " distinct divisors exceeds 64 bits (at divisor " + std::to_string(d) + ")");
                }
                m = *next;
            }
            return ReliefPolicy(ReliefMode::Modulus, m);
        }

        static ReliefPolicy for_mode(ReliefMode mode, const Troop &troop)
        {
            return mode == ReliefMode::Modulus ? modulus(troop) : divide();
        }

        ReliefMode mode() const noexcept { return m_mode; }

        // Divisor in Divide mode, M in Modulus mode.
        WorryLevel factor() const noexcept { return m_factor; }

        WorryLevel apply(WorryLevel value) const noexcept
        {
            switch (m_mode)
            {
            case ReliefMode::Divide:
                return value / m_factor;
            case ReliefMode::Modulus:
                return value % m_factor;
            }
            return value;
        }

    private:
        ReliefPolicy(ReliefMode mode, WorryLevel factor) : m_mode(mode), m_factor(factor) {}

        ReliefMode m_mode = ReliefMode::Divide;
        WorryLevel m_factor = DefaultReliefDivisor;
    };
}
