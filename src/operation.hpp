#pragma once

#include "checked_math.hpp"
#include "common.hpp"
#include "errors.hpp"

#include <string>

namespace monkeysim
{
    struct Operand
    {
        enum class Kind : std::uint8_t
        {
            Old = 0,
            Literal = 1,
        };

        Kind kind = Kind::Old;
        WorryLevel literal = 0;

        static constexpr Operand old() noexcept { return Operand{Kind::Old, 0}; }
        static constexpr Operand value(WorryLevel v) noexcept { return Operand{Kind::Literal, v}; }

        constexpr WorryLevel resolve(WorryLevel current) const noexcept
        {
            switch (kind)
            {
            case Kind::Old:
                return current;
            case Kind::Literal:
                return literal;
            }
            return current;
        }
    };

    enum class Operator : std::uint8_t
    {
        Add = 0,
        Multiply = 1,
    };

    inline const char *operator_symbol(Operator op) noexcept
    {
        switch (op)
        {
        case Operator::Add:
            return "+";
        case Operator::Multiply:
            return "*";
        }
        return "?";
    }

    // new = lhs op rhs
    struct Operation
    {
        Operand lhs = Operand::old();
        Operator op = Operator::Add;
        Operand rhs = Operand::old();
    };

    inline std::string operand_string(const Operand &o)
    {
        return o.kind == Operand::Kind::Old ? std::string("old") : std::to_string(o.literal);
    }

    inline std::string operation_string(const Operation &operation)
    {
        return "new = " + operand_string(operation.lhs) + " " + operator_symbol(operation.op) + " " + operand_string(operation.rhs);
    }

    // Value transform. Throws OverflowError if the result does not fit in WorryLevel.
    inline WorryLevel apply(const Operation &operation, WorryLevel current)
    {
        const WorryLevel a = operation.lhs.resolve(current);
        const WorryLevel b = operation.rhs.resolve(current);

        std::optional<WorryLevel> out;
        switch (operation.op)
        {
        case Operator::Add:
            out = checked_add(a, b);
            break;
        case Operator::Multiply:
            out = checked_mul(a, b);
            break;
        }

        if (!out)
        {
            throw OverflowError("worry level overflow evaluating '" + operation_string(operation) +
                                "' with old=" + std::to_string(current));
        }
        return *out;
    }
}
