#pragma once

#include "common.hpp"
#include "divisibility.hpp"
#include "errors.hpp"
#include "monkey.hpp"
#include "operation.hpp"

#include <charconv>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace monkeysim
{
    // Parser for the troop description format:
    //
    //   Monkey 0:
    //     Starting items: 79, 98
    //     Operation: new = old * 19
    //     Test: divisible by 23
    //       If true: throw to monkey 2
    //       If false: throw to monkey 3
    //
    // Blocks are separated by one or more blank lines. Ids must count up
    // from 0. Route targets are not checked here; the simulation rejects
    // unknown targets when an item is actually thrown.
    class TroopParser
    {
    public:
        explicit TroopParser(std::string_view text) : m_text(text) {}

        Troop parse()
        {
            Troop troop;
            skip_blank_lines_();
            if (eof_())
            {
                fail_("empty input, expected 'Monkey'");
            }

            MonkeyId expected = 0;
            while (!eof_())
            {
                const std::size_t headerPos = m_pos;
                MonkeySpec spec;
                std::vector<WorryLevel> items;
                const MonkeyId id = parse_monkey_(spec, items);
                if (id != expected)
                {
                    fail_at_(headerPos, "expected Monkey " + std::to_string(expected) + ", found Monkey " + std::to_string(id));
                }
                troop.add(id, spec, std::move(items));
                ++expected;

                if (skip_blank_lines_() == 0 && !eof_())
                {
                    fail_("expected blank line between monkeys");
                }
            }
            return troop;
        }

    private:
        MonkeyId parse_monkey_(MonkeySpec &spec, std::vector<WorryLevel> &items)
        {
            expect_("Monkey");
            require_spaces_();
            const MonkeyId id = parse_id_("monkey id");
            skip_spaces_();
            expect_(":");
            end_line_();

            begin_field_("Starting items");
            items.push_back(parse_worry_("item"));
            skip_spaces_();
            while (peek_() == ',')
            {
                ++m_pos;
                skip_spaces_();
                items.push_back(parse_worry_("item"));
                skip_spaces_();
            }
            end_line_();

            begin_field_("Operation");
            expect_("new");
            skip_spaces_();
            expect_("=");
            skip_spaces_();
            spec.operation.lhs = parse_operand_();
            skip_spaces_();
            spec.operation.op = parse_operator_();
            skip_spaces_();
            spec.operation.rhs = parse_operand_();
            end_line_();

            begin_field_("Test");
            expect_("divisible by");
            skip_spaces_();
            const std::size_t divisorPos = m_pos;
            spec.test.divisor = parse_worry_("test divisor");
            if (spec.test.divisor <= 0)
            {
                fail_at_(divisorPos, "test divisor must be positive");
            }
            end_line_();

            begin_field_("If true");
            spec.route.ifTrue = parse_throw_();
            end_line_();

            begin_field_("If false");
            spec.route.ifFalse = parse_throw_();
            end_line_();

            return id;
        }

        // Leading indentation, the field name and the colon.
        void begin_field_(std::string_view name)
        {
            skip_spaces_();
            expect_(name);
            skip_spaces_();
            expect_(":");
            skip_spaces_();
        }

        Operand parse_operand_()
        {
            if (accept_("old"))
            {
                return Operand::old();
            }
            if (is_digit_(peek_()))
            {
                return Operand::value(parse_worry_("operand"));
            }
            fail_("expected 'old' or a number");
        }

        Operator parse_operator_()
        {
            if (accept_("+"))
            {
                return Operator::Add;
            }
            if (accept_("*"))
            {
                return Operator::Multiply;
            }
            fail_("expected '+' or '*'");
        }

        MonkeyId parse_throw_()
        {
            expect_("throw to monkey");
            skip_spaces_();
            return parse_id_("target monkey id");
        }

        MonkeyId parse_id_(const char *what)
        {
            const std::size_t start = m_pos;
            const auto v = parse_unsigned_(what);
            if (v >= NoMonkey)
            {
                fail_at_(start, std::string(what) + " out of range");
            }
            return static_cast<MonkeyId>(v);
        }

        WorryLevel parse_worry_(const char *what)
        {
            const std::size_t start = m_pos;
            const auto v = parse_unsigned_(what);
            if (v > static_cast<std::uint64_t>(std::numeric_limits<WorryLevel>::max()))
            {
                fail_at_(start, std::string(what) + " out of range");
            }
            return static_cast<WorryLevel>(v);
        }

        std::uint64_t parse_unsigned_(const char *what)
        {
            if (!is_digit_(peek_()))
            {
                fail_(std::string("expected number for ") + what);
            }
            std::uint64_t v = 0;
            const char *first = m_text.data() + m_pos;
            const char *last = m_text.data() + m_text.size();
            const auto r = std::from_chars(first, last, v);
            if (r.ec != std::errc())
            {
                fail_(std::string(what) + " out of range");
            }
            m_pos += static_cast<std::size_t>(r.ptr - first);
            return v;
        }

        void end_line_()
        {
            skip_spaces_();
            if (eof_())
            {
                return;
            }
            if (accept_("\r\n") || accept_("\n"))
            {
                return;
            }
            fail_("expected end of line");
        }

        // Returns the number of line breaks consumed.
        std::size_t skip_blank_lines_()
        {
            std::size_t lines = 0;
            while (!eof_())
            {
                std::size_t p = m_pos;
                while (p < m_text.size() && is_space_(m_text[p]))
                {
                    ++p;
                }
                if (p == m_text.size())
                {
                    m_pos = p;
                    return lines;
                }
                if (m_text[p] == '\n')
                {
                    m_pos = p + 1;
                    ++lines;
                    continue;
                }
                if (m_text[p] == '\r' && p + 1 < m_text.size() && m_text[p + 1] == '\n')
                {
                    m_pos = p + 2;
                    ++lines;
                    continue;
                }
                return lines;
            }
            return lines;
        }

        void skip_spaces_()
        {
            while (!eof_() && is_space_(m_text[m_pos]))
            {
                ++m_pos;
            }
        }

        void require_spaces_()
        {
            if (eof_() || !is_space_(m_text[m_pos]))
            {
                fail_("expected whitespace");
            }
            skip_spaces_();
        }

        bool accept_(std::string_view token)
        {
            if (m_text.substr(m_pos, token.size()) == token)
            {
                m_pos += token.size();
                return true;
            }
            return false;
        }

        void expect_(std::string_view token)
        {
            if (!accept_(token))
            {
                fail_("expected '" + std::string(token) + "'");
            }
        }

        char peek_() const noexcept { return eof_() ? '\0' : m_text[m_pos]; }
        bool eof_() const noexcept { return m_pos >= m_text.size(); }

        static bool is_space_(char c) noexcept { return c == ' ' || c == '\t'; }
        static bool is_digit_(char c) noexcept { return c >= '0' && c <= '9'; }

        [[noreturn]] void fail_(const std::string &msg) const { fail_at_(m_pos, msg); }

        [[noreturn]] void fail_at_(std::size_t pos, const std::string &msg) const
        {
            std::size_t line = 1;
            std::size_t column = 1;
            for (std::size_t i = 0; i < pos && i < m_text.size(); ++i)
            {
                if (m_text[i] == '\n')
                {
                    ++line;
                    column = 1;
                }
                else
                {
                    ++column;
                }
            }
            throw ParseError(msg, line, column);
        }

        std::string_view m_text;
        std::size_t m_pos = 0;
    };

    inline Troop parse_troop(std::string_view text)
    {
        return TroopParser(text).parse();
    }

    inline Troop load_troop_file(const std::string &path)
    {
        std::ifstream in(path, std::ios::binary);
        if (!in)
        {
            throw ParseError("cannot open '" + path + "'");
        }
        std::ostringstream buf;
        buf << in.rdbuf();
        if (in.bad())
        {
            throw ParseError("failed reading '" + path + "'");
        }
        return parse_troop(buf.str());
    }
}
