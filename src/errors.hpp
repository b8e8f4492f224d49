#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace monkeysim
{
    // Every failure is fatal to a run; callers catch Error or one of the kinds below.
    class Error : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    class ParseError final : public Error
    {
    public:
        explicit ParseError(const std::string &msg) : Error("parse error: " + msg) {}

        ParseError(const std::string &msg, std::size_t line, std::size_t column)
            : Error("parse error at " + std::to_string(line) + ":" + std::to_string(column) + ": " + msg),
              m_line(line),
              m_column(column)
        {
        }

        std::size_t line() const noexcept { return m_line; }
        std::size_t column() const noexcept { return m_column; }

    private:
        std::size_t m_line = 0;
        std::size_t m_column = 0;
    };

    class OverflowError final : public Error
    {
    public:
        using Error::Error;
    };

    class RoutingError final : public Error
    {
    public:
        using Error::Error;
    };

    class StateError final : public Error
    {
    public:
        using Error::Error;
    };

    class InsufficientDataError final : public Error
    {
    public:
        using Error::Error;
    };
}
