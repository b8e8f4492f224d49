#include "errors.hpp"
#include "inspection_counter.hpp"
#include "log.hpp"
#include "relief.hpp"
#include "simulation.hpp"
#include "troop_parser.hpp"

#include <charconv>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace
{
    enum class Mode
    {
        Short,
        Long,
        Both,
    };

    struct Params
    {
        std::string input;
        Mode mode = Mode::Both;

        // A custom run replaces the canonical short/long runs.
        std::optional<std::uint64_t> rounds;
        std::optional<monkeysim::ReliefMode> relief;

        bool counts = false;
        monkeysim::LogLevel logLevel = monkeysim::LogLevel::Off;

        // Log to this file instead of stderr.
        std::string logFile;
    };

    bool parse_u64(std::string_view s, std::uint64_t &out)
    {
        unsigned long long v = 0;
        auto r = std::from_chars(s.data(), s.data() + s.size(), v);
        if (r.ec != std::errc() || r.ptr != s.data() + s.size())
        {
            return false;
        }
        out = static_cast<std::uint64_t>(v);
        return true;
    }

    [[noreturn]] void usage_and_exit()
    {
        std::cerr << "monkey_business [options] <input-file>\n"
                  << "  --mode short|long|both\n"
                  << "  --rounds N\n"
                  << "  --relief divide|modulus\n"
                  << "  --counts\n"
                  << "  --log-level error|warn|info|debug|trace|off\n"
                  << "  --log-file PATH\n";
        std::exit(2);
    }

    Params parse_args(int argc, char **argv)
    {
        Params p;
        for (int i = 1; i < argc; ++i)
        {
            std::string_view a(argv[i]);
            auto need = [&]() -> std::string_view
            {
                if (i + 1 >= argc)
                {
                    usage_and_exit();
                }
                return std::string_view(argv[++i]);
            };

            if (a == "--mode")
            {
                const auto v = need();
                if (v == "short")
                    p.mode = Mode::Short;
                else if (v == "long")
                    p.mode = Mode::Long;
                else if (v == "both")
                    p.mode = Mode::Both;
                else
                    usage_and_exit();
            }
            else if (a == "--rounds")
            {
                std::uint64_t n = 0;
                if (!parse_u64(need(), n))
                    usage_and_exit();
                p.rounds = n;
            }
            else if (a == "--relief")
            {
                const auto v = need();
                if (v == "divide")
                    p.relief = monkeysim::ReliefMode::Divide;
                else if (v == "modulus")
                    p.relief = monkeysim::ReliefMode::Modulus;
                else
                    usage_and_exit();
            }
            else if (a == "--counts")
            {
                p.counts = true;
            }
            else if (a == "--log-level")
            {
                const auto lvl = monkeysim::parse_log_level(need());
                if (!lvl)
                    usage_and_exit();
                p.logLevel = *lvl;
            }
            else if (a == "--log-file")
            {
                p.logFile = std::string(need());
            }
            else if (!a.empty() && a.front() == '-')
            {
                usage_and_exit();
            }
            else if (p.input.empty())
            {
                p.input = std::string(a);
            }
            else
            {
                usage_and_exit();
            }
        }

        if (p.input.empty())
        {
            usage_and_exit();
        }
        return p;
    }

    void print_counts(const monkeysim::InspectionCounter &counter)
    {
        const auto &counts = counter.counts();
        for (std::size_t i = 0; i < counts.size(); ++i)
        {
            std::cout << "  monkey " << i << " inspected " << counts[i] << " items\n";
        }
    }

    void run_and_report(const monkeysim::Troop &troop, const char *label, monkeysim::SimulationConfig cfg, bool counts)
    {
        const monkeysim::InspectionCounter counter = monkeysim::simulate(troop, std::move(cfg));
        std::cout << label << "=" << counter.monkey_business() << "\n";
        if (counts)
        {
            print_counts(counter);
        }
    }

    int run(const Params &p)
    {
        const monkeysim::Troop troop = monkeysim::load_troop_file(p.input);

        monkeysim::SimulationConfig base;
        base.logLevel = p.logLevel;

        if (p.rounds || p.relief)
        {
            monkeysim::SimulationConfig cfg = base;
            cfg.rounds = p.rounds.value_or(monkeysim::ShortRunRounds);
            cfg.relief = p.relief.value_or(monkeysim::ReliefMode::Divide);
            run_and_report(troop, "custom", std::move(cfg), p.counts);
            return 0;
        }

        if (p.mode == Mode::Short || p.mode == Mode::Both)
        {
            run_and_report(troop, "short", monkeysim::short_run_config(base), p.counts);
        }
        if (p.mode == Mode::Long || p.mode == Mode::Both)
        {
            run_and_report(troop, "long", monkeysim::long_run_config(base), p.counts);
        }
        return 0;
    }
}

int main(int argc, char **argv)
{
    const Params p = parse_args(argc, argv);

    FILE *logFile = nullptr;
    if (!p.logFile.empty())
    {
        logFile = std::fopen(p.logFile.c_str(), "w");
        if (!logFile)
        {
            std::cerr << "error: cannot open log file '" << p.logFile << "'\n";
            return 1;
        }
        monkeysim::Logger::instance().set_sink(logFile);
    }

    int rc = 0;
    try
    {
        rc = run(p);
    }
    catch (const monkeysim::Error &e)
    {
        std::cerr << "error: " << e.what() << "\n";
        rc = 1;
    }

    if (logFile)
    {
        monkeysim::Logger::instance().set_sink(nullptr);
        std::fclose(logFile);
    }
    return rc;
}
