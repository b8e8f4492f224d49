#pragma once

#include "common.hpp"
#include "divisibility.hpp"
#include "errors.hpp"
#include "inspection_counter.hpp"
#include "log.hpp"
#include "monkey.hpp"
#include "operation.hpp"
#include "relief.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace monkeysim
{
    inline constexpr RoundIndex ShortRunRounds = 20;
    inline constexpr RoundIndex LongRunRounds = 10000;

    struct RoundSummary
    {
        RoundIndex round = 0;

        // Inspections performed by each monkey during this round.
        std::vector<std::uint64_t> inspected;

        // Items waiting in each queue once the round has finished.
        std::vector<std::size_t> queueSizes;
    };

    struct SimulationConfig
    {
        RoundIndex rounds = ShortRunRounds;
        ReliefMode relief = ReliefMode::Divide;

        // Logging (disabled by default).
        LogLevel logLevel = LogLevel::Off;

        // Optional trace of every inspection: (round, monkey, worry before, worry after relief, target).
        std::function<void(RoundIndex, MonkeyId, WorryLevel, WorryLevel, MonkeyId)> inspectionSink;

        // Optional per-round summary, delivered after the last monkey's turn.
        std::function<void(const RoundSummary &)> roundSink;

        // Verify item conservation after every round (throws StateError on violation).
#if defined(MONKEYSIM_ENABLE_INVARIANT_CHECKS_DEFAULT)
        bool enableInvariantChecks = (MONKEYSIM_ENABLE_INVARIANT_CHECKS_DEFAULT != 0);
#else
        bool enableInvariantChecks = false;
#endif
    };

    // Round-based item routing between monkeys.
    //
    // Monkeys take turns in ascending MonkeyId order. A turn swaps the monkey's
    // whole queue out and routes every taken item into the live queue of its
    // target. Items thrown to a higher id are therefore seen again in the same
    // round; items thrown to a lower id wait for the next one.
    class Simulation final
    {
    public:
        // Throws StateError if the troop's ids are not dense from zero, a
        // divisor is not positive or a monkey has no item list, and
        // OverflowError if the relief modulus does not fit.
        Simulation(const Troop &troop, SimulationConfig cfg)
            : m_cfg(std::move(cfg)), m_relief(ReliefPolicy::for_mode(m_cfg.relief, troop))
        {
            Logger::instance().set_level(m_cfg.logLevel);

            MonkeyId expected = 0;
            for (const auto &[id, spec] : troop.specs)
            {
                if (id != expected)
                {
                    throw StateError("Simulation: monkey ids must be dense from 0 (expected " + std::to_string(expected) +
                                     ", found " + std::to_string(id) + ")");
                }
                if (spec.test.divisor <= 0)
                {
                    throw StateError("Simulation: non-positive test divisor " + std::to_string(spec.test.divisor) +
                                     " for " + monkey_name(id));
                }
                m_specs.push_back(spec);
                ++expected;
            }

            m_queues.resize(m_specs.size());
            for (const auto &[id, list] : troop.items)
            {
                if (id >= m_specs.size())
                {
                    throw StateError("Simulation: items given for " + monkey_name(id) + " which has no spec");
                }
                m_queues[id].assign(list.begin(), list.end());
                m_itemCount += list.size();
            }
            for (MonkeyId id = 0; id < m_specs.size(); ++id)
            {
                if (troop.items.count(id) == 0)
                {
                    throw StateError("Simulation: no item queue for " + monkey_name(id));
                }
            }

            m_counter = InspectionCounter(m_specs.size());
        }

        // Runs the remaining configured rounds and returns the final counts.
        const InspectionCounter &run()
        {
            require_not_failed_("run");
            Logger::instance().logf(LogLevel::Info, m_round, NoMonkey,
                                    "run: rounds=%llu relief=%s factor=%lld monkeys=%zu items=%zu",
                                    static_cast<unsigned long long>(m_cfg.rounds),
                                    relief_mode_name(m_relief.mode()),
                                    static_cast<long long>(m_relief.factor()),
                                    m_specs.size(),
                                    m_itemCount);

            while (m_round < m_cfg.rounds)
            {
                run_round();
            }

            Logger::instance().logf(LogLevel::Info, m_round, NoMonkey, "run complete: inspections=%llu",
                                    static_cast<unsigned long long>(m_counter.total()));
            return m_counter;
        }

        // Step exactly one round, regardless of the configured round count.
        // Any exception leaves the simulation failed: the interrupted turn's
        // batch is lost, so no further rounds or counts are served.
        void run_round()
        {
            require_not_failed_("run_round");
            try
            {
                run_round_();
            }
            catch (...)
            {
                m_failed = true;
                throw;
            }
        }

        RoundIndex round() const noexcept { return m_round; }
        std::size_t monkey_count() const noexcept { return m_specs.size(); }
        std::size_t item_count() const noexcept { return m_itemCount; }
        bool failed() const noexcept { return m_failed; }

        const ReliefPolicy &relief() const noexcept { return m_relief; }
        const std::vector<ItemQueue> &queues() const noexcept { return m_queues; }

        const InspectionCounter &counter() const
        {
            require_not_failed_("counter");
            return m_counter;
        }

    private:
        void run_round_()
        {
            const RoundIndex round = m_round + 1;

            RoundSummary summary;
            summary.round = round;
            summary.inspected.assign(m_specs.size(), 0);

            for (MonkeyId id = 0; id < m_specs.size(); ++id)
            {
                const MonkeySpec &spec = m_specs[id];
                const ItemQueue batch = std::exchange(queue_(id), ItemQueue{});

                Logger::instance().logf(LogLevel::Debug, round, id, "turn: items=%zu", batch.size());

                for (const WorryLevel item : batch)
                {
                    m_counter.record(id);
                    ++summary.inspected[id];

                    const WorryLevel worry = inspect_(round, id, spec, item);
                    const MonkeyId target = spec.route.select(apply(spec.test, worry));
                    if (target >= m_queues.size())
                    {
                        throw RoutingError("Simulation: throw to unknown " + monkey_name(target) + " @ " +
                                           context_string_(round, id, item));
                    }

                    Logger::instance().logf(LogLevel::Trace, round, id, "inspect: %lld -> %lld throw to %u",
                                            static_cast<long long>(item),
                                            static_cast<long long>(worry),
                                            static_cast<unsigned>(target));
                    if (m_cfg.inspectionSink)
                    {
                        m_cfg.inspectionSink(round, id, item, worry, target);
                    }

                    m_queues[target].push_back(worry);
                }
            }

            m_round = round;

            if (m_cfg.enableInvariantChecks)
            {
                check_conservation_();
            }

            if (m_cfg.roundSink)
            {
                summary.queueSizes.reserve(m_queues.size());
                for (const auto &q : m_queues)
                {
                    summary.queueSizes.push_back(q.size());
                }
                m_cfg.roundSink(summary);
            }
        }

        void require_not_failed_(const char *what) const
        {
            if (m_failed)
            {
                throw StateError(std::string("Simulation::") + what + ": simulation failed in round " +
                                 std::to_string(m_round + 1) + " and holds no complete result");
            }
        }

        static std::string context_string_(RoundIndex round, MonkeyId monkey, WorryLevel item)
        {
            return "round=" + std::to_string(round) + " " + monkey_name(monkey) + " item=" + std::to_string(item);
        }

        ItemQueue &queue_(MonkeyId id)
        {
            if (id >= m_queues.size())
            {
                throw StateError("Simulation: missing queue for " + monkey_name(id));
            }
            return m_queues[id];
        }

        WorryLevel inspect_(RoundIndex round, MonkeyId id, const MonkeySpec &spec, WorryLevel item) const
        {
            WorryLevel worry = 0;
            try
            {
                worry = apply(spec.operation, item);
            }
            catch (const OverflowError &e)
            {
                throw OverflowError(std::string(e.what()) + " @ " + context_string_(round, id, item) +
                                    " relief=" + relief_mode_name(m_relief.mode()));
            }
            return m_relief.apply(worry);
        }

        void check_conservation_() const
        {
            std::size_t n = 0;
            for (const auto &q : m_queues)
            {
                n += q.size();
            }
            if (n != m_itemCount)
            {
                throw StateError("Simulation: item count changed after round " + std::to_string(m_round) +
                                 " (expected " + std::to_string(m_itemCount) + ", found " + std::to_string(n) + ")");
            }
        }

        SimulationConfig m_cfg;
        ReliefPolicy m_relief;

        std::vector<MonkeySpec> m_specs;
        std::vector<ItemQueue> m_queues;
        InspectionCounter m_counter;

        RoundIndex m_round = 0;
        std::size_t m_itemCount = 0;
        bool m_failed = false;
    };

    // Run `troop` to completion under `cfg` and return the final counts.
    inline InspectionCounter simulate(const Troop &troop, SimulationConfig cfg)
    {
        Simulation sim(troop, std::move(cfg));
        return sim.run();
    }

    // 20 rounds with divide relief. `base` supplies logging and sinks; its
    // rounds and relief are overridden.
    inline SimulationConfig short_run_config(SimulationConfig base = {})
    {
        base.rounds = ShortRunRounds;
        base.relief = ReliefMode::Divide;
        return base;
    }

    // 10000 rounds with modulus relief.
    inline SimulationConfig long_run_config(SimulationConfig base = {})
    {
        base.rounds = LongRunRounds;
        base.relief = ReliefMode::Modulus;
        return base;
    }

    inline std::uint64_t run_short(const Troop &troop, SimulationConfig cfg = {})
    {
        return simulate(troop, short_run_config(std::move(cfg))).monkey_business();
    }

    inline std::uint64_t run_long(const Troop &troop, SimulationConfig cfg = {})
    {
        return simulate(troop, long_run_config(std::move(cfg))).monkey_business();
    }
}
