/*
Purpose: Fatal error paths of a simulation run.

What this tests:
- Throwing to a monkey outside the troop raises RoutingError naming the target and round;
  an invalid target that is never used does not fail the run.
- After a failed round the simulation refuses further rounds and withholds its partial
  counts with StateError.
- Troops with missing item lists, gaps in the ids, items for unknown monkeys, or a
  non-positive test divisor are rejected with StateError before any round runs, in
  either relief mode.
- Overflow in the transform raises OverflowError with round and monkey context, and a
  relief modulus that does not fit is rejected at construction.
- A run where fewer than two monkeys inspect anything raises InsufficientDataError.
*/

#include "simulation.hpp"

#include <cassert>
#include <cstdint>
#include <string>

namespace
{
    template <class E, class Fn>
    std::string expect_throw(Fn &&fn)
    {
        bool threw = false;
        std::string msg;
        try
        {
            fn();
        }
        catch (const E &e)
        {
            threw = true;
            msg = e.what();
        }
        assert(threw);
        return msg;
    }

    bool contains(const std::string &s, const std::string &needle)
    {
        return s.find(needle) != std::string::npos;
    }

    monkeysim::MonkeySpec spec(monkeysim::Operation op, monkeysim::WorryLevel divisor, monkeysim::MonkeyId ifTrue, monkeysim::MonkeyId ifFalse)
    {
        monkeysim::MonkeySpec s;
        s.operation = op;
        s.test.divisor = divisor;
        s.route = monkeysim::RoutePreference{ifTrue, ifFalse};
        return s;
    }

    const monkeysim::Operation kPlusOne{monkeysim::Operand::old(), monkeysim::Operator::Add, monkeysim::Operand::value(1)};
    const monkeysim::Operation kSquare{monkeysim::Operand::old(), monkeysim::Operator::Multiply, monkeysim::Operand::old()};
}

int main()
{
    // Routing to an unknown monkey.
    {
        monkeysim::Troop troop;
        troop.add(0, spec(kPlusOne, 2, /*ifTrue=*/7, /*ifFalse=*/1), {5});
        troop.add(1, spec(kPlusOne, 2, 0, 0), {});

        const std::string msg = expect_throw<monkeysim::RoutingError>([&]
                                                                      { (void)monkeysim::run_long(troop); });
        assert(contains(msg, "monkey 7"));
        assert(contains(msg, "round=1"));
    }

    // A failed round leaves the simulation unusable.
    {
        monkeysim::Troop troop;
        troop.add(0, spec(kPlusOne, 2, /*ifTrue=*/7, /*ifFalse=*/1), {1, 2, 3, 5});
        troop.add(1, spec(kPlusOne, 2, 0, 0), {});

        monkeysim::SimulationConfig cfg;
        cfg.rounds = 5;
        cfg.relief = monkeysim::ReliefMode::Modulus;
        monkeysim::Simulation sim(troop, cfg);
        assert(!sim.failed());

        (void)expect_throw<monkeysim::RoutingError>([&]
                                                    { sim.run_round(); });
        assert(sim.failed());
        assert(sim.round() == 0);

        const std::string msg = expect_throw<monkeysim::StateError>([&]
                                                                    { (void)sim.run(); });
        assert(contains(msg, "failed"));
        (void)expect_throw<monkeysim::StateError>([&]
                                                  { sim.run_round(); });
        (void)expect_throw<monkeysim::StateError>([&]
                                                  { (void)sim.counter(); });
        assert(sim.round() == 0);
    }

    // The same failure reached through run().
    {
        monkeysim::Troop troop;
        troop.add(0, spec(kPlusOne, 2, /*ifTrue=*/7, /*ifFalse=*/1), {1, 2, 3, 5});
        troop.add(1, spec(kPlusOne, 2, 0, 0), {});

        monkeysim::Simulation sim(troop, {});
        (void)expect_throw<monkeysim::RoutingError>([&]
                                                    { (void)sim.run(); });
        (void)expect_throw<monkeysim::StateError>([&]
                                                  { (void)sim.run(); });
    }

    // Zero test divisor, in both relief modes.
    {
        monkeysim::Troop troop;
        troop.add(0, spec(kPlusOne, 0, 1, 1), {1});
        troop.add(1, spec(kPlusOne, 3, 0, 0), {2});

        const std::string msg = expect_throw<monkeysim::StateError>([&]
                                                                    { (void)monkeysim::run_short(troop); });
        assert(contains(msg, "divisor"));
        assert(contains(msg, "monkey 0"));
        (void)expect_throw<monkeysim::StateError>([&]
                                                  { (void)monkeysim::run_long(troop); });
    }

    // Negative test divisor.
    {
        monkeysim::Troop troop;
        troop.add(0, spec(kPlusOne, 3, 1, 1), {1});
        troop.add(1, spec(kPlusOne, -4, 0, 0), {2});

        const std::string msg = expect_throw<monkeysim::StateError>([&]
                                                                    { monkeysim::Simulation sim(troop, {}); });
        assert(contains(msg, "monkey 1"));
    }

    // An invalid target that is never taken is harmless.
    {
        monkeysim::Troop troop;
        troop.add(0, spec(kPlusOne, 1000, /*ifTrue=*/7, /*ifFalse=*/1), {1});
        troop.add(1, spec(kPlusOne, 1000, /*ifTrue=*/9, /*ifFalse=*/0), {2});

        monkeysim::SimulationConfig cfg;
        cfg.rounds = 3;
        cfg.relief = monkeysim::ReliefMode::Modulus;
        const auto counter = monkeysim::simulate(troop, cfg);
        assert(counter.total() > 0);
    }

    // Missing item list.
    {
        monkeysim::Troop troop;
        troop.add(0, spec(kPlusOne, 2, 1, 1), {1});
        troop.specs.emplace(1, spec(kPlusOne, 2, 0, 0));

        const std::string msg = expect_throw<monkeysim::StateError>([&]
                                                                    { monkeysim::Simulation sim(troop, {}); });
        assert(contains(msg, "monkey 1"));
    }

    // Gap in the ids.
    {
        monkeysim::Troop troop;
        troop.add(0, spec(kPlusOne, 2, 2, 2), {1});
        troop.add(2, spec(kPlusOne, 2, 0, 0), {1});

        (void)expect_throw<monkeysim::StateError>([&]
                                                  { monkeysim::Simulation sim(troop, {}); });
    }

    // Items for a monkey that has no spec.
    {
        monkeysim::Troop troop;
        troop.add(0, spec(kPlusOne, 2, 1, 1), {1});
        troop.add(1, spec(kPlusOne, 2, 0, 0), {1});
        troop.items[4] = {9};

        (void)expect_throw<monkeysim::StateError>([&]
                                                  { monkeysim::Simulation sim(troop, {}); });
    }

    // Duplicate id through Troop::add.
    {
        monkeysim::Troop troop;
        troop.add(0, spec(kPlusOne, 2, 0, 0), {1});
        (void)expect_throw<monkeysim::StateError>([&]
                                                  { troop.add(0, spec(kPlusOne, 3, 0, 0), {}); });
    }

    // Transform overflow under divide relief.
    {
        monkeysim::Troop troop;
        troop.add(0, spec(kPlusOne, 2, 1, 1), {4});
        troop.add(1, spec(kSquare, 2, 0, 0), {3037000500LL});

        const std::string msg = expect_throw<monkeysim::OverflowError>([&]
                                                                       { (void)monkeysim::run_short(troop); });
        assert(contains(msg, "round=1"));
        assert(contains(msg, "monkey 1"));
        assert(contains(msg, "relief=divide"));
    }

    // Relief modulus that does not fit in 64 bits.
    {
        monkeysim::Troop troop;
        troop.add(0, spec(kPlusOne, 1000000007, 1, 1), {1});
        troop.add(1, spec(kPlusOne, 1000000009, 2, 2), {1});
        troop.add(2, spec(kPlusOne, 998244353, 0, 0), {1});

        (void)expect_throw<monkeysim::OverflowError>([&]
                                                     { (void)monkeysim::run_long(troop); });

        // The divide run of the same troop is unaffected.
        assert(monkeysim::run_short(troop) > 0);
    }

    // Only one monkey ever inspects.
    {
        monkeysim::Troop troop;
        troop.add(0, spec(kPlusOne, 2, 0, 0), {1, 2, 3});
        troop.add(1, spec(kPlusOne, 2, 0, 0), {});

        (void)expect_throw<monkeysim::InsufficientDataError>([&]
                                                             { (void)monkeysim::run_short(troop); });
    }

    // Every error kind is catchable as monkeysim::Error.
    {
        monkeysim::Troop troop;
        troop.add(0, spec(kPlusOne, 2, 0, 0), {1});
        (void)expect_throw<monkeysim::Error>([&]
                                             { (void)monkeysim::run_short(troop); });
    }

    return 0;
}
