#include "divisibility.hpp"

#include <cassert>

int main()
{
    const monkeysim::DivisibilityTest by23{23};

    assert(monkeysim::apply(by23, 0));
    assert(monkeysim::apply(by23, 23));
    assert(monkeysim::apply(by23, 2080 * 23));
    assert(!monkeysim::apply(by23, 500));
    assert(!monkeysim::apply(by23, 1));

    // Repeated evaluation of the same value gives the same answer.
    for (int i = 0; i < 3; ++i)
    {
        assert(monkeysim::apply(by23, 46) == monkeysim::apply(by23, 46));
        assert(monkeysim::apply(by23, 47) == monkeysim::apply(by23, 47));
    }

    const monkeysim::RoutePreference route{/*ifTrue=*/2, /*ifFalse=*/3};
    assert(route.select(true) == 2);
    assert(route.select(false) == 3);
    assert(route.select(monkeysim::apply(by23, 620)) == 3);

    return 0;
}
