#include <imagine/imagine.h>

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace imagine::test {

namespace {
    int increment(int x) { return x + 1; }

    int decrement(int x) { return x - 1; }

    // Records "+name" on enter and "-name" on exit for every target
    struct RecordingObserver : ImaginationObserver {
        void on_after_enter(const CursorBase &cursor) override { events.push_back("+" + cursor.name()); }

        void on_after_exit(const CursorBase &cursor) override { events.push_back("-" + cursor.name()); }

        std::vector<std::string> events;
    };

    // Refuses to let the named target be entered
    struct RefusingObserver : ImaginationObserver {
        explicit RefusingObserver(std::string name) : name{std::move(name)} {}

        void on_before_enter(const CursorBase &cursor) override {
            if (cursor.name() == name) { throw std::runtime_error("refused " + name); }
        }

        std::string name;
    };

    // Objects to every exit with something that is not a std::exception
    struct ObjectingObserver : ImaginationObserver {
        void on_before_exit(const CursorBase &) override { throw 42; }
    };

    // Objects to the named target being exited
    struct ExitRefusingObserver : ImaginationObserver {
        explicit ExitRefusingObserver(std::string name) : name{std::move(name)} {}

        void on_before_exit(const CursorBase &cursor) override {
            if (cursor.name() == name) { throw std::runtime_error("refused exit of " + name); }
        }

        std::string name;
    };

    template<typename Observer>
    auto observe(std::shared_ptr<Observer> observer) {
        ObserverRegistry::instance().add(observer);
        return make_scope_exit([observer] { ObserverRegistry::instance().remove(observer); });
    }
} // namespace

TEST_CASE("Combined activations override several callables at once", "[activation_group]") {
    auto f = wrap(increment, "f");
    auto g = wrap(decrement, "g");

    // Values computed before anything is active
    auto w1 = f.at(0).imagine(g(0));
    auto w2 = g.at(0).imagine(f(0));

    {
        auto scope = (w1 + w2).scoped();
        REQUIRE(f(0) == -1);
        REQUIRE(g(0) == 1);
        REQUIRE(f(1) == 2);
    }
    REQUIRE(f(0) == 1);
    REQUIRE(g(0) == -1);
}

TEST_CASE("Groups enter left to right and exit right to left", "[activation_group]") {
    auto recorder = std::make_shared<RecordingObserver>();
    auto registration = observe(recorder);

    auto f = wrap(increment, "f");
    auto g = wrap(decrement, "g");
    auto h = wrap(increment, "h");

    auto group = f.imagine(0) + g.imagine(0) + h.imagine(0);
    REQUIRE(group.size() == 3);
    {
        ActivationScope scope{group};
        REQUIRE(recorder->events == std::vector<std::string>{"+f", "+g", "+h"});
    }
    REQUIRE(recorder->events == std::vector<std::string>{"+f", "+g", "+h", "-h", "-g", "-f"});
}

TEST_CASE("Nested groups flatten depth first in declared order", "[activation_group]") {
    auto recorder = std::make_shared<RecordingObserver>();
    auto registration = observe(recorder);

    auto a = wrap(increment, "a");
    auto b = wrap(increment, "b");
    auto c = wrap(increment, "c");
    auto d = wrap(increment, "d");

    auto left = a.imagine(1) + b.imagine(2);
    auto right = c.imagine(3).combine(d.imagine(4));
    auto group = left.combine(right);
    REQUIRE(group.size() == 4);

    group.enter();
    REQUIRE(recorder->events == std::vector<std::string>{"+a", "+b", "+c", "+d"});
    REQUIRE(a(0) + b(0) + c(0) + d(0) == 10);
    group.exit();
    REQUIRE(recorder->events == std::vector<std::string>{"+a", "+b", "+c", "+d", "-d", "-c", "-b", "-a"});
    REQUIRE(a(0) + b(0) + c(0) + d(0) == 4);
}

TEST_CASE("Overlapping targets in a group release in mirror order", "[activation_group]") {
    auto f = wrap(increment, "f");
    auto outer = f.at(1).imagine(10);
    auto inner = f.at(1).imagine(20).at(2).imagine(30);

    {
        auto scope = (outer + inner).scoped();
        // the rightmost override was entered last and wins
        REQUIRE(f(1) == 20);
        REQUIRE(f(2) == 30);
        REQUIRE(f.depth() == 2);
    }
    REQUIRE(f(1) == 2);
    REQUIRE(f.depth() == 0);

    {
        auto scope = (inner + outer).scoped();
        REQUIRE(f(1) == 10);
        // outer was built without inner's overrides
        REQUIRE(f(2) == 3);
    }
    REQUIRE(f.depth() == 0);
}

TEST_CASE("A group is reusable and its members still work alone", "[activation_group]") {
    auto f = wrap(increment, "f");
    auto g = wrap(decrement, "g");
    auto w1 = f.at(5).imagine(0);
    auto w2 = g.at(5).imagine(0);
    auto group = w1 + w2;

    for (int i = 0; i < 2; ++i) {
        ActivationScope scope{group};
        REQUIRE(f(5) + g(5) == 0);
    }
    {
        ActivationScope scope{w1};
        REQUIRE(f(5) == 0);
        REQUIRE(g(5) == 4);
    }
    REQUIRE(f(5) + g(5) == 10);
}

TEST_CASE("A failing enter leaves already entered members released", "[activation_group][errors]") {
    auto recorder = std::make_shared<RecordingObserver>();
    auto record = observe(recorder);
    auto refuse = observe(std::make_shared<RefusingObserver>("refused_g"));

    auto f = wrap(increment, "refused_f");
    auto g = wrap(decrement, "refused_g");
    auto h = wrap(increment, "refused_h");
    auto group = f.imagine(0) + g.imagine(0) + h.imagine(0);

    REQUIRE_THROWS_WITH(group.enter(), "refused refused_g");
    REQUIRE(recorder->events == std::vector<std::string>{"+refused_f", "-refused_f"});
    REQUIRE(f(1) == 2);
    REQUIRE(f.depth() == 0);
    REQUIRE(g.depth() == 0);
    REQUIRE(h.depth() == 0);
}

TEST_CASE("Rebasing a group rebases every member onto its own target", "[activation_group][rebase]") {
    auto f = wrap(increment, "f");
    auto g = wrap(decrement, "g");

    auto late = f.at(2).imagine(20) + g.at(2).imagine(-20);
    auto live = (f.at(1).imagine(10) + g.at(1).imagine(-10)).scoped();

    {
        ActivationScope scope{late};
        REQUIRE(f(1) == 2);
        REQUIRE(g(1) == 0);
        REQUIRE(f(2) == 20);
    }
    auto rebased = late.rebase();
    REQUIRE(rebased.size() == 2);
    {
        ActivationScope scope{rebased};
        REQUIRE(f(1) == 10);
        REQUIRE(g(1) == -10);
        REQUIRE(f(2) == 20);
        REQUIRE(g(2) == -20);
    }
    REQUIRE(f(2) == 3);
}

TEST_CASE("A failing exit notification still restores the prior chain", "[activation_group][errors]") {
    auto refuse = observe(std::make_shared<ExitRefusingObserver>("objected"));
    auto f = wrap(increment, "objected");
    auto w = f.at(0).imagine(42);

    {
        auto scope = w.scoped();
        REQUIRE(f(0) == 42);
    }
    REQUIRE(f(0) == 1);
    REQUIRE(f.depth() == 0);
    REQUIRE_FALSE(w.is_entered());

    w.enter();
    REQUIRE_THROWS_WITH(w.exit(), "refused exit of objected");
    REQUIRE(f(0) == 1);
    REQUIRE(f.depth() == 0);

    // Nothing stale was left behind, the activation can be used again
    w.enter();
    REQUIRE(f(0) == 42);
    REQUIRE_THROWS(w.exit());
    REQUIRE_THROWS_AS(w.exit(), ImagineError);
}

TEST_CASE("A failing exit notification inside a group releases every member", "[activation_group][errors]") {
    auto refuse = observe(std::make_shared<ExitRefusingObserver>("objected_g"));
    auto f = wrap(increment, "objected_f");
    auto g = wrap(decrement, "objected_g");
    auto h = wrap(increment, "objected_h");
    auto group = f.imagine(0) + g.imagine(0) + h.imagine(0);

    group.enter();
    REQUIRE(f(5) + g(5) + h(5) == 0);
    REQUIRE_THROWS_WITH(group.exit(), "refused exit of objected_g");
    REQUIRE(f(5) == 6);
    REQUIRE(g(5) == 4);
    REQUIRE(h(5) == 6);
    REQUIRE(f.depth() + g.depth() + h.depth() == 0);
}

TEST_CASE("A scope survives an exit notification that throws a non standard exception", "[activation_group][errors]") {
    auto f = wrap(increment, "objected_scope");
    {
        auto objecting = observe(std::make_shared<ObjectingObserver>());
        auto scope = (f.imagine(7) + f.at(1).imagine(8)).scoped();
        REQUIRE(f(1) == 8);
        // the point override was built on its own, not on top of the constant
        REQUIRE(f(2) == 3);
    }
    REQUIRE(f(1) == 2);
    REQUIRE(f.depth() == 0);
}

} // namespace imagine::test
