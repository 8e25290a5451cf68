#include <catch2/catch.hpp>
#include "puzzle_validator/constraint.hpp"

using namespace puzzle_validator;

namespace {

using V = Domain::value_type;

Assignment assigned(std::initializer_list<std::optional<V>> values) {
    return Assignment(values);
}

}  // namespace

// ============================================================================
// AllDifferentConstraint tests
// ============================================================================

TEST_CASE("AllDifferentConstraint check", "[constraint][all_different]") {
    AllDifferentConstraint c({0, 1, 2});
    REQUIRE(c.name() == "all_different");

    SECTION("all distinct") {
        REQUIRE(c.check(assigned({1, 2, 3})) == Satisfaction::Satisfied);
    }

    SECTION("duplicate among committed values") {
        REQUIRE(c.check(assigned({1, 1, std::nullopt})) == Satisfaction::Violated);
    }

    SECTION("partial without duplicate") {
        REQUIRE(c.check(assigned({1, std::nullopt, 3})) == Satisfaction::Undetermined);
    }
}

TEST_CASE("AllDifferentConstraint propagate", "[constraint][all_different]") {
    SECTION("singleton removed from the others") {
        DomainTable d({Domain(1, 1), Domain(1, 3), Domain(1, 3)});
        AllDifferentConstraint c({0, 1, 2});
        REQUIRE(c.propagate(d));
        REQUIRE(!d[1].contains(1));
        REQUIRE(!d[2].contains(1));
        REQUIRE(d[1].size() == 2);
    }

    SECTION("chained singletons") {
        DomainTable d({Domain(1, 1), Domain(1, 2), Domain(1, 3)});
        AllDifferentConstraint c({0, 1, 2});
        REQUIRE(c.propagate(d));
        REQUIRE(d[1].values() == std::vector<V>{2});
        REQUIRE(d[2].values() == std::vector<V>{3});
    }

    SECTION("equal singletons - failure") {
        DomainTable d({Domain(2, 2), Domain(2, 2)});
        AllDifferentConstraint c({0, 1});
        REQUIRE(!c.propagate(d));
    }

    SECTION("more variables than values - failure") {
        DomainTable d({Domain(1, 2), Domain(1, 2), Domain(1, 2)});
        AllDifferentConstraint c({0, 1, 2});
        REQUIRE(!c.propagate(d));
    }

    SECTION("no singletons - no change") {
        DomainTable d({Domain(1, 3), Domain(1, 3)});
        DomainTable before = d;
        AllDifferentConstraint c({0, 1});
        REQUIRE(c.propagate(d));
        REQUIRE(d.shared_with(before) == 2);
    }
}

// ============================================================================
// LinearEqConstraint tests
// ============================================================================

TEST_CASE("LinearEqConstraint check", "[constraint][linear_eq]") {
    LinearEqConstraint c({0, 1}, 5);
    REQUIRE(c.name() == "linear_eq");
    REQUIRE(c.coefficients() == std::vector<int64_t>{1, 1});

    REQUIRE(c.check(assigned({2, 3})) == Satisfaction::Satisfied);
    REQUIRE(c.check(assigned({2, 2})) == Satisfaction::Violated);
    // 全変数が確定するまで判定しない
    REQUIRE(c.check(assigned({9, std::nullopt})) == Satisfaction::Undetermined);
}

TEST_CASE("LinearEqConstraint propagate", "[constraint][linear_eq]") {
    SECTION("small cage sum bounds both cells") {
        DomainTable d({Domain(1, 4), Domain(1, 4)});
        LinearEqConstraint c({0, 1}, 3);
        REQUIRE(c.propagate(d));
        REQUIRE(d[0].values() == std::vector<V>{1, 2});
        REQUIRE(d[1].values() == std::vector<V>{1, 2});
    }

    SECTION("fixed cell determines the other") {
        DomainTable d({Domain(3, 3), Domain(1, 9)});
        LinearEqConstraint c({0, 1}, 10);
        REQUIRE(c.propagate(d));
        REQUIRE(d[1].values() == std::vector<V>{7});
    }

    SECTION("mixed coefficients") {
        // 2x - y = 0
        DomainTable d({Domain(1, 3), Domain(1, 3)});
        LinearEqConstraint c({2, -1}, {0, 1}, 0);
        REQUIRE(c.propagate(d));
        REQUIRE(d[0].values() == std::vector<V>{1});
        REQUIRE(d[1].values() == std::vector<V>{2});
    }

    SECTION("unreachable target - failure") {
        DomainTable d({Domain(1, 4), Domain(1, 4)});
        LinearEqConstraint c({0, 1}, 10);
        REQUIRE(!c.propagate(d));
    }
}

// ============================================================================
// TableConstraint tests
// ============================================================================

TEST_CASE("TableConstraint check", "[constraint][table]") {
    TableConstraint c({0, 1}, {1, 2, 2, 3, 3, 1});
    REQUIRE(c.name() == "table");
    REQUIRE(c.arity() == 2);
    REQUIRE(c.num_tuples() == 3);

    REQUIRE(c.check(assigned({2, 3})) == Satisfaction::Satisfied);
    REQUIRE(c.check(assigned({2, 1})) == Satisfaction::Violated);
    REQUIRE(c.check(assigned({3, std::nullopt})) == Satisfaction::Undetermined);
    REQUIRE(c.check(assigned({std::nullopt, 4})) == Satisfaction::Violated);
}

TEST_CASE("TableConstraint propagate", "[constraint][table]") {
    TableConstraint c({0, 1}, {1, 2, 2, 3, 3, 1});

    SECTION("unsupported values removed") {
        DomainTable d({Domain(1, 2), Domain(1, 3)});
        REQUIRE(c.propagate(d));
        REQUIRE(d[0].values() == std::vector<V>{1, 2});
        REQUIRE(d[1].values() == std::vector<V>{2, 3});
    }

    SECTION("no tuple fits - failure") {
        DomainTable d({Domain(1, 1), Domain(1, 1)});
        REQUIRE(!c.propagate(d));
    }
}

// ============================================================================
// LessConstraint tests
// ============================================================================

TEST_CASE("LessConstraint", "[constraint][less]") {
    LessConstraint c(0, 1);
    REQUIRE(c.name() == "less");

    SECTION("check") {
        REQUIRE(c.check(assigned({1, 2})) == Satisfaction::Satisfied);
        REQUIRE(c.check(assigned({2, 2})) == Satisfaction::Violated);
        REQUIRE(c.check(assigned({2, std::nullopt})) == Satisfaction::Undetermined);
    }

    SECTION("bound propagation") {
        DomainTable d({Domain(1, 5), Domain(1, 5)});
        REQUIRE(c.propagate(d));
        REQUIRE(d[0].max().value() == 4);
        REQUIRE(d[1].min().value() == 2);
    }

    SECTION("infeasible - x.min >= y.max") {
        DomainTable d({Domain(5, 5), Domain(1, 5)});
        REQUIRE(!c.propagate(d));
    }
}

// ============================================================================
// AbsDifferenceConstraint tests
// ============================================================================

TEST_CASE("AbsDifferenceConstraint", "[constraint][abs_difference]") {
    AbsDifferenceConstraint c(0, 1, 3);
    REQUIRE(c.name() == "abs_difference");

    SECTION("check") {
        REQUIRE(c.check(assigned({4, 1})) == Satisfaction::Satisfied);
        REQUIRE(c.check(assigned({1, 4})) == Satisfaction::Satisfied);
        REQUIRE(c.check(assigned({1, 3})) == Satisfaction::Violated);
        REQUIRE(c.check(assigned({std::nullopt, 3})) == Satisfaction::Undetermined);
    }

    SECTION("only values with a partner survive") {
        DomainTable d({Domain(1, 4), Domain(1, 4)});
        REQUIRE(c.propagate(d));
        REQUIRE(d[0].values() == std::vector<V>{1, 4});
        REQUIRE(d[1].values() == std::vector<V>{1, 4});
    }

    SECTION("no partner - failure") {
        DomainTable d({Domain(1, 2), Domain(1, 2)});
        REQUIRE(!c.propagate(d));
    }
}

// ============================================================================
// FixedConstraint tests
// ============================================================================

TEST_CASE("FixedConstraint", "[constraint][fixed]") {
    FixedConstraint c(0, 5);
    REQUIRE(c.name() == "fixed");

    REQUIRE(c.check(assigned({5})) == Satisfaction::Satisfied);
    REQUIRE(c.check(assigned({4})) == Satisfaction::Violated);
    REQUIRE(c.check(assigned({std::nullopt})) == Satisfaction::Undetermined);

    SECTION("given pins the domain") {
        DomainTable d({Domain(1, 9)});
        REQUIRE(c.propagate(d));
        REQUIRE(d[0].values() == std::vector<V>{5});
    }

    SECTION("given outside the domain - failure") {
        DomainTable d({Domain(1, 2)});
        REQUIRE(!c.propagate(d));
    }
}

// ============================================================================
// Constraint (variant wrapper) tests
// ============================================================================

TEST_CASE("Constraint dispatches to its rule", "[constraint]") {
    Constraint c(4, LessConstraint(2, 0));
    REQUIRE(c.id() == 4);
    REQUIRE(c.name() == "less");
    REQUIRE(c.scope() == std::vector<size_t>{2, 0});
    REQUIRE(std::holds_alternative<LessConstraint>(c.rule()));

    REQUIRE(c.check(assigned({3, std::nullopt, 1})) == Satisfaction::Satisfied);

    DomainTable d({Domain(1, 3), Domain(1, 1), Domain(1, 3)});
    REQUIRE(c.propagate(d));
    REQUIRE(d[0].min().value() == 2);
    REQUIRE(d[2].max().value() == 2);
}
