#include <catch2/catch.hpp>
#include "puzzle_validator/session.hpp"
#include "fixtures.hpp"
#include <chrono>

using namespace puzzle_validator;
using namespace std::chrono_literals;

namespace {

using V = Domain::value_type;

constexpr size_t A = 0;
constexpr size_t B = 1;
constexpr size_t C = 2;

// odd_triangle の変数
constexpr size_t TX = 0;
constexpr size_t TW = 3;
constexpr size_t TV = 4;

/**
 * @brief ヒント g=2 と自由なマス f（g, f は 1..3 で AllDifferent）
 */
PuzzlePtr given_and_free() {
    PuzzleDefinition def;
    def.add_variable("g", 1, 3);
    def.add_variable("f", 1, 3);
    def.add_constraint(FixedConstraint(0, 2));
    def.add_constraint(AllDifferentConstraint({0, 1}));
    return load_puzzle(def);
}

PuzzlePtr single_cell() {
    PuzzleDefinition def;
    def.add_variable("only", std::vector<V>{5});
    return load_puzzle(def);
}

}  // namespace

// ============================================================================
// Opening a session
// ============================================================================

TEST_CASE("open_session starts in progress", "[session]") {
    auto puzzle = testing::three_cells();
    auto session = open_session(puzzle);

    REQUIRE(session->status().state == SessionState::InProgress);
    REQUIRE(session->generation() == 0);
    REQUIRE(!session->contradiction());
    for (size_t i = 0; i < puzzle->num_variables(); ++i) {
        REQUIRE(!session->is_committed(i));
        REQUIRE(session->domain(i) == puzzle->variable(i).domain());
    }
}

TEST_CASE("open_session rejects a missing puzzle", "[session]") {
    REQUIRE_THROWS_AS(open_session(nullptr), std::invalid_argument);
}

// ============================================================================
// Editing
// ============================================================================

TEST_CASE("Session edits shrink the remaining candidates", "[session]") {
    auto session = open_session(testing::three_cells());

    auto status = session->edit(A, 1);
    REQUIRE(status.state == SessionState::InProgress);
    REQUIRE(session->domain(B).values() == std::vector<V>{2, 3});

    status = session->edit(B, 2);
    REQUIRE(status.state == SessionState::InProgress);
    REQUIRE(session->domain(C).values() == std::vector<V>{3});
    REQUIRE(!session->is_committed(C));
    REQUIRE(session->generation() == 2);
}

TEST_CASE("Session reports a violation and recovers on undo", "[session]") {
    auto session = open_session(testing::three_cells());
    session->edit(A, 1);

    auto status = session->edit(B, 1);
    REQUIRE(status.state == SessionState::Violated);
    REQUIRE(status.implicated_constraints == std::set<size_t>{0});
    REQUIRE(status.implicated_variables.count(A) == 1);
    REQUIRE(status.implicated_variables.count(B) == 1);
    REQUIRE(session->contradiction());
    // 編集自体は保持される
    REQUIRE(session->committed()[B] == V{1});

    SECTION("further edits stay violated") {
        REQUIRE(session->edit(C, 3).state == SessionState::Violated);
    }

    SECTION("undo restores the previous state") {
        status = session->undo(B);
        REQUIRE(status.state == SessionState::InProgress);
        REQUIRE(!session->is_committed(B));
        REQUIRE(!session->contradiction());
        REQUIRE(session->domain(B).values() == std::vector<V>{2, 3});
    }

    SECTION("changing the offending value also recovers") {
        status = session->edit(B, 3);
        REQUIRE(status.state == SessionState::InProgress);
        REQUIRE(session->domain(C).values() == std::vector<V>{2});
    }
}

TEST_CASE("Session accepts values outside the current candidates", "[session]") {
    auto session = open_session(testing::three_cells());
    session->edit(A, 2);
    REQUIRE(!session->domain(B).contains(2));

    // 開始時点の候補にあれば受け付け、矛盾として報告する
    auto status = session->edit(B, 2);
    REQUIRE(status.state == SessionState::Violated);
}

TEST_CASE("Session detects an overfull all-different group on the first edit", "[session]") {
    // 4変数・値2つ: 1つ確定した時点で残り3変数に値が1つしか無い
    PuzzleDefinition def;
    for (const char* name : {"a", "b", "c", "d"}) {
        def.add_variable(name, 1, 2);
    }
    def.add_constraint(AllDifferentConstraint({0, 1, 2, 3}));
    auto session = open_session(load_puzzle(def));

    auto status = session->edit(0, 1);
    REQUIRE(status.state == SessionState::Violated);
    REQUIRE(status.implicated_constraints == std::set<size_t>{0});

    REQUIRE(session->edit(1, 2).state == SessionState::Violated);
    REQUIRE(session->edit(2, 1).state == SessionState::Violated);
    REQUIRE(session->edit(3, 2).state == SessionState::Violated);
}

TEST_CASE("Session reports solved", "[session]") {
    SECTION("single cell") {
        auto session = open_session(single_cell());
        REQUIRE(session->edit(0, 5).state == SessionState::Solved);
    }

    SECTION("three cells") {
        auto session = open_session(testing::three_cells());
        session->edit(A, 1);
        session->edit(B, 2);
        auto status = session->edit(C, 3);
        REQUIRE(status.state == SessionState::Solved);
        REQUIRE(status.implicated_variables.empty());

        // 完成後も編集は通常通り評価される
        REQUIRE(session->edit(C, std::nullopt).state == SessionState::InProgress);
    }
}

TEST_CASE("Session reports infeasible", "[session]") {
    auto session = open_session(testing::odd_triangle());

    auto status = session->edit(TW, 1);
    REQUIRE(status.state == SessionState::Infeasible);
    REQUIRE(status.implicated_variables.empty());
    REQUIRE(status.implicated_constraints.empty());
    REQUIRE(!session->last_search_stats().plausibility_failed);

    SECTION("adding a commitment keeps it infeasible") {
        REQUIRE(session->edit(TV, 2).state == SessionState::Infeasible);
    }

    SECTION("clearing re-evaluates and stays infeasible") {
        REQUIRE(session->edit(TW, std::nullopt).state == SessionState::Infeasible);
    }

    SECTION("a propagation conflict outranks infeasibility") {
        REQUIRE(session->edit(TX, 1).state == SessionState::Violated);
    }
}

TEST_CASE("Session with feasibility disabled", "[session]") {
    SessionOptions options;
    options.feasibility_enabled = false;
    auto session = open_session(testing::odd_triangle(), options);

    REQUIRE(session->edit(TW, 1).state == SessionState::InProgress);
    REQUIRE(session->edit(TX, 1).state == SessionState::Violated);

    session->set_feasibility_enabled(true);
    session->undo(TX);
    REQUIRE(session->status().state == SessionState::Infeasible);
}

TEST_CASE("Session search ceiling gives a caveat", "[session]") {
    SessionOptions options;
    options.node_limit = 1;
    auto session = open_session(testing::latin_square(4), options);

    auto status = session->edit(0, 1);
    REQUIRE(status.state == SessionState::InProgress);
    REQUIRE(status.caveat);
    REQUIRE(session->last_search_stats().ceiling_hit);

    session->set_node_limit(0);
    REQUIRE(session->options().node_limit == 0);
    status = session->refresh();
    REQUIRE(status.state == SessionState::InProgress);
    REQUIRE(!status.caveat);
}

// ============================================================================
// Undo, refresh and restore
// ============================================================================

TEST_CASE("Session undo", "[session][undo]") {
    auto puzzle = testing::three_cells();
    auto session = open_session(puzzle);

    SECTION("undo without history is a no-op") {
        auto status = session->undo(A);
        REQUIRE(status.state == SessionState::InProgress);
        REQUIRE(!session->is_committed(A));
        REQUIRE(session->generation() == 1);
    }

    SECTION("undo walks back through value changes") {
        session->edit(A, 1);
        session->edit(A, 2);
        session->undo(A);
        REQUIRE(session->committed()[A] == V{1});
        session->undo(A);
        REQUIRE(!session->is_committed(A));
        REQUIRE(session->domain(B) == puzzle->variable(B).domain());
    }

    SECTION("clearing returns candidates to their starting values") {
        session->edit(A, 1);
        session->edit(A, std::nullopt);
        for (size_t i = 0; i < puzzle->num_variables(); ++i) {
            REQUIRE(session->domain(i) == puzzle->variable(i).domain());
        }
    }
}

TEST_CASE("Session editing to the same value changes nothing", "[session]") {
    auto session = open_session(testing::three_cells());
    auto first = session->edit(A, 1);
    auto generation = session->generation();

    auto again = session->edit(A, 1);
    REQUIRE(again == first);
    REQUIRE(session->generation() == generation);
}

TEST_CASE("Session refresh matches incremental evaluation", "[session]") {
    auto session = open_session(testing::latin_square(4));
    session->edit(0, 1);
    session->edit(5, 2);
    auto status = session->edit(10, 3);

    std::vector<Domain> before;
    for (size_t i = 0; i < 16; ++i) {
        before.push_back(session->domain(i));
    }

    REQUIRE(session->refresh() == status);
    for (size_t i = 0; i < 16; ++i) {
        REQUIRE(session->domain(i) == before[i]);
    }
}

TEST_CASE("Session keeps givens applied across rebuilds", "[session]") {
    constexpr size_t G = 0;
    constexpr size_t F = 1;
    auto puzzle = given_and_free();

    SECTION("refresh, then change an edited value") {
        auto session = open_session(puzzle);
        session->refresh();
        REQUIRE(session->domain(G).values() == std::vector<V>{2});
        REQUIRE(session->domain(F).values() == std::vector<V>{1, 3});

        REQUIRE(session->edit(F, 1).state == SessionState::InProgress);
        REQUIRE(session->domain(G).values() == std::vector<V>{2});

        REQUIRE(session->edit(F, 3).state == SessionState::InProgress);
        REQUIRE(session->domain(G).values() == std::vector<V>{2});

        session->edit(F, std::nullopt);
        REQUIRE(session->domain(G).values() == std::vector<V>{2});
        REQUIRE(session->domain(F).values() == std::vector<V>{1, 3});
    }

    SECTION("first edit without refresh") {
        auto session = open_session(puzzle);
        session->edit(F, 3);
        REQUIRE(session->domain(G).values() == std::vector<V>{2});
    }

    SECTION("undo after clashing with a given") {
        auto session = open_session(puzzle);
        session->refresh();
        REQUIRE(session->edit(F, 2).state == SessionState::Violated);
        session->undo(F);
        REQUIRE(!session->contradiction());
        REQUIRE(session->domain(G).values() == std::vector<V>{2});
        REQUIRE(session->domain(F).values() == std::vector<V>{1, 3});
    }

    SECTION("same result with and without refresh") {
        auto refreshed = open_session(puzzle);
        auto fresh = open_session(puzzle);
        refreshed->refresh();
        for (V v : {V{1}, V{3}, V{1}}) {
            REQUIRE(refreshed->edit(F, v) == fresh->edit(F, v));
            REQUIRE(refreshed->domain(G) == fresh->domain(G));
            REQUIRE(refreshed->domain(F) == fresh->domain(F));
        }
    }
}

TEST_CASE("Session restore", "[session][restore]") {
    auto session = open_session(testing::three_cells());

    SECTION("restored values are evaluated") {
        auto status = session->restore({1, std::nullopt, std::nullopt});
        REQUIRE(status.state == SessionState::InProgress);
        REQUIRE(session->domain(B).values() == std::vector<V>{2, 3});
    }

    SECTION("restore discards undo history") {
        session->edit(A, 2);
        session->restore({1, std::nullopt, std::nullopt});
        session->undo(A);
        REQUIRE(session->committed()[A] == V{1});
    }

    SECTION("restored violation") {
        REQUIRE(session->restore({1, 1, std::nullopt}).state == SessionState::Violated);
    }

    SECTION("size mismatch") {
        REQUIRE_THROWS_AS(session->restore({1, 2}), std::invalid_argument);
    }

    SECTION("value outside the starting domain") {
        REQUIRE_THROWS_AS(session->restore({1, 2, 9}), std::invalid_argument);
    }
}

TEST_CASE("Session is deterministic", "[session]") {
    auto puzzle = testing::latin_square(4);
    auto first = open_session(puzzle);
    auto second = open_session(puzzle);

    const std::vector<std::pair<size_t, std::optional<V>>> edits = {
        {0, 1}, {5, 2}, {1, 2}, {1, std::nullopt}, {4, 1}, {4, 3}, {15, 4},
    };
    for (const auto& e : edits) {
        REQUIRE(first->edit(e.first, e.second) == second->edit(e.first, e.second));
        for (size_t i = 0; i < puzzle->num_variables(); ++i) {
            REQUIRE(first->domain(i) == second->domain(i));
        }
    }

    // 同じ確定値を一括で与えたセッションとも一致する
    auto restored = open_session(puzzle);
    REQUIRE(restored->restore(first->committed()) == first->status());
    for (size_t i = 0; i < puzzle->num_variables(); ++i) {
        REQUIRE(restored->domain(i) == first->domain(i));
    }
}

// ============================================================================
// Errors
// ============================================================================

TEST_CASE("Session rejects unknown variables and values", "[session][errors]") {
    auto session = open_session(testing::three_cells());

    REQUIRE_THROWS_AS(session->edit(99, 1), std::out_of_range);
    REQUIRE_THROWS_AS(session->undo(99), std::out_of_range);
    REQUIRE_THROWS_AS(session->domain(99), std::out_of_range);
    REQUIRE_THROWS_AS(session->is_committed(99), std::out_of_range);
    REQUIRE_THROWS_AS(session->edit(A, 7), std::invalid_argument);

    // 失敗した操作は状態を変えない
    REQUIRE(session->generation() == 0);
    REQUIRE(!session->is_committed(A));
}

// ============================================================================
// Background search
// ============================================================================

TEST_CASE("Session background search", "[session][background]") {
    SessionOptions options;
    options.background_search = true;
    auto session = open_session(testing::odd_triangle(), options);

    auto status = session->edit(TW, 1);
    REQUIRE(status.state == SessionState::InProgress);
    REQUIRE(status.search_pending);

    REQUIRE(session->wait_for_search(10s));
    auto polled = session->poll();
    REQUIRE(polled.has_value());
    REQUIRE(polled->state == SessionState::Infeasible);
    REQUIRE(!polled->search_pending);
    REQUIRE(session->status() == *polled);

    SECTION("nothing further to poll") {
        REQUIRE(!session->poll().has_value());
    }
}

TEST_CASE("Session discards stale background results", "[session][background]") {
    SessionOptions options;
    options.background_search = true;
    auto session = open_session(testing::odd_triangle(), options);

    session->edit(TW, 1);
    REQUIRE(session->wait_for_search(10s));

    // 探索を伴わない編集で世代が進む
    REQUIRE(session->edit(TX, 1).state == SessionState::Violated);

    REQUIRE(!session->poll().has_value());
    REQUIRE(session->stale_results() == 1);
    REQUIRE(session->status().state == SessionState::Violated);
}

TEST_CASE("Session without background search has nothing to poll", "[session][background]") {
    auto session = open_session(testing::three_cells());
    REQUIRE(session->wait_for_search(1ms));
    REQUIRE(!session->poll().has_value());
}
