/**
 * @file fixtures.hpp
 * @brief テスト用のパズル定義と総当たり列挙
 */
#ifndef PUZZLE_VALIDATOR_TESTS_FIXTURES_HPP
#define PUZZLE_VALIDATOR_TESTS_FIXTURES_HPP

#include "puzzle_validator/puzzle.hpp"
#include <string>
#include <vector>

namespace puzzle_validator {
namespace testing {

/**
 * @brief n×n のラテン方陣（行・列ごとに AllDifferent、値は 1..n）
 *
 * 変数 ID は r * n + c。制約は行 0..n-1、列 0..n-1 の順。
 */
inline PuzzlePtr latin_square(size_t n) {
    PuzzleDefinition def;
    for (size_t r = 0; r < n; ++r) {
        for (size_t c = 0; c < n; ++c) {
            def.add_variable("r" + std::to_string(r) + "c" + std::to_string(c),
                             1, static_cast<Domain::value_type>(n));
        }
    }
    for (size_t r = 0; r < n; ++r) {
        std::vector<size_t> row;
        for (size_t c = 0; c < n; ++c) row.push_back(r * n + c);
        def.add_constraint(AllDifferentConstraint(row));
    }
    for (size_t c = 0; c < n; ++c) {
        std::vector<size_t> col;
        for (size_t r = 0; r < n; ++r) col.push_back(r * n + c);
        def.add_constraint(AllDifferentConstraint(col));
    }
    return load_puzzle(def);
}

/**
 * @brief A, B, C ∈ {1,2,3} に AllDifferent を1つ
 */
inline PuzzlePtr three_cells() {
    PuzzleDefinition def;
    def.add_variable("A", 1, 3);
    def.add_variable("B", 1, 3);
    def.add_variable("C", 1, 3);
    def.add_constraint(AllDifferentConstraint({0, 1, 2}));
    return load_puzzle(def);
}

/**
 * @brief x, y, z ∈ {1,2} に2変数の AllDifferent を3つ、自由変数 w, v ∈ {1,2,3}
 *
 * 伝播では矛盾が出ないが完成形は存在しない。
 */
inline PuzzlePtr odd_triangle() {
    PuzzleDefinition def;
    def.add_variable("x", 1, 2);
    def.add_variable("y", 1, 2);
    def.add_variable("z", 1, 2);
    def.add_variable("w", 1, 3);
    def.add_variable("v", 1, 3);
    def.add_constraint(AllDifferentConstraint({0, 1}));
    def.add_constraint(AllDifferentConstraint({1, 2}));
    def.add_constraint(AllDifferentConstraint({0, 2}));
    return load_puzzle(def);
}

namespace detail {

inline size_t count_from(const Puzzle& puzzle, const DomainTable& domains,
                         Assignment& assignment, size_t var, size_t limit) {
    if (var == domains.size()) {
        for (const auto& c : puzzle.constraints()) {
            if (c.check(assignment) != Satisfaction::Satisfied) return 0;
        }
        return 1;
    }
    size_t count = 0;
    for (auto v : domains[var].values()) {
        assignment[var] = v;
        count += count_from(puzzle, domains, assignment, var + 1, limit - count);
        if (count >= limit) break;
    }
    assignment[var].reset();
    return count;
}

}  // namespace detail

/**
 * @brief 候補値集合内の完成形を総当たりで数える（limit 個で打ち切り）
 */
inline size_t count_completions(const Puzzle& puzzle, const DomainTable& domains,
                                size_t limit = SIZE_MAX) {
    Assignment assignment(domains.size());
    return detail::count_from(puzzle, domains, assignment, 0, limit);
}

}  // namespace testing
}  // namespace puzzle_validator

#endif // PUZZLE_VALIDATOR_TESTS_FIXTURES_HPP
