/**
 * @file global.hpp
 * @brief グローバル制約クラス (all_different, linear_eq, table)
 */
#ifndef PUZZLE_VALIDATOR_CONSTRAINTS_GLOBAL_HPP
#define PUZZLE_VALIDATOR_CONSTRAINTS_GLOBAL_HPP

#include "puzzle_validator/domain_table.hpp"
#include "puzzle_validator/satisfaction.hpp"
#include <vector>
#include <string>
#include <cstdint>

namespace puzzle_validator {

/**
 * @brief all_different制約: 全変数が異なる値を取る
 *
 * 行・列・ブロックの一意性ルールに対応する。
 * 伝播は確定値の除去（forward checking）と鳩の巣原理による矛盾検出。
 */
class AllDifferentConstraint {
public:
    explicit AllDifferentConstraint(std::vector<size_t> vars);

    std::string name() const;
    const std::vector<size_t>& scope() const { return vars_; }
    Satisfaction check(const Assignment& assignment) const;
    bool propagate(DomainTable& domains) const;

private:
    std::vector<size_t> vars_;
};

/**
 * @brief linear_eq制約: sum(coeffs[i] * vars[i]) == target
 *
 * キラーサドクのケージやカックロの和ルールに対応する。
 * 伝播は bounds consistency。
 */
class LinearEqConstraint {
public:
    LinearEqConstraint(std::vector<int64_t> coeffs, std::vector<size_t> vars, int64_t target);

    /**
     * @brief 係数が全て 1 の和制約を作成
     */
    LinearEqConstraint(std::vector<size_t> vars, int64_t target);

    std::string name() const;
    const std::vector<size_t>& scope() const { return vars_; }
    const std::vector<int64_t>& coefficients() const { return coeffs_; }
    int64_t target() const { return target_; }
    Satisfaction check(const Assignment& assignment) const;
    bool propagate(DomainTable& domains) const;

private:
    std::vector<int64_t> coeffs_;
    std::vector<size_t> vars_;
    int64_t target_;
};

/**
 * @brief table制約: (vars[0], ..., vars[n-1]) が許可タプルのいずれかに一致
 *
 * 隣接ルールなど、小さな関係を列挙で与える場合に使用する。
 * タプルは行優先でフラットに格納する（tuples[t * arity + i]）。
 */
class TableConstraint {
public:
    TableConstraint(std::vector<size_t> vars, std::vector<Domain::value_type> flat_tuples);

    std::string name() const;
    const std::vector<size_t>& scope() const { return vars_; }
    const std::vector<Domain::value_type>& tuples() const { return flat_tuples_; }
    size_t arity() const { return vars_.size(); }
    size_t num_tuples() const { return vars_.empty() ? 0 : flat_tuples_.size() / vars_.size(); }
    Satisfaction check(const Assignment& assignment) const;
    bool propagate(DomainTable& domains) const;

private:
    std::vector<size_t> vars_;
    std::vector<Domain::value_type> flat_tuples_;
};

} // namespace puzzle_validator

#endif // PUZZLE_VALIDATOR_CONSTRAINTS_GLOBAL_HPP
