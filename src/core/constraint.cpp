/**
 * @file constraint.cpp
 * @brief 制約 variant の共通インターフェース実装
 *
 * 各ルールの実装は src/core/constraints/ 以下の個別ファイルに配置:
 * - constraints/comparison.cpp: 比較制約 (less, abs_difference, fixed)
 * - constraints/all_different.cpp, linear_eq.cpp, table.cpp: グローバル制約
 */
#include "puzzle_validator/constraint.hpp"

namespace puzzle_validator {

Constraint::Constraint(size_t id, ConstraintRule rule)
    : id_(id)
    , rule_(std::move(rule)) {}

std::string Constraint::name() const {
    return std::visit([](const auto& r) { return r.name(); }, rule_);
}

const std::vector<size_t>& Constraint::scope() const {
    return std::visit([](const auto& r) -> const std::vector<size_t>& { return r.scope(); }, rule_);
}

Satisfaction Constraint::check(const Assignment& assignment) const {
    return std::visit([&assignment](const auto& r) { return r.check(assignment); }, rule_);
}

bool Constraint::propagate(DomainTable& domains) const {
    return std::visit([&domains](const auto& r) { return r.propagate(domains); }, rule_);
}

} // namespace puzzle_validator
