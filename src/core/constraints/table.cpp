#include "puzzle_validator/constraints/global.hpp"
#include <set>

namespace puzzle_validator {

// ============================================================================
// TableConstraint implementation
// ============================================================================

TableConstraint::TableConstraint(std::vector<size_t> vars,
                                 std::vector<Domain::value_type> flat_tuples)
    : vars_(std::move(vars))
    , flat_tuples_(std::move(flat_tuples)) {}

std::string TableConstraint::name() const {
    return "table";
}

Satisfaction TableConstraint::check(const Assignment& assignment) const {
    size_t arity = vars_.size();
    bool all_assigned = true;
    for (auto var : vars_) {
        if (!assignment[var]) {
            all_assigned = false;
            break;
        }
    }

    // 確定済みの位置が一致するタプルを探す
    for (size_t t = 0; t < num_tuples(); ++t) {
        bool match = true;
        for (size_t i = 0; i < arity; ++i) {
            const auto& value = assignment[vars_[i]];
            if (value && *value != flat_tuples_[t * arity + i]) {
                match = false;
                break;
            }
        }
        if (match) {
            return all_assigned ? Satisfaction::Satisfied : Satisfaction::Undetermined;
        }
    }
    return Satisfaction::Violated;
}

bool TableConstraint::propagate(DomainTable& domains) const {
    size_t arity = vars_.size();
    std::vector<std::set<Domain::value_type>> supported(arity);
    bool any_valid = false;

    // 現在の候補値集合で成立しうるタプルだけを残し、各位置のサポートを集める
    for (size_t t = 0; t < num_tuples(); ++t) {
        bool valid = true;
        for (size_t i = 0; i < arity; ++i) {
            if (!domains[vars_[i]].contains(flat_tuples_[t * arity + i])) {
                valid = false;
                break;
            }
        }
        if (!valid) continue;
        any_valid = true;
        for (size_t i = 0; i < arity; ++i) {
            supported[i].insert(flat_tuples_[t * arity + i]);
        }
    }
    if (!any_valid) {
        return false;
    }

    // サポートの無い値を削除
    for (size_t i = 0; i < arity; ++i) {
        for (auto v : domains[vars_[i]].values()) {
            if (supported[i].count(v) == 0) {
                domains.remove(vars_[i], v);
            }
        }
    }
    return true;
}

}  // namespace puzzle_validator
