#include "puzzle_validator/constraints/global.hpp"
#include <set>

namespace puzzle_validator {

// ============================================================================
// AllDifferentConstraint implementation
// ============================================================================

AllDifferentConstraint::AllDifferentConstraint(std::vector<size_t> vars)
    : vars_(std::move(vars)) {}

std::string AllDifferentConstraint::name() const {
    return "all_different";
}

Satisfaction AllDifferentConstraint::check(const Assignment& assignment) const {
    std::set<Domain::value_type> used_values;
    bool all_assigned = true;
    for (auto var : vars_) {
        const auto& value = assignment[var];
        if (!value) {
            all_assigned = false;
            continue;
        }
        // 確定済みの値が重複していれば未確定変数があっても違反
        if (!used_values.insert(*value).second) {
            return Satisfaction::Violated;
        }
    }
    return all_assigned ? Satisfaction::Satisfied : Satisfaction::Undetermined;
}

bool AllDifferentConstraint::propagate(DomainTable& domains) const {
    // 確定した変数の値を他の変数から削除
    // 削除によって新たに確定した変数があれば繰り返す
    std::vector<bool> done(vars_.size(), false);
    bool progress = true;
    while (progress) {
        progress = false;
        for (size_t i = 0; i < vars_.size(); ++i) {
            if (done[i]) continue;
            const Domain& d = domains[vars_[i]];
            if (d.empty()) return false;
            if (!d.is_singleton()) continue;

            done[i] = true;
            auto val = d.min().value();
            for (size_t j = 0; j < vars_.size(); ++j) {
                if (j == i) continue;
                if (domains.remove(vars_[j], val)) {
                    if (domains[vars_[j]].empty()) {
                        return false;
                    }
                    progress = true;
                }
            }
        }
    }

    // 鳩の巣原理: 変数の数 > 利用可能な値の数 なら矛盾
    std::set<Domain::value_type> pool;
    for (auto var : vars_) {
        for (auto v : domains[var].values()) {
            pool.insert(v);
        }
    }
    if (pool.size() < vars_.size()) {
        return false;
    }

    return true;
}

}  // namespace puzzle_validator
