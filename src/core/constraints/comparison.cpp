#include "puzzle_validator/constraints/comparison.hpp"

namespace puzzle_validator {

// ============================================================================
// LessConstraint implementation
// ============================================================================

LessConstraint::LessConstraint(size_t x, size_t y)
    : vars_{x, y} {}

std::string LessConstraint::name() const {
    return "less";
}

Satisfaction LessConstraint::check(const Assignment& assignment) const {
    const auto& x_val = assignment[x()];
    const auto& y_val = assignment[y()];
    if (x_val && y_val) {
        return *x_val < *y_val ? Satisfaction::Satisfied : Satisfaction::Violated;
    }
    return Satisfaction::Undetermined;
}

bool LessConstraint::propagate(DomainTable& domains) const {
    if (domains[x()].empty() || domains[y()].empty()) {
        return false;
    }

    // x < y なので x の上限は y.max - 1
    auto y_max = domains[y()].max().value();
    domains.remove_above(x(), y_max - 1);
    if (domains[x()].empty()) {
        return false;
    }

    // y の下限は x.min + 1
    auto x_min = domains[x()].min().value();
    domains.remove_below(y(), x_min + 1);
    return !domains[y()].empty();
}

// ============================================================================
// AbsDifferenceConstraint implementation
// ============================================================================

AbsDifferenceConstraint::AbsDifferenceConstraint(size_t x, size_t y, Domain::value_type distance)
    : vars_{x, y}
    , distance_(distance) {}

std::string AbsDifferenceConstraint::name() const {
    return "abs_difference";
}

Satisfaction AbsDifferenceConstraint::check(const Assignment& assignment) const {
    const auto& x_val = assignment[x()];
    const auto& y_val = assignment[y()];
    if (x_val && y_val) {
        auto diff = *x_val - *y_val;
        if (diff < 0) diff = -diff;
        return diff == distance_ ? Satisfaction::Satisfied : Satisfaction::Violated;
    }
    return Satisfaction::Undetermined;
}

bool AbsDifferenceConstraint::propagate(DomainTable& domains) const {
    // 関係が対称なので x -> y, y -> x の2パスで固定点に達する
    const size_t order[2][2] = {{x(), y()}, {y(), x()}};
    for (const auto& pair : order) {
        size_t a = pair[0];
        size_t b = pair[1];
        for (auto v : domains[a].values()) {
            if (!domains[b].contains(v + distance_) && !domains[b].contains(v - distance_)) {
                domains.remove(a, v);
            }
        }
        if (domains[a].empty()) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// FixedConstraint implementation
// ============================================================================

FixedConstraint::FixedConstraint(size_t x, Domain::value_type value)
    : vars_{x}
    , value_(value) {}

std::string FixedConstraint::name() const {
    return "fixed";
}

Satisfaction FixedConstraint::check(const Assignment& assignment) const {
    const auto& x_val = assignment[x()];
    if (!x_val) {
        return Satisfaction::Undetermined;
    }
    return *x_val == value_ ? Satisfaction::Satisfied : Satisfaction::Violated;
}

bool FixedConstraint::propagate(DomainTable& domains) const {
    // ヒント値が候補に無ければ空になる
    domains.assign(x(), value_);
    return !domains[x()].empty();
}

}  // namespace puzzle_validator
