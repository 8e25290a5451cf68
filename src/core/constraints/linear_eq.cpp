#include "puzzle_validator/constraints/global.hpp"

namespace puzzle_validator {

namespace {

// 負数を含む整数除算の切り捨て・切り上げ
int64_t floor_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

int64_t ceil_div(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) == (b < 0))) {
        ++q;
    }
    return q;
}

}  // namespace

// ============================================================================
// LinearEqConstraint implementation
// ============================================================================

LinearEqConstraint::LinearEqConstraint(std::vector<int64_t> coeffs,
                                       std::vector<size_t> vars,
                                       int64_t target)
    : coeffs_(std::move(coeffs))
    , vars_(std::move(vars))
    , target_(target) {}

LinearEqConstraint::LinearEqConstraint(std::vector<size_t> vars, int64_t target)
    : coeffs_(vars.size(), 1)
    , vars_(std::move(vars))
    , target_(target) {}

std::string LinearEqConstraint::name() const {
    return "linear_eq";
}

Satisfaction LinearEqConstraint::check(const Assignment& assignment) const {
    int64_t sum = 0;
    for (size_t i = 0; i < vars_.size(); ++i) {
        const auto& value = assignment[vars_[i]];
        if (!value) {
            return Satisfaction::Undetermined;
        }
        sum += coeffs_[i] * *value;
    }
    return sum == target_ ? Satisfaction::Satisfied : Satisfaction::Violated;
}

bool LinearEqConstraint::propagate(DomainTable& domains) const {
    bool changed = true;
    while (changed) {
        changed = false;

        // 各項の取りうる範囲の和
        int64_t sum_min = 0;
        int64_t sum_max = 0;
        for (size_t i = 0; i < vars_.size(); ++i) {
            const Domain& d = domains[vars_[i]];
            if (d.empty()) return false;
            int64_t lo = d.min().value();
            int64_t hi = d.max().value();
            int64_t c = coeffs_[i];
            if (c > 0) {
                sum_min += c * lo;
                sum_max += c * hi;
            } else {
                sum_min += c * hi;
                sum_max += c * lo;
            }
        }
        if (target_ < sum_min || target_ > sum_max) {
            return false;
        }

        for (size_t i = 0; i < vars_.size(); ++i) {
            size_t var = vars_[i];
            int64_t lo = domains[var].min().value();
            int64_t hi = domains[var].max().value();
            int64_t c = coeffs_[i];
            int64_t term_min = c > 0 ? c * lo : c * hi;
            int64_t term_max = c > 0 ? c * hi : c * lo;

            // c * x ∈ [target - (他の項の max), target - (他の項の min)]
            int64_t t_lo = target_ - (sum_max - term_max);
            int64_t t_hi = target_ - (sum_min - term_min);

            int64_t new_lo;
            int64_t new_hi;
            if (c > 0) {
                new_lo = ceil_div(t_lo, c);
                new_hi = floor_div(t_hi, c);
            } else {
                new_lo = ceil_div(t_hi, c);
                new_hi = floor_div(t_lo, c);
            }

            bool shrunk = domains.remove_below(var, new_lo);
            shrunk = domains.remove_above(var, new_hi) || shrunk;
            if (domains[var].empty()) {
                return false;
            }
            if (shrunk) {
                // 和の範囲が変わったので再計算
                changed = true;
                break;
            }
        }
    }
    return true;
}

}  // namespace puzzle_validator
