/**
 * @file comparison.hpp
 * @brief 比較制約クラス (less, abs_difference, fixed)
 */
#ifndef PUZZLE_VALIDATOR_CONSTRAINTS_COMPARISON_HPP
#define PUZZLE_VALIDATOR_CONSTRAINTS_COMPARISON_HPP

#include "puzzle_validator/domain_table.hpp"
#include "puzzle_validator/satisfaction.hpp"
#include <vector>
#include <string>

namespace puzzle_validator {

/**
 * @brief less制約: x < y
 */
class LessConstraint {
public:
    LessConstraint(size_t x, size_t y);

    std::string name() const;
    const std::vector<size_t>& scope() const { return vars_; }
    size_t x() const { return vars_[0]; }
    size_t y() const { return vars_[1]; }
    Satisfaction check(const Assignment& assignment) const;
    bool propagate(DomainTable& domains) const;

private:
    std::vector<size_t> vars_;
};

/**
 * @brief abs_difference制約: |x - y| == distance
 *
 * 隣接マスの差を指定するルール（連続ドットなど）。
 */
class AbsDifferenceConstraint {
public:
    AbsDifferenceConstraint(size_t x, size_t y, Domain::value_type distance);

    std::string name() const;
    const std::vector<size_t>& scope() const { return vars_; }
    size_t x() const { return vars_[0]; }
    size_t y() const { return vars_[1]; }
    Domain::value_type distance() const { return distance_; }
    Satisfaction check(const Assignment& assignment) const;
    bool propagate(DomainTable& domains) const;

private:
    std::vector<size_t> vars_;
    Domain::value_type distance_;
};

/**
 * @brief fixed制約: x == value（ヒントとして与えられたマス）
 */
class FixedConstraint {
public:
    FixedConstraint(size_t x, Domain::value_type value);

    std::string name() const;
    const std::vector<size_t>& scope() const { return vars_; }
    size_t x() const { return vars_[0]; }
    Domain::value_type value() const { return value_; }
    Satisfaction check(const Assignment& assignment) const;
    bool propagate(DomainTable& domains) const;

private:
    std::vector<size_t> vars_;
    Domain::value_type value_;
};

} // namespace puzzle_validator

#endif // PUZZLE_VALIDATOR_CONSTRAINTS_COMPARISON_HPP
