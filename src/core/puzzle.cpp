#include "puzzle_validator/puzzle.hpp"
#include <algorithm>
#include <cstdint>
#include <set>
#include <stdexcept>
#include <type_traits>

namespace puzzle_validator {

namespace {

std::string describe(size_t index, const ConstraintRule& rule) {
    auto name = std::visit([](const auto& r) { return r.name(); }, rule);
    return "constraint #" + std::to_string(index) + " (" + name + ")";
}

/**
 * @brief ルール固有のパラメータ検査
 * @return エラーメッセージ（問題なければ空文字列）
 */
std::string validate_rule(const ConstraintRule& rule) {
    return std::visit([](const auto& r) -> std::string {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, LinearEqConstraint>) {
            if (r.coefficients().size() != r.scope().size()) {
                return "coefficient count does not match scope size";
            }
            for (auto c : r.coefficients()) {
                if (c == 0) return "zero coefficient";
            }
        } else if constexpr (std::is_same_v<T, TableConstraint>) {
            if (r.tuples().empty() || r.tuples().size() % r.arity() != 0) {
                return "tuple arity does not match scope size";
            }
        } else if constexpr (std::is_same_v<T, AbsDifferenceConstraint>) {
            if (r.distance() < 0) return "negative distance";
        }
        return std::string();
    }, rule);
}

}  // namespace

// ============================================================================
// PuzzleDefinition
// ============================================================================

size_t PuzzleDefinition::add_variable(std::string name, std::vector<Domain::value_type> values) {
    variables_.push_back(VariableSpec{std::move(name), std::move(values)});
    return variables_.size() - 1;
}

size_t PuzzleDefinition::add_variable(std::string name, Domain::value_type min, Domain::value_type max) {
    std::vector<Domain::value_type> values;
    if (min <= max) {
        auto last = static_cast<uint64_t>(max) - static_cast<uint64_t>(min);
        if (last >= Domain::MAX_VALUES) {
            throw MalformedPuzzleError("variable '" + name + "' has more than " +
                                       std::to_string(Domain::MAX_VALUES) + " candidate values");
        }
        values.reserve(static_cast<size_t>(last) + 1);
        // min + i <= max なのでオーバーフローしない
        for (uint64_t i = 0; i <= last; ++i) {
            values.push_back(min + static_cast<Domain::value_type>(i));
        }
    }
    return add_variable(std::move(name), std::move(values));
}

void PuzzleDefinition::add_constraint(ConstraintRule rule) {
    constraints_.push_back(std::move(rule));
}

// ============================================================================
// Puzzle
// ============================================================================

const Variable& Puzzle::variable(size_t id) const {
    if (id >= variables_.size()) {
        throw std::out_of_range("Variable ID out of range: " + std::to_string(id));
    }
    return variables_[id];
}

const Constraint& Puzzle::constraint(size_t id) const {
    if (id >= constraints_.size()) {
        throw std::out_of_range("Constraint ID out of range: " + std::to_string(id));
    }
    return constraints_[id];
}

size_t Puzzle::find_variable(const std::string& name) const {
    auto it = name_to_id_.find(name);
    if (it != name_to_id_.end()) return it->second;
    return SIZE_MAX;
}

PuzzlePtr load_puzzle(const PuzzleDefinition& definition) {
    auto puzzle = std::make_shared<Puzzle>(Puzzle::Token{});

    // 変数
    std::vector<Domain> domains;
    const auto& var_specs = definition.variables();
    for (size_t i = 0; i < var_specs.size(); ++i) {
        const auto& spec = var_specs[i];
        if (spec.name.empty()) {
            throw MalformedPuzzleError("variable #" + std::to_string(i) + " has an empty name");
        }
        if (spec.values.empty()) {
            throw MalformedPuzzleError("variable '" + spec.name + "' has an empty domain");
        }
        if (!puzzle->name_to_id_.emplace(spec.name, i).second) {
            throw MalformedPuzzleError("duplicate variable name: " + spec.name);
        }
        Domain domain;
        try {
            domain = Domain(spec.values);
        } catch (const std::length_error& e) {
            throw MalformedPuzzleError("variable '" + spec.name + "': " + e.what());
        }
        domains.push_back(domain);
        puzzle->variables_.emplace_back(i, spec.name, std::move(domain));
    }

    // 制約
    size_t num_vars = var_specs.size();
    const auto& rules = definition.constraints();
    for (size_t c = 0; c < rules.size(); ++c) {
        const auto& rule = rules[c];
        const auto& scope = std::visit(
            [](const auto& r) -> const std::vector<size_t>& { return r.scope(); }, rule);

        if (scope.empty()) {
            throw MalformedPuzzleError(describe(c, rule) + " has an empty scope");
        }
        std::set<size_t> seen;
        for (auto var : scope) {
            if (var >= num_vars) {
                throw MalformedPuzzleError(describe(c, rule) + " references unknown variable #" +
                                           std::to_string(var));
            }
            if (!seen.insert(var).second) {
                throw MalformedPuzzleError(describe(c, rule) + " references variable '" +
                                           var_specs[var].name + "' twice");
            }
        }
        auto error = validate_rule(rule);
        if (!error.empty()) {
            throw MalformedPuzzleError(describe(c, rule) + ": " + error);
        }
        puzzle->constraints_.emplace_back(c, rule);
    }

    // 索引: 変数 -> 制約、変数 -> 隣接変数
    puzzle->var_to_constraints_.assign(num_vars, {});
    std::vector<std::set<size_t>> neighbor_sets(num_vars);
    for (const auto& constraint : puzzle->constraints_) {
        const auto& scope = constraint.scope();
        for (auto var : scope) {
            puzzle->var_to_constraints_[var].push_back(constraint.id());
            for (auto other : scope) {
                if (other != var) neighbor_sets[var].insert(other);
            }
        }
    }
    puzzle->neighbors_.reserve(num_vars);
    for (const auto& s : neighbor_sets) {
        puzzle->neighbors_.emplace_back(s.begin(), s.end());
    }

    puzzle->initial_domains_ = DomainTable(domains);
    return puzzle;
}

} // namespace puzzle_validator
