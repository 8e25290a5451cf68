#include "puzzle_validator/feasibility.hpp"
#include <iostream>

namespace puzzle_validator {

FeasibilityChecker::FeasibilityChecker(const Puzzle& puzzle)
    : puzzle_(puzzle)
    , engine_(puzzle) {}

Feasibility FeasibilityChecker::check(const DomainTable& snapshot) {
    stats_ = SearchStats{};
    auto start = std::chrono::steady_clock::now();

    if (verbose_) {
        std::cerr << "% [verbose] feasibility start: " << puzzle_.num_variables()
                  << " variables, " << puzzle_.num_constraints()
                  << " constraints, node_limit=" << node_limit_ << "\n";
    }

    // 妥当性チェック: 編集に関係しない制約も含めて全制約を伝播
    DomainTable root = snapshot;
    Feasibility result;
    auto prop = engine_.propagate_all(root);
    if (!prop.ok) {
        stats_.plausibility_failed = true;
        result = Feasibility::Infeasible;
    } else {
        result = search(root, 0);
    }

    stats_.elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);

    if (verbose_) {
        std::cerr << "% [verbose] feasibility done: " << to_string(result)
                  << " nodes=" << stats_.nodes
                  << " failures=" << stats_.failures
                  << " max_depth=" << stats_.max_depth
                  << " elapsed_us=" << stats_.elapsed.count()
                  << (stats_.plausibility_failed ? " (plausibility check failed)" : "")
                  << (stats_.ceiling_hit ? " (node limit reached)" : "")
                  << "\n";
    }
    return result;
}

Feasibility FeasibilityChecker::search(const DomainTable& domains, size_t depth) {
    if (depth > stats_.max_depth) {
        stats_.max_depth = depth;
    }

    size_t var = select_variable(domains);
    if (var == SIZE_MAX) {
        // 全変数が単一値: 伝播で検出できない違反が無いか最終確認
        return verify(domains) ? Feasibility::Feasible : Feasibility::Infeasible;
    }

    for (auto value : domains[var].values()) {
        if (stopped_) {
            return Feasibility::Inconclusive;
        }
        if (node_limit_ > 0 && stats_.nodes >= node_limit_) {
            stats_.ceiling_hit = true;
            return Feasibility::Inconclusive;
        }
        ++stats_.nodes;

        DomainTable child = domains;
        child.assign(var, value);
        auto prop = engine_.propagate(child, {var});
        if (!prop.ok) {
            ++stats_.failures;
            continue;
        }

        auto sub = search(child, depth + 1);
        if (sub != Feasibility::Infeasible) {
            // Feasible ならそのまま、Inconclusive なら結論を出せない
            return sub;
        }
    }
    return Feasibility::Infeasible;
}

size_t FeasibilityChecker::select_variable(const DomainTable& domains) const {
    // 最小候補数の変数（同数なら ID 昇順で最初のもの）
    size_t best = SIZE_MAX;
    size_t best_size = SIZE_MAX;
    for (size_t i = 0; i < domains.size(); ++i) {
        size_t s = domains[i].size();
        if (s > 1 && s < best_size) {
            best = i;
            best_size = s;
        }
    }
    return best;
}

bool FeasibilityChecker::verify(const DomainTable& domains) const {
    Assignment assignment(domains.size());
    for (size_t i = 0; i < domains.size(); ++i) {
        if (!domains[i].is_singleton()) {
            return false;
        }
        assignment[i] = domains[i].min();
    }
    for (const auto& constraint : puzzle_.constraints()) {
        if (constraint.check(assignment) != Satisfaction::Satisfied) {
            return false;
        }
    }
    return true;
}

} // namespace puzzle_validator
