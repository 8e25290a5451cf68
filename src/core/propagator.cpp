#include "puzzle_validator/propagator.hpp"
#include <algorithm>
#include <iostream>

namespace puzzle_validator {

PropagationEngine::PropagationEngine(const Puzzle& puzzle)
    : puzzle_(puzzle) {}

PropagationResult PropagationEngine::propagate_all(DomainTable& domains) const {
    std::vector<size_t> all(puzzle_.num_variables());
    for (size_t i = 0; i < all.size(); ++i) {
        all[i] = i;
    }
    return propagate(domains, all);
}

PropagationResult PropagationEngine::propagate(DomainTable& domains,
                                               const std::vector<size_t>& dirty) const {
    PropagationResult result;
    const size_t n = puzzle_.num_variables();

    // dirty 変数を重複なく昇順に並べる
    std::vector<bool> marked(n, false);
    std::vector<size_t> current;
    for (auto var : dirty) {
        if (var < n && !marked[var]) {
            marked[var] = true;
            current.push_back(var);
        }
    }
    std::sort(current.begin(), current.end());

    // 呼び出し時点で既に空の変数があれば制約を実行せずに矛盾
    for (auto var : current) {
        if (domains[var].empty()) {
            result.emptied.insert(var);
        }
    }
    if (!result.emptied.empty()) {
        result.ok = false;
        if (verbose_) {
            std::cerr << "% [verbose] propagate: " << result.emptied.size()
                      << " variable(s) already empty\n";
        }
        return result;
    }

    std::vector<size_t> sizes_before;
    while (!current.empty()) {
        ++result.rounds;

        // このラウンドで実行する制約（ID 昇順で決定的）
        std::set<size_t> active;
        for (auto var : current) {
            for (auto c_id : puzzle_.constraints_for_var(var)) {
                active.insert(c_id);
            }
        }

        std::vector<size_t> shrunk;
        for (auto c_id : active) {
            const auto& constraint = puzzle_.constraints()[c_id];
            const auto& scope = constraint.scope();

            sizes_before.resize(scope.size());
            for (size_t i = 0; i < scope.size(); ++i) {
                sizes_before[i] = domains[scope[i]].size();
            }

            ++result.revisions;
            bool ok = constraint.propagate(domains);

            for (size_t i = 0; i < scope.size(); ++i) {
                const Domain& d = domains[scope[i]];
                if (d.size() < sizes_before[i]) {
                    shrunk.push_back(scope[i]);
                }
                if (d.empty()) {
                    result.emptied.insert(scope[i]);
                }
            }

            if (!ok || !result.emptied.empty()) {
                result.ok = false;
                result.conflicts.insert(c_id);
                if (verbose_) {
                    std::cerr << "% [verbose] propagate: conflict in constraint #" << c_id
                              << " (" << constraint.name() << ") after "
                              << result.rounds << " round(s)\n";
                }
                return result;
            }
        }

        // 縮小した変数とその隣接変数を次のラウンドで再処理
        std::fill(marked.begin(), marked.end(), false);
        std::vector<size_t> next;
        for (auto var : shrunk) {
            if (!marked[var]) {
                marked[var] = true;
                next.push_back(var);
            }
            for (auto nb : puzzle_.neighbors(var)) {
                if (!marked[nb]) {
                    marked[nb] = true;
                    next.push_back(nb);
                }
            }
        }
        std::sort(next.begin(), next.end());
        current = std::move(next);
    }

    if (verbose_) {
        std::cerr << "% [verbose] propagate: fixed point after " << result.rounds
                  << " round(s), " << result.revisions << " revision(s)\n";
    }
    return result;
}

} // namespace puzzle_validator
