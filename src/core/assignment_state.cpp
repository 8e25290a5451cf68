#include "puzzle_validator/assignment_state.hpp"

namespace puzzle_validator {

AssignmentState::AssignmentState(const Puzzle& puzzle)
    : puzzle_(puzzle)
    , committed_(puzzle.num_variables())
    , domains_(puzzle.initial_domains())
    , history_(puzzle.num_variables()) {}

void AssignmentState::store(size_t var_idx, std::optional<value_type> value) {
    if (committed_[var_idx] && !value) {
        --committed_count_;
    } else if (!committed_[var_idx] && value) {
        ++committed_count_;
    }
    committed_[var_idx] = value;
}

void AssignmentState::set(size_t var_idx, std::optional<value_type> value) {
    history_[var_idx].push_back(committed_[var_idx]);
    store(var_idx, value);
}

bool AssignmentState::revert(size_t var_idx) {
    auto& stack = history_[var_idx];
    if (stack.empty()) {
        return false;
    }
    auto previous = stack.back();
    stack.pop_back();
    store(var_idx, previous);
    return true;
}

void AssignmentState::replace_all(const Assignment& values) {
    for (size_t i = 0; i < committed_.size(); ++i) {
        store(i, values[i]);
        history_[i].clear();
    }
}

std::vector<size_t> AssignmentState::rebuild() {
    // 開始時点のテーブルは Puzzle と共有され、書き込み時に複製される
    domains_ = puzzle_.initial_domains();
    std::vector<size_t> dirty;
    for (size_t i = 0; i < committed_.size(); ++i) {
        if (committed_[i]) {
            domains_.assign(i, *committed_[i]);
            dirty.push_back(i);
        }
    }
    contradiction_ = false;
    return dirty;
}

} // namespace puzzle_validator
