#include "puzzle_validator/session.hpp"
#include <iostream>
#include <stdexcept>

namespace puzzle_validator {

namespace {

const Puzzle& require_puzzle(const PuzzlePtr& puzzle) {
    if (!puzzle) {
        throw std::invalid_argument("Session requires a loaded puzzle");
    }
    return *puzzle;
}

}  // namespace

Session::Session(PuzzlePtr puzzle, SessionOptions options)
    : puzzle_(std::move(puzzle))
    , options_(options)
    , state_(require_puzzle(puzzle_))
    , engine_(*puzzle_)
    , checker_(*puzzle_) {
    engine_.set_verbose(options_.verbose);
    checker_.set_verbose(options_.verbose);
    checker_.set_node_limit(options_.node_limit);
    if (options_.background_search) {
        worker_ = std::make_unique<FeasibilityWorker>(puzzle_, options_.node_limit, options_.verbose);
    }
}

Session::~Session() = default;

void Session::check_variable(size_t var_idx) const {
    if (var_idx >= puzzle_->num_variables()) {
        throw std::out_of_range("Variable ID out of range: " + std::to_string(var_idx));
    }
}

const Domain& Session::domain(size_t var_idx) const {
    check_variable(var_idx);
    return state_.domains()[var_idx];
}

bool Session::is_committed(size_t var_idx) const {
    check_variable(var_idx);
    return state_.is_committed(var_idx);
}

void Session::set_node_limit(size_t limit) {
    options_.node_limit = limit;
    checker_.set_node_limit(limit);
    if (worker_) {
        worker_->set_node_limit(limit);
    }
}

void Session::set_verbose(bool enabled) {
    options_.verbose = enabled;
    engine_.set_verbose(enabled);
    checker_.set_verbose(enabled);
}

SessionStatus Session::edit(size_t var_idx, std::optional<value_type> value) {
    check_variable(var_idx);
    const auto& var = puzzle_->variable(var_idx);
    if (value && !var.domain().contains(*value)) {
        throw std::invalid_argument("Value " + std::to_string(*value) +
                                    " is not in the domain of '" + var.name() + "'");
    }

    auto previous = state_.value(var_idx);
    if (previous == value) {
        if (options_.verbose) {
            std::cerr << "% [verbose] edit: '" << var.name() << "' unchanged\n";
        }
        return status_;
    }

    // 未確定の変数に現在の候補内の値を確定するだけなら候補は縮小のみ
    bool shrink_only = value && !previous && !state_.contradiction() &&
                       state_.domains()[var_idx].contains(*value);
    // 増分伝播は全制約の不動点にあるテーブルからのみ行う
    // それ以外（クリア・値の変更・候補外の値・矛盾中・未評価）は開始時点から作り直す
    bool incremental = shrink_only && settled_;
    state_.set(var_idx, value);

    PropagationResult prop;
    if (incremental) {
        state_.domains().assign(var_idx, *value);
        prop = engine_.propagate(state_.domains(), {var_idx});
    } else {
        prop = reevaluate();
    }

    if (options_.verbose) {
        std::cerr << "% [verbose] edit: '" << var.name() << "' = ";
        if (value) {
            std::cerr << *value;
        } else {
            std::cerr << "(clear)";
        }
        std::cerr << (incremental ? " (incremental)" : " (rebuild)") << "\n";
    }
    return finish(prop, shrink_only);
}

SessionStatus Session::undo(size_t var_idx) {
    check_variable(var_idx);
    bool reverted = state_.revert(var_idx);
    if (options_.verbose) {
        std::cerr << "% [verbose] undo: '" << puzzle_->variable(var_idx).name() << "'"
                  << (reverted ? "" : " (no history)") << "\n";
    }
    return finish(reevaluate(), false);
}

SessionStatus Session::refresh() {
    return finish(reevaluate(), false);
}

SessionStatus Session::restore(const Assignment& values) {
    if (values.size() != puzzle_->num_variables()) {
        throw std::invalid_argument("Assignment size " + std::to_string(values.size()) +
                                    " does not match variable count " +
                                    std::to_string(puzzle_->num_variables()));
    }
    for (size_t i = 0; i < values.size(); ++i) {
        const auto& var = puzzle_->variable(i);
        if (values[i] && !var.domain().contains(*values[i])) {
            throw std::invalid_argument("Value " + std::to_string(*values[i]) +
                                        " is not in the domain of '" + var.name() + "'");
        }
    }

    state_.replace_all(values);
    auto prop = reevaluate();
    if (options_.verbose) {
        std::cerr << "% [verbose] restore: " << state_.committed_count() << " committed value(s)\n";
    }
    return finish(prop, false);
}

PropagationResult Session::reevaluate() {
    // ヒント（Fixed）など確定値と無関係な制約も含めて全制約を伝播する
    state_.rebuild();
    return engine_.propagate_all(state_.domains());
}

SessionStatus Session::finish(const PropagationResult& prop, bool shrink_only) {
    ++generation_;
    settled_ = prop.ok;
    SessionStatus status;

    if (!prop.ok) {
        state_.set_contradiction(true);
        status.state = SessionState::Violated;
        status.implicated_constraints = prop.conflicts;
        status.implicated_variables = prop.emptied;
        for (auto c_id : prop.conflicts) {
            for (auto var : puzzle_->constraints()[c_id].scope()) {
                if (state_.is_committed(var)) {
                    status.implicated_variables.insert(var);
                }
            }
        }
    } else if (state_.all_committed()) {
        // 全変数が確定: 探索せずに判定
        for (const auto& constraint : puzzle_->constraints()) {
            if (constraint.check(state_.committed()) == Satisfaction::Violated) {
                status.implicated_constraints.insert(constraint.id());
                for (auto var : constraint.scope()) {
                    status.implicated_variables.insert(var);
                }
            }
        }
        status.state = status.implicated_constraints.empty() ? SessionState::Solved
                                                             : SessionState::Violated;
    } else if (!options_.feasibility_enabled) {
        status.state = SessionState::InProgress;
    } else if (shrink_only && status_.state == SessionState::Infeasible) {
        // 確定値を追加しただけでは完成可能性は回復しない
        status.state = SessionState::Infeasible;
        if (options_.verbose) {
            std::cerr << "% [verbose] feasibility skipped: still infeasible\n";
        }
    } else if (worker_) {
        worker_->submit(generation_, state_.domains());
        status.state = SessionState::InProgress;
        status.search_pending = true;
    } else {
        auto result = checker_.check(state_.domains());
        last_search_stats_ = checker_.stats();
        status = from_feasibility(result);
    }

    status_ = status;
    if (options_.verbose) {
        std::cerr << "% [verbose] status: " << to_string(status_.state)
                  << " generation=" << generation_
                  << (status_.caveat ? " (caveat)" : "")
                  << (status_.search_pending ? " (search pending)" : "") << "\n";
    }
    return status_;
}

SessionStatus Session::from_feasibility(Feasibility result) {
    SessionStatus status;
    switch (result) {
        case Feasibility::Feasible:
            status.state = SessionState::InProgress;
            break;
        case Feasibility::Infeasible:
            status.state = SessionState::Infeasible;
            break;
        case Feasibility::Inconclusive:
            // 伝播で分かる範囲では違反なし
            status.state = SessionState::InProgress;
            status.caveat = true;
            break;
    }
    return status;
}

std::optional<SessionStatus> Session::poll() {
    if (!worker_) {
        return std::nullopt;
    }
    auto outcome = worker_->take_result();
    if (!outcome) {
        return std::nullopt;
    }
    if (outcome->generation != generation_) {
        ++stale_results_;
        if (options_.verbose) {
            std::cerr << "% [verbose] discarded stale search result (generation "
                      << outcome->generation << ", current " << generation_ << ")\n";
        }
        return std::nullopt;
    }

    last_search_stats_ = outcome->stats;
    status_ = from_feasibility(outcome->result);
    if (options_.verbose) {
        std::cerr << "% [verbose] status: " << to_string(status_.state)
                  << " generation=" << generation_ << " (background)"
                  << (status_.caveat ? " (caveat)" : "") << "\n";
    }
    return status_;
}

bool Session::wait_for_search(std::chrono::milliseconds timeout) {
    if (!worker_) {
        return true;
    }
    return worker_->wait_idle(timeout);
}

std::unique_ptr<Session> open_session(PuzzlePtr puzzle, SessionOptions options) {
    return std::make_unique<Session>(std::move(puzzle), options);
}

} // namespace puzzle_validator
