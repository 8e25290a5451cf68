#include "puzzle_validator/feasibility_worker.hpp"
#include <iostream>

namespace puzzle_validator {

FeasibilityWorker::FeasibilityWorker(PuzzlePtr puzzle, size_t node_limit, bool verbose)
    : puzzle_(std::move(puzzle))
    , checker_(*puzzle_)
    , node_limit_(node_limit) {
    checker_.set_verbose(verbose);
    thread_ = std::thread([this]() { run(); });
}

FeasibilityWorker::~FeasibilityWorker() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutdown_ = true;
        pending_.reset();
    }
    checker_.stop();
    cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
}

void FeasibilityWorker::submit(uint64_t generation, const DomainTable& snapshot) {
    // ワーカースレッドとセッションでスロットを共有しない
    DomainTable own = snapshot.detached();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_ = Job{generation, std::move(own)};
    }
    cv_.notify_all();
}

std::optional<FeasibilityOutcome> FeasibilityWorker::take_result() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::optional<FeasibilityOutcome> out;
    out.swap(result_);
    return out;
}

bool FeasibilityWorker::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this]() { return !pending_ && !running_; });
}

bool FeasibilityWorker::busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.has_value() || running_;
}

void FeasibilityWorker::set_node_limit(size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    node_limit_ = limit;
}

void FeasibilityWorker::run() {
    while (true) {
        Job job;
        size_t node_limit;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return shutdown_ || pending_.has_value(); });
            if (shutdown_) {
                return;
            }
            job = std::move(*pending_);
            pending_.reset();
            running_ = true;
            node_limit = node_limit_;
        }

        // 探索はロック外で実行（submit() をブロックしない）
        checker_.set_node_limit(node_limit);
        FeasibilityOutcome outcome;
        outcome.generation = job.generation;
        outcome.result = checker_.check(job.snapshot);
        outcome.stats = checker_.stats();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_ = false;
            if (!shutdown_) {
                result_ = std::move(outcome);
            }
        }
        cv_.notify_all();
    }
}

} // namespace puzzle_validator
