/**
 * @file feasibility_worker.hpp
 * @brief 完成可能性探索のバックグラウンドワーカー
 */
#ifndef PUZZLE_VALIDATOR_FEASIBILITY_WORKER_HPP
#define PUZZLE_VALIDATOR_FEASIBILITY_WORKER_HPP

#include "puzzle_validator/feasibility.hpp"
#include <thread>
#include <mutex>
#include <condition_variable>
#include <optional>
#include <cstdint>

namespace puzzle_validator {

/**
 * @brief バックグラウンド探索の結果（開始時の世代番号付き）
 */
struct FeasibilityOutcome {
    uint64_t generation = 0;
    Feasibility result = Feasibility::Inconclusive;
    SearchStats stats;
};

/**
 * @brief 1セッション専用の探索ワーカー
 *
 * 専用スレッドを1本持ち、同時に実行する探索は常に1つだけ。
 * 実行中に submit() された新しいジョブは保留スロットを上書きする
 * （古い保留ジョブは実行されずに破棄される）。実行中の探索は中断せず、
 * 結果は世代番号付きで保存され、古いかどうかの判定は呼び出し側が行う。
 *
 * デストラクタは実行中の探索に停止を要求し、スレッドを join する。
 */
class FeasibilityWorker {
public:
    FeasibilityWorker(PuzzlePtr puzzle, size_t node_limit, bool verbose);
    ~FeasibilityWorker();

    FeasibilityWorker(const FeasibilityWorker&) = delete;
    FeasibilityWorker& operator=(const FeasibilityWorker&) = delete;

    /**
     * @brief 探索ジョブを登録
     * @param generation ジョブ作成時のセッション世代
     * @param snapshot 伝播済みテーブル（スロットを共有しない複製を保持する）
     */
    void submit(uint64_t generation, const DomainTable& snapshot);

    /**
     * @brief 完了済みの最新結果を取り出す（無ければ std::nullopt）
     */
    std::optional<FeasibilityOutcome> take_result();

    /**
     * @brief 保留・実行中のジョブが無くなるまで待つ
     * @return タイムアウト前にアイドルになれば true
     */
    bool wait_idle(std::chrono::milliseconds timeout);

    /**
     * @brief 保留または実行中のジョブがあるか
     */
    bool busy() const;

    /**
     * @brief ノード数上限を変更（次のジョブから有効）
     */
    void set_node_limit(size_t limit);

private:
    struct Job {
        uint64_t generation;
        DomainTable snapshot;
    };

    void run();

    PuzzlePtr puzzle_;
    FeasibilityChecker checker_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::optional<Job> pending_;
    std::optional<FeasibilityOutcome> result_;
    bool running_ = false;
    bool shutdown_ = false;
    size_t node_limit_;

    std::thread thread_;  // 他メンバの初期化後に起動するため最後に宣言
};

} // namespace puzzle_validator

#endif // PUZZLE_VALIDATOR_FEASIBILITY_WORKER_HPP
