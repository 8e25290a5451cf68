/**
 * @file session.hpp
 * @brief 検証セッション（GUI から呼ばれるファサード）
 */
#ifndef PUZZLE_VALIDATOR_SESSION_HPP
#define PUZZLE_VALIDATOR_SESSION_HPP

#include "puzzle_validator/assignment_state.hpp"
#include "puzzle_validator/propagator.hpp"
#include "puzzle_validator/feasibility.hpp"
#include "puzzle_validator/feasibility_worker.hpp"
#include <memory>
#include <optional>
#include <set>
#include <chrono>
#include <cstdint>

namespace puzzle_validator {

/**
 * @brief セッションの状態
 */
enum class SessionState {
    InProgress,   // 違反なし、完成可能（または判定保留）
    Violated,     // 伝播で矛盾、または確定値が制約に違反
    Infeasible,   // 違反は無いが完成形が存在しない
    Solved        // 全変数が確定し全制約を充足
};

inline const char* to_string(SessionState s) {
    switch (s) {
        case SessionState::InProgress: return "in_progress";
        case SessionState::Violated: return "violated";
        case SessionState::Infeasible: return "infeasible";
        case SessionState::Solved: return "solved";
    }
    return "unknown";
}

/**
 * @brief 編集ごとに返す状態
 */
struct SessionStatus {
    SessionState state = SessionState::InProgress;
    std::set<size_t> implicated_variables;    // 関与する変数 ID
    std::set<size_t> implicated_constraints;  // 関与する制約 ID
    bool caveat = false;          // 探索が上限に達し完成可能性は未確認
    bool search_pending = false;  // バックグラウンド探索の結果待ち

    bool operator==(const SessionStatus& other) const {
        return state == other.state &&
               implicated_variables == other.implicated_variables &&
               implicated_constraints == other.implicated_constraints &&
               caveat == other.caveat &&
               search_pending == other.search_pending;
    }
    bool operator!=(const SessionStatus& other) const { return !(*this == other); }
};

/**
 * @brief セッション設定
 */
struct SessionOptions {
    size_t node_limit = FeasibilityChecker::DEFAULT_NODE_LIMIT;  // 探索ノード数上限（0 は上限なし）
    bool feasibility_enabled = true;   // false なら伝播による矛盾検出のみ
    bool background_search = false;   // true なら探索をワーカースレッドで実行
    bool verbose = false;
};

/**
 * @brief 検証セッション
 *
 * 1つのパズルに対するユーザーの入力状態を専有し、編集ごとに
 * 伝播 → 完成判定 → 完成可能性探索 のパイプラインを実行して状態を返す。
 *
 * 状態遷移:
 * - 伝播で矛盾 → Violated（編集は保持され、undo で解消）
 * - 全変数確定かつ全制約充足 → Solved（以後の編集も通常通り評価）
 * - 探索で完成形なし → Infeasible
 * - 探索で完成形あり → InProgress
 * - 探索がノード数上限 → InProgress（caveat = true）
 *
 * セッションの操作は全て呼び出しスレッドで同期的に完了する。
 * background_search が有効な場合のみ、探索はスナップショットに対して
 * ワーカースレッドで実行され、結果は poll() で取り込む。
 * 結果は開始時の世代番号が現在の世代と一致する場合のみ適用される。
 */
class Session {
public:
    using value_type = Domain::value_type;

    explicit Session(PuzzlePtr puzzle, SessionOptions options = SessionOptions{});
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * @brief 変数の確定値を設定またはクリア（std::nullopt）
     *
     * 現在の候補に無い値も受け付け、その場合は Violated となる。
     *
     * @throws std::out_of_range 未知の変数 ID
     * @throws std::invalid_argument 開始時点の候補値に無い値
     */
    SessionStatus edit(size_t var_idx, std::optional<value_type> value);

    /**
     * @brief 変数の直前の編集を取り消す（どの状態でも可能）
     * @throws std::out_of_range 未知の変数 ID
     */
    SessionStatus undo(size_t var_idx);

    /**
     * @brief 開始時点から全変数 dirty でパイプラインを再実行
     */
    SessionStatus refresh();

    /**
     * @brief 保存済みの確定値で全体を置き換えて再評価（取り消し履歴は破棄）
     * @throws std::invalid_argument サイズ不一致、または開始時点の候補値に無い値
     */
    SessionStatus restore(const Assignment& values);

    /**
     * @brief バックグラウンド探索の結果を取り込む
     * @return 現在の世代の結果が適用されれば新しい状態、それ以外は std::nullopt
     */
    std::optional<SessionStatus> poll();

    /**
     * @brief バックグラウンド探索の完了を待つ（テスト・終了処理用）
     * @return タイムアウト前に完了すれば true
     */
    bool wait_for_search(std::chrono::milliseconds timeout);

    const SessionStatus& status() const { return status_; }

    const Puzzle& puzzle() const { return *puzzle_; }

    /**
     * @brief 変数の現在の候補値集合
     * @throws std::out_of_range 未知の変数 ID
     */
    const Domain& domain(size_t var_idx) const;

    bool is_committed(size_t var_idx) const;

    const Assignment& committed() const { return state_.committed(); }

    bool contradiction() const { return state_.contradiction(); }

    /**
     * @brief 世代番号（評価のたびに増加）
     */
    uint64_t generation() const { return generation_; }

    /**
     * @brief 直前に完了した探索の統計情報
     */
    const SearchStats& last_search_stats() const { return last_search_stats_; }

    /**
     * @brief 破棄した古いバックグラウンド結果の数
     */
    size_t stale_results() const { return stale_results_; }

    // ===== 設定 =====

    const SessionOptions& options() const { return options_; }

    void set_node_limit(size_t limit);

    void set_feasibility_enabled(bool enabled) { options_.feasibility_enabled = enabled; }

    void set_verbose(bool enabled);

private:
    /**
     * @brief 開始時点から作り直し、全制約を不動点まで伝播
     */
    PropagationResult reevaluate();

    /**
     * @brief 伝播結果からパイプラインの残りを実行して状態を確定
     * @param prop 伝播結果
     * @param shrink_only 候補値集合が縮小するだけの編集か
     */
    SessionStatus finish(const PropagationResult& prop, bool shrink_only);

    /**
     * @brief 探索結果を状態に変換
     */
    static SessionStatus from_feasibility(Feasibility result);

    void check_variable(size_t var_idx) const;

    PuzzlePtr puzzle_;
    SessionOptions options_;
    AssignmentState state_;
    PropagationEngine engine_;
    FeasibilityChecker checker_;
    std::unique_ptr<FeasibilityWorker> worker_;

    SessionStatus status_;
    uint64_t generation_ = 0;
    SearchStats last_search_stats_;
    size_t stale_results_ = 0;
    bool settled_ = false;  // テーブルが全制約の不動点にあるか
};

/**
 * @brief パズルを開いてセッションを作成（初期状態は InProgress）
 */
std::unique_ptr<Session> open_session(PuzzlePtr puzzle, SessionOptions options = SessionOptions{});

} // namespace puzzle_validator

#endif // PUZZLE_VALIDATOR_SESSION_HPP
