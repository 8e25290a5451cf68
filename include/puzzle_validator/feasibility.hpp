/**
 * @file feasibility.hpp
 * @brief 完成可能性チェッカー（ノード数上限付きバックトラック探索）
 */
#ifndef PUZZLE_VALIDATOR_FEASIBILITY_HPP
#define PUZZLE_VALIDATOR_FEASIBILITY_HPP

#include "puzzle_validator/propagator.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>

namespace puzzle_validator {

/**
 * @brief 探索結果
 */
enum class Feasibility {
    Feasible,      // 少なくとも1つの完成形が存在する
    Infeasible,    // 探索空間を尽くしても完成形が存在しない
    Inconclusive   // ノード数上限に達した（または停止要求）
};

inline const char* to_string(Feasibility f) {
    switch (f) {
        case Feasibility::Feasible: return "feasible";
        case Feasibility::Infeasible: return "infeasible";
        case Feasibility::Inconclusive: return "inconclusive";
    }
    return "unknown";
}

/**
 * @brief 探索統計情報
 */
struct SearchStats {
    size_t nodes = 0;                      // 試行した仮割り当ての数
    size_t failures = 0;                   // 伝播で矛盾した仮割り当ての数
    size_t max_depth = 0;
    bool plausibility_failed = false;      // 探索前の全伝播で矛盾
    bool ceiling_hit = false;              // ノード数上限に到達
    std::chrono::microseconds elapsed{0};
};

/**
 * @brief 完成可能性チェッカー
 *
 * 与えられた候補値テーブル（伝播済みのスナップショット）に対して、
 * 全制約を満たす完全な割り当てが存在するかを判定する。解そのものは返さない。
 *
 * 手順:
 * 1. スナップショットのコピーに全変数 dirty で伝播（妥当性チェック）
 * 2. 候補が最小の未固定変数を選択（同数なら ID の小さい方）
 * 3. 値を昇順に試し、テーブルをコピーして仮割り当て後に伝播してから再帰
 *
 * テーブルのコピーはコピーオンライトのため、ノードごとの複製は
 * 実際に縮小した変数の Domain のみ。入力テーブルは変更しない。
 */
class FeasibilityChecker {
public:
    /// ノード数上限のデフォルト値
    static constexpr size_t DEFAULT_NODE_LIMIT = 200000;

    explicit FeasibilityChecker(const Puzzle& puzzle);

    /**
     * @brief 完成可能性を判定
     * @param snapshot 判定対象の候補値テーブル（変更されない）
     */
    Feasibility check(const DomainTable& snapshot);

    /**
     * @brief 直前の check() の統計情報を取得
     */
    const SearchStats& stats() const { return stats_; }

    /**
     * @brief ノード数上限を設定（0 は上限なし）
     */
    void set_node_limit(size_t limit) { node_limit_ = limit; }
    size_t node_limit() const { return node_limit_; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

    /**
     * @brief 探索を停止する（別スレッドから呼び出し可能）
     *
     * 停止した探索は Inconclusive を返す。
     */
    void stop() { stopped_ = true; }

    void reset_stop() { stopped_ = false; }

    bool is_stopped() const { return stopped_; }

private:
    Feasibility search(const DomainTable& domains, size_t depth);

    /**
     * @brief 次に分岐する変数を選択
     * @return 候補が2つ以上の変数が無ければ SIZE_MAX
     */
    size_t select_variable(const DomainTable& domains) const;

    /**
     * @brief 全変数が単一値のテーブルで全制約が充足されるか
     */
    bool verify(const DomainTable& domains) const;

    const Puzzle& puzzle_;
    PropagationEngine engine_;
    size_t node_limit_ = DEFAULT_NODE_LIMIT;
    bool verbose_ = false;
    std::atomic<bool> stopped_{false};
    SearchStats stats_;
};

} // namespace puzzle_validator

#endif // PUZZLE_VALIDATOR_FEASIBILITY_HPP
