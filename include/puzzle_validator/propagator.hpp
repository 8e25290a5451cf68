/**
 * @file propagator.hpp
 * @brief 制約伝播エンジン（固定点まで候補値集合を縮小）
 */
#ifndef PUZZLE_VALIDATOR_PROPAGATOR_HPP
#define PUZZLE_VALIDATOR_PROPAGATOR_HPP

#include "puzzle_validator/puzzle.hpp"
#include <vector>
#include <set>

namespace puzzle_validator {

/**
 * @brief 伝播結果
 */
struct PropagationResult {
    bool ok = true;                 // false なら矛盾（候補値集合が空）
    std::set<size_t> conflicts;     // 矛盾を起こした制約 ID
    std::set<size_t> emptied;       // 候補値集合が空になった変数
    size_t rounds = 0;              // ワークリストのラウンド数
    size_t revisions = 0;           // propagate() の呼び出し回数
};

/**
 * @brief 制約伝播エンジン
 *
 * dirty 変数のワークリストを処理する。各ラウンドで dirty 変数を
 * スコープに含む制約を ID 順に propagate() し、候補値集合が縮小した変数と
 * その隣接変数を次のラウンドの dirty とする。縮小が無くなれば固定点。
 *
 * 候補値集合は単調に縮小するのみのため、必ず停止する。
 * エンジン自体は状態を持たず、const な Puzzle を参照するだけなので
 * 複数スレッドから同時に使用してよい（テーブルは呼び出し側ごとに別）。
 */
class PropagationEngine {
public:
    explicit PropagationEngine(const Puzzle& puzzle);

    /**
     * @brief dirty 変数から固定点まで伝播
     * @param domains 変更対象のテーブル
     * @param dirty 直前に変更された変数
     */
    PropagationResult propagate(DomainTable& domains, const std::vector<size_t>& dirty) const;

    /**
     * @brief 全変数を dirty として伝播（全制約を少なくとも1回実行）
     */
    PropagationResult propagate_all(DomainTable& domains) const;

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

private:
    const Puzzle& puzzle_;
    bool verbose_ = false;
};

} // namespace puzzle_validator

#endif // PUZZLE_VALIDATOR_PROPAGATOR_HPP
