/**
 * @file constraint.hpp
 * @brief 制約の閉じた variant 型と共通インターフェース
 */
#ifndef PUZZLE_VALIDATOR_CONSTRAINT_HPP
#define PUZZLE_VALIDATOR_CONSTRAINT_HPP

#include "puzzle_validator/constraints/comparison.hpp"
#include "puzzle_validator/constraints/global.hpp"
#include <variant>
#include <vector>
#include <string>

namespace puzzle_validator {

/**
 * @brief ルール種別の閉じた集合
 *
 * 全ての種別は以下の共通インターフェースを持つ:
 * - name(): ログ用の名前
 * - scope(): 関与する変数インデックス
 * - check(assignment): 確定値に対する判定
 * - propagate(domains): 候補値集合の縮小（矛盾時 false）
 *
 * 種別を追加した場合、std::visit を使う箇所はコンパイル時に網羅性が検査される。
 */
using ConstraintRule = std::variant<
    AllDifferentConstraint,
    LinearEqConstraint,
    TableConstraint,
    LessConstraint,
    AbsDifferenceConstraint,
    FixedConstraint
>;

/**
 * @brief Puzzle に登録された制約
 *
 * ルール本体と Puzzle 内の制約 ID を保持する。不変。
 */
class Constraint {
public:
    Constraint(size_t id, ConstraintRule rule);

    /**
     * @brief 制約IDを取得（Puzzle 内の登録順インデックス）
     */
    size_t id() const { return id_; }

    const ConstraintRule& rule() const { return rule_; }

    std::string name() const;

    /**
     * @brief 制約が関係する変数インデックスを取得
     */
    const std::vector<size_t>& scope() const;

    /**
     * @brief 確定値に対して制約を判定
     */
    Satisfaction check(const Assignment& assignment) const;

    /**
     * @brief 制約伝播を実行
     * @return 伝播が成功すれば true、失敗（候補値集合が空）すれば false
     */
    bool propagate(DomainTable& domains) const;

private:
    size_t id_;
    ConstraintRule rule_;
};

} // namespace puzzle_validator

#endif // PUZZLE_VALIDATOR_CONSTRAINT_HPP
