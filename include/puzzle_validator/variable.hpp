/**
 * @file variable.hpp
 * @brief パズル変数クラス（入力可能なマス）
 */
#ifndef PUZZLE_VALIDATOR_VARIABLE_HPP
#define PUZZLE_VALIDATOR_VARIABLE_HPP

#include "puzzle_validator/domain.hpp"
#include <string>

namespace puzzle_validator {

/**
 * @brief パズル変数を表すクラス
 *
 * 1つの入力可能なマスに対応する。ロード後は不変。
 */
class Variable {
public:
    /**
     * @brief 変数を作成
     * @param id Puzzle 内のインデックス
     * @param name 変数名（Puzzle 内で一意）
     * @param domain 開始時点の候補値集合
     * @note 通常は load_puzzle() が作成する
     */
    Variable(size_t id, std::string name, Domain domain);

    /**
     * @brief 変数の Puzzle 内 ID を取得
     *
     * Puzzle 内のインデックスとして直接使用可能。
     */
    size_t id() const { return id_; }

    const std::string& name() const;

    /**
     * @brief 開始時点の候補値集合を取得
     */
    const Domain& domain() const;

private:
    size_t id_;
    std::string name_;
    Domain domain_;
};

} // namespace puzzle_validator

#endif // PUZZLE_VALIDATOR_VARIABLE_HPP
