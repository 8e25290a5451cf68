/**
 * @file puzzle.hpp
 * @brief パズル定義（ローダーからの入力）と不変パズルモデル
 */
#ifndef PUZZLE_VALIDATOR_PUZZLE_HPP
#define PUZZLE_VALIDATOR_PUZZLE_HPP

#include "puzzle_validator/variable.hpp"
#include "puzzle_validator/constraint.hpp"
#include "puzzle_validator/domain_table.hpp"
#include <vector>
#include <map>
#include <memory>
#include <string>
#include <stdexcept>

namespace puzzle_validator {

/**
 * @brief パズルの構造的欠陥（ロード失敗）
 */
class MalformedPuzzleError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief 変数の定義（名前と開始時点の候補値）
 */
struct VariableSpec {
    std::string name;
    std::vector<Domain::value_type> values;
};

/**
 * @brief ローダーが組み立てるパズル定義
 *
 * 制約のスコープは add_variable() が返すインデックスで変数を参照する。
 * 検証は load_puzzle() で行うため、ここでは何も検査しない。
 */
class PuzzleDefinition {
public:
    /**
     * @brief 値リストの候補値を持つ変数を追加
     * @return 変数インデックス
     */
    size_t add_variable(std::string name, std::vector<Domain::value_type> values);

    /**
     * @brief 区間 [min, max] の候補値を持つ変数を追加
     * @return 変数インデックス
     * @throws MalformedPuzzleError 値が Domain::MAX_VALUES 個を超える場合
     */
    size_t add_variable(std::string name, Domain::value_type min, Domain::value_type max);

    /**
     * @brief 制約を追加
     */
    void add_constraint(ConstraintRule rule);

    const std::vector<VariableSpec>& variables() const { return variables_; }
    const std::vector<ConstraintRule>& constraints() const { return constraints_; }

private:
    std::vector<VariableSpec> variables_;
    std::vector<ConstraintRule> constraints_;
};

/**
 * @brief 不変のパズルモデル
 *
 * 変数・制約と、伝播用の索引（変数 -> 制約、変数 -> 隣接変数）を保持する。
 * 構築後は読み取り専用のため、複数のセッション・スレッドから共有してよい。
 */
class Puzzle {
    struct Token {
        explicit Token() = default;
    };

public:
    /**
     * @brief load_puzzle() 専用（Token は外部から作れない）
     */
    explicit Puzzle(Token) {}

    const std::vector<Variable>& variables() const { return variables_; }
    const std::vector<Constraint>& constraints() const { return constraints_; }

    size_t num_variables() const { return variables_.size(); }
    size_t num_constraints() const { return constraints_.size(); }

    /**
     * @brief IDで変数を取得
     * @throws std::out_of_range 範囲外の ID
     */
    const Variable& variable(size_t id) const;

    /**
     * @brief IDで制約を取得
     * @throws std::out_of_range 範囲外の ID
     */
    const Constraint& constraint(size_t id) const;

    /**
     * @brief 名前から変数インデックスを検索
     * @return 見つかればインデックス、なければ SIZE_MAX
     */
    size_t find_variable(const std::string& name) const;

    /**
     * @brief 変数をスコープに含む制約 ID（昇順）
     */
    const std::vector<size_t>& constraints_for_var(size_t var_idx) const {
        return var_to_constraints_[var_idx];
    }

    /**
     * @brief 変数と制約を共有する他の変数（昇順）
     */
    const std::vector<size_t>& neighbors(size_t var_idx) const {
        return neighbors_[var_idx];
    }

    /**
     * @brief 開始時点の候補値テーブル
     *
     * コピーは Domain を共有するため安価。書き込み時に複製される。
     */
    const DomainTable& initial_domains() const { return initial_domains_; }

private:
    friend std::shared_ptr<const Puzzle> load_puzzle(const PuzzleDefinition& definition);

    std::vector<Variable> variables_;
    std::vector<Constraint> constraints_;
    std::map<std::string, size_t> name_to_id_;
    std::vector<std::vector<size_t>> var_to_constraints_;
    std::vector<std::vector<size_t>> neighbors_;
    DomainTable initial_domains_;
};

using PuzzlePtr = std::shared_ptr<const Puzzle>;

/**
 * @brief パズル定義を検証して不変モデルを構築
 *
 * @throws MalformedPuzzleError 以下のいずれかの場合
 *   - 変数名が空または重複
 *   - 開始時点の候補値が空
 *   - 制約スコープが空、未知の変数を参照、または同じ変数を重複して含む
 *   - linear_eq の係数数がスコープと不一致、または係数 0
 *   - table のタプル長がスコープと不一致、またはタプルが 0 個
 *   - abs_difference の距離が負
 */
PuzzlePtr load_puzzle(const PuzzleDefinition& definition);

} // namespace puzzle_validator

#endif // PUZZLE_VALIDATOR_PUZZLE_HPP
