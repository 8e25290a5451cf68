/**
 * @file assignment_state.hpp
 * @brief ユーザーの入力状態（確定値・候補値集合・取り消し履歴）
 */
#ifndef PUZZLE_VALIDATOR_ASSIGNMENT_STATE_HPP
#define PUZZLE_VALIDATOR_ASSIGNMENT_STATE_HPP

#include "puzzle_validator/puzzle.hpp"
#include <vector>
#include <optional>

namespace puzzle_validator {

/**
 * @brief 1セッションが専有する入力状態
 *
 * 変数ごとに確定値（または未確定）と現在の候補値集合を持つ。
 * 確定値は常に現在の候補値集合に含まれる。候補値集合が空になった場合は
 * 原因の編集が取り消されるまで contradiction フラグが立つ。
 */
class AssignmentState {
public:
    using value_type = Domain::value_type;

    explicit AssignmentState(const Puzzle& puzzle);

    const Assignment& committed() const { return committed_; }

    std::optional<value_type> value(size_t var_idx) const { return committed_[var_idx]; }

    bool is_committed(size_t var_idx) const { return committed_[var_idx].has_value(); }

    size_t committed_count() const { return committed_count_; }

    bool all_committed() const { return committed_count_ == committed_.size(); }

    const DomainTable& domains() const { return domains_; }
    DomainTable& domains() { return domains_; }

    bool contradiction() const { return contradiction_; }
    void set_contradiction(bool value) { contradiction_ = value; }

    /**
     * @brief 確定値を変更し、変更前の値を取り消し履歴に積む
     */
    void set(size_t var_idx, std::optional<value_type> value);

    /**
     * @brief 変数の直前の編集を取り消す
     * @return 取り消す履歴があれば true
     */
    bool revert(size_t var_idx);

    /**
     * @brief 全ての確定値を置き換え、取り消し履歴を破棄する
     */
    void replace_all(const Assignment& values);

    /**
     * @brief 変数の取り消し履歴の深さ
     */
    size_t history_depth(size_t var_idx) const { return history_[var_idx].size(); }

    /**
     * @brief 候補値集合を開始時点から作り直し、全確定値を単一値として適用
     * @return 確定済みの変数（伝播の dirty 集合）
     */
    std::vector<size_t> rebuild();

private:
    void store(size_t var_idx, std::optional<value_type> value);

    const Puzzle& puzzle_;
    Assignment committed_;
    size_t committed_count_ = 0;
    DomainTable domains_;
    std::vector<std::vector<std::optional<value_type>>> history_;
    bool contradiction_ = false;
};

} // namespace puzzle_validator

#endif // PUZZLE_VALIDATOR_ASSIGNMENT_STATE_HPP
