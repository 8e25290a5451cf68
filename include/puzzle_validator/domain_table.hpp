/**
 * @file domain_table.hpp
 * @brief 変数ごとの候補値集合テーブル（コピーオンライト）
 */
#ifndef PUZZLE_VALIDATOR_DOMAIN_TABLE_HPP
#define PUZZLE_VALIDATOR_DOMAIN_TABLE_HPP

#include "puzzle_validator/domain.hpp"
#include <vector>
#include <memory>

namespace puzzle_validator {

/**
 * @brief 変数インデックスで引く候補値集合のアリーナ
 *
 * テーブルのコピーは各スロットの共有ポインタのみを複製する。
 * スロットへの書き込み時に他テーブルと共有されていれば、
 * そのスロットだけを複製してから変更する（copy-on-branch）。
 *
 * 探索ノードごとの分岐は O(変数数) のポインタコピーで済み、
 * 実際に縮小された変数の Domain だけが複製される。
 *
 * @note 複製の要否は use_count() で判定するため、スロットを共有する
 *       テーブル同士は同じスレッドに属すること。別スレッドへ渡す場合は
 *       detached() で共有を切る。Puzzle が保持する開始時点のテーブルは
 *       変更されないので、どのスレッドから共有してもよい。
 */
class DomainTable {
public:
    using value_type = Domain::value_type;

    DomainTable() = default;

    /**
     * @brief 初期候補値集合からテーブルを作成
     */
    explicit DomainTable(const std::vector<Domain>& domains);

    size_t size() const { return slots_.size(); }

    /**
     * @brief どのテーブルともスロットを共有しない複製を作成
     */
    DomainTable detached() const;

    /**
     * @brief 変数の候補値集合を取得（読み取り専用）
     */
    const Domain& operator[](size_t var_idx) const { return *slots_[var_idx]; }

    /**
     * @brief 変数の候補値集合を書き込み用に取得
     *
     * 共有されているスロットはここで複製される。
     */
    Domain& mutable_domain(size_t var_idx);

    /**
     * @brief 値を削除
     * @return 候補値集合が縮小したら true
     */
    bool remove(size_t var_idx, value_type value);

    /**
     * @brief threshold 未満の値を削除
     * @return 候補値集合が縮小したら true
     */
    bool remove_below(size_t var_idx, value_type threshold);

    /**
     * @brief threshold 超の値を削除
     * @return 候補値集合が縮小したら true
     */
    bool remove_above(size_t var_idx, value_type threshold);

    /**
     * @brief 単一値に絞り込む（値が無ければ空になる）
     * @return 候補値集合が縮小したら true
     */
    bool assign(size_t var_idx, value_type value);

    /**
     * @brief 空の候補値集合を持つ変数があるか
     */
    bool any_empty() const;

    /**
     * @brief 全変数が単一値に固定されているか
     */
    bool all_singleton() const;

    /**
     * @brief other とスロットを共有している変数の数（テスト・診断用）
     */
    size_t shared_with(const DomainTable& other) const;

    /**
     * @brief 全変数の候補値集合が値として等しいか
     */
    bool operator==(const DomainTable& other) const;
    bool operator!=(const DomainTable& other) const { return !(*this == other); }

private:
    std::vector<std::shared_ptr<Domain>> slots_;
};

} // namespace puzzle_validator

#endif // PUZZLE_VALIDATOR_DOMAIN_TABLE_HPP
