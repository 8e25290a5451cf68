/**
 * @file domain.hpp
 * @brief 候補値集合クラス（Sparse Set ベース）
 */
#ifndef PUZZLE_VALIDATOR_DOMAIN_HPP
#define PUZZLE_VALIDATOR_DOMAIN_HPP

#include <vector>
#include <unordered_map>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace puzzle_validator {

/**
 * @brief 変数の候補値集合を表すクラス
 *
 * Sparse Set を使用し、O(1) での値の存在確認と削除を実現する。
 * Sparse 配列はフラット vector（offset ベース）で高速ルックアップ。
 * 値リストのレンジが SPARSE_THRESHOLD を超えて疎な場合は、フラット配列の
 * 代わりにハッシュ索引（index_）で位置を管理する。
 *
 * 値の個数は MAX_VALUES 以下。超える場合は std::length_error を送出する。
 *
 * 伝播中に矛盾を表現するため、空集合も正当な状態として扱う。
 * 値は初期集合から削除されるのみで、追加されることはない。
 */
class Domain {
public:
    using value_type = int64_t;

    /// フラット sparse 配列を使う最大レンジ（これを超えて疎ならハッシュ索引）
    static constexpr size_t SPARSE_THRESHOLD = 10000;

    /// 1つの候補値集合が持てる値の最大個数
    static constexpr size_t MAX_VALUES = size_t{1} << 20;

    /**
     * @brief 空の候補値集合を作成
     */
    Domain();

    /**
     * @brief 区間 [min, max] の候補値集合を作成
     * @throws std::length_error 区間の値が MAX_VALUES 個を超える場合
     */
    Domain(value_type min, value_type max);

    /**
     * @brief 値リストから候補値集合を作成（重複は除去）
     * @throws std::length_error 値が MAX_VALUES 個を超える場合
     */
    explicit Domain(std::vector<value_type> values);

    bool empty() const { return n_ == 0; }

    size_t size() const { return n_; }

    /**
     * @brief 最小値を取得（空なら std::nullopt）
     */
    std::optional<value_type> min() const { return n_ == 0 ? std::nullopt : std::optional<value_type>(min_); }

    /**
     * @brief 最大値を取得（空なら std::nullopt）
     */
    std::optional<value_type> max() const { return n_ == 0 ? std::nullopt : std::optional<value_type>(max_); }

    /**
     * @brief 値が候補に含まれるか
     */
    bool contains(value_type value) const;

    /**
     * @brief 値を削除
     * @return 値が存在して削除されたら true（結果が空になる場合も含む）
     */
    bool remove(value_type value);

    /**
     * @brief threshold 未満の値を一括削除
     * @return 1つ以上削除されたら true
     */
    bool remove_below(value_type threshold);

    /**
     * @brief threshold 超の値を一括削除
     * @return 1つ以上削除されたら true
     */
    bool remove_above(value_type threshold);

    /**
     * @brief 単一値に絞り込む
     *
     * 値が候補に含まれない場合、候補値集合は空になる。
     *
     * @return 値が候補に含まれていたら true
     */
    bool assign(value_type value);

    /**
     * @brief 全ての値を削除
     */
    void clear();

    /**
     * @brief 単一値に固定されているか
     */
    bool is_singleton() const { return n_ == 1; }

    /**
     * @brief 有効な値を昇順で取得
     */
    std::vector<value_type> values() const;

    /**
     * @brief 値集合として等しいか（内部の並び順は無視）
     */
    bool operator==(const Domain& other) const;
    bool operator!=(const Domain& other) const { return !(*this == other); }

    /**
     * @brief other の部分集合か
     */
    bool is_subset_of(const Domain& other) const;

    /**
     * @brief ハッシュ索引で管理しているか（疎な値リスト）
     */
    bool is_indexed() const { return indexed_; }

private:
    size_t position(value_type value) const;
    void set_position(value_type value, size_t idx);
    void swap_at(size_t i, size_t j);
    void update_bounds();

    std::vector<value_type> values_;  // Dense 配列
    std::vector<size_t> sparse_;      // フラット sparse 配列（sparse_[val - offset_] = index）
    std::unordered_map<value_type, size_t> index_;  // indexed_ 時の値 → index
    bool indexed_ = false;
    value_type offset_;               // = 初期 min 値
    size_t n_;                        // 有効な値の数
    value_type min_;                  // キャッシュ
    value_type max_;                  // キャッシュ
};

} // namespace puzzle_validator

#endif // PUZZLE_VALIDATOR_DOMAIN_HPP
