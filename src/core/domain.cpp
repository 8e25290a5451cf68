#include "puzzle_validator/domain.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>
#include <string>

namespace puzzle_validator {

namespace {

/**
 * @brief hi - lo を符号なしで計算（lo <= hi が前提、オーバーフローしない）
 */
uint64_t span_of(Domain::value_type lo, Domain::value_type hi) {
    return static_cast<uint64_t>(hi) - static_cast<uint64_t>(lo);
}

[[noreturn]] void throw_too_large(const std::string& what) {
    throw std::length_error("domain " + what + " exceeds " +
                            std::to_string(Domain::MAX_VALUES) + " values");
}

}  // namespace

Domain::Domain()
    : offset_(0)
    , n_(0)
    , min_(std::numeric_limits<value_type>::max())
    , max_(std::numeric_limits<value_type>::min()) {}

Domain::Domain(value_type min, value_type max)
    : offset_(min)
    , n_(0)
    , min_(min)
    , max_(max) {
    if (min > max) {
        offset_ = 0;
        min_ = std::numeric_limits<value_type>::max();
        max_ = std::numeric_limits<value_type>::min();
        return;
    }
    uint64_t last = span_of(min, max);
    if (last >= MAX_VALUES) {
        throw_too_large("[" + std::to_string(min) + ", " + std::to_string(max) + "]");
    }
    size_t range = static_cast<size_t>(last) + 1;
    sparse_.resize(range);
    values_.reserve(range);
    for (size_t i = 0; i < range; ++i) {
        // min + i <= max なのでオーバーフローしない
        sparse_[i] = i;
        values_.push_back(min + static_cast<value_type>(i));
    }
    n_ = range;
}

Domain::Domain(std::vector<value_type> values)
    : offset_(0)
    , n_(0)
    , min_(std::numeric_limits<value_type>::max())
    , max_(std::numeric_limits<value_type>::min()) {
    if (values.empty()) {
        return;
    }
    // 重複を除去してソート
    std::sort(values.begin(), values.end());
    values.erase(std::unique(values.begin(), values.end()), values.end());
    if (values.size() > MAX_VALUES) {
        throw_too_large("of " + std::to_string(values.size()) + " values");
    }

    values_ = std::move(values);
    n_ = values_.size();
    min_ = values_.front();
    max_ = values_.back();
    offset_ = min_;

    uint64_t last = span_of(min_, max_);
    if (last >= SPARSE_THRESHOLD && last / 2 >= n_) {
        // 疎な値リスト: レンジ分の配列は確保しない
        indexed_ = true;
        index_.reserve(n_);
        for (size_t i = 0; i < n_; ++i) {
            index_.emplace(values_[i], i);
        }
        return;
    }
    sparse_.assign(static_cast<size_t>(last) + 1, SIZE_MAX);
    for (size_t i = 0; i < n_; ++i) {
        sparse_[static_cast<size_t>(span_of(offset_, values_[i]))] = i;
    }
}

bool Domain::contains(value_type value) const {
    if (n_ == 0 || value < min_ || value > max_) return false;
    return position(value) < n_;
}

bool Domain::remove(value_type value) {
    if (!contains(value)) {
        return false;  // 元々存在しない（変更なし）
    }

    size_t idx = position(value);
    swap_at(idx, n_ - 1);
    --n_;

    if (value == min_ || value == max_) {
        update_bounds();
    }
    return true;
}

bool Domain::remove_below(value_type threshold) {
    if (n_ == 0 || threshold <= min_) return false;

    size_t before = n_;
    size_t i = 0;
    while (i < n_) {
        if (values_[i] < threshold) {
            swap_at(i, n_ - 1);
            --n_;
            // swap先を再チェックするので i は進めない
        } else {
            ++i;
        }
    }
    update_bounds();
    return n_ != before;
}

bool Domain::remove_above(value_type threshold) {
    if (n_ == 0 || threshold >= max_) return false;

    size_t before = n_;
    size_t i = 0;
    while (i < n_) {
        if (values_[i] > threshold) {
            swap_at(i, n_ - 1);
            --n_;
        } else {
            ++i;
        }
    }
    update_bounds();
    return n_ != before;
}

bool Domain::assign(value_type value) {
    if (!contains(value)) {
        clear();
        return false;
    }

    size_t idx = position(value);
    swap_at(idx, 0);
    n_ = 1;
    min_ = value;
    max_ = value;
    return true;
}

void Domain::clear() {
    n_ = 0;
    update_bounds();
}

std::vector<Domain::value_type> Domain::values() const {
    std::vector<value_type> result(values_.begin(), values_.begin() + static_cast<std::ptrdiff_t>(n_));
    std::sort(result.begin(), result.end());
    return result;
}

bool Domain::operator==(const Domain& other) const {
    if (n_ != other.n_) return false;
    for (size_t i = 0; i < n_; ++i) {
        if (!other.contains(values_[i])) return false;
    }
    return true;
}

bool Domain::is_subset_of(const Domain& other) const {
    if (n_ > other.n_) return false;
    for (size_t i = 0; i < n_; ++i) {
        if (!other.contains(values_[i])) return false;
    }
    return true;
}

size_t Domain::position(value_type value) const {
    if (indexed_) {
        auto it = index_.find(value);
        return it == index_.end() ? SIZE_MAX : it->second;
    }
    if (value < offset_) return SIZE_MAX;
    uint64_t idx_val = span_of(offset_, value);
    if (idx_val >= sparse_.size()) return SIZE_MAX;
    return sparse_[static_cast<size_t>(idx_val)];
}

void Domain::set_position(value_type value, size_t idx) {
    if (indexed_) {
        index_[value] = idx;
    } else {
        sparse_[static_cast<size_t>(span_of(offset_, value))] = idx;
    }
}

void Domain::swap_at(size_t i, size_t j) {
    if (i == j) return;
    value_type vi = values_[i];
    value_type vj = values_[j];
    values_[i] = vj;
    values_[j] = vi;
    set_position(vi, j);
    set_position(vj, i);
}

void Domain::update_bounds() {
    if (n_ == 0) {
        min_ = std::numeric_limits<value_type>::max();
        max_ = std::numeric_limits<value_type>::min();
        return;
    }

    // Dense 配列の有効部分 [0, n_) をスキャンして min/max を求める
    value_type lo = values_[0];
    value_type hi = values_[0];
    for (size_t i = 1; i < n_; ++i) {
        value_type v = values_[i];
        if (v < lo) lo = v;
        if (v > hi) hi = v;
    }
    min_ = lo;
    max_ = hi;
}

} // namespace puzzle_validator
