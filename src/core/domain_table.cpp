#include "puzzle_validator/domain_table.hpp"
#include <algorithm>

namespace puzzle_validator {

DomainTable::DomainTable(const std::vector<Domain>& domains) {
    slots_.reserve(domains.size());
    for (const auto& d : domains) {
        slots_.push_back(std::make_shared<Domain>(d));
    }
}

DomainTable DomainTable::detached() const {
    DomainTable copy;
    copy.slots_.reserve(slots_.size());
    for (const auto& slot : slots_) {
        copy.slots_.push_back(std::make_shared<Domain>(*slot));
    }
    return copy;
}

Domain& DomainTable::mutable_domain(size_t var_idx) {
    auto& slot = slots_[var_idx];
    if (slot.use_count() > 1) {
        // 共有中: このスロットだけ複製してから書き込む
        slot = std::make_shared<Domain>(*slot);
    }
    return *slot;
}

bool DomainTable::remove(size_t var_idx, value_type value) {
    if (!slots_[var_idx]->contains(value)) {
        return false;  // 複製を避けるため先に確認
    }
    return mutable_domain(var_idx).remove(value);
}

bool DomainTable::remove_below(size_t var_idx, value_type threshold) {
    const Domain& d = *slots_[var_idx];
    if (d.empty() || threshold <= d.min().value()) {
        return false;
    }
    return mutable_domain(var_idx).remove_below(threshold);
}

bool DomainTable::remove_above(size_t var_idx, value_type threshold) {
    const Domain& d = *slots_[var_idx];
    if (d.empty() || threshold >= d.max().value()) {
        return false;
    }
    return mutable_domain(var_idx).remove_above(threshold);
}

bool DomainTable::assign(size_t var_idx, value_type value) {
    const Domain& d = *slots_[var_idx];
    if (d.empty()) {
        return false;
    }
    if (d.is_singleton() && d.contains(value)) {
        return false;  // 既に固定済み
    }
    mutable_domain(var_idx).assign(value);
    return true;
}

bool DomainTable::any_empty() const {
    for (const auto& slot : slots_) {
        if (slot->empty()) return true;
    }
    return false;
}

bool DomainTable::all_singleton() const {
    for (const auto& slot : slots_) {
        if (!slot->is_singleton()) return false;
    }
    return true;
}

size_t DomainTable::shared_with(const DomainTable& other) const {
    size_t count = 0;
    size_t n = std::min(slots_.size(), other.slots_.size());
    for (size_t i = 0; i < n; ++i) {
        if (slots_[i] == other.slots_[i]) ++count;
    }
    return count;
}

bool DomainTable::operator==(const DomainTable& other) const {
    if (slots_.size() != other.slots_.size()) return false;
    for (size_t i = 0; i < slots_.size(); ++i) {
        if (slots_[i] == other.slots_[i]) continue;
        if (*slots_[i] != *other.slots_[i]) return false;
    }
    return true;
}

} // namespace puzzle_validator
