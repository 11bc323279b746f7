#include "tile_csp/domain.hpp"
#include <algorithm>
#include <limits>
#include <cassert>
#include <stdexcept>
#include <string>

namespace tile_csp {

namespace {

// max - min + 1 を符号なしで計算（int64_t のオーバーフローを避ける）
size_t checked_range(Domain::value_type min, Domain::value_type max) {
    auto span = static_cast<uint64_t>(max) - static_cast<uint64_t>(min);
    if (span >= Domain::MAX_RANGE) {
        throw std::invalid_argument("domain range [" + std::to_string(min) + ", " +
                                    std::to_string(max) + "] exceeds " +
                                    std::to_string(Domain::MAX_RANGE) + " values");
    }
    return static_cast<size_t>(span) + 1;
}

} // namespace

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
        return;
    }
    size_t range = checked_range(min, max);
    sparse_.assign(range, SIZE_MAX);
    values_.reserve(range);
    for (size_t i = 0; i < range; ++i) {
        sparse_[i] = i;
        values_.push_back(min + static_cast<value_type>(i));
    }
    n_ = values_.size();
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
    size_t range = checked_range(values.front(), values.back());

    values_ = std::move(values);
    n_ = values_.size();
    min_ = values_.front();
    max_ = values_.back();
    offset_ = min_;

    sparse_.assign(range, SIZE_MAX);
    for (size_t i = 0; i < n_; ++i) {
        sparse_[static_cast<size_t>(values_[i] - offset_)] = i;
    }
}

bool Domain::contains(value_type value) const {
    if (n_ == 0 || value < min_ || value > max_) return false;
    auto idx_val = static_cast<size_t>(value - offset_);
    if (idx_val >= sparse_.size()) {
        return false;
    }
    return sparse_[idx_val] < n_;
}

size_t Domain::index_of(value_type value) const {
    if (value < offset_) return SIZE_MAX;
    auto idx_val = static_cast<size_t>(static_cast<uint64_t>(value) - static_cast<uint64_t>(offset_));
    if (idx_val >= sparse_.size() || sparse_[idx_val] >= n_) {
        return SIZE_MAX;
    }
    return sparse_[idx_val];
}

bool Domain::remove(value_type value) {
    size_t idx = index_of(value);
    if (idx == SIZE_MAX) {
        return true;  // 元々存在しない → 成功（変更なし）
    }

    // 削除すると空になる場合は失敗
    if (n_ == 1) {
        return false;
    }

    swap_at(idx, n_ - 1);
    --n_;

    if (value == min_ || value == max_) {
        update_bounds();
    }
    return true;
}

bool Domain::assign(value_type value) {
    size_t idx = index_of(value);
    if (idx == SIZE_MAX) {
        return false;
    }
    swap_at(idx, 0);
    n_ = 1;
    min_ = value;
    max_ = value;
    return true;
}

void Domain::restore(value_type value, size_t old_index) {
    assert(n_ < values_.size() && values_[n_] == value);
    (void)value;
    ++n_;
    swap_at(n_ - 1, old_index);
    update_bounds();
}

std::vector<Domain::value_type> Domain::values() const {
    std::vector<value_type> result(values_.begin(), values_.begin() + static_cast<std::ptrdiff_t>(n_));
    std::sort(result.begin(), result.end());
    return result;
}

void Domain::swap_at(size_t i, size_t j) {
    if (i == j) return;
    value_type vi = values_[i];
    value_type vj = values_[j];
    values_[i] = vj;
    values_[j] = vi;
    sparse_[static_cast<size_t>(vj - offset_)] = i;
    sparse_[static_cast<size_t>(vi - offset_)] = j;
}

void Domain::update_bounds() {
    if (n_ == 0) return;
    min_ = values_[0];
    max_ = values_[0];
    for (size_t i = 1; i < n_; ++i) {
        if (values_[i] < min_) min_ = values_[i];
        if (values_[i] > max_) max_ = values_[i];
    }
}

} // namespace tile_csp
