#include "tile_csp/constraints/linear.hpp"
#include <algorithm>
#include <limits>
#include <stdexcept>

namespace tile_csp {

// ============================================================================
// LinearBoundConstraint implementation
// ============================================================================

LinearBoundConstraint::LinearBoundConstraint(std::vector<VariablePtr> vars,
                                             std::vector<WeightTable> weights,
                                             int64_t lb, int64_t ub)
    : Constraint(std::move(vars))
    , lb_(lb)
    , ub_(ub)
    , weights_(std::move(weights)) {
    if (weights_.size() != vars_.size()) {
        throw std::invalid_argument("linear_bound: weights and variables differ in length");
    }

    var_lo_.assign(vars_.size(), 0);
    var_hi_.assign(vars_.size(), 0);
    coupled_.assign(vars_.size(), false);
    for (size_t i = 0; i < vars_.size(); ++i) {
        refresh(i);
        // 初期定義域で重みが一定の変数は他の変数の選択に影響しない
        coupled_[i] = var_hi_[i] > var_lo_[i];
    }
}

std::string LinearBoundConstraint::name() const {
    return "linear_bound";
}

int64_t LinearBoundConstraint::weight(size_t x, Domain::value_type v) const {
    const auto& table = weights_[x];
    if (v < 0 || static_cast<size_t>(v) >= table.size()) {
        return 0;
    }
    return table[static_cast<size_t>(v)];
}

std::optional<bool> LinearBoundConstraint::is_satisfied() const {
    int64_t sum = 0;
    for (size_t i = 0; i < vars_.size(); ++i) {
        if (!vars_[i]->is_assigned()) {
            return std::nullopt;
        }
        sum += weight(i, vars_[i]->assigned_value().value());
    }
    return lb_ <= sum && sum <= ub_;
}

bool LinearBoundConstraint::is_feasible() const {
    return sum_lo_ <= ub_ && sum_hi_ >= lb_;
}

bool LinearBoundConstraint::supports(size_t x, Domain::value_type vx) const {
    int64_t rest_lo = sum_lo_ - var_lo_[x];
    int64_t rest_hi = sum_hi_ - var_hi_[x];
    int64_t w = weight(x, vx);
    return rest_lo + w <= ub_ && rest_hi + w >= lb_;
}

bool LinearBoundConstraint::supports(size_t x, Domain::value_type vx,
                                     size_t y, Domain::value_type vy) const {
    if (x == y) {
        return vx == vy && supports(x, vx);
    }
    int64_t rest_lo = sum_lo_ - var_lo_[x] - var_lo_[y];
    int64_t rest_hi = sum_hi_ - var_hi_[x] - var_hi_[y];
    int64_t w = weight(x, vx) + weight(y, vy);
    return rest_lo + w <= ub_ && rest_hi + w >= lb_;
}

void LinearBoundConstraint::on_domain_change(size_t x) {
    refresh(x);
}

void LinearBoundConstraint::refresh(size_t x) {
    const auto& domain = vars_[x]->domain();
    if (domain.empty()) {
        return;
    }

    int64_t lo = std::numeric_limits<int64_t>::max();
    int64_t hi = std::numeric_limits<int64_t>::min();
    for (auto v : domain) {
        int64_t w = weight(x, v);
        lo = std::min(lo, w);
        hi = std::max(hi, w);
    }

    // 差分更新
    sum_lo_ += lo - var_lo_[x];
    sum_hi_ += hi - var_hi_[x];
    var_lo_[x] = lo;
    var_hi_[x] = hi;
}

} // namespace tile_csp
