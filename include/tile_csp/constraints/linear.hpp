/**
 * @file linear.hpp
 * @brief 重み付き和の上下限制約 (lb <= Σ w_i(x_i) <= ub)
 */
#ifndef TILE_CSP_CONSTRAINTS_LINEAR_HPP
#define TILE_CSP_CONSTRAINTS_LINEAR_HPP

#include "tile_csp/constraint.hpp"

namespace tile_csp {

/**
 * @brief 重み付き和の上下限制約: lb <= Σ w_i(x_i) <= ub
 *
 * w_i は変数ごとの重みテーブル（値 → 重み）。
 * 各変数について現在の定義域上の最小重み・最大重みと、その総和を
 * 差分更新で保持する。射影は「他の変数の最小和/最大和」を使った
 * 区間チェックで、定義域の変化とともに単調に厳しくなる。
 */
class LinearBoundConstraint : public Constraint {
public:
    /// 値 → 重み（値は 0 以上の小さな整数。範囲外の値の重みは 0）
    using WeightTable = std::vector<int64_t>;

    /**
     * @brief 制約を作成
     * @param vars 変数リスト（重複なし）
     * @param weights 変数ごとの重みテーブル（vars と同じ長さ）
     * @param lb 下限
     * @param ub 上限
     * @throws std::invalid_argument vars と weights の長さが異なる場合
     */
    LinearBoundConstraint(std::vector<VariablePtr> vars,
                          std::vector<WeightTable> weights,
                          int64_t lb, int64_t ub);

    std::string name() const override;
    std::optional<bool> is_satisfied() const override;
    bool is_feasible() const override;
    bool supports(size_t x, Domain::value_type vx) const override;
    bool supports(size_t x, Domain::value_type vx,
                  size_t y, Domain::value_type vy) const override;
    bool couples(size_t x) const override { return coupled_[x]; }
    void on_domain_change(size_t x) override;

    /**
     * @brief 変数 x が値 v を取った時の重み
     */
    int64_t weight(size_t x, Domain::value_type v) const;

    int64_t lower_bound() const { return lb_; }
    int64_t upper_bound() const { return ub_; }

    /**
     * @brief 現在の定義域で達成可能な和の最小値
     */
    int64_t min_sum() const { return sum_lo_; }

    /**
     * @brief 現在の定義域で達成可能な和の最大値
     */
    int64_t max_sum() const { return sum_hi_; }

protected:
    int64_t lb_;
    int64_t ub_;

private:
    void refresh(size_t x);

    std::vector<WeightTable> weights_;
    std::vector<int64_t> var_lo_;   // 変数ごとの現在の最小重み
    std::vector<int64_t> var_hi_;   // 変数ごとの現在の最大重み
    int64_t sum_lo_ = 0;
    int64_t sum_hi_ = 0;
    std::vector<bool> coupled_;
};

} // namespace tile_csp

#endif // TILE_CSP_CONSTRAINTS_LINEAR_HPP
