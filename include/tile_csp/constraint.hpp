/**
 * @file constraint.hpp
 * @brief 制約基底クラス
 */
#ifndef TILE_CSP_CONSTRAINT_HPP
#define TILE_CSP_CONSTRAINT_HPP

#include "tile_csp/variable.hpp"
#include <vector>
#include <memory>
#include <optional>
#include <string>
#include <cstdint>

namespace tile_csp {

/**
 * @brief 制約の基底クラス
 *
 * 制約は n 項だが、AC-3 が扱えるように単項・2項への射影
 * (supports) を提供する。射影は現在の定義域に対して健全であること：
 * ある値が射影で否定されるなら、その値を含む解は存在しない。
 *
 * 変数の引数はすべて制約内部のインデックス（vars_ の添字）で渡す。
 */
class Constraint {
public:
    virtual ~Constraint() = default;

    /**
     * @brief 制約IDを取得
     */
    size_t id() const { return id_; }

    /**
     * @brief Model 内のインデックスを取得
     */
    size_t model_index() const { return model_index_; }

    /**
     * @brief Model 内のインデックスを設定（Model::add_constraint から呼ばれる）
     */
    void set_model_index(size_t idx) { model_index_ = idx; }

    /**
     * @brief 制約の名前を取得
     */
    virtual std::string name() const = 0;

    /**
     * @brief 制約が関係する変数を取得
     */
    const std::vector<VariablePtr>& variables() const { return vars_; }

    /**
     * @brief 制約が満たされているか確認
     * @return 満たされていればtrue、違反していればfalse、
     *         未確定ならstd::nullopt
     */
    virtual std::optional<bool> is_satisfied() const = 0;

    /**
     * @brief 現在の定義域で制約を満たす可能性が残っているか
     */
    virtual bool is_feasible() const = 0;

    /**
     * @brief 単項射影: x = vx が他の変数の現在の定義域と両立しうるか
     */
    virtual bool supports(size_t x, Domain::value_type vx) const = 0;

    /**
     * @brief 2項射影: x = vx, y = vy が他の変数の現在の定義域と両立しうるか
     */
    virtual bool supports(size_t x, Domain::value_type vx,
                          size_t y, Domain::value_type vy) const = 0;

    /**
     * @brief 変数が他の変数と結合しているか（アークを張る対象か）
     *
     * 初期定義域のどの値を選んでも制約への寄与が変わらない変数は
     * 他の変数の選択に影響しないため false を返してよい。
     */
    virtual bool couples(size_t x) const { (void)x; return true; }

    /**
     * @brief 変数の定義域が変化した時に呼ばれる（削除・復元の両方）
     */
    virtual void on_domain_change(size_t x) = 0;

protected:
    /**
     * @brief コンストラクタ
     * @param vars 制約に関与する変数リスト
     */
    explicit Constraint(std::vector<VariablePtr> vars);

    // 制約に関与する変数
    std::vector<VariablePtr> vars_;

private:
    static size_t next_id_;
    size_t id_;
    size_t model_index_ = SIZE_MAX;
};

using ConstraintPtr = std::shared_ptr<Constraint>;

} // namespace tile_csp

#include "tile_csp/constraints/linear.hpp"

#endif // TILE_CSP_CONSTRAINT_HPP
