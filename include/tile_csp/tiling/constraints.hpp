/**
 * @file constraints.hpp
 * @brief タイル配置の大域制約（在庫・可視数）
 */
#ifndef TILE_CSP_TILING_CONSTRAINTS_HPP
#define TILE_CSP_TILING_CONSTRAINTS_HPP

#include "tile_csp/constraint.hpp"
#include "tile_csp/tiling/domain_builder.hpp"

namespace tile_csp {
namespace tiling {

/**
 * @brief 在庫制約: 形状 shape を使う配置の数 <= capacity
 */
class InventoryConstraint : public LinearBoundConstraint {
public:
    InventoryConstraint(std::vector<VariablePtr> vars, TileShape shape, int64_t capacity);

    std::string name() const override;

    TileShape shape() const { return shape_; }
    int64_t capacity() const { return ub_; }

private:
    TileShape shape_;
};

/**
 * @brief 可視数制約: 見える色 color の茂みの数 == target
 *
 * vars[i] は placements[i] の配置変数であること。
 */
class VisibilityConstraint : public LinearBoundConstraint {
public:
    VisibilityConstraint(std::vector<VariablePtr> vars,
                         const std::vector<Placement>& placements,
                         Landscape::Color color, int64_t target);

    std::string name() const override;

    Landscape::Color color() const { return color_; }
    int64_t target() const { return lb_; }

private:
    Landscape::Color color_;
};

} // namespace tiling
} // namespace tile_csp

#endif // TILE_CSP_TILING_CONSTRAINTS_HPP
