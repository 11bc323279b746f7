#include "tile_csp/tiling/constraints.hpp"
#include <stdexcept>

namespace tile_csp {
namespace tiling {

namespace {

std::vector<LinearBoundConstraint::WeightTable> shape_weights(size_t n, TileShape shape) {
    LinearBoundConstraint::WeightTable table(NUM_TILE_VALUES, 0);
    for (size_t v = 0; v < NUM_TILE_VALUES; ++v) {
        if (shape_of(static_cast<Domain::value_type>(v)) == shape) {
            table[v] = 1;
        }
    }
    return std::vector<LinearBoundConstraint::WeightTable>(n, table);
}

std::vector<LinearBoundConstraint::WeightTable> visibility_weights(
        const std::vector<Placement>& placements, Landscape::Color color) {
    if (color < 1 || color > NUM_COLORS) {
        throw std::invalid_argument("visibility: unknown color " + std::to_string(color));
    }
    std::vector<LinearBoundConstraint::WeightTable> weights;
    weights.reserve(placements.size());
    for (const auto& p : placements) {
        LinearBoundConstraint::WeightTable table(NUM_TILE_VALUES, 0);
        for (size_t v = 0; v < NUM_TILE_VALUES; ++v) {
            table[v] = p.visible[v][static_cast<size_t>(color)];
        }
        weights.push_back(std::move(table));
    }
    return weights;
}

} // namespace

// ============================================================================
// InventoryConstraint implementation
// ============================================================================

InventoryConstraint::InventoryConstraint(std::vector<VariablePtr> vars, TileShape shape,
                                         int64_t capacity)
    : LinearBoundConstraint(vars, shape_weights(vars.size(), shape), 0, capacity)
    , shape_(shape) {}

std::string InventoryConstraint::name() const {
    return "inventory(" + shape_key(shape_) + ")";
}

// ============================================================================
// VisibilityConstraint implementation
// ============================================================================

VisibilityConstraint::VisibilityConstraint(std::vector<VariablePtr> vars,
                                           const std::vector<Placement>& placements,
                                           Landscape::Color color, int64_t target)
    : LinearBoundConstraint(vars, visibility_weights(placements, color), target, target)
    , color_(color) {}

std::string VisibilityConstraint::name() const {
    return "visibility(color=" + std::to_string(color_) + ")";
}

} // namespace tiling
} // namespace tile_csp
