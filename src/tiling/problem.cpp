#include "tile_csp/tiling/problem.hpp"

namespace tile_csp {
namespace tiling {

Inventory::Inventory(int64_t full, int64_t outer_boundary, int64_t el_shape)
    : counts_{full, outer_boundary, el_shape} {}

int64_t Inventory::total() const {
    int64_t total = 0;
    for (auto c : counts_) {
        total += c;
    }
    return total;
}

size_t footprint_count(const Landscape& landscape) {
    return (landscape.rows() / TILE_SIZE) * (landscape.cols() / TILE_SIZE);
}

void validate_problem(const TilingProblem& problem) {
    const auto& landscape = problem.landscape;

    if (landscape.empty()) {
        throw ConfigurationError("landscape is empty");
    }
    if (landscape.rows() % TILE_SIZE != 0 || landscape.cols() % TILE_SIZE != 0) {
        throw ConfigurationError("landscape size " + std::to_string(landscape.rows()) + "x" +
                                 std::to_string(landscape.cols()) +
                                 " is not a multiple of " + std::to_string(TILE_SIZE));
    }

    for (size_t s = 0; s < NUM_SHAPES; ++s) {
        auto shape = static_cast<TileShape>(s);
        if (problem.inventory.count(shape) < 0) {
            throw ConfigurationError("negative inventory for " + shape_key(shape));
        }
    }

    for (const auto& [color, count] : problem.target) {
        if (color < 1 || color > NUM_COLORS) {
            throw ConfigurationError("visibility target for unknown color " + std::to_string(color));
        }
        if (count < 0) {
            throw ConfigurationError("negative visibility target for color " + std::to_string(color));
        }
        if (count > landscape.bush_count(color)) {
            throw ConfigurationError("visibility target " + std::to_string(count) +
                                     " for color " + std::to_string(color) +
                                     " exceeds the " + std::to_string(landscape.bush_count(color)) +
                                     " bushes of that color");
        }
    }

    if (!problem.allow_untiled) {
        auto footprints = static_cast<int64_t>(footprint_count(landscape));
        if (problem.inventory.total() < footprints) {
            throw ConfigurationError("inventory of " + std::to_string(problem.inventory.total()) +
                                     " tiles cannot cover " + std::to_string(footprints) +
                                     " footprints");
        }
    }
}

} // namespace tiling
} // namespace tile_csp
