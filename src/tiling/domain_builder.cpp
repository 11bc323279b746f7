#include "tile_csp/tiling/domain_builder.hpp"
#include <algorithm>
#include <limits>

namespace tile_csp {
namespace tiling {

std::string Placement::name() const {
    return "p[" + std::to_string(row) + "," + std::to_string(col) + "]";
}

DomainBuilder::DomainBuilder(const TilingProblem& problem)
    : problem_(problem) {
    validate_problem(problem_);

    const auto& landscape = problem_.landscape;
    for (size_t r = 0; r < landscape.rows(); r += TILE_SIZE) {
        for (size_t c = 0; c < landscape.cols(); c += TILE_SIZE) {
            placements_.push_back(make_placement(landscape, r, c));
        }
    }

    if (problem_.allow_untiled) {
        candidates_.push_back(NO_TILE);
    }
    if (problem_.inventory.count(TileShape::Full) > 0) {
        candidates_.push_back(FULL_TILE);
    }
    if (problem_.inventory.count(TileShape::OuterBoundary) > 0) {
        candidates_.push_back(OUTER_BOUNDARY_TILE);
    }
    if (problem_.inventory.count(TileShape::ELShape) > 0) {
        for (size_t o = 0; o < NUM_EL_ORIENTATIONS; ++o) {
            candidates_.push_back(encode(TileShape::ELShape, static_cast<ElOrientation>(o)));
        }
    }
}

Domain DomainBuilder::initial_domain(const Placement& /*placement*/) const {
    return Domain(candidates_);
}

Placement DomainBuilder::make_placement(const Landscape& landscape, size_t row, size_t col) {
    Placement p;
    p.row = row;
    p.col = col;

    for (size_t v = 0; v < NUM_TILE_VALUES; ++v) {
        auto value = static_cast<Domain::value_type>(v);
        for (size_t r = 0; r < TILE_SIZE; ++r) {
            for (size_t c = 0; c < TILE_SIZE; ++c) {
                auto color = landscape.color(row + r, col + c);
                if (color != Landscape::NONE && !covers(value, r, c)) {
                    p.visible[v][static_cast<size_t>(color)]++;
                }
            }
        }
    }
    return p;
}

void DomainBuilder::check_static_bounds() const {
    for (const auto& [color, target] : problem_.target) {
        int64_t lo = 0;
        int64_t hi = 0;
        for (const auto& p : placements_) {
            int64_t p_lo = std::numeric_limits<int64_t>::max();
            int64_t p_hi = std::numeric_limits<int64_t>::min();
            for (auto v : candidates_) {
                int64_t w = p.visible[static_cast<size_t>(v)][static_cast<size_t>(color)];
                p_lo = std::min(p_lo, w);
                p_hi = std::max(p_hi, w);
            }
            lo += p_lo;
            hi += p_hi;
        }

        if (target < lo || target > hi) {
            throw ConfigurationError("visibility target " + std::to_string(target) +
                                     " for color " + std::to_string(color) +
                                     " is outside the achievable range [" +
                                     std::to_string(lo) + ", " + std::to_string(hi) + "]");
        }
    }
}

} // namespace tiling
} // namespace tile_csp
