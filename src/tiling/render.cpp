#include "tile_csp/tiling/render.hpp"
#include <sstream>

namespace tile_csp {
namespace tiling {

namespace {

/// フットプリント (行, 列) → 選んだ値（選択のないフットプリントは NO_TILE）
std::vector<std::vector<Domain::value_type>> value_grid(
        const Landscape& landscape, const std::vector<PlacementChoice>& choices) {
    std::vector<std::vector<Domain::value_type>> grid(
        landscape.rows() / TILE_SIZE,
        std::vector<Domain::value_type>(landscape.cols() / TILE_SIZE, NO_TILE));
    for (const auto& choice : choices) {
        auto fr = choice.row / TILE_SIZE;
        auto fc = choice.col / TILE_SIZE;
        if (fr < grid.size() && fc < grid[fr].size()) {
            grid[fr][fc] = choice.value;
        }
    }
    return grid;
}

char shape_symbol(Domain::value_type value) {
    auto shape = shape_of(value);
    if (!shape) {
        return '.';
    }
    switch (*shape) {
        case TileShape::Full:          return 'F';
        case TileShape::OuterBoundary: return 'O';
        case TileShape::ELShape:       return 'L';
    }
    return '?';
}

} // namespace

std::string render_visual(const Landscape& landscape, const std::vector<PlacementChoice>& choices) {
    auto grid = value_grid(landscape, choices);
    std::ostringstream oss;

    for (size_t fr = 0; fr < grid.size(); ++fr) {
        for (size_t r = 0; r < TILE_SIZE; ++r) {
            for (size_t fc = 0; fc < grid[fr].size(); ++fc) {
                if (fc > 0) oss << ' ';
                for (size_t c = 0; c < TILE_SIZE; ++c) {
                    if (covers(grid[fr][fc], r, c)) {
                        oss << '#';
                        continue;
                    }
                    auto color = landscape.color(fr * TILE_SIZE + r, fc * TILE_SIZE + c);
                    oss << (color == Landscape::NONE ? '.' : static_cast<char>('0' + color));
                }
            }
            oss << '\n';
        }
    }
    return oss.str();
}

std::string render_symbolic(const Landscape& landscape, const std::vector<PlacementChoice>& choices) {
    auto grid = value_grid(landscape, choices);
    std::ostringstream oss;
    for (const auto& row : grid) {
        for (size_t fc = 0; fc < row.size(); ++fc) {
            if (fc > 0) oss << ' ';
            oss << shape_symbol(row[fc]);
        }
        oss << '\n';
    }
    return oss.str();
}

std::string render_usage(const Inventory& inventory, const std::array<int64_t, NUM_SHAPES>& used) {
    std::ostringstream oss;
    for (size_t s = 0; s < NUM_SHAPES; ++s) {
        auto shape = static_cast<TileShape>(s);
        oss << shape_name(shape) << ": " << used[s] << "/" << inventory.count(shape) << " used\n";
    }
    return oss.str();
}

std::string render_visibility(const std::map<Landscape::Color, int64_t>& visible,
                              const VisibilityTarget& target) {
    std::ostringstream oss;
    for (const auto& [color, count] : visible) {
        oss << "Color " << color << ": " << count << " visible";
        auto it = target.find(color);
        if (it != target.end()) {
            oss << " (target " << it->second << ")";
        }
        oss << '\n';
    }
    return oss.str();
}

std::string render_solution(const TilingProblem& problem, const TilingResult& result) {
    std::ostringstream oss;
    oss << "\nTile Placement Solution:\n";
    oss << "F = Full Block, O = Outer Boundary, L = El Shape\n";
    oss << "\nVisual Representation:\n";
    oss << render_visual(problem.landscape, result.choices);
    oss << "\nSymbolic Representation:\n";
    oss << render_symbolic(problem.landscape, result.choices);
    oss << "\nTile Usage:\n";
    oss << render_usage(problem.inventory, result.used);
    oss << "\nVisible Bushes:\n";
    oss << render_visibility(result.visible, problem.target);
    return oss.str();
}

} // namespace tiling
} // namespace tile_csp
