#include "tile_csp/tiling/landscape.hpp"

namespace tile_csp {
namespace tiling {

Landscape::Landscape(size_t rows, size_t cols, std::vector<Color> cells)
    : rows_(rows)
    , cols_(cols)
    , cells_(std::move(cells)) {
    if (cells_.size() != rows_ * cols_) {
        throw ConfigurationError("landscape has " + std::to_string(cells_.size()) +
                                 " cells, expected " + std::to_string(rows_ * cols_));
    }
    for (size_t i = 0; i < cells_.size(); ++i) {
        Color c = cells_[i];
        if (c < NONE || c > NUM_COLORS) {
            throw ConfigurationError("invalid bush color " + std::to_string(c) +
                                     " at (" + std::to_string(i / cols_) + ", " +
                                     std::to_string(i % cols_) + ")");
        }
        counts_[static_cast<size_t>(c)]++;
    }
}

Landscape Landscape::from_rows(const std::vector<std::vector<Color>>& rows) {
    if (rows.empty()) {
        return Landscape(0, 0, {});
    }
    size_t cols = rows.front().size();
    std::vector<Color> cells;
    cells.reserve(rows.size() * cols);
    for (size_t r = 0; r < rows.size(); ++r) {
        if (rows[r].size() != cols) {
            throw ConfigurationError("landscape row " + std::to_string(r) + " has " +
                                     std::to_string(rows[r].size()) + " cells, expected " +
                                     std::to_string(cols));
        }
        cells.insert(cells.end(), rows[r].begin(), rows[r].end());
    }
    return Landscape(rows.size(), cols, std::move(cells));
}

int64_t Landscape::bush_count(Color color) const {
    if (color <= NONE || color > NUM_COLORS) {
        return 0;
    }
    return counts_[static_cast<size_t>(color)];
}

int64_t Landscape::total_bushes() const {
    int64_t total = 0;
    for (Color c = 1; c <= NUM_COLORS; ++c) {
        total += counts_[static_cast<size_t>(c)];
    }
    return total;
}

} // namespace tiling
} // namespace tile_csp
