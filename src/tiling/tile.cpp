#include "tile_csp/tiling/tile.hpp"
#include <stdexcept>

namespace tile_csp {
namespace tiling {

Domain::value_type encode(TileShape shape, ElOrientation orientation) {
    switch (shape) {
        case TileShape::Full:
            return FULL_TILE;
        case TileShape::OuterBoundary:
            return OUTER_BOUNDARY_TILE;
        case TileShape::ELShape:
            return EL_BASE + static_cast<Domain::value_type>(orientation);
    }
    return NO_TILE;
}

std::optional<TileShape> shape_of(Domain::value_type value) {
    if (value == FULL_TILE) return TileShape::Full;
    if (value == OUTER_BOUNDARY_TILE) return TileShape::OuterBoundary;
    if (value >= EL_BASE && value < static_cast<Domain::value_type>(NUM_TILE_VALUES)) {
        return TileShape::ELShape;
    }
    return std::nullopt;
}

std::optional<ElOrientation> orientation_of(Domain::value_type value) {
    if (shape_of(value) != TileShape::ELShape) {
        return std::nullopt;
    }
    return static_cast<ElOrientation>(value - EL_BASE);
}

bool covers(Domain::value_type value, size_t r, size_t c) {
    constexpr size_t last = TILE_SIZE - 1;
    auto shape = shape_of(value);
    if (!shape) {
        return false;
    }

    switch (*shape) {
        case TileShape::Full:
            return true;
        case TileShape::OuterBoundary:
            return r == 0 || r == last || c == 0 || c == last;
        case TileShape::ELShape:
            break;
    }

    switch (*orientation_of(value)) {
        case ElOrientation::TopLeft:     return r == 0 || c == 0;
        case ElOrientation::TopRight:    return r == 0 || c == last;
        case ElOrientation::BottomRight: return r == last || c == last;
        case ElOrientation::BottomLeft:  return r == last || c == 0;
    }
    return false;
}

std::string value_name(Domain::value_type value) {
    switch (value) {
        case NO_TILE:             return "NoTile";
        case FULL_TILE:           return "Full";
        case OUTER_BOUNDARY_TILE: return "OuterBoundary";
        case EL_BASE + 0:         return "EL(top-left)";
        case EL_BASE + 1:         return "EL(top-right)";
        case EL_BASE + 2:         return "EL(bottom-right)";
        case EL_BASE + 3:         return "EL(bottom-left)";
        default:
            throw std::out_of_range("Unknown tile value: " + std::to_string(value));
    }
}

std::string shape_name(TileShape shape) {
    switch (shape) {
        case TileShape::Full:          return "Full Block";
        case TileShape::OuterBoundary: return "Outer Boundary";
        case TileShape::ELShape:       return "El Shape";
    }
    return "";
}

std::string shape_key(TileShape shape) {
    switch (shape) {
        case TileShape::Full:          return "FULL_BLOCK";
        case TileShape::OuterBoundary: return "OUTER_BOUNDARY";
        case TileShape::ELShape:       return "EL_SHAPE";
    }
    return "";
}

} // namespace tiling
} // namespace tile_csp
