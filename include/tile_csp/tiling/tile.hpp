/**
 * @file tile.hpp
 * @brief タイル形状と変数値の符号化
 */
#ifndef TILE_CSP_TILING_TILE_HPP
#define TILE_CSP_TILING_TILE_HPP

#include "tile_csp/domain.hpp"
#include <optional>
#include <string>
#include <cstddef>

namespace tile_csp {
namespace tiling {

/// タイル（フットプリント）の一辺のセル数
constexpr size_t TILE_SIZE = 4;

/// 茂みの色の数（色は 1..NUM_COLORS、0 は茂みなし）
constexpr int NUM_COLORS = 4;

/**
 * @brief タイル形状（向きは含まない）
 */
enum class TileShape {
    Full = 0,            // 16 セルすべてを覆う
    OuterBoundary = 1,   // 外周 12 セルを覆い、中央 2x2 が見える
    ELShape = 2          // 隣り合う2辺（1行 + 1列、7 セル）を覆う
};

constexpr size_t NUM_SHAPES = 3;

/**
 * @brief EL 形状の向き（覆う2辺）
 */
enum class ElOrientation {
    TopLeft = 0,
    TopRight = 1,
    BottomRight = 2,
    BottomLeft = 3
};

constexpr size_t NUM_EL_ORIENTATIONS = 4;

// ===== 変数値の符号化 =====
// 配置変数の値は以下の整数で表す。EL は EL_BASE + 向き。

constexpr Domain::value_type NO_TILE = 0;
constexpr Domain::value_type FULL_TILE = 1;
constexpr Domain::value_type OUTER_BOUNDARY_TILE = 2;
constexpr Domain::value_type EL_BASE = 3;

/// 値の種類数（NO_TILE ～ EL_BASE + 3）
constexpr size_t NUM_TILE_VALUES = 7;

/**
 * @brief 形状（と EL の向き）から値を得る
 */
Domain::value_type encode(TileShape shape, ElOrientation orientation = ElOrientation::TopLeft);

/**
 * @brief 値の形状を取得（NO_TILE や範囲外の値なら std::nullopt）
 */
std::optional<TileShape> shape_of(Domain::value_type value);

/**
 * @brief EL の向きを取得（EL 以外なら std::nullopt）
 */
std::optional<ElOrientation> orientation_of(Domain::value_type value);

/**
 * @brief 値のタイルがフットプリント内のセル (r, c) を覆うか
 * @param r フットプリント内の行 (0..TILE_SIZE-1)
 * @param c フットプリント内の列 (0..TILE_SIZE-1)
 */
bool covers(Domain::value_type value, size_t r, size_t c);

/**
 * @brief 値の表示名（"NoTile", "Full", "OuterBoundary", "EL(top-left)" など）
 * @throws std::out_of_range 値が範囲外の場合
 */
std::string value_name(Domain::value_type value);

/**
 * @brief 形状の表示名
 */
std::string shape_name(TileShape shape);

/**
 * @brief 入力ファイル上の形状キー（"FULL_BLOCK", "OUTER_BOUNDARY", "EL_SHAPE"）
 */
std::string shape_key(TileShape shape);

} // namespace tiling
} // namespace tile_csp

#endif // TILE_CSP_TILING_TILE_HPP
