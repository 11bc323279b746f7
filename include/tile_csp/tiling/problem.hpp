/**
 * @file problem.hpp
 * @brief タイル配置問題のインスタンス
 */
#ifndef TILE_CSP_TILING_PROBLEM_HPP
#define TILE_CSP_TILING_PROBLEM_HPP

#include "tile_csp/tiling/landscape.hpp"
#include "tile_csp/tiling/tile.hpp"
#include <array>
#include <map>

namespace tile_csp {
namespace tiling {

/**
 * @brief 形状ごとのタイル在庫
 */
class Inventory {
public:
    Inventory() = default;
    Inventory(int64_t full, int64_t outer_boundary, int64_t el_shape);

    int64_t count(TileShape shape) const { return counts_[static_cast<size_t>(shape)]; }
    void set(TileShape shape, int64_t count) { counts_[static_cast<size_t>(shape)] = count; }

    /**
     * @brief 全形状の在庫の合計
     */
    int64_t total() const;

private:
    std::array<int64_t, NUM_SHAPES> counts_{};
};

/**
 * @brief 色 → 見えるべき茂みの数
 *
 * 含まれない色は制約しない。
 */
using VisibilityTarget = std::map<Landscape::Color, int64_t>;

/**
 * @brief タイル配置問題
 */
struct TilingProblem {
    Landscape landscape;
    Inventory inventory;
    VisibilityTarget target;
    bool allow_untiled = true;   // false ならすべてのフットプリントにタイルを置く
};

/**
 * @brief フットプリントの数（行方向 × 列方向）
 */
size_t footprint_count(const Landscape& landscape);

/**
 * @brief 問題の構造を検証
 *
 * 検出するもの:
 * - 空のグリッド、4 の倍数でない縦横サイズ
 * - 負の在庫、負の目標値、範囲外の色の目標
 * - その色の茂みの総数を超える目標
 * - タイルなしを許さない場合に在庫の合計がフットプリント数に満たない
 *
 * @throws ConfigurationError
 */
void validate_problem(const TilingProblem& problem);

} // namespace tiling
} // namespace tile_csp

#endif // TILE_CSP_TILING_PROBLEM_HPP
