/**
 * @file render.hpp
 * @brief 解のテキスト表示
 */
#ifndef TILE_CSP_TILING_RENDER_HPP
#define TILE_CSP_TILING_RENDER_HPP

#include "tile_csp/tiling/tiling_solver.hpp"
#include <string>

namespace tile_csp {
namespace tiling {

/**
 * @brief 4x4 のタイル模様
 *
 * 覆われたセルは '#'、見える茂みは色の数字、見える空きセルは '.'。
 * フットプリントの間は空白1つで区切る。
 */
std::string render_visual(const Landscape& landscape, const std::vector<PlacementChoice>& choices);

/**
 * @brief フットプリントごとの記号（F, O, L、タイルなしは '.'）
 */
std::string render_symbolic(const Landscape& landscape, const std::vector<PlacementChoice>& choices);

/**
 * @brief 形状ごとの使用数（"Full Block: 1/2 used"）
 */
std::string render_usage(const Inventory& inventory, const std::array<int64_t, NUM_SHAPES>& used);

/**
 * @brief 色ごとの見える茂みの数と目標
 */
std::string render_visibility(const std::map<Landscape::Color, int64_t>& visible,
                              const VisibilityTarget& target);

/**
 * @brief 解全体の表示
 */
std::string render_solution(const TilingProblem& problem, const TilingResult& result);

} // namespace tiling
} // namespace tile_csp

#endif // TILE_CSP_TILING_RENDER_HPP
