/**
 * @file domain_builder.hpp
 * @brief 配置変数と初期定義域の構築
 */
#ifndef TILE_CSP_TILING_DOMAIN_BUILDER_HPP
#define TILE_CSP_TILING_DOMAIN_BUILDER_HPP

#include "tile_csp/tiling/problem.hpp"
#include "tile_csp/domain.hpp"
#include <array>
#include <string>
#include <vector>

namespace tile_csp {
namespace tiling {

/**
 * @brief 配置（1つの 4x4 フットプリント）
 */
struct Placement {
    size_t row;   // アンカーセル（左上）の行
    size_t col;   // アンカーセル（左上）の列

    /// visible[value][color]: 値を選んだ時に見える色 color の茂みの数（color 0 は未使用）
    std::array<std::array<int64_t, NUM_COLORS + 1>, NUM_TILE_VALUES> visible{};

    /**
     * @brief 変数名（"p[row,col]"、row/col はアンカーセル）
     */
    std::string name() const;
};

/**
 * @brief 初期定義域の構築
 *
 * フットプリントは行優先のアンカー順に並ぶ。
 * 形状の幾何的な合法性は茂みの色に依存しないため、在庫が 1 以上ある形状
 * （EL は 4 方向すべて）が全フットプリントの候補になる。
 * タイルなしが許される場合は NO_TILE も候補に加える。
 */
class DomainBuilder {
public:
    /**
     * @brief 問題を検証してフットプリントを列挙
     * @throws ConfigurationError 問題が不正な場合
     */
    explicit DomainBuilder(const TilingProblem& problem);

    /**
     * @brief 行優先のフットプリント
     */
    const std::vector<Placement>& placements() const { return placements_; }

    /**
     * @brief 全フットプリント共通の候補値（昇順）
     */
    const std::vector<Domain::value_type>& candidate_values() const { return candidates_; }

    /**
     * @brief 配置の初期定義域
     */
    Domain initial_domain(const Placement& placement) const;

    /**
     * @brief 静的な上下限チェック
     *
     * 目標のある各色について、候補値の寄与の最小和・最大和を求め、
     * 目標がその範囲外なら探索せずに不正とする。
     *
     * @throws ConfigurationError
     */
    void check_static_bounds() const;

    /**
     * @brief フットプリントの可視寄与表を作る
     */
    static Placement make_placement(const Landscape& landscape, size_t row, size_t col);

private:
    const TilingProblem& problem_;
    std::vector<Placement> placements_;
    std::vector<Domain::value_type> candidates_;
};

} // namespace tiling
} // namespace tile_csp

#endif // TILE_CSP_TILING_DOMAIN_BUILDER_HPP
