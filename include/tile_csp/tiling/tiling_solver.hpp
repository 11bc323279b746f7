/**
 * @file tiling_solver.hpp
 * @brief タイル配置問題のソルバー（モデル構築と結果の変換）
 */
#ifndef TILE_CSP_TILING_TILING_SOLVER_HPP
#define TILE_CSP_TILING_TILING_SOLVER_HPP

#include "tile_csp/solver.hpp"
#include "tile_csp/tiling/domain_builder.hpp"
#include <array>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace tile_csp {
namespace tiling {

/**
 * @brief 求解結果の種類
 */
enum class TilingStatus {
    Solved,          // 全制約を満たす配置が見つかった
    NoSolution,      // 探索を尽くしても解がない
    InvalidProblem,  // 問題が不正（探索していない）
    Aborted          // ノード数・深さの上限、または stop() で中断
};

/**
 * @brief 1つのフットプリントに選んだ値
 */
struct PlacementChoice {
    size_t row;
    size_t col;
    Domain::value_type value;
};

/**
 * @brief 求解結果
 */
struct TilingResult {
    TilingStatus status = TilingStatus::NoSolution;
    std::string message;                       // InvalidProblem の理由
    std::vector<PlacementChoice> choices;      // Solved の場合のみ（行優先）
    std::map<Landscape::Color, int64_t> visible;  // 色 → 見える茂みの数（Solved の場合のみ）
    std::array<int64_t, NUM_SHAPES> used{};    // 形状ごとの使用数（Solved の場合のみ）
    SolverStats stats;
};

/**
 * @brief ソルバー設定
 */
struct TilingOptions {
    bool verbose = false;
    bool degree_tiebreak = true;
    bool lcv = true;
    size_t node_limit = 0;    // 0 = 無制限
    size_t depth_limit = 0;   // 0 = 無制限
};

/**
 * @brief タイル配置ソルバー
 *
 * 問題を検証し、フットプリントごとに配置変数を作り、
 * 形状ごとの在庫制約と目標のある色ごとの可視数制約を追加して解く。
 */
class TilingSolver {
public:
    explicit TilingSolver(TilingProblem problem, TilingOptions options = TilingOptions());

    /**
     * @brief 問題を解く
     *
     * 問題が不正な場合も例外は投げず、InvalidProblem を返す。
     */
    TilingResult solve();

    /**
     * @brief CSP モデルを構築
     * @throws ConfigurationError 問題が不正な場合
     */
    std::unique_ptr<Model> build_model();

    /**
     * @brief 最後に構築したモデルのフットプリント（行優先）
     */
    const std::vector<Placement>& placements() const { return placements_; }

    const TilingProblem& problem() const { return problem_; }

    /**
     * @brief 探索を停止する（シグナルハンドラから呼び出し可能）
     */
    void stop() { solver_.stop(); }

private:
    TilingProblem problem_;
    TilingOptions options_;
    std::vector<Placement> placements_;
    Solver solver_;
};

/**
 * @brief 選んだ値から色ごとの見える茂みの数を数える（色 1..NUM_COLORS すべて）
 */
std::map<Landscape::Color, int64_t> count_visible(const Landscape& landscape,
                                                  const std::vector<PlacementChoice>& choices);

/**
 * @brief 選んだ値から形状ごとの使用数を数える
 */
std::array<int64_t, NUM_SHAPES> count_usage(const std::vector<PlacementChoice>& choices);

/**
 * @brief 求解結果の種類の表示名
 */
std::string to_string(TilingStatus status);

} // namespace tiling
} // namespace tile_csp

#endif // TILE_CSP_TILING_TILING_SOLVER_HPP
