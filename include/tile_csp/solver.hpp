/**
 * @file solver.hpp
 * @brief CSPソルバークラス（AC-3 維持付きバックトラック探索）
 */
#ifndef TILE_CSP_SOLVER_HPP
#define TILE_CSP_SOLVER_HPP

#include "tile_csp/model.hpp"
#include "tile_csp/arc_consistency.hpp"
#include "tile_csp/heuristics.hpp"
#include <functional>
#include <map>
#include <atomic>

namespace tile_csp {

/**
 * @brief 解を表す型
 */
using Solution = std::map<std::string, Domain::value_type>;

/**
 * @brief 解のコールバック関数型
 * @return trueを返すと探索を継続、falseで停止
 */
using SolutionCallback = std::function<bool(const Solution&)>;

/**
 * @brief 探索結果
 */
enum class SearchResult {
    SAT,      // 解が見つかった
    UNSAT,    // 解が存在しない（探索を尽くした）
    UNKNOWN   // 不明（ノード数・深さの上限、または stop() による中断）
};

/**
 * @brief 探索の状態
 */
enum class SearchState {
    Active,
    Success,
    Failure
};

/**
 * @brief 探索フレーム（再帰1段分）
 */
struct SearchFrame {
    size_t var_idx;
    std::vector<Domain::value_type> values;  // 試行順
    size_t next = 0;                         // 次に試す values の位置
    int save_point;                          // このフレームの変更を記録するレベル
};

/**
 * @brief ソルバー統計情報
 */
struct SolverStats {
    size_t node_count = 0;
    size_t fail_count = 0;
    size_t max_depth = 0;
    size_t solution_count = 0;
    size_t revise_count = 0;
    size_t prune_count = 0;
};

/**
 * @brief CSPソルバー
 *
 * - 探索前に AC-3 で全アークを整合させる
 * - 変数選択は MRV + 次数 + ID 順、値順序は LCV
 * - 割り当てごとに増分 AC-3 を実行し、矛盾したら次の値へ
 * - 明示的なフレームスタックで深さ優先探索（フレームごとに中断判定）
 *
 * 探索フレーム d の変更は save_point d で Trail に記録され、
 * 次の値を試す前に rewind_to(d - 1) で取り消される。
 * 前処理の変更は save_point 0 に記録され、探索では取り消さない。
 */
class Solver {
public:
    Solver() = default;

    /**
     * @brief 最初の解を探索
     * @param model 解くモデル
     * @return 解が見つかればその解、なければstd::nullopt
     *         （result() で UNSAT と UNKNOWN を区別できる）
     */
    std::optional<Solution> solve(Model& model);

    /**
     * @brief 全ての解を探索
     * @param model 解くモデル
     * @param callback 解が見つかるたびに呼ばれるコールバック
     * @return 見つかった解の数
     */
    size_t solve_all(Model& model, SolutionCallback callback);

    /**
     * @brief 直前の探索結果
     */
    SearchResult result() const { return result_; }

    /**
     * @brief 統計情報を取得
     */
    const SolverStats& stats() const { return stats_; }

    /**
     * @brief 次数によるタイブレークを有効/無効にする
     */
    void set_degree_enabled(bool enabled) { selector_.set_degree_enabled(enabled); }

    /**
     * @brief LCV による値順序を有効/無効にする
     */
    void set_lcv_enabled(bool enabled) { selector_.set_lcv_enabled(enabled); }

    /**
     * @brief 探索ノード数の上限（0 = 無制限）
     */
    void set_node_limit(size_t limit) { node_limit_ = limit; }

    /**
     * @brief 探索深さの上限（0 = 無制限）
     */
    void set_depth_limit(size_t limit) { depth_limit_ = limit; }

    /**
     * @brief 探索を停止する（シグナルハンドラから呼び出し可能）
     */
    void stop() { stopped_ = true; }

    /**
     * @brief 停止フラグをリセット
     */
    void reset_stop() { stopped_ = false; }

    /**
     * @brief 停止フラグを確認
     */
    bool is_stopped() const { return stopped_; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

private:
    std::atomic<bool> stopped_{false};
    bool verbose_ = false;

    /**
     * @brief presolve（ウォッチリスト・アーク構築と初期 AC-3）
     * @return 伝播成功ならtrue、矛盾が検出されたらfalse
     */
    bool presolve(Model& model);

    /**
     * @brief メイン探索ループ
     * @param callback 解ごとに呼ばれる。false を返すと探索を終了
     */
    SearchResult run_search(Model& model, const SolutionCallback& callback);

    /**
     * @brief 中断条件（停止フラグ・ノード数・深さ）
     */
    bool should_abort(size_t depth) const;

    /**
     * @brief 現在の解を構築
     */
    Solution build_solution(const Model& model) const;

    /**
     * @brief 全制約が満たされているか検証
     */
    bool verify_solution(const Model& model) const;

    void collect_propagation_stats();

    ArcConsistency propagator_;
    HeuristicSelector selector_;

    size_t node_limit_ = 0;
    size_t depth_limit_ = 0;

    SearchResult result_ = SearchResult::UNKNOWN;
    SolverStats stats_;
};

} // namespace tile_csp

#endif // TILE_CSP_SOLVER_HPP
