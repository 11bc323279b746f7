/**
 * @file arc_consistency.hpp
 * @brief AC-3 による定義域の絞り込み
 */
#ifndef TILE_CSP_ARC_CONSISTENCY_HPP
#define TILE_CSP_ARC_CONSISTENCY_HPP

#include "tile_csp/model.hpp"
#include <deque>
#include <vector>

namespace tile_csp {

/**
 * @brief 伝播の統計情報
 */
struct PropagationStats {
    size_t revise_count = 0;   // revise() の呼び出し回数
    size_t prune_count = 0;    // 削除した値の数
    size_t sweep_count = 0;    // 全アークを積み直した回数
};

/**
 * @brief AC-3 伝播器
 *
 * Model::build_arcs() で構築したアークに対して AC-3 を実行する。
 * 大域制約の2項射影は他の変数の定義域に依存するため、
 * 何かを削除したパスの後には全アークの確認パスを行い、
 * 確認パスで何も削除されなくなった時点で終了する。
 * したがって伝播直後にもう一度伝播しても何も削除されない。
 *
 * 削除はすべて save_point 付きで Model の Trail に記録される。
 */
class ArcConsistency {
public:
    /**
     * @brief 全アークで伝播（探索前の前処理）
     * @return 矛盾がなければtrue、いずれかの定義域が空になるならfalse
     */
    bool propagate(Model& model, int save_point);

    /**
     * @brief 変数割り当て後の増分伝播
     *
     * 割り当てた変数へ向かう未割り当て変数からのアークから開始する。
     *
     * @return 矛盾がなければtrue
     */
    bool propagate_assignment(Model& model, int save_point, size_t var_idx);

    /**
     * @brief アークを修正: from の値のうち to に支持値がないものを削除
     * @param changed 値を削除したら true が設定される
     * @return 矛盾（from の定義域が空になる）がなければtrue
     */
    bool revise(Model& model, int save_point, size_t arc_idx, bool& changed);

    /**
     * @brief 単項射影による絞り込みと制約ごとの上下限チェック
     * @param changed 値を削除したら true が設定される
     * @return 矛盾がなければtrue
     */
    bool node_consistency(Model& model, int save_point, bool& changed);

    /**
     * @brief アーク上で from = vx の支持値が to にあるか
     */
    static bool has_support(const Model& model, const Arc& arc, Domain::value_type vx);

    const PropagationStats& stats() const { return stats_; }
    void reset_stats() { stats_ = PropagationStats{}; }

private:
    /**
     * @brief キューを処理し、固定点まで確認パスを繰り返す
     * @param full_sweep キューに全アークが積まれているか
     */
    bool run(Model& model, int save_point, bool full_sweep);

    void enqueue(size_t arc_idx);
    void enqueue_all(const Model& model);
    void reset_queue(const Model& model);
    void clear_queue();

    std::deque<size_t> queue_;
    std::vector<bool> in_queue_;
    PropagationStats stats_;
};

} // namespace tile_csp

#endif // TILE_CSP_ARC_CONSISTENCY_HPP
