/**
 * @file heuristics.hpp
 * @brief 変数選択（MRV + 次数）と値順序（LCV）
 */
#ifndef TILE_CSP_HEURISTICS_HPP
#define TILE_CSP_HEURISTICS_HPP

#include "tile_csp/model.hpp"
#include <vector>

namespace tile_csp {

/**
 * @brief 探索ヒューリスティック
 *
 * 変数選択: 未割り当て変数のうちドメインサイズ最小 (MRV)、
 * 同点なら未割り当ての隣接変数が最多 (次数)、さらに同点なら
 * 変数ID の小さい方（モデル構築順）を選ぶ。
 *
 * 値順序: 隣接する未割り当て変数の定義域から削る値の数が
 * 少ない順 (LCV)。同数なら値の昇順。
 */
class HeuristicSelector {
public:
    /**
     * @brief 次数によるタイブレークを有効/無効にする
     */
    void set_degree_enabled(bool enabled) { degree_enabled_ = enabled; }

    /**
     * @brief LCV による値順序を有効/無効にする（無効時は値の昇順）
     */
    void set_lcv_enabled(bool enabled) { lcv_enabled_ = enabled; }

    /**
     * @brief 次に割り当てる変数を選択
     * @return 変数インデックス。全変数が割り当て済みなら SIZE_MAX
     */
    size_t select_variable(const Model& model) const;

    /**
     * @brief 未割り当ての隣接変数へのアーク数
     */
    size_t degree(const Model& model, size_t var_idx) const;

    /**
     * @brief 変数の現在の定義域を試行順に並べる
     */
    std::vector<Domain::value_type> order_values(const Model& model, size_t var_idx) const;

    /**
     * @brief var_idx = value とした時に隣接する未割り当て変数から削られる値の数
     */
    size_t count_eliminations(const Model& model, size_t var_idx, Domain::value_type value) const;

private:
    bool degree_enabled_ = true;
    bool lcv_enabled_ = true;
};

} // namespace tile_csp

#endif // TILE_CSP_HEURISTICS_HPP
