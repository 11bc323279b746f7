/**
 * @file model.hpp
 * @brief CSPモデルクラス（変数・制約・アーク管理、集中Trail）
 */
#ifndef TILE_CSP_MODEL_HPP
#define TILE_CSP_MODEL_HPP

#include "tile_csp/variable.hpp"
#include "tile_csp/constraint.hpp"
#include <vector>
#include <map>
#include <string>
#include <cstdint>

namespace tile_csp {

/**
 * @brief Trail エントリ
 *
 * Remove: 定義域から value を削除した（old_index は削除前の dense 配列上の位置）
 * Assign: 探索が変数に値を割り当てた
 */
struct TrailEntry {
    enum class Kind { Remove, Assign };
    Kind kind;
    size_t var_idx;
    Domain::value_type value;
    size_t old_index;
};

/**
 * @brief 制約ウォッチリストのエントリ
 */
struct WatchEntry {
    size_t constraint_idx;
    size_t internal_var_idx;
};

/**
 * @brief アーク上で共有される制約
 */
struct ArcLink {
    size_t constraint_idx;
    size_t from_internal;   // 制約内での from 変数のインデックス
    size_t to_internal;     // 制約内での to 変数のインデックス
};

/**
 * @brief アーク (from, to)
 *
 * from の各値について、to の定義域に links の全制約を同時に満たす
 * 値があるかを検査する。
 */
struct Arc {
    size_t from;
    size_t to;
    std::vector<ArcLink> links;
};

/**
 * @brief CSPモデル
 *
 * 変数と制約を管理し、集中型 Trail でバックトラックを効率化する。
 * 定義域の変更はすべて save_point 付きで Trail に記録され、
 * rewind_to() で LIFO 順に正確に巻き戻される。
 */
class Model {
public:
    Model() = default;

    // ===== 変数・制約管理 =====

    /**
     * @brief 変数を作成して登録（推奨）
     * @param name 変数名
     * @param domain 定義域
     * @return 作成された変数へのポインタ
     */
    VariablePtr create_variable(std::string name, Domain domain);

    /**
     * @brief 値リストドメインの変数を作成して登録
     */
    VariablePtr create_variable(std::string name, std::vector<Domain::value_type> values);

    /**
     * @brief 変数を追加（既存の変数を登録する場合）
     * @return 変数のID（インデックス）
     */
    size_t add_variable(VariablePtr var);

    /**
     * @brief 制約を追加
     */
    void add_constraint(ConstraintPtr constraint);

    const std::vector<VariablePtr>& variables() const;
    const std::vector<ConstraintPtr>& constraints() const;

    /**
     * @brief IDで変数を取得
     */
    VariablePtr variable(size_t id) const;

    /**
     * @brief 名前で変数を取得
     */
    VariablePtr variable(const std::string& name) const;

    /**
     * @brief 名前から変数インデックスを検索
     * @return 見つかればインデックス、なければ SIZE_MAX
     */
    size_t find_variable_index(const std::string& name) const;

    // ===== 変数データアクセス =====

    /**
     * @brief 変数のドメインサイズを取得
     */
    size_t domain_size(size_t var_idx) const { return variables_[var_idx]->domain().size(); }

    /**
     * @brief 変数のドメインに値が含まれるか
     */
    bool contains(size_t var_idx, Domain::value_type val) const {
        return variables_[var_idx]->domain().contains(val);
    }

    /**
     * @brief 探索で値が割り当てられているか
     */
    bool is_assigned(size_t var_idx) const { return assigned_[var_idx]; }

    /**
     * @brief 割り当て済み変数の数を取得（O(1)）
     */
    size_t assigned_count() const { return assigned_count_; }

    /**
     * @brief 変数の値を取得（単一値に絞り込まれている場合）
     */
    Domain::value_type value(size_t var_idx) const { return variables_[var_idx]->domain().min().value(); }

    // ===== ドメイン操作（Trail 付き） =====

    /**
     * @brief 特定の値を削除
     * @return 成功（ドメインが空でない）したらtrue。
     *         最後の1値を削除しようとした場合は false でドメインは不変
     */
    bool remove_value(int save_point, size_t var_idx, Domain::value_type value);

    /**
     * @brief 変数に値を割り当てる（他の値をすべて削除して Assignment に記録）
     * @return 成功（値がドメインに存在）したらtrue
     */
    bool assign(int save_point, size_t var_idx, Domain::value_type value);

    // ===== Trail 管理 =====

    /**
     * @brief 指定セーブポイントまで巻き戻す
     *
     * save_point より大きいレベルで記録された変更をすべて取り消す。
     */
    void rewind_to(int save_point);

    /**
     * @brief Trail のサイズを取得
     */
    size_t trail_size() const { return trail_.size(); }

    // ===== 制約ウォッチリスト・アーク =====

    /**
     * @brief 制約ウォッチリストを構築（制約追加後に呼び出す）
     */
    void build_constraint_watch_list();

    /**
     * @brief 変数に関連する制約を取得
     */
    const std::vector<WatchEntry>& constraints_for_var(size_t var_idx) const {
        static const std::vector<WatchEntry> empty;
        if (var_idx < var_to_constraint_indices_.size()) {
            return var_to_constraint_indices_[var_idx];
        }
        return empty;
    }

    /**
     * @brief アークを構築（build_constraint_watch_list の後に呼び出す）
     *
     * 同じ制約で結合している変数の組ごとに双方向のアークを1本ずつ張る。
     * 複数の制約を共有する組はアーク1本にまとめる。
     */
    void build_arcs();

    /**
     * @brief 全制約の内部状態を現在の定義域から作り直す
     *
     * ウォッチリスト構築前に定義域を直接変更した場合に呼び出す。
     */
    void sync_constraints();

    const std::vector<Arc>& arcs() const { return arcs_; }

    /**
     * @brief to == var_idx のアークのインデックス
     */
    const std::vector<size_t>& arcs_into(size_t var_idx) const { return arcs_into_[var_idx]; }

    /**
     * @brief from == var_idx のアークのインデックス
     */
    const std::vector<size_t>& arcs_from(size_t var_idx) const { return arcs_from_[var_idx]; }

    /**
     * @brief アークで結合している変数（昇順）
     */
    const std::vector<size_t>& neighbors(size_t var_idx) const { return neighbors_[var_idx]; }

private:
    void notify_domain_change(size_t var_idx);

    std::vector<VariablePtr> variables_;
    std::vector<ConstraintPtr> constraints_;
    std::map<std::string, size_t> name_to_id_;

    // Assignment（探索による割り当て）
    std::vector<bool> assigned_;
    size_t assigned_count_ = 0;

    // 集中 Trail
    std::vector<std::pair<int, TrailEntry>> trail_;

    // 制約 raw ポインタ配列（shared_ptr デリファレンス回避）
    std::vector<Constraint*> constraint_ptrs_;

    // 制約ウォッチリスト: 各変数に関連する制約のリスト
    std::vector<std::vector<WatchEntry>> var_to_constraint_indices_;

    // アーク
    std::vector<Arc> arcs_;
    std::vector<std::vector<size_t>> arcs_into_;
    std::vector<std::vector<size_t>> arcs_from_;
    std::vector<std::vector<size_t>> neighbors_;
};

} // namespace tile_csp

#endif // TILE_CSP_MODEL_HPP
