/**
 * @file domain.hpp
 * @brief 整数定義域クラス（Sparse Set ベース）
 */
#ifndef TILE_CSP_DOMAIN_HPP
#define TILE_CSP_DOMAIN_HPP

#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>

namespace tile_csp {

/**
 * @brief 整数定義域を表すクラス
 *
 * Sparse Set を使用し、O(1) での値の存在確認と削除を実現する。
 * 削除した値は dense 配列の末尾側 (n_ 以降) に退避されるため、
 * 削除時の位置を記録しておけば restore() で元の配置に戻せる。
 *
 * sparse 配列は min..max の全範囲を確保するので、範囲は MAX_RANGE 以下に限る。
 */
class Domain {
public:
    using value_type = int64_t;

    /// min..max の値の個数の上限
    static constexpr size_t MAX_RANGE = 10000;

    /**
     * @brief 空の定義域を作成
     */
    Domain();

    /**
     * @brief 区間定義域を作成
     * @param min 最小値
     * @param max 最大値
     * @throws std::invalid_argument 範囲が MAX_RANGE を超える場合
     */
    Domain(value_type min, value_type max);

    /**
     * @brief 値リストから定義域を作成
     * @param values 定義域に含める値のリスト（重複は除去される）
     * @throws std::invalid_argument 最小値から最大値までの範囲が MAX_RANGE を超える場合
     */
    explicit Domain(std::vector<value_type> values);

    /**
     * @brief 定義域が空かどうか
     */
    bool empty() const { return n_ == 0; }

    /**
     * @brief 定義域のサイズを取得
     */
    size_t size() const { return n_; }

    /**
     * @brief 最小値を取得
     */
    std::optional<value_type> min() const { return n_ == 0 ? std::nullopt : std::optional<value_type>(min_); }

    /**
     * @brief 最大値を取得
     */
    std::optional<value_type> max() const { return n_ == 0 ? std::nullopt : std::optional<value_type>(max_); }

    /**
     * @brief 値が定義域に含まれるか
     */
    bool contains(value_type value) const;

    /**
     * @brief 値を削除
     *
     * 存在しない値の削除は成功（変更なし）として扱う。
     * 最後の1値を削除しようとした場合は失敗し、定義域は変更しない。
     *
     * @return 定義域が空にならなければtrue
     */
    bool remove(value_type value);

    /**
     * @brief 指定値に固定
     * @return 成功したらtrue（値が定義域に存在する場合）
     */
    bool assign(value_type value);

    /**
     * @brief 直前に削除された値を元の位置に戻す
     *
     * 削除の逆順（LIFO）で呼び出すこと。
     *
     * @param value 戻す値（dense 配列の n_ 番目にあるはずの値）
     * @param old_index 削除前の dense 配列上の位置
     */
    void restore(value_type value, size_t old_index);

    /**
     * @brief 全ての有効な値を昇順で取得
     */
    std::vector<value_type> values() const;

    /**
     * @brief 単一値に固定されているか
     */
    bool is_singleton() const { return n_ == 1; }

    /**
     * @brief 値のインデックスを返す（無ければ SIZE_MAX）
     */
    size_t index_of(value_type value) const;

    /**
     * @brief Dense 配列の有効範囲の先頭ポインタ
     */
    const value_type* begin() const { return values_.data(); }

    /**
     * @brief Dense 配列の有効範囲の末尾ポインタ
     */
    const value_type* end() const { return values_.data() + n_; }

    /**
     * @brief Dense 配列全体（削除済みの値も含む）
     */
    const std::vector<value_type>& dense() const { return values_; }

    /**
     * @brief 有効サイズ (n_) を取得
     */
    size_t n() const { return n_; }

private:
    void swap_at(size_t i, size_t j);
    void update_bounds();

    std::vector<value_type> values_;  // Dense 配列
    std::vector<size_t> sparse_;      // フラット sparse 配列（sparse_[val - offset_] = index）
    value_type offset_;               // = 初期 min 値
    size_t n_;                        // 有効な値の数
    value_type min_;                  // キャッシュ
    value_type max_;                  // キャッシュ
};

} // namespace tile_csp

#endif // TILE_CSP_DOMAIN_HPP
