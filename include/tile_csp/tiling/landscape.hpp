/**
 * @file landscape.hpp
 * @brief 茂みの地形（グリッドモデル）
 */
#ifndef TILE_CSP_TILING_LANDSCAPE_HPP
#define TILE_CSP_TILING_LANDSCAPE_HPP

#include "tile_csp/tiling/tile.hpp"
#include <stdexcept>
#include <string>
#include <vector>
#include <array>
#include <cstdint>
#include <cstddef>

namespace tile_csp {
namespace tiling {

/**
 * @brief 問題インスタンスの不正（探索に入る前に検出される）
 */
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief 茂みの地形
 *
 * 各セルは茂みの色 1..NUM_COLORS か、茂みなし (0)。
 * 構築後は変更されない。
 */
class Landscape {
public:
    using Color = int;

    /// 茂みなし
    static constexpr Color NONE = 0;

    Landscape() = default;

    /**
     * @brief 行優先のセル配列から作成
     * @throws ConfigurationError セル数が rows * cols と異なる、または色が範囲外の場合
     */
    Landscape(size_t rows, size_t cols, std::vector<Color> cells);

    /**
     * @brief 行のリストから作成（全行が同じ長さであること）
     * @throws ConfigurationError 行の長さが揃っていない、または色が範囲外の場合
     */
    static Landscape from_rows(const std::vector<std::vector<Color>>& rows);

    size_t rows() const { return rows_; }
    size_t cols() const { return cols_; }
    bool empty() const { return rows_ == 0 || cols_ == 0; }

    /**
     * @brief セルの色を取得
     */
    Color color(size_t r, size_t c) const { return cells_[r * cols_ + c]; }

    /**
     * @brief 指定色の茂みの総数
     */
    int64_t bush_count(Color color) const;

    /**
     * @brief 茂みの総数
     */
    int64_t total_bushes() const;

private:
    size_t rows_ = 0;
    size_t cols_ = 0;
    std::vector<Color> cells_;
    std::array<int64_t, NUM_COLORS + 1> counts_{};   // 色ごとの茂みの数（添字 0 は茂みなしのセル数）
};

} // namespace tiling
} // namespace tile_csp

#endif // TILE_CSP_TILING_LANDSCAPE_HPP
