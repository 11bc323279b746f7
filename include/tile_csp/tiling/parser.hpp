/**
 * @file parser.hpp
 * @brief タイル配置問題の入力ファイルパーサー
 *
 * 形式:
 * @code
 * # コメント
 * 0 1 1 0 ...        地形（空白区切りの色、'{' で始まる行まで）
 * {FULL_BLOCK=1,OUTER_BOUNDARY=1,EL_SHAPE=2}
 * 1:4                色:見えるべき茂みの数
 * @endcode
 */
#ifndef TILE_CSP_TILING_PARSER_HPP
#define TILE_CSP_TILING_PARSER_HPP

#include "tile_csp/tiling/problem.hpp"
#include <istream>
#include <memory>
#include <string>

namespace tile_csp {
namespace tiling {

/**
 * @throws std::runtime_error ファイルが開けない、または構文エラー
 * @throws ConfigurationError 地形の色が範囲外
 */
std::unique_ptr<TilingProblem> parse_file(const std::string& filename);
std::unique_ptr<TilingProblem> parse_string(const std::string& input);
std::unique_ptr<TilingProblem> parse_stream(std::istream& in);

} // namespace tiling
} // namespace tile_csp

#endif // TILE_CSP_TILING_PARSER_HPP
