/**
 * @file constraint.cpp
 * @brief 制約基底クラスの実装
 *
 * 各制約の実装は src/core/constraints/ 以下の個別ファイルに配置:
 * - constraints/linear.cpp: 重み付き和の上下限制約
 */
#include "tile_csp/constraint.hpp"

namespace tile_csp {

// 静的メンバの初期化
size_t Constraint::next_id_ = 0;

Constraint::Constraint(std::vector<VariablePtr> vars)
    : vars_(std::move(vars))
    , id_(next_id_++) {}

} // namespace tile_csp
