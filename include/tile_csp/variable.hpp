/**
 * @file variable.hpp
 * @brief CSP変数クラス
 */
#ifndef TILE_CSP_VARIABLE_HPP
#define TILE_CSP_VARIABLE_HPP

#include "tile_csp/domain.hpp"
#include <string>
#include <memory>

namespace tile_csp {

/**
 * @brief CSP変数を表すクラス
 *
 * 定義域の変更は Trail に記録する必要があるため、
 * 探索中は Model::remove_value() / Model::assign() を経由すること。
 */
class Variable {
public:
    /**
     * @brief 変数を作成
     * @param name 変数名
     * @param domain 定義域
     * @note 通常は Model::create_variable() を使用してください
     */
    Variable(std::string name, Domain domain);

    /**
     * @brief 変数のModel内IDを取得
     *
     * Model::add_variable() で設定される。
     * Model内のインデックスとして直接使用可能。
     */
    size_t id() const { return id_; }

    /**
     * @brief IDを設定（Modelから呼び出される）
     */
    void set_id(size_t id) { id_ = id; }

    /**
     * @brief 変数名を取得
     */
    const std::string& name() const;

    /**
     * @brief 定義域への参照を取得
     */
    Domain& domain();
    const Domain& domain() const;

    /**
     * @brief 単一値に絞り込まれているか
     */
    bool is_assigned() const { return domain_.is_singleton(); }

    /**
     * @brief 絞り込まれた値を取得
     */
    std::optional<Domain::value_type> assigned_value() const {
        if (domain_.is_singleton()) {
            return domain_.min();
        }
        return std::nullopt;
    }

private:
    size_t id_ = SIZE_MAX;
    std::string name_;
    Domain domain_;
};

using VariablePtr = std::shared_ptr<Variable>;

} // namespace tile_csp

#endif // TILE_CSP_VARIABLE_HPP
