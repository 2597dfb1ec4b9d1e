/**
 * @file variable.hpp
 * @brief 決定変数クラス
 */
#ifndef EDAKARI_VARIABLE_HPP
#define EDAKARI_VARIABLE_HPP

#include "edakari/domain.hpp"
#include <string>

namespace edakari {

/**
 * @brief 決定変数を表すクラス
 *
 * 名前とルートでの定義域だけを持つ。探索中の絞り込みは Assignment 側で行い、
 * Variable 自体はモデル構築後に変更されない。
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
     * Model::create_variable() で設定される。
     * Model内のインデックスとして直接使用可能。
     */
    size_t id() const { return id_; }

    /**
     * @brief IDを設定（Modelから呼び出される）
     */
    void set_id(size_t id) { id_ = id; }

    const std::string& name() const { return name_; }

    /**
     * @brief ルートでの定義域
     */
    const Domain& domain() const { return domain_; }

private:
    size_t id_ = SIZE_MAX;
    std::string name_;
    Domain domain_;
};

} // namespace edakari

#endif // EDAKARI_VARIABLE_HPP
