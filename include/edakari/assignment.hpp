/**
 * @file assignment.hpp
 * @brief 部分割当クラス
 */
#ifndef EDAKARI_ASSIGNMENT_HPP
#define EDAKARI_ASSIGNMENT_HPP

#include "edakari/domain.hpp"
#include <vector>
#include <string>

namespace edakari {

/**
 * @brief 部分割当
 *
 * 変数ごとに現在の（絞り込まれた）定義域を持つ。
 * 定義域が単一値の変数を「決定済み」とみなす。
 */
class Assignment {
public:
    Assignment() = default;

    explicit Assignment(std::vector<Domain> domains);

    /**
     * @brief 変数の数
     */
    size_t size() const { return domains_.size(); }

    /**
     * @brief 変数の現在の定義域
     */
    const Domain& domain(size_t var_idx) const { return domains_.at(var_idx); }

    /**
     * @brief 変数が決定済みか
     */
    bool is_assigned(size_t var_idx) const { return domains_.at(var_idx).is_singleton(); }

    /**
     * @brief 決定済み変数の値
     * @throws std::logic_error 未決定の変数を指定した場合
     */
    Domain::value_type value(size_t var_idx) const;

    /**
     * @brief 決定済み変数の数（O(1)）
     */
    size_t assigned_count() const { return assigned_count_; }

    /**
     * @brief 全変数が決定済みか
     */
    bool is_complete() const { return assigned_count_ == domains_.size(); }

    /**
     * @brief 空の定義域を持つ変数があるか
     */
    bool has_empty_domain() const;

    /**
     * @brief 1変数の定義域を置き換えたコピーを作る
     */
    Assignment narrowed(size_t var_idx, Domain domain) const;

    /**
     * @brief 完全割当の値ベクトル
     * @throws std::logic_error 未決定の変数がある場合
     */
    std::vector<Domain::value_type> values() const;

    /**
     * @brief 値ベクトルから完全割当を作る
     */
    static Assignment from_values(const std::vector<Domain::value_type>& values);

    /**
     * @brief 診断用の文字列 "[x0=1, x1=0..3]"
     */
    std::string to_string() const;

private:
    std::vector<Domain> domains_;
    size_t assigned_count_ = 0;
};

} // namespace edakari

#endif // EDAKARI_ASSIGNMENT_HPP
