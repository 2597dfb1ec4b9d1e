/**
 * @file constraint.hpp
 * @brief 制約基底クラスと全制約ヘッダのインクルード
 */
#ifndef EDAKARI_CONSTRAINT_HPP
#define EDAKARI_CONSTRAINT_HPP

#include "edakari/assignment.hpp"
#include <vector>
#include <memory>
#include <optional>
#include <string>

namespace edakari {

/**
 * @brief 制約の基底クラス
 *
 * 部分割当に対して三値で判定する:
 * - true: 現在の定義域のどの完全化でも満たされる
 * - false: どの完全化でも満たされない（違反確定）
 * - std::nullopt: 未確定
 *
 * 探索ノードごとに独立した Assignment を受け取るため状態を持たず、
 * 複数ワーカーから同時に呼び出してよい。
 */
class Constraint {
public:
    virtual ~Constraint() = default;

    /**
     * @brief 制約の名前を取得
     */
    virtual std::string name() const = 0;

    /**
     * @brief 制約が関係する変数のインデックス
     */
    const std::vector<size_t>& var_indices() const { return vars_; }

    /**
     * @brief 制約が満たされているか確認
     * @return 満たされていればtrue、違反していればfalse、
     *         未確定ならstd::nullopt
     */
    virtual std::optional<bool> is_satisfied(const Assignment& assignment) const = 0;

    /**
     * @brief 違反が確定しているか
     */
    bool is_violated(const Assignment& assignment) const {
        auto r = is_satisfied(assignment);
        return r.has_value() && !*r;
    }

    /**
     * @brief モデルへの登録時の検査
     * @throws InvalidInputError インデックスが範囲外の場合
     */
    virtual void validate(size_t num_variables) const;

protected:
    /**
     * @brief コンストラクタ
     * @param vars 制約に関与する変数インデックス
     */
    explicit Constraint(std::vector<size_t> vars);

    std::vector<size_t> vars_;
};

using ConstraintPtr = std::shared_ptr<Constraint>;

} // namespace edakari

// 各制約グループのヘッダをインクルード
#include "edakari/constraints/global.hpp"

#endif // EDAKARI_CONSTRAINT_HPP
