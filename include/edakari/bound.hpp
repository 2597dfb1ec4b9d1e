/**
 * @file bound.hpp
 * @brief 限界オラクル（許容的な上界・下界の計算）
 */
#ifndef EDAKARI_BOUND_HPP
#define EDAKARI_BOUND_HPP

#include "edakari/model.hpp"
#include <memory>
#include <string>

namespace edakari {

/**
 * @brief 限界オラクルの基底クラス
 *
 * bound(model, a) は a のどの完全・実行可能な拡張 e に対しても
 * objective(e) より悪くならない値を返さなければならない（許容性）。
 * 最小化なら下界、最大化なら上界。
 *
 * 実装は状態を持たないこと（複数ワーカーから同時に呼ばれる）。
 */
class BoundOracle {
public:
    virtual ~BoundOracle() = default;

    /**
     * @brief オラクルの名前（ログ・エラーメッセージ用）
     */
    virtual std::string name() const = 0;

    /**
     * @brief 部分割当の限界値
     * @pre assignment は実行可能（空の定義域を持たない）
     */
    virtual double bound(const Model& model, const Assignment& assignment) const = 0;
};

using BoundOraclePtr = std::shared_ptr<const BoundOracle>;

/**
 * @brief 分離可能な目的関数に対する緩和限界（デフォルト）
 *
 * 制約を無視し、未決定変数ごとに残りの定義域で最良の項を選ぶ:
 * constant + sum(決定済みの項) + sum(未決定変数の最良の項)
 */
class SeparableBound : public BoundOracle {
public:
    std::string name() const override;

    /**
     * @throws InvalidInputError モデルの目的関数が分離可能でない場合
     */
    double bound(const Model& model, const Assignment& assignment) const override;
};

} // namespace edakari

#endif // EDAKARI_BOUND_HPP
