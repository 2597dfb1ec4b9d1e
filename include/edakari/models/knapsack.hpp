/**
 * @file knapsack.hpp
 * @brief 0-1 ナップサック問題モデルと連続緩和による上界
 */
#ifndef EDAKARI_MODELS_KNAPSACK_HPP
#define EDAKARI_MODELS_KNAPSACK_HPP

#include "edakari/bound.hpp"
#include "edakari/model.hpp"
#include <vector>
#include <cstdint>

namespace edakari {

/**
 * @brief 0-1 ナップサック問題
 *
 * x_i ∈ {0,1}、sum(weights[i] * x[i]) <= capacity のもとで
 * sum(values[i] * x[i]) を最大化する。
 */
class KnapsackModel : public Model {
public:
    /**
     * @throws InvalidInputError 長さの不一致、負の重さ・価値・容量
     */
    KnapsackModel(std::vector<int64_t> weights, std::vector<double> values, int64_t capacity);

    size_t num_items() const { return weights_.size(); }
    const std::vector<int64_t>& weights() const { return weights_; }
    const std::vector<double>& values() const { return values_; }
    int64_t capacity() const { return capacity_; }

    /**
     * @brief 価値/重さの比の降順に並べた品目インデックス
     *
     * 重さ0の品目は先頭。同じ比なら添字順。
     */
    const std::vector<size_t>& ratio_order() const { return ratio_order_; }

    void validate() const override;
    std::string name() const override { return "knapsack"; }

private:
    std::vector<int64_t> weights_;
    std::vector<double> values_;
    int64_t capacity_;
    std::vector<size_t> ratio_order_;
};

/**
 * @brief Dantzig の連続緩和上界
 *
 * 決定済みの品目を固定し、残り容量に未決定の品目を比の良い順に詰め、
 * 最後の1品目だけ分数で入れる。
 */
class KnapsackBound : public BoundOracle {
public:
    std::string name() const override;

    /**
     * @throws InvalidInputError model が KnapsackModel でない場合
     */
    double bound(const Model& model, const Assignment& assignment) const override;
};

} // namespace edakari

#endif // EDAKARI_MODELS_KNAPSACK_HPP
