/**
 * @file assignment.hpp
 * @brief 割当問題モデル（作業者とタスクの一対一対応）
 */
#ifndef EDAKARI_MODELS_ASSIGNMENT_HPP
#define EDAKARI_MODELS_ASSIGNMENT_HPP

#include "edakari/model.hpp"
#include <vector>

namespace edakari {

/**
 * @brief 割当問題
 *
 * 作業者 i にタスク x_i を割り当て、sum(cost[i][x_i]) を最小化する。
 * 目的関数は分離可能なのでデフォルトの SeparableBound を使う。
 */
class AssignmentModel : public Model {
public:
    /**
     * @throws InvalidInputError 正方行列でない、または有限でないコスト
     */
    explicit AssignmentModel(std::vector<std::vector<double>> cost);

    size_t size() const { return cost_.size(); }
    double cost(size_t worker, size_t task) const { return cost_.at(worker).at(task); }

    double objective_term(size_t var_idx, Domain::value_type value) const override;

    void validate() const override;
    std::string name() const override { return "assignment"; }

private:
    std::vector<std::vector<double>> cost_;
};

} // namespace edakari

#endif // EDAKARI_MODELS_ASSIGNMENT_HPP
