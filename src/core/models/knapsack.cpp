#include "edakari/models/knapsack.hpp"
#include "edakari/constraints/global.hpp"
#include "edakari/error.hpp"
#include <algorithm>
#include <cmath>
#include <memory>
#include <numeric>

namespace edakari {

KnapsackModel::KnapsackModel(std::vector<int64_t> weights, std::vector<double> values,
                             int64_t capacity)
    : weights_(std::move(weights))
    , values_(std::move(values))
    , capacity_(capacity) {
    validate();

    std::vector<size_t> items(weights_.size());
    for (size_t i = 0; i < weights_.size(); ++i) {
        create_variable("x" + std::to_string(i), 0, 1);
        set_objective_coefficient(i, values_[i]);
        items[i] = i;
    }
    set_sense(ObjectiveSense::Maximize);
    add_constraint(std::make_shared<IntLinLeConstraint>(weights_, items, capacity_));

    ratio_order_ = items;
    std::stable_sort(ratio_order_.begin(), ratio_order_.end(), [this](size_t a, size_t b) {
        // values[a]/weights[a] > values[b]/weights[b] を除算なしで比較
        if (weights_[a] == 0 || weights_[b] == 0) {
            return weights_[a] == 0 && weights_[b] != 0;
        }
        return values_[a] * static_cast<double>(weights_[b]) >
               values_[b] * static_cast<double>(weights_[a]);
    });
}

void KnapsackModel::validate() const {
    if (weights_.size() != values_.size()) {
        throw InvalidInputError("knapsack: " + std::to_string(weights_.size()) + " weights for " +
                                std::to_string(values_.size()) + " values");
    }
    if (capacity_ < 0) {
        throw InvalidInputError("knapsack: negative capacity " + std::to_string(capacity_));
    }
    for (size_t i = 0; i < weights_.size(); ++i) {
        if (weights_[i] < 0) {
            throw InvalidInputError("knapsack: negative weight for item " + std::to_string(i));
        }
        if (!std::isfinite(values_[i]) || values_[i] < 0.0) {
            throw InvalidInputError("knapsack: invalid value for item " + std::to_string(i));
        }
    }
    Model::validate();
}

std::string KnapsackBound::name() const {
    return "knapsack_dantzig";
}

double KnapsackBound::bound(const Model& model, const Assignment& assignment) const {
    const auto* knapsack = dynamic_cast<const KnapsackModel*>(&model);
    if (knapsack == nullptr) {
        throw InvalidInputError("knapsack bound: " + model.name() + " is not a knapsack model");
    }
    const auto& weights = knapsack->weights();
    const auto& values = knapsack->values();

    double total = 0.0;
    int64_t remaining = knapsack->capacity();
    for (size_t i = 0; i < assignment.size(); ++i) {
        if (assignment.is_assigned(i) && assignment.value(i) == 1) {
            total += values[i];
            remaining -= weights[i];
        }
    }
    if (remaining < 0) {
        // 容量超過（実行不可能なノード）
        return total;
    }

    for (size_t i : knapsack->ratio_order()) {
        if (assignment.is_assigned(i)) continue;
        if (!assignment.domain(i).contains(1)) continue;
        if (weights[i] <= remaining) {
            total += values[i];
            remaining -= weights[i];
        } else {
            total += values[i] * static_cast<double>(remaining) / static_cast<double>(weights[i]);
            break;
        }
    }
    return total;
}

} // namespace edakari
