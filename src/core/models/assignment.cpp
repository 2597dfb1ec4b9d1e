#include "edakari/models/assignment.hpp"
#include "edakari/constraints/global.hpp"
#include "edakari/error.hpp"
#include <cmath>
#include <memory>

namespace edakari {

AssignmentModel::AssignmentModel(std::vector<std::vector<double>> cost)
    : cost_(std::move(cost)) {
    validate();

    const auto n = static_cast<Domain::value_type>(cost_.size());
    std::vector<size_t> workers(cost_.size());
    for (size_t i = 0; i < cost_.size(); ++i) {
        create_variable("x" + std::to_string(i), 0, n - 1);
        workers[i] = i;
    }
    set_sense(ObjectiveSense::Minimize);
    if (cost_.size() > 1) {
        add_constraint(std::make_shared<AllDifferentConstraint>(workers));
    }
}

double AssignmentModel::objective_term(size_t var_idx, Domain::value_type value) const {
    return cost_.at(var_idx).at(static_cast<size_t>(value));
}

void AssignmentModel::validate() const {
    for (size_t i = 0; i < cost_.size(); ++i) {
        if (cost_[i].size() != cost_.size()) {
            throw InvalidInputError("assignment: row " + std::to_string(i) + " has " +
                                    std::to_string(cost_[i].size()) + " entries, expected " +
                                    std::to_string(cost_.size()));
        }
        for (double c : cost_[i]) {
            if (!std::isfinite(c)) {
                throw InvalidInputError("assignment: non-finite cost in row " +
                                        std::to_string(i));
            }
        }
    }
    Model::validate();
}

} // namespace edakari
