#include "edakari/bound.hpp"
#include "edakari/error.hpp"
#include <stdexcept>

namespace edakari {

std::string SeparableBound::name() const {
    return "separable";
}

double SeparableBound::bound(const Model& model, const Assignment& assignment) const {
    if (!model.has_separable_objective()) {
        throw InvalidInputError("separable bound: objective of " + model.name() +
                                " is not separable");
    }
    const auto sense = model.sense();
    double sum = model.objective_constant();
    for (size_t i = 0; i < assignment.size(); ++i) {
        const auto& d = assignment.domain(i);
        if (d.empty()) {
            throw std::logic_error("separable bound: empty domain for x" + std::to_string(i));
        }
        double best = model.objective_term(i, d.at(0));
        for (size_t k = 1; k < d.size(); ++k) {
            double term = model.objective_term(i, d.at(k));
            if (is_better(term, best, sense)) {
                best = term;
            }
        }
        sum += best;
    }
    return sum;
}

} // namespace edakari
