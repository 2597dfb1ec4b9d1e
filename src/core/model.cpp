#include "edakari/model.hpp"
#include "edakari/error.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace edakari {

std::string to_string(ObjectiveSense sense) {
    return sense == ObjectiveSense::Minimize ? "minimize" : "maximize";
}

bool is_better(double a, double b, ObjectiveSense sense) {
    return sense == ObjectiveSense::Minimize ? a < b : a > b;
}

double worst_value(ObjectiveSense sense) {
    return sense == ObjectiveSense::Minimize ? std::numeric_limits<double>::infinity()
                                             : -std::numeric_limits<double>::infinity();
}

size_t Model::create_variable(std::string name, Domain domain) {
    size_t id = variables_.size();
    if (name_to_id_.count(name) != 0) {
        throw InvalidInputError("duplicate variable name: " + name);
    }
    name_to_id_[name] = id;
    variables_.emplace_back(std::move(name), std::move(domain));
    variables_.back().set_id(id);
    coefficients_.push_back(0.0);
    return id;
}

size_t Model::create_variable(std::string name, Domain::value_type min, Domain::value_type max) {
    return create_variable(std::move(name), Domain(min, max));
}

size_t Model::create_variable(std::string name, std::vector<Domain::value_type> values) {
    return create_variable(std::move(name), Domain(std::move(values)));
}

void Model::add_constraint(ConstraintPtr constraint) {
    if (!constraint) {
        throw InvalidInputError("null constraint");
    }
    constraint->validate(variables_.size());
    constraints_.push_back(std::move(constraint));
}

const Variable& Model::variable(size_t id) const {
    if (id >= variables_.size()) {
        throw std::out_of_range("Variable ID out of range");
    }
    return variables_[id];
}

size_t Model::find_variable_index(const std::string& name) const {
    auto it = name_to_id_.find(name);
    if (it != name_to_id_.end()) return it->second;
    return SIZE_MAX;
}

void Model::set_objective_coefficient(size_t var_idx, double coeff) {
    if (var_idx >= coefficients_.size()) {
        throw InvalidInputError("objective coefficient for unknown variable " +
                                std::to_string(var_idx));
    }
    coefficients_[var_idx] = coeff;
}

double Model::objective_term(size_t var_idx, Domain::value_type value) const {
    return coefficients_.at(var_idx) * static_cast<double>(value);
}

double Model::objective(const Assignment& assignment) const {
    check_size(assignment);
    if (!assignment.is_complete()) {
        throw std::logic_error("objective requires a complete assignment");
    }
    double sum = constant_;
    for (size_t i = 0; i < assignment.size(); ++i) {
        sum += objective_term(i, assignment.value(i));
    }
    return sum;
}

Assignment Model::root_assignment() const {
    std::vector<Domain> domains;
    domains.reserve(variables_.size());
    for (const auto& var : variables_) {
        domains.push_back(var.domain());
    }
    return Assignment(std::move(domains));
}

bool Model::is_complete(const Assignment& assignment) const {
    check_size(assignment);
    return assignment.is_complete();
}

bool Model::is_feasible(const Assignment& assignment) const {
    check_size(assignment);
    if (assignment.has_empty_domain()) {
        return false;
    }
    for (const auto& c : constraints_) {
        if (c->is_violated(assignment)) {
            return false;
        }
    }
    return true;
}

void Model::validate() const {
    for (const auto& c : constraints_) {
        c->validate(variables_.size());
    }
    if (!std::isfinite(constant_)) {
        throw InvalidInputError("objective constant is not finite");
    }
    for (size_t i = 0; i < coefficients_.size(); ++i) {
        if (!std::isfinite(coefficients_[i])) {
            throw InvalidInputError("objective coefficient of " + variables_[i].name() +
                                    " is not finite");
        }
    }
}

void Model::check_size(const Assignment& assignment) const {
    if (assignment.size() != variables_.size()) {
        throw InvalidInputError("assignment has " + std::to_string(assignment.size()) +
                                " variables, model has " + std::to_string(variables_.size()));
    }
}

} // namespace edakari
