#include "edakari/constraints/global.hpp"
#include "edakari/error.hpp"
#include <map>

namespace edakari {

// ============================================================================
// IntLinLeConstraint implementation
// ============================================================================

IntLinLeConstraint::IntLinLeConstraint(std::vector<int64_t> coeffs,
                                       std::vector<size_t> vars,
                                       int64_t bound)
    : Constraint(std::vector<size_t>())  // 後で設定
    , bound_(bound) {
    if (coeffs.size() != vars.size()) {
        throw InvalidInputError("int_lin_le: " + std::to_string(coeffs.size()) +
                                " coefficients for " + std::to_string(vars.size()) +
                                " variables");
    }

    // 同一変数の係数を集約（係数が0の変数は除外）
    std::map<size_t, int64_t> aggregated;
    for (size_t i = 0; i < vars.size(); ++i) {
        aggregated[vars[i]] += coeffs[i];
    }
    for (const auto& [var_idx, coeff] : aggregated) {
        if (coeff == 0) continue;
        vars_.push_back(var_idx);
        coeffs_.push_back(coeff);
    }
}

std::string IntLinLeConstraint::name() const {
    return "int_lin_le";
}

std::optional<bool> IntLinLeConstraint::is_satisfied(const Assignment& assignment) const {
    int64_t min_sum = 0;
    int64_t max_sum = 0;
    for (size_t i = 0; i < vars_.size(); ++i) {
        const auto& d = assignment.domain(vars_[i]);
        if (d.empty()) {
            return false;
        }
        int64_t c = coeffs_[i];
        int64_t lo = d.min().value();
        int64_t hi = d.max().value();
        if (c > 0) {
            min_sum += c * lo;
            max_sum += c * hi;
        } else {
            min_sum += c * hi;
            max_sum += c * lo;
        }
    }
    if (min_sum > bound_) {
        return false;
    }
    if (max_sum <= bound_) {
        return true;
    }
    return std::nullopt;
}

} // namespace edakari
