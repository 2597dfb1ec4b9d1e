#include "edakari/constraints/global.hpp"
#include <set>

namespace edakari {

// ============================================================================
// AllDifferentConstraint implementation
// ============================================================================

AllDifferentConstraint::AllDifferentConstraint(std::vector<size_t> vars)
    : Constraint(std::move(vars)) {}

std::string AllDifferentConstraint::name() const {
    return "all_different";
}

std::optional<bool> AllDifferentConstraint::is_satisfied(const Assignment& assignment) const {
    std::set<Domain::value_type> used;
    size_t unfixed_count = 0;
    for (auto var_idx : vars_) {
        const auto& d = assignment.domain(var_idx);
        if (d.empty()) {
            return false;
        }
        if (d.is_singleton()) {
            if (!used.insert(d.at(0)).second) {
                return false;  // 重複
            }
        } else {
            ++unfixed_count;
        }
    }
    if (unfixed_count == 0) {
        return true;
    }

    // 未決定変数に残る値のプール（決定済みの値を除く）
    std::set<Domain::value_type> pool;
    for (auto var_idx : vars_) {
        const auto& d = assignment.domain(var_idx);
        if (d.is_singleton()) continue;
        for (auto v : d) {
            if (used.count(v) == 0) {
                pool.insert(v);
            }
        }
    }
    if (pool.size() < unfixed_count) {
        return false;
    }
    return std::nullopt;
}

} // namespace edakari
