#include "edakari/branching.hpp"
#include <stdexcept>

namespace edakari {

std::string to_string(BranchingRule rule) {
    switch (rule) {
        case BranchingRule::FirstUnassigned:
            return "first_unassigned";
        case BranchingRule::MostConstrained:
            return "most_constrained";
    }
    return "unknown";
}

std::string BranchStep::to_string() const {
    return "x" + std::to_string(var_idx) + "=" + domain.to_string();
}

std::vector<Child> BranchingStrategy::branch(const Model& /*model*/, const Assignment& assignment,
                                             size_t var_idx) const {
    const auto& d = assignment.domain(var_idx);
    if (d.size() < 2) {
        throw std::logic_error("cannot branch on decided variable x" + std::to_string(var_idx));
    }

    std::vector<Child> children;
    if (bisect_threshold_ > 0 && d.size() > bisect_threshold_) {
        // 値の並びの中央で二分: [min..mid], [mid+1..max]
        size_t mid = d.size() / 2;
        for (auto part : {d.slice(0, mid), d.slice(mid, d.size())}) {
            BranchStep step{var_idx, part};
            children.push_back({assignment.narrowed(var_idx, std::move(part)), std::move(step)});
        }
        return children;
    }

    children.reserve(d.size());
    for (auto v : d) {
        Domain single(v, v);
        BranchStep step{var_idx, single};
        children.push_back({assignment.narrowed(var_idx, std::move(single)), std::move(step)});
    }
    return children;
}

// ============================================================================
// FirstUnassignedBranching
// ============================================================================

std::string FirstUnassignedBranching::name() const {
    return to_string(BranchingRule::FirstUnassigned);
}

size_t FirstUnassignedBranching::select_variable(const Model& /*model*/,
                                                 const Assignment& assignment) const {
    for (size_t i = 0; i < assignment.size(); ++i) {
        if (assignment.domain(i).size() > 1) {
            return i;
        }
    }
    throw std::logic_error("select_variable: assignment is complete");
}

// ============================================================================
// MostConstrainedBranching
// ============================================================================

std::string MostConstrainedBranching::name() const {
    return to_string(BranchingRule::MostConstrained);
}

size_t MostConstrainedBranching::select_variable(const Model& /*model*/,
                                                 const Assignment& assignment) const {
    size_t best = SIZE_MAX;
    size_t best_size = SIZE_MAX;
    for (size_t i = 0; i < assignment.size(); ++i) {
        size_t sz = assignment.domain(i).size();
        // 厳密に小さい場合のみ更新（同サイズは宣言順で先のもの）
        if (sz > 1 && sz < best_size) {
            best = i;
            best_size = sz;
        }
    }
    if (best == SIZE_MAX) {
        throw std::logic_error("select_variable: assignment is complete");
    }
    return best;
}

std::unique_ptr<BranchingStrategy> make_branching_strategy(BranchingRule rule,
                                                           size_t bisect_threshold) {
    std::unique_ptr<BranchingStrategy> strategy;
    switch (rule) {
        case BranchingRule::FirstUnassigned:
            strategy = std::make_unique<FirstUnassignedBranching>();
            break;
        case BranchingRule::MostConstrained:
            strategy = std::make_unique<MostConstrainedBranching>();
            break;
    }
    strategy->set_bisect_threshold(bisect_threshold);
    return strategy;
}

} // namespace edakari
