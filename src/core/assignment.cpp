#include "edakari/assignment.hpp"
#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace edakari {

Assignment::Assignment(std::vector<Domain> domains)
    : domains_(std::move(domains)) {
    assigned_count_ = static_cast<size_t>(
        std::count_if(domains_.begin(), domains_.end(),
                      [](const Domain& d) { return d.is_singleton(); }));
}

Domain::value_type Assignment::value(size_t var_idx) const {
    const auto& d = domains_.at(var_idx);
    if (!d.is_singleton()) {
        throw std::logic_error("variable x" + std::to_string(var_idx) + " is not assigned");
    }
    return d.at(0);
}

bool Assignment::has_empty_domain() const {
    return std::any_of(domains_.begin(), domains_.end(),
                       [](const Domain& d) { return d.empty(); });
}

Assignment Assignment::narrowed(size_t var_idx, Domain domain) const {
    Assignment child(*this);
    auto& slot = child.domains_.at(var_idx);
    if (slot.is_singleton()) --child.assigned_count_;
    if (domain.is_singleton()) ++child.assigned_count_;
    slot = std::move(domain);
    return child;
}

std::vector<Domain::value_type> Assignment::values() const {
    std::vector<Domain::value_type> result;
    result.reserve(domains_.size());
    for (size_t i = 0; i < domains_.size(); ++i) {
        result.push_back(value(i));
    }
    return result;
}

Assignment Assignment::from_values(const std::vector<Domain::value_type>& values) {
    std::vector<Domain> domains;
    domains.reserve(values.size());
    for (auto v : values) {
        domains.emplace_back(v, v);
    }
    return Assignment(std::move(domains));
}

std::string Assignment::to_string() const {
    std::ostringstream oss;
    oss << "[";
    for (size_t i = 0; i < domains_.size(); ++i) {
        if (i > 0) oss << ", ";
        oss << "x" << i << "=" << domains_[i].to_string();
    }
    oss << "]";
    return oss.str();
}

} // namespace edakari
