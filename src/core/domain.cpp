#include "edakari/domain.hpp"
#include "edakari/error.hpp"
#include <algorithm>
#include <iterator>
#include <sstream>

namespace edakari {

Domain::Domain(value_type min, value_type max) {
    if (min > max) {
        return;
    }
    // max - min は符号付きでは溢れうるので符号なしで計算
    uint64_t span = static_cast<uint64_t>(max) - static_cast<uint64_t>(min);
    if (span >= MAX_INTERVAL_SIZE) {
        throw InvalidInputError("domain " + std::to_string(min) + ".." + std::to_string(max) +
                                " has more than " + std::to_string(MAX_INTERVAL_SIZE) + " values");
    }
    values_.reserve(static_cast<size_t>(span) + 1);
    for (value_type v = min; v < max; ++v) {
        values_.push_back(v);
    }
    values_.push_back(max);
}

Domain::Domain(std::vector<value_type> values)
    : values_(std::move(values)) {
    // 重複を除去してソート
    std::sort(values_.begin(), values_.end());
    values_.erase(std::unique(values_.begin(), values_.end()), values_.end());
}

bool Domain::contains(value_type value) const {
    return std::binary_search(values_.begin(), values_.end(), value);
}

Domain Domain::slice(size_t first, size_t last) const {
    Domain result;
    last = std::min(last, values_.size());
    if (first >= last) {
        return result;
    }
    result.values_.assign(values_.begin() + static_cast<std::ptrdiff_t>(first),
                          values_.begin() + static_cast<std::ptrdiff_t>(last));
    return result;
}

Domain Domain::merged(const Domain& other) const {
    Domain result;
    result.values_.reserve(values_.size() + other.values_.size());
    std::set_union(values_.begin(), values_.end(),
                   other.values_.begin(), other.values_.end(),
                   std::back_inserter(result.values_));
    return result;
}

std::string Domain::to_string() const {
    std::ostringstream oss;
    if (values_.empty()) {
        oss << "{}";
    } else if (values_.size() == 1) {
        oss << values_.front();
    } else if (values_.back() - values_.front() + 1 == static_cast<value_type>(values_.size())) {
        // 連続区間
        oss << values_.front() << ".." << values_.back();
    } else {
        oss << "{";
        for (size_t i = 0; i < values_.size(); ++i) {
            if (i > 0) oss << ",";
            oss << values_[i];
        }
        oss << "}";
    }
    return oss.str();
}

} // namespace edakari
