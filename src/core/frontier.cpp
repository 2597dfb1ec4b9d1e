#include "edakari/frontier.hpp"
#include <algorithm>
#include <stdexcept>

namespace edakari {

std::string to_string(SearchOrder order) {
    switch (order) {
        case SearchOrder::BestBoundFirst:
            return "best_bound_first";
        case SearchOrder::DepthFirst:
            return "depth_first";
    }
    return "unknown";
}

bool Frontier::Compare::operator()(const FrontierEntry& a, const FrontierEntry& b) const {
    if (order == SearchOrder::BestBoundFirst) {
        if (a.bound != b.bound) {
            return is_better(b.bound, a.bound, sense);
        }
        if (a.depth != b.depth) {
            return a.depth < b.depth;
        }
    }
    return a.seq < b.seq;
}

Frontier::Frontier(SearchOrder order, ObjectiveSense sense)
    : comp_{order, sense} {}

void Frontier::insert(NodeId node, double bound, size_t depth) {
    heap_.push_back(FrontierEntry{node, bound, depth, next_seq_++});
    std::push_heap(heap_.begin(), heap_.end(), comp_);
    peak_size_ = std::max(peak_size_, heap_.size());
}

FrontierEntry Frontier::extract_best() {
    if (heap_.empty()) {
        throw std::out_of_range("extract_best on empty frontier");
    }
    std::pop_heap(heap_.begin(), heap_.end(), comp_);
    FrontierEntry entry = heap_.back();
    heap_.pop_back();
    return entry;
}

std::optional<double> Frontier::best_bound() const {
    if (heap_.empty()) {
        return std::nullopt;
    }
    double best = heap_.front().bound;
    for (const auto& e : heap_) {
        if (is_better(e.bound, best, comp_.sense)) {
            best = e.bound;
        }
    }
    return best;
}

} // namespace edakari
