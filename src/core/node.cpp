#include "edakari/node.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace edakari {

NodeId NodeArena::create(NodeId parent, size_t depth, double bound,
                         BranchStep step, Assignment assignment) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (parent != NO_NODE) {
        ++checked(parent).live_children;
    }

    NodeId id;
    if (!free_.empty()) {
        id = free_.back();
        free_.pop_back();
    } else {
        id = nodes_.size();
        nodes_.emplace_back();
    }

    Node& node = nodes_[id];
    node.id = id;
    node.parent = parent;
    node.depth = depth;
    node.bound = bound;
    node.step = std::move(step);
    node.assignment = std::move(assignment);
    node.live_children = 0;
    node.released = false;

    peak_size_ = std::max(peak_size_, nodes_.size() - free_.size());
    return id;
}

Node& NodeArena::checked(NodeId id) {
    if (id >= nodes_.size() || nodes_[id].id == NO_NODE) {
        throw std::out_of_range("Node ID out of range");
    }
    return nodes_[id];
}

const Node& NodeArena::checked(NodeId id) const {
    if (id >= nodes_.size() || nodes_[id].id == NO_NODE) {
        throw std::out_of_range("Node ID out of range");
    }
    return nodes_[id];
}

const Node& NodeArena::at(NodeId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return checked(id);
}

void NodeArena::release(NodeId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    Node& node = checked(id);
    if (node.released) {
        throw std::logic_error("Node " + std::to_string(id) + " is already released");
    }
    node.released = true;
    node.assignment = Assignment();

    // 子を持たない解放済みノードから根の方向へ回収
    NodeId current = id;
    while (current != NO_NODE) {
        Node& n = nodes_[current];
        if (!n.released || n.live_children > 0) {
            break;
        }
        NodeId parent = n.parent;
        n = Node();
        free_.push_back(current);
        if (parent != NO_NODE) {
            --nodes_[parent].live_children;
        }
        current = parent;
    }
}

std::vector<BranchStep> NodeArena::path_to(NodeId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<BranchStep> path;
    while (id != NO_NODE) {
        const auto& node = checked(id);
        if (node.parent != NO_NODE) {
            path.push_back(node.step);
        }
        id = node.parent;
    }
    std::reverse(path.begin(), path.end());
    return path;
}

size_t NodeArena::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nodes_.size() - free_.size();
}

size_t NodeArena::peak_size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peak_size_;
}

void NodeArena::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    nodes_.clear();
    free_.clear();
    peak_size_ = 0;
}

} // namespace edakari
