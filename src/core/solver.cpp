#include "edakari/solver.hpp"
#include "edakari/error.hpp"
#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <exception>
#include <iostream>
#include <sstream>
#include <thread>

namespace edakari {

namespace {
// 完全ノードでの許容性検査の相対許容誤差
constexpr double ADMISSIBILITY_TOLERANCE = 1e-9;

std::string format_value(double v) {
    std::ostringstream oss;
    oss << v;
    return oss.str();
}
}  // namespace

std::string to_string(SolveStatus status) {
    switch (status) {
        case SolveStatus::Optimal:
            return "Optimal";
        case SolveStatus::Infeasible:
            return "Infeasible";
        case SolveStatus::Unproven:
            return "Unproven";
    }
    return "Unknown";
}

std::string format_stats(const SearchStats& s) {
    std::ostringstream oss;
    oss << "explored=" << s.nodes_explored
        << " expanded=" << s.nodes_expanded
        << " pruned=" << s.nodes_pruned
        << " infeasible=" << s.nodes_infeasible
        << " solutions=" << s.solutions_found
        << " peak_frontier=" << s.peak_frontier_size
        << " peak_nodes=" << s.peak_retained_nodes
        << " max_depth=" << s.max_depth
        << " elapsed=" << s.elapsed_seconds << "s";
    return oss.str();
}

std::optional<double> SolveResult::gap() const {
    if (!objective || !best_bound) {
        return std::nullopt;
    }
    return std::abs(*objective - *best_bound);
}

Solver::Solver(const Model& model, SolverOptions options)
    : Solver(model, nullptr, nullptr, std::move(options)) {}

Solver::Solver(const Model& model, BoundOraclePtr bound, SolverOptions options)
    : Solver(model, std::move(bound), nullptr, std::move(options)) {}

Solver::Solver(const Model& model, BoundOraclePtr bound,
               std::shared_ptr<const BranchingStrategy> branching,
               SolverOptions options)
    : model_(model)
    , bound_(std::move(bound))
    , branching_(std::move(branching))
    , options_(std::move(options))
    , frontier_(options_.search_order, model.sense())
    , incumbent_(model.sense()) {
    options_.validate();
    model_.validate();

    if (!bound_) {
        if (!model_.has_separable_objective()) {
            throw InvalidInputError(model_.name() +
                                    ": objective is not separable, a bound oracle is required");
        }
        bound_ = std::make_shared<SeparableBound>();
    }
    if (!branching_) {
        branching_ = make_branching_strategy(options_.branching_rule, options_.bisect_threshold);
    }
}

void Solver::set_initial_solution(const std::vector<Domain::value_type>& values) {
    if (values.size() != model_.num_variables()) {
        throw InvalidInputError("initial solution has " + std::to_string(values.size()) +
                                " values, model has " +
                                std::to_string(model_.num_variables()) + " variables");
    }
    for (size_t i = 0; i < values.size(); ++i) {
        if (!model_.domain_of(i).contains(values[i])) {
            throw InvalidInputError("initial solution: value " + std::to_string(values[i]) +
                                    " is not in the domain of " + model_.variable(i).name());
        }
    }
    auto assignment = Assignment::from_values(values);
    if (!model_.is_feasible(assignment)) {
        throw InvalidInputError("initial solution is infeasible");
    }
    double obj = model_.objective(assignment);
    if (!std::isfinite(obj)) {
        throw InvalidInputError("initial solution has a non-finite objective");
    }
    initial_solution_ = values;
    initial_objective_ = obj;
}

SolveResult Solver::solve() {
    start_ = std::chrono::steady_clock::now();
    stats_ = SearchStats{};
    arena_.clear();
    frontier_ = Frontier(options_.search_order, model_.sense());
    incumbent_.reset();
    if (initial_solution_) {
        incumbent_.try_update(*initial_solution_, initial_objective_);
    }

    if (options_.verbose) {
        log("solve start: " + model_.name() + ", " + std::to_string(model_.num_variables()) +
            " variables, " + std::to_string(model_.constraints().size()) + " constraints, " +
            to_string(model_.sense()) + ", order=" + to_string(options_.search_order) +
            ", branching=" + branching_->name() + ", bound=" + bound_->name() +
            ", workers=" + std::to_string(options_.worker_count));
    }

    // INIT
    Assignment root = model_.root_assignment();
    if (root.has_empty_domain() || !model_.is_feasible(root)) {
        if (options_.verbose) log("root is infeasible");
        return build_result(false);
    }

    double root_bound = compute_bound(root, 0);
    if (options_.pruning && !incumbent_.improves(root_bound)) {
        // ウォームスタート解がルートの限界値に達している
        ++stats_.nodes_pruned;
    } else {
        NodeId root_id = arena_.create(NO_NODE, 0, root_bound, BranchStep{}, std::move(root));
        frontier_.insert(root_id, root_bound, 0);
    }

    bool limited = options_.worker_count > 1 ? run_parallel() : run_sequential();
    return build_result(limited);
}

bool Solver::run_sequential() {
    std::vector<ChildEntry> children;
    while (true) {
        // SELECT
        if (frontier_.is_empty()) {
            return false;
        }
        if (limit_reached(stats_.nodes_explored)) {
            return true;
        }
        FrontierEntry entry = frontier_.extract_best();
        ++stats_.nodes_explored;

        children.clear();
        process_node(entry, stats_, children);

        // 同順位の兄弟は値の小さい子から取り出されるよう逆順に挿入
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            frontier_.insert(it->node, it->bound, it->depth);
        }

        if (options_.verbose && stats_.nodes_explored % options_.log_interval == 0) {
            log_progress(stats_.nodes_explored, frontier_.size());
        }
    }
}

bool Solver::run_parallel() {
    std::mutex mutex;
    std::condition_variable cv;
    size_t active = 0;
    size_t explored = 0;
    bool done = false;
    bool limited = false;
    std::exception_ptr error;
    std::vector<SearchStats> worker_stats(options_.worker_count);

    auto worker = [&](size_t worker_id) {
        SearchStats& stats = worker_stats[worker_id];
        std::vector<ChildEntry> children;
        while (true) {
            FrontierEntry entry;
            {
                std::unique_lock<std::mutex> lock(mutex);
                // 空なら、他のワーカーが子を挿入するか全員が待機に入るまで待つ
                cv.wait(lock, [&] { return done || !frontier_.is_empty() || active == 0; });
                if (done) {
                    return;
                }
                if (frontier_.is_empty()) {
                    // active == 0: フロンティアは恒久的に空
                    done = true;
                    cv.notify_all();
                    return;
                }
                if (limit_reached(explored)) {
                    limited = true;
                    done = true;
                    cv.notify_all();
                    return;
                }
                entry = frontier_.extract_best();
                ++explored;
                ++active;
                if (options_.verbose && explored % options_.log_interval == 0) {
                    log_progress(explored, frontier_.size());
                }
            }
            ++stats.nodes_explored;

            children.clear();
            try {
                process_node(entry, stats, children);
            } catch (...) {
                // 最初の例外を保持し、全ワーカーの終了後に solve() から再送出する
                std::lock_guard<std::mutex> lock(mutex);
                if (!error) {
                    error = std::current_exception();
                }
                done = true;
                --active;
                cv.notify_all();
                return;
            }

            {
                std::lock_guard<std::mutex> lock(mutex);
                for (auto it = children.rbegin(); it != children.rend(); ++it) {
                    // 展開中に他のワーカーが暫定解を更新していれば挿入前に捨てる
                    if (options_.pruning && !incumbent_.improves(it->bound)) {
                        ++stats.nodes_pruned;
                        arena_.release(it->node);
                        continue;
                    }
                    frontier_.insert(it->node, it->bound, it->depth);
                }
                --active;
            }
            cv.notify_all();
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(options_.worker_count);
    try {
        for (size_t i = 0; i < options_.worker_count; ++i) {
            threads.emplace_back(worker, i);
        }
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            done = true;
        }
        cv.notify_all();
        for (auto& t : threads) t.join();
        throw;
    }
    for (auto& t : threads) {
        t.join();
    }

    for (const auto& s : worker_stats) {
        stats_.nodes_explored += s.nodes_explored;
        stats_.nodes_expanded += s.nodes_expanded;
        stats_.nodes_pruned += s.nodes_pruned;
        stats_.nodes_infeasible += s.nodes_infeasible;
        stats_.solutions_found += s.solutions_found;
        stats_.max_depth = std::max(stats_.max_depth, s.max_depth);
    }

    if (error) {
        std::rethrow_exception(error);
    }
    return limited;
}

void Solver::process_node(const FrontierEntry& entry, SearchStats& stats,
                          std::vector<ChildEntry>& children) {
    const Node& node = arena_.at(entry.node);
    stats.max_depth = std::max(stats.max_depth, node.depth);

    // BOUND → PRUNE
    if (options_.pruning && !incumbent_.improves(entry.bound)) {
        ++stats.nodes_pruned;
        arena_.release(entry.node);
        return;
    }

    // ACCEPT
    if (node.assignment.is_complete()) {
        accept(node, stats);
        arena_.release(entry.node);
        return;
    }

    // BRANCH
    std::vector<Child> branches;
    try {
        size_t var_idx = branching_->select_variable(model_, node.assignment);
        branches = branching_->branch(model_, node.assignment, var_idx);
    } catch (const NodeError&) {
        throw;
    } catch (const std::exception& e) {
        std::throw_with_nested(SearchError(std::string("branching failed: ") + e.what(),
                                           node.depth, node.assignment.to_string()));
    }
    ++stats.nodes_expanded;

    const size_t depth = node.depth + 1;
    for (auto& child : branches) {
        bool feasible = false;
        try {
            feasible = model_.is_feasible(child.assignment);
        } catch (const std::exception& e) {
            std::throw_with_nested(SearchError(std::string("feasibility check failed: ") + e.what(),
                                               depth, child.assignment.to_string()));
        }
        if (!feasible) {
            ++stats.nodes_infeasible;
            continue;
        }

        double child_bound = compute_bound(child.assignment, depth);
        if (options_.pruning && !incumbent_.improves(child_bound)) {
            ++stats.nodes_pruned;
            continue;
        }
        NodeId child_id = arena_.create(entry.node, depth, child_bound,
                                        std::move(child.step), std::move(child.assignment));
        children.push_back(ChildEntry{child_id, child_bound, depth});
    }
    arena_.release(entry.node);
}

void Solver::accept(const Node& node, SearchStats& stats) {
    double obj = 0.0;
    try {
        obj = model_.objective(node.assignment);
    } catch (const std::exception& e) {
        std::throw_with_nested(SearchError(std::string("objective evaluation failed: ") + e.what(),
                                           node.depth, node.assignment.to_string()));
    }
    if (!std::isfinite(obj)) {
        throw NumericError("objective is not finite (" + format_value(obj) + ")",
                           node.depth, node.assignment.to_string());
    }
    double tolerance = ADMISSIBILITY_TOLERANCE * std::max(1.0, std::abs(obj));
    if (is_better(obj, node.bound, model_.sense()) && std::abs(obj - node.bound) > tolerance) {
        throw NumericError("bound oracle " + bound_->name() + " is not admissible: bound " +
                           format_value(node.bound) + ", objective " + format_value(obj),
                           node.depth, node.assignment.to_string());
    }

    // 解放前に経路を確定させる（祖先はこのノードが保持されている間だけ残る）
    if (incumbent_.improves(obj) &&
        incumbent_.try_update(node.assignment.values(), obj, arena_.path_to(node.id))) {
        ++stats.solutions_found;
        if (options_.verbose) {
            log("new incumbent " + format_value(obj) + " at depth " + std::to_string(node.depth));
        }
    }
}

double Solver::compute_bound(const Assignment& assignment, size_t depth) const {
    double value = 0.0;
    try {
        value = bound_->bound(model_, assignment);
    } catch (const NodeError&) {
        throw;
    } catch (const std::exception& e) {
        std::throw_with_nested(SearchError("bound oracle " + bound_->name() + " failed: " + e.what(),
                                           depth, assignment.to_string()));
    }
    if (!std::isfinite(value)) {
        throw NumericError("bound oracle " + bound_->name() + " returned " + format_value(value),
                           depth, assignment.to_string());
    }
    return value;
}

bool Solver::limit_reached(size_t nodes_explored) const {
    if (stopped_) {
        return true;
    }
    if (options_.node_limit && nodes_explored >= *options_.node_limit) {
        return true;
    }
    if (options_.time_limit &&
        std::chrono::steady_clock::now() - start_ >= *options_.time_limit) {
        return true;
    }
    return false;
}

SolveResult Solver::build_result(bool limited) {
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start_;
    stats_.elapsed_seconds = elapsed.count();
    stats_.peak_frontier_size = frontier_.peak_size();
    stats_.peak_retained_nodes = arena_.peak_size();

    SolveResult result;
    auto snapshot = incumbent_.snapshot();
    if (limited) {
        result.status = SolveStatus::Unproven;
    } else {
        result.status = snapshot ? SolveStatus::Optimal : SolveStatus::Infeasible;
    }

    if (snapshot) {
        result.solution = snapshot->values;
        result.objective = snapshot->objective;
        result.path = snapshot->path;
    }

    if (result.status == SolveStatus::Optimal) {
        result.best_bound = snapshot->objective;
    } else if (result.status == SolveStatus::Unproven) {
        // 残りのフロンティアと暫定解のうち良い方が最適値の限界
        auto open = frontier_.best_bound();
        if (open && snapshot) {
            result.best_bound = is_better(*open, snapshot->objective, model_.sense())
                                    ? *open : snapshot->objective;
        } else if (open) {
            result.best_bound = open;
        } else if (snapshot) {
            result.best_bound = snapshot->objective;
        }
    }

    // 打ち切り時の残りのノードは破棄
    frontier_.clear();
    arena_.clear();
    result.stats = stats_;

    if (options_.verbose) {
        std::string message = "solve done: " + to_string(result.status);
        if (result.objective) {
            message += " objective=" + format_value(*result.objective);
        }
        if (auto g = result.gap(); g && result.status == SolveStatus::Unproven) {
            message += " gap=" + format_value(*g);
        }
        log(message);
        log(format_stats(stats_));
    }
    return result;
}

void Solver::log(const std::string& message) const {
    std::lock_guard<std::mutex> lock(log_mutex_);
    std::cerr << "% [verbose] " << message << "\n";
}

void Solver::log_progress(size_t nodes_explored, size_t frontier_size) const {
    std::string message = "nodes=" + std::to_string(nodes_explored) +
                          " frontier=" + std::to_string(frontier_size);
    if (incumbent_.has_value()) {
        message += " incumbent=" + format_value(incumbent_.objective());
    }
    log(message);
}

} // namespace edakari
