#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "edakari/solver.hpp"
#include "edakari/error.hpp"
#include "edakari/models/knapsack.hpp"
#include "edakari/models/scheduling.hpp"
#include "test_helpers.hpp"
#include <chrono>
#include <cmath>
#include <limits>
#include <random>
#include <stdexcept>
#include <thread>

using namespace edakari;
using Catch::Approx;

namespace {

// 小さな乱数モデル（線形制約と、試行によっては AllDifferent 付き）
void build_constrained_model(Model& model, std::mt19937& rng, size_t num_vars) {
    test::build_random_model(model, rng, num_vars);
    std::uniform_int_distribution<int> coeff(-2, 3);
    std::vector<int64_t> coeffs;
    std::vector<size_t> vars;
    for (size_t i = 0; i < num_vars; ++i) {
        coeffs.push_back(coeff(rng));
        vars.push_back(i);
    }
    model.add_constraint(std::make_shared<IntLinLeConstraint>(coeffs, vars, 4));
    if (rng() % 2 == 0) {
        model.add_constraint(std::make_shared<AllDifferentConstraint>(std::vector<size_t>{0, 1, 2}));
    }
    if (rng() % 2 == 0) {
        model.set_sense(ObjectiveSense::Maximize);
    }
}

// 目的関数が -x0 - x1 - ... となる小さなモデル（枝刈りが起きにくい）
void build_wide_model(Model& model, size_t num_vars) {
    for (size_t i = 0; i < num_vars; ++i) {
        model.create_variable("x" + std::to_string(i), 0, 1);
        model.set_objective_coefficient(i, -1.0);
    }
}

class ConstantBound : public BoundOracle {
public:
    explicit ConstantBound(double value) : value_(value) {}
    std::string name() const override { return "constant"; }
    double bound(const Model&, const Assignment&) const override { return value_; }

private:
    double value_;
};

class FailingBound : public BoundOracle {
public:
    std::string name() const override { return "failing"; }
    double bound(const Model& model, const Assignment& assignment) const override {
        if (assignment.assigned_count() > 0) {
            throw std::runtime_error("oracle failure");
        }
        return SeparableBound().bound(model, assignment);
    }
};

class SlowBound : public BoundOracle {
public:
    std::string name() const override { return "slow"; }
    double bound(const Model& model, const Assignment& assignment) const override {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
        return SeparableBound().bound(model, assignment);
    }
};

// x1 が決まったノードの限界計算を遅らせる。x0 = 1 側は x0 = 0 側より十分遅い
class StaggeredBound : public BoundOracle {
public:
    std::string name() const override { return "staggered"; }
    double bound(const Model& model, const Assignment& assignment) const override {
        const auto& x0 = assignment.domain(0);
        const auto& x1 = assignment.domain(1);
        if (x0.is_singleton() && x1.is_singleton()) {
            if (x0.at(0) == 0) {
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            } else if (x1.at(0) == 1) {
                std::this_thread::sleep_for(std::chrono::milliseconds(400));
            }
        }
        return SeparableBound().bound(model, assignment);
    }
};

// 経路の分枝決定をルートに順に適用した割当
Assignment replay(const Model& model, const std::vector<BranchStep>& path) {
    auto a = model.root_assignment();
    for (const auto& step : path) {
        a = a.narrowed(step.var_idx, step.domain);
    }
    return a;
}

} // namespace

// ============================================================================
// Concrete scenarios
// ============================================================================

TEST_CASE("Solver knapsack scenario", "[solver][scenario]") {
    KnapsackModel model({2, 3, 4}, {3, 4, 5}, 5);

    SECTION("default bound") {
        Solver solver(model);
        auto result = solver.solve();
        REQUIRE(result.status == SolveStatus::Optimal);
        REQUIRE(result.objective.value() == Approx(7.0));
        REQUIRE(result.solution.value() == std::vector<int64_t>{1, 1, 0});
        REQUIRE(result.best_bound.value() == Approx(7.0));
        REQUIRE(result.gap().value() == Approx(0.0));
    }

    SECTION("fractional relaxation bound") {
        Solver solver(model, std::make_shared<KnapsackBound>());
        auto result = solver.solve();
        REQUIRE(result.status == SolveStatus::Optimal);
        REQUIRE(result.objective.value() == Approx(7.0));
        REQUIRE(result.solution.value() == std::vector<int64_t>{1, 1, 0});
        REQUIRE(solver.bound_oracle().name() == "knapsack_dantzig");
    }

    SECTION("depth-first order") {
        SolverOptions options;
        options.search_order = SearchOrder::DepthFirst;
        Solver solver(model, std::make_shared<KnapsackBound>(), options);
        auto result = solver.solve();
        REQUIRE(result.status == SolveStatus::Optimal);
        REQUIRE(result.objective.value() == Approx(7.0));
    }
}

TEST_CASE("Solver scheduling scenario", "[solver][scenario]") {
    SchedulingModel model(std::vector<Job>{Job{1, 3, std::nullopt, 1.0, 0},
                                           Job{2, 2, std::nullopt, 2.0, 0},
                                           Job{3, 1, std::nullopt, 3.0, 0}});

    Solver solver(model, std::make_shared<SchedulingBound>());
    auto result = solver.solve();

    REQUIRE(result.status == SolveStatus::Optimal);
    // 処理順は job 3, 2, 1（インデックス 2, 1, 0）: 1*3 + 3*2 + 6*1
    REQUIRE(result.solution.value() == std::vector<int64_t>{2, 1, 0});
    REQUIRE(result.objective.value() == 15.0);
    REQUIRE(result.objective.value() == test::brute_force_optimum(model).value());
}

TEST_CASE("Solver infeasible scenarios", "[solver][infeasible]") {
    SECTION("empty root domain") {
        Model model;
        model.create_variable("x", 0, 3);
        model.create_variable("y", Domain());
        Solver solver(model);
        auto result = solver.solve();
        REQUIRE(result.status == SolveStatus::Infeasible);
        REQUIRE(!result.has_solution());
        REQUIRE(!result.objective.has_value());
        REQUIRE(!result.best_bound.has_value());
        REQUIRE(result.stats.nodes_explored == 0);
    }

    SECTION("infeasible root constraint") {
        Model model;
        for (int i = 0; i < 3; ++i) model.create_variable("x" + std::to_string(i), 0, 1);
        model.add_constraint(std::make_shared<AllDifferentConstraint>(std::vector<size_t>{0, 1, 2}));
        auto result = Solver(model).solve();
        REQUIRE(result.status == SolveStatus::Infeasible);
    }

    SECTION("infeasibility found during search") {
        Model model;
        model.create_variable("x", 0, 1);
        model.create_variable("y", 0, 1);
        model.add_constraint(std::make_shared<AllDifferentConstraint>(std::vector<size_t>{0, 1}));
        model.add_constraint(std::make_shared<IntLinLeConstraint>(
            std::vector<int64_t>{1, 1}, std::vector<size_t>{0, 1}, 0));
        auto result = Solver(model).solve();
        REQUIRE(result.status == SolveStatus::Infeasible);
        REQUIRE(result.stats.nodes_explored > 0);
        REQUIRE(result.stats.nodes_infeasible > 0);
        REQUIRE(result.stats.solutions_found == 0);
    }
}

TEST_CASE("Solver with no variables", "[solver]") {
    Model model;
    model.set_objective_constant(4.0);
    auto result = Solver(model).solve();

    REQUIRE(result.status == SolveStatus::Optimal);
    REQUIRE(result.objective.value() == 4.0);
    REQUIRE(result.solution.value().empty());
    REQUIRE(result.path.empty());
}

// ============================================================================
// Optimality and pruning
// ============================================================================

TEST_CASE("Solver matches brute force on random models", "[solver][random]") {
    std::mt19937 rng(12345);
    for (int trial = 0; trial < 20; ++trial) {
        Model model;
        build_constrained_model(model, rng, 5);
        auto expected = test::brute_force_optimum(model);

        for (auto order : {SearchOrder::BestBoundFirst, SearchOrder::DepthFirst}) {
            for (auto rule : {BranchingRule::FirstUnassigned, BranchingRule::MostConstrained}) {
                SolverOptions options;
                options.search_order = order;
                options.branching_rule = rule;
                options.bisect_threshold = (trial % 3 == 0) ? 2 : 0;
                auto result = Solver(model, options).solve();

                INFO("trial " << trial << " " << to_string(order) << " " << to_string(rule));
                if (expected) {
                    REQUIRE(result.status == SolveStatus::Optimal);
                    REQUIRE(result.objective.value() == Approx(*expected));
                    auto a = Assignment::from_values(result.solution.value());
                    REQUIRE(model.is_feasible(a));
                    REQUIRE(model.objective(a) == Approx(*expected));
                } else {
                    REQUIRE(result.status == SolveStatus::Infeasible);
                }
            }
        }
    }
}

TEST_CASE("Pruning never loses the optimum", "[solver][pruning]") {
    std::mt19937 rng(777);
    for (int trial = 0; trial < 15; ++trial) {
        Model model;
        build_constrained_model(model, rng, 5);

        SolverOptions with_pruning;
        SolverOptions without_pruning;
        without_pruning.pruning = false;

        auto pruned = Solver(model, with_pruning).solve();
        auto full = Solver(model, without_pruning).solve();

        REQUIRE(pruned.status == full.status);
        if (full.objective) {
            REQUIRE(pruned.objective.value() == Approx(*full.objective));
        }
        REQUIRE(full.stats.nodes_pruned == 0);
        REQUIRE(pruned.stats.nodes_explored <= full.stats.nodes_explored);
    }
}

TEST_CASE("Sequential search is deterministic", "[solver][determinism]") {
    std::mt19937 rng(4242);
    Model model;
    build_constrained_model(model, rng, 6);

    Solver solver(model);
    auto first = solver.solve();
    auto second = solver.solve();
    auto third = Solver(model).solve();

    for (const auto* r : {&second, &third}) {
        REQUIRE(r->status == first.status);
        REQUIRE(r->solution == first.solution);
        REQUIRE(r->objective == first.objective);
        REQUIRE(r->stats.nodes_explored == first.stats.nodes_explored);
        REQUIRE(r->stats.nodes_pruned == first.stats.nodes_pruned);
        REQUIRE(r->stats.nodes_infeasible == first.stats.nodes_infeasible);
        REQUIRE(r->stats.peak_frontier_size == first.stats.peak_frontier_size);
    }
}

TEST_CASE("Incumbent history is monotonic", "[solver][incumbent]") {
    std::mt19937 rng(31337);
    for (int trial = 0; trial < 5; ++trial) {
        Model model;
        build_constrained_model(model, rng, 6);
        SolverOptions options;
        options.search_order = SearchOrder::DepthFirst;
        Solver solver(model, options);
        auto result = solver.solve();

        auto history = solver.incumbent().history();
        REQUIRE(history.size() == result.stats.solutions_found);
        for (size_t i = 1; i < history.size(); ++i) {
            REQUIRE(is_better(history[i].objective, history[i - 1].objective, model.sense()));
            REQUIRE(history[i].elapsed_seconds >= history[i - 1].elapsed_seconds);
        }
        if (result.objective) {
            REQUIRE(history.back().objective == *result.objective);
        }
    }
}

TEST_CASE("Result path leads to the incumbent", "[solver][path]") {
    KnapsackModel model({2, 3, 4}, {3, 4, 5}, 5);

    SECTION("one child per value") {
        auto result = Solver(model).solve();
        REQUIRE(result.path.size() == 3);
        for (size_t i = 0; i < result.path.size(); ++i) {
            REQUIRE(result.path[i].var_idx == i);
        }
        REQUIRE(replay(model, result.path).values() == result.solution.value());
    }

    SECTION("bisection") {
        Model m;
        m.create_variable("x", 0, 7);
        m.create_variable("y", 0, 7);
        m.set_objective_coefficient(0, 1.0);
        m.set_objective_coefficient(1, -1.0);
        SolverOptions options;
        options.bisect_threshold = 2;
        auto result = Solver(m, options).solve();
        REQUIRE(result.objective.value() == -7.0);
        REQUIRE(result.solution.value() == std::vector<int64_t>{0, 7});
        REQUIRE(result.path.size() > 2);
        REQUIRE(replay(m, result.path).values() == result.solution.value());
    }
}

TEST_CASE("Retained nodes stay bounded by frontier and depth", "[solver][memory]") {
    const size_t n = 12;
    Model model;
    for (size_t i = 0; i < n; ++i) {
        model.create_variable("x" + std::to_string(i), 0, 1);
        model.set_objective_coefficient(i, static_cast<double>(i % 3) - 1.0);
    }

    for (size_t workers : {size_t(1), size_t(4)}) {
        SolverOptions options;
        options.search_order = SearchOrder::DepthFirst;
        options.pruning = false;
        options.worker_count = workers;
        auto result = Solver(model, options).solve();
        const auto& s = result.stats;

        INFO(format_stats(s));
        REQUIRE(result.status == SolveStatus::Optimal);
        REQUIRE(s.nodes_explored == (size_t(1) << (n + 1)) - 1);
        // フロンティア上のノード、展開中のノードとその子、それらの祖先だけが残る
        REQUIRE(s.peak_retained_nodes <= (s.peak_frontier_size + 3 * workers) * (n + 1));
        REQUIRE(s.peak_retained_nodes * 4 < s.nodes_explored);
        REQUIRE(replay(model, result.path).values() == result.solution.value());
    }
}

// ============================================================================
// Limits and stop
// ============================================================================

TEST_CASE("Node limit yields Unproven", "[solver][limits]") {
    Model model;
    build_wide_model(model, 10);
    SolverOptions options;
    options.node_limit = 3;
    options.pruning = false;

    auto result = Solver(model, options).solve();

    REQUIRE(result.status == SolveStatus::Unproven);
    REQUIRE(result.stats.nodes_explored == 3);
    REQUIRE(result.best_bound.has_value());
    REQUIRE(result.best_bound.value() == -10.0);
}

TEST_CASE("Node limit with incumbent reports a gap", "[solver][limits]") {
    KnapsackModel model({3, 4, 5, 6, 7, 8, 9, 10}, {4, 5, 6, 7, 8, 9, 10, 11}, 20);
    SolverOptions options;
    options.search_order = SearchOrder::DepthFirst;
    options.node_limit = 12;

    auto result = Solver(model, options).solve();

    REQUIRE(result.status == SolveStatus::Unproven);
    REQUIRE(result.has_solution());
    REQUIRE(result.best_bound.has_value());
    REQUIRE(*result.best_bound >= *result.objective);
    REQUIRE(result.gap().value() >= 0.0);
    REQUIRE(model.is_feasible(Assignment::from_values(*result.solution)));
}

TEST_CASE("Time limit yields Unproven", "[solver][limits]") {
    Model model;
    build_wide_model(model, 8);
    SolverOptions options;
    options.time_limit = std::chrono::milliseconds(1);

    auto result = Solver(model, std::make_shared<SlowBound>(), options).solve();

    REQUIRE(result.status == SolveStatus::Unproven);
    REQUIRE(result.stats.nodes_explored == 0);
    REQUIRE(result.best_bound.value() == -8.0);
}

TEST_CASE("Stop request yields Unproven", "[solver][limits]") {
    KnapsackModel model({2, 3, 4}, {3, 4, 5}, 5);
    Solver solver(model);

    solver.stop();
    REQUIRE(solver.is_stopped());
    auto stopped = solver.solve();
    REQUIRE(stopped.status == SolveStatus::Unproven);
    REQUIRE(stopped.stats.nodes_explored == 0);

    solver.reset_stop();
    auto result = solver.solve();
    REQUIRE(result.status == SolveStatus::Optimal);
    REQUIRE(result.objective.value() == Approx(7.0));
}

// ============================================================================
// Errors
// ============================================================================

TEST_CASE("Non-finite bound raises NumericError", "[solver][error]") {
    KnapsackModel model({2, 3, 4}, {3, 4, 5}, 5);
    Solver solver(model, std::make_shared<ConstantBound>(std::numeric_limits<double>::quiet_NaN()));

    REQUIRE_THROWS_AS(solver.solve(), NumericError);
}

TEST_CASE("Inadmissible bound raises NumericError", "[solver][error]") {
    // 最大化で上界が小さすぎる
    KnapsackModel model({2, 3, 4}, {3, 4, 5}, 5);
    Solver solver(model, std::make_shared<ConstantBound>(1.0));

    try {
        solver.solve();
        FAIL("expected NumericError");
    } catch (const NumericError& e) {
        REQUIRE(e.depth() == 3);
        REQUIRE(std::string(e.what()).find("not admissible") != std::string::npos);
    }
}

TEST_CASE("Oracle failure is wrapped in SearchError", "[solver][error]") {
    KnapsackModel model({2, 3, 4}, {3, 4, 5}, 5);
    Solver solver(model, std::make_shared<FailingBound>());

    try {
        solver.solve();
        FAIL("expected SearchError");
    } catch (const SearchError& e) {
        REQUIRE(e.depth() == 1);
        REQUIRE(e.assignment().find("x0=") != std::string::npos);
        REQUIRE_THROWS_AS(std::rethrow_if_nested(e), std::runtime_error);
    }
}

TEST_CASE("Invalid input is rejected before search", "[solver][error]") {
    SECTION("non-separable model without oracle") {
        SchedulingModel model(std::vector<Job>{Job{1, 2, std::nullopt, 1.0, 0}});
        REQUIRE_THROWS_AS(Solver(model), InvalidInputError);
    }

    SECTION("invalid options") {
        KnapsackModel model({1}, {1}, 1);
        SolverOptions options;
        options.worker_count = 0;
        REQUIRE_THROWS_AS(Solver(model, options), InvalidInputError);
    }

    SECTION("invalid warm start") {
        KnapsackModel model({2, 3, 4}, {3, 4, 5}, 5);
        Solver solver(model);
        REQUIRE_THROWS_AS(solver.set_initial_solution({1, 1}), InvalidInputError);
        REQUIRE_THROWS_AS(solver.set_initial_solution({1, 1, 1}), InvalidInputError);
        REQUIRE_THROWS_AS(solver.set_initial_solution({2, 0, 0}), InvalidInputError);
    }
}

// ============================================================================
// Warm start
// ============================================================================

TEST_CASE("Warm start seeds the incumbent", "[solver][warm_start]") {
    KnapsackModel model({2, 3, 4}, {3, 4, 5}, 5);

    SECTION("suboptimal warm start is improved") {
        Solver solver(model);
        solver.set_initial_solution({0, 0, 1});
        auto result = solver.solve();
        REQUIRE(result.status == SolveStatus::Optimal);
        REQUIRE(result.objective.value() == Approx(7.0));
        auto history = solver.incumbent().history();
        REQUIRE(history.front().objective == 5.0);
        REQUIRE(history.size() == result.stats.solutions_found + 1);
    }

    SECTION("optimal warm start prunes the root") {
        Solver solver(model, std::make_shared<KnapsackBound>());
        solver.set_initial_solution({1, 1, 0});
        auto result = solver.solve();
        REQUIRE(result.status == SolveStatus::Optimal);
        REQUIRE(result.solution.value() == std::vector<int64_t>{1, 1, 0});
        REQUIRE(result.stats.nodes_explored == 0);
        REQUIRE(result.stats.solutions_found == 0);
        REQUIRE(result.path.empty());
    }
}

// ============================================================================
// Parallel search
// ============================================================================

TEST_CASE("Parallel search agrees with sequential search", "[solver][parallel]") {
    std::mt19937 rng(2024);
    for (int trial = 0; trial < 10; ++trial) {
        Model model;
        build_constrained_model(model, rng, 6);

        SolverOptions parallel;
        parallel.worker_count = 4;
        auto seq = Solver(model).solve();
        auto par = Solver(model, parallel).solve();

        REQUIRE(par.status == seq.status);
        if (seq.objective) {
            REQUIRE(par.objective.value() == Approx(*seq.objective));
            REQUIRE(model.is_feasible(Assignment::from_values(par.solution.value())));
            REQUIRE(model.objective(Assignment::from_values(par.solution.value())) ==
                    Approx(*seq.objective));
        }
    }
}

TEST_CASE("Parallel search on scheduling", "[solver][parallel]") {
    std::vector<Job> jobs;
    for (int j = 0; j < 6; ++j) {
        jobs.push_back(Job{j, 1 + (j * 5) % 7, std::nullopt, 1.0 + j % 3, (j * 3) % 5});
    }
    SchedulingModel model(jobs);
    SolverOptions options;
    options.worker_count = 3;

    auto result = Solver(model, std::make_shared<SchedulingBound>(), options).solve();

    REQUIRE(result.status == SolveStatus::Optimal);
    REQUIRE(result.objective.value() == Approx(test::brute_force_optimum(model).value()));
}

TEST_CASE("Parallel search propagates worker errors", "[solver][parallel][error]") {
    KnapsackModel model({2, 3, 4, 5}, {3, 4, 5, 6}, 8);
    SolverOptions options;
    options.worker_count = 3;
    Solver solver(model, std::make_shared<FailingBound>(), options);

    REQUIRE_THROWS_AS(solver.solve(), SearchError);
}

TEST_CASE("Parallel node limit", "[solver][parallel][limits]") {
    Model model;
    build_wide_model(model, 12);
    SolverOptions options;
    options.worker_count = 4;
    options.node_limit = 50;
    options.pruning = false;

    auto result = Solver(model, options).solve();

    REQUIRE(result.status == SolveStatus::Unproven);
    REQUIRE(result.stats.nodes_explored == 50);
}

TEST_CASE("Parallel children are re-checked against the incumbent on insertion",
          "[solver][parallel][pruning]") {
    // x0 = 1 の子 (1,0) は暫定解がない間に限界値が計算されるが、
    // 兄弟 (1,1) の計算中に別ワーカーが暫定解 0 を見つける
    Model model;
    model.create_variable("x0", 0, 1);
    model.create_variable("x1", 0, 1);
    model.set_objective_coefficient(0, 10.0);
    SolverOptions options;
    options.worker_count = 2;

    auto result = Solver(model, std::make_shared<StaggeredBound>(), options).solve();

    REQUIRE(result.status == SolveStatus::Optimal);
    REQUIRE(result.objective.value() == 0.0);
    REQUIRE(result.solution.value() == std::vector<int64_t>{0, 0});
    // root, x0=0, x0=1, (0,0), (0,1) のみ。(1,0) はフロンティアに入らない
    REQUIRE(result.stats.nodes_explored == 5);
}

// ============================================================================
// Statistics and logging
// ============================================================================

TEST_CASE("Statistics are consistent", "[solver][stats]") {
    KnapsackModel model({5, 4, 6, 3, 2}, {10, 40, 30, 50, 15}, 10);
    Solver solver(model);
    auto result = solver.solve();
    const auto& s = result.stats;

    REQUIRE(result.status == SolveStatus::Optimal);
    REQUIRE(s.nodes_explored >= s.nodes_expanded);
    REQUIRE(s.max_depth <= model.num_variables());
    REQUIRE(s.peak_frontier_size > 0);
    REQUIRE(s.elapsed_seconds >= 0.0);
    REQUIRE(solver.stats().nodes_explored == s.nodes_explored);
    REQUIRE(format_stats(s).find("explored=" + std::to_string(s.nodes_explored)) == 0);
    REQUIRE(to_string(SolveStatus::Unproven) == "Unproven");
}

TEST_CASE("Verbose mode does not change the result", "[solver][verbose]") {
    KnapsackModel model({2, 3, 4}, {3, 4, 5}, 5);
    SolverOptions options;
    options.log_interval = 1;
    Solver solver(model, options);
    solver.set_verbose(true);

    auto result = solver.solve();
    REQUIRE(solver.options().verbose);
    REQUIRE(result.objective.value() == Approx(7.0));
}
