/**
 * @file solver.hpp
 * @brief 分枝限定法ソルバー（探索ドライバとワーカープール）
 */
#ifndef EDAKARI_SOLVER_HPP
#define EDAKARI_SOLVER_HPP

#include "edakari/bound.hpp"
#include "edakari/branching.hpp"
#include "edakari/frontier.hpp"
#include "edakari/incumbent.hpp"
#include "edakari/model.hpp"
#include "edakari/node.hpp"
#include "edakari/options.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace edakari {

/**
 * @brief 探索結果の状態
 */
enum class SolveStatus {
    Optimal,      // 暫定解が最適であることを証明した
    Infeasible,   // 実行可能解が存在しない
    Unproven      // 資源制限・停止要求で打ち切った
};

std::string to_string(SolveStatus status);

/**
 * @brief ソルバー統計情報
 */
struct SearchStats {
    size_t nodes_explored = 0;      // フロンティアから取り出したノード
    size_t nodes_expanded = 0;      // 分枝したノード
    size_t nodes_pruned = 0;        // 限界値で捨てたノード
    size_t nodes_infeasible = 0;    // 実行不可能で捨てた子
    size_t solutions_found = 0;     // 暫定解の更新回数
    size_t peak_frontier_size = 0;
    size_t peak_retained_nodes = 0; // 同時に保持した探索ノードの最大数
    size_t max_depth = 0;
    double elapsed_seconds = 0.0;
};

/**
 * @brief 統計情報を1行の文字列にする
 */
std::string format_stats(const SearchStats& stats);

/**
 * @brief 探索結果
 */
struct SolveResult {
    SolveStatus status = SolveStatus::Infeasible;

    /// 暫定解の値（変数インデックス順）
    std::optional<std::vector<Domain::value_type>> solution;
    std::optional<double> objective;

    /// 最適値がこれより良くならないことが保証された値
    std::optional<double> best_bound;

    /// ルートから暫定解のノードまでの分枝決定
    std::vector<BranchStep> path;

    SearchStats stats;

    bool has_solution() const { return solution.has_value(); }

    /**
     * @brief 最適性ギャップ |objective - best_bound|
     */
    std::optional<double> gap() const;
};

/**
 * @brief 分枝限定法ソルバー
 *
 * INIT → SELECT → BOUND → {PRUNE | ACCEPT | BRANCH} → SELECT ... → TERMINATED
 *
 * - 限界値は子ノード生成時に計算し、取り出し時に暫定解と比較する
 * - 資源制限と停止要求は SELECT ごとに確認し、Unproven で終了する
 * - worker_count > 1 ではフロンティアと暫定解を共有するワーカープールで探索する
 *
 * Model・限界オラクル・分枝戦略は構築時に注入する。Model は呼び出し側が所有し、
 * Solver より長く生存しなければならない。
 */
class Solver {
public:
    /**
     * @brief デフォルトの限界オラクル（SeparableBound）で構築
     * @throws InvalidInputError モデル・設定が不正、または目的関数が分離不可能な場合
     */
    explicit Solver(const Model& model, SolverOptions options = SolverOptions());

    /**
     * @brief 限界オラクルを指定して構築
     */
    Solver(const Model& model, BoundOraclePtr bound, SolverOptions options = SolverOptions());

    /**
     * @brief 限界オラクルと分枝戦略を指定して構築
     *
     * branching を指定した場合 options の branching_rule / bisect_threshold は使わない。
     */
    Solver(const Model& model, BoundOraclePtr bound,
           std::shared_ptr<const BranchingStrategy> branching,
           SolverOptions options = SolverOptions());

    Solver(const Solver&) = delete;
    Solver& operator=(const Solver&) = delete;

    /**
     * @brief 探索を実行
     *
     * 呼び出すたびに状態を初期化する（ウォームスタート解は保持）。
     *
     * @throws NumericError 限界値・目的関数値が有限でない、または許容的でない場合
     * @throws SearchError 限界計算・分枝中に他の例外が発生した場合
     */
    SolveResult solve();

    /**
     * @brief 初期暫定解を設定（ウォームスタート）
     * @throws InvalidInputError 完全・実行可能な割当でない場合
     */
    void set_initial_solution(const std::vector<Domain::value_type>& values);

    /**
     * @brief 暫定解（探索中・探索後）
     */
    const Incumbent& incumbent() const { return incumbent_; }

    const SolverOptions& options() const { return options_; }

    /**
     * @brief 最後の探索の統計情報
     */
    const SearchStats& stats() const { return stats_; }

    const BoundOracle& bound_oracle() const { return *bound_; }
    const BranchingStrategy& branching_strategy() const { return *branching_; }

    /**
     * @brief 探索を停止する（別スレッド・シグナルハンドラから呼び出し可能）
     */
    void stop() { stopped_ = true; }

    /**
     * @brief 停止フラグをリセット
     */
    void reset_stop() { stopped_ = false; }

    /**
     * @brief 停止フラグを確認
     */
    bool is_stopped() const { return stopped_; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { options_.verbose = enabled; }

private:
    /**
     * @brief 展開で得た子（フロンティアに入れる前）
     */
    struct ChildEntry {
        NodeId node;
        double bound;
        size_t depth;
    };

    // ===== 探索 =====

    /**
     * @brief 逐次探索ループ
     * @return 資源制限で打ち切ったら true
     */
    bool run_sequential();

    /**
     * @brief ワーカープールによる並列探索
     * @return 資源制限で打ち切ったら true
     */
    bool run_parallel();

    /**
     * @brief 取り出したノードを処理（BOUND → PRUNE | ACCEPT | BRANCH）
     * @param children フロンティアに挿入すべき子を追加する
     */
    void process_node(const FrontierEntry& entry, SearchStats& stats,
                      std::vector<ChildEntry>& children);

    /**
     * @brief 完全割当を暫定解の候補として評価（ACCEPT）
     */
    void accept(const Node& node, SearchStats& stats);

    /**
     * @brief 限界オラクルを呼び、値を検査
     */
    double compute_bound(const Assignment& assignment, size_t depth) const;

    /**
     * @brief SELECT での資源制限・停止要求の確認
     */
    bool limit_reached(size_t nodes_explored) const;

    /**
     * @brief 結果を組み立てる
     */
    SolveResult build_result(bool limited);

    void log(const std::string& message) const;
    void log_progress(size_t nodes_explored, size_t frontier_size) const;

    // ===== メンバ変数 =====

    const Model& model_;
    BoundOraclePtr bound_;
    std::shared_ptr<const BranchingStrategy> branching_;
    SolverOptions options_;

    NodeArena arena_;
    Frontier frontier_;
    Incumbent incumbent_;
    SearchStats stats_;

    std::optional<std::vector<Domain::value_type>> initial_solution_;
    double initial_objective_ = 0.0;

    std::atomic<bool> stopped_{false};
    std::chrono::steady_clock::time_point start_;
    mutable std::mutex log_mutex_;
};

} // namespace edakari

#endif // EDAKARI_SOLVER_HPP
