/**
 * @file options.hpp
 * @brief ソルバー設定
 */
#ifndef EDAKARI_OPTIONS_HPP
#define EDAKARI_OPTIONS_HPP

#include "edakari/branching.hpp"
#include "edakari/frontier.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace edakari {

/**
 * @brief ソルバー設定
 *
 * 探索順序・分枝方針は Solver の構築時に固定される。
 */
struct SolverOptions {
    SearchOrder search_order = SearchOrder::BestBoundFirst;
    BranchingRule branching_rule = BranchingRule::FirstUnassigned;

    /// 取り出すノード数の上限（std::nullopt なら無制限）
    std::optional<size_t> node_limit;

    /// 経過時間の上限（std::nullopt なら無制限）
    std::optional<std::chrono::milliseconds> time_limit;

    /// 1 なら逐次探索
    size_t worker_count = 1;

    /// false にすると限界値による枝刈りを行わない（検証用）
    bool pruning = true;

    /// 定義域サイズがこれを超える変数は二分割で分枝（0 なら無効）
    size_t bisect_threshold = 0;

    bool verbose = false;

    /// verbose 時の進捗出力間隔（取り出したノード数）
    size_t log_interval = 100000;

    /**
     * @throws InvalidInputError worker_count や node_limit が不正な場合
     */
    void validate() const;
};

/**
 * @brief キー・値の組から設定を作る
 *
 * 認識するキー: search_order, branching_strategy, node_limit, time_limit,
 * worker_count, pruning, bisect_threshold, verbose, log_interval。
 * node_limit / time_limit は "unbounded" を受け付ける。
 * time_limit は秒数（"2.5"、"2.5s"）またはミリ秒（"500ms"）。
 *
 * @throws InvalidInputError 未知のキーや不正な値
 */
SolverOptions parse_solver_options(const std::map<std::string, std::string>& values);

SearchOrder parse_search_order(const std::string& text);
BranchingRule parse_branching_rule(const std::string& text);

} // namespace edakari

#endif // EDAKARI_OPTIONS_HPP
