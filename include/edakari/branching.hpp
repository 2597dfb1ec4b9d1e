/**
 * @file branching.hpp
 * @brief 分枝戦略（変数選択と定義域の分割）
 */
#ifndef EDAKARI_BRANCHING_HPP
#define EDAKARI_BRANCHING_HPP

#include "edakari/model.hpp"
#include <memory>
#include <string>
#include <vector>

namespace edakari {

/**
 * @brief 変数選択の方針
 */
enum class BranchingRule {
    FirstUnassigned,   // 宣言順で最初の未決定変数
    MostConstrained    // 定義域が最小の変数（同サイズなら宣言順）
};

std::string to_string(BranchingRule rule);

/**
 * @brief 分枝決定: 子ノードで変数 var_idx の定義域を domain に絞る
 */
struct BranchStep {
    size_t var_idx = SIZE_MAX;
    Domain domain;

    std::string to_string() const;
};

/**
 * @brief 分枝で生成される子
 */
struct Child {
    Assignment assignment;
    BranchStep step;
};

/**
 * @brief 分枝戦略の基底クラス
 *
 * branch() が返す子の定義域は親の定義域を重複なく覆う（網羅的・排他的）。
 * 定義域サイズが bisect_threshold を超える変数は値の並びの中央で二分し、
 * それ以外は値ごとに1つの子を昇順で作る。
 */
class BranchingStrategy {
public:
    virtual ~BranchingStrategy() = default;

    virtual std::string name() const = 0;

    /**
     * @brief 次に分枝する変数を選択
     * @throws std::logic_error 未決定の変数がない場合
     */
    virtual size_t select_variable(const Model& model, const Assignment& assignment) const = 0;

    /**
     * @brief 変数の定義域を分割して子を作る
     * @throws std::logic_error 変数が決定済みの場合
     */
    virtual std::vector<Child> branch(const Model& model, const Assignment& assignment,
                                      size_t var_idx) const;

    /**
     * @brief 二分割に切り替える定義域サイズ（0 なら常に値ごとに分枝）
     */
    void set_bisect_threshold(size_t threshold) { bisect_threshold_ = threshold; }
    size_t bisect_threshold() const { return bisect_threshold_; }

private:
    size_t bisect_threshold_ = 0;
};

/**
 * @brief 宣言順で最初の未決定変数を選ぶ
 */
class FirstUnassignedBranching : public BranchingStrategy {
public:
    std::string name() const override;
    size_t select_variable(const Model& model, const Assignment& assignment) const override;
};

/**
 * @brief 定義域サイズ最小の未決定変数を選ぶ（同サイズなら宣言順）
 */
class MostConstrainedBranching : public BranchingStrategy {
public:
    std::string name() const override;
    size_t select_variable(const Model& model, const Assignment& assignment) const override;
};

/**
 * @brief 方針から分枝戦略を作成
 */
std::unique_ptr<BranchingStrategy> make_branching_strategy(BranchingRule rule,
                                                           size_t bisect_threshold = 0);

} // namespace edakari

#endif // EDAKARI_BRANCHING_HPP
