/**
 * @file global.hpp
 * @brief グローバル制約クラス
 */
#ifndef EDAKARI_CONSTRAINTS_GLOBAL_HPP
#define EDAKARI_CONSTRAINTS_GLOBAL_HPP

#include "edakari/constraint.hpp"
#include <vector>
#include <cstdint>

namespace edakari {

// ============================================================================
// AllDifferent constraint
// ============================================================================

/**
 * @brief 全ての変数が異なる値を取る制約
 *
 * 決定済み変数の値の重複に加えて、未決定変数に残る値の数が
 * 未決定変数の数に足りない場合（鳩の巣原理）も違反とする。
 */
class AllDifferentConstraint : public Constraint {
public:
    /**
     * @brief コンストラクタ
     * @param vars 制約に関与する変数インデックス
     */
    explicit AllDifferentConstraint(std::vector<size_t> vars);

    std::string name() const override;
    std::optional<bool> is_satisfied(const Assignment& assignment) const override;
};

// ============================================================================
// IntLinLe constraint
// ============================================================================

/**
 * @brief 線形不等式制約: sum(coeffs[i] * vars[i]) <= bound
 *
 * 現在の定義域での最小到達和が bound を超えたら違反、
 * 最大到達和が bound 以下なら充足とする。
 */
class IntLinLeConstraint : public Constraint {
public:
    /**
     * @throws InvalidInputError coeffs と vars の長さが異なる場合
     */
    IntLinLeConstraint(std::vector<int64_t> coeffs,
                       std::vector<size_t> vars,
                       int64_t bound);

    std::string name() const override;
    std::optional<bool> is_satisfied(const Assignment& assignment) const override;

    const std::vector<int64_t>& coeffs() const { return coeffs_; }
    int64_t bound() const { return bound_; }

private:
    std::vector<int64_t> coeffs_;
    int64_t bound_;
};

} // namespace edakari

#endif // EDAKARI_CONSTRAINTS_GLOBAL_HPP
