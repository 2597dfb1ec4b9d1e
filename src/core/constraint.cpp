/**
 * @file constraint.cpp
 * @brief 制約基底クラスの実装
 *
 * 各制約の実装は src/core/constraints/ 以下の個別ファイルに配置:
 * - constraints/global/all_different.cpp
 * - constraints/global/int_lin_le.cpp
 */
#include "edakari/constraint.hpp"
#include "edakari/error.hpp"

namespace edakari {

Constraint::Constraint(std::vector<size_t> vars)
    : vars_(std::move(vars)) {}

void Constraint::validate(size_t num_variables) const {
    for (auto var_idx : vars_) {
        if (var_idx >= num_variables) {
            throw InvalidInputError(name() + ": variable index " + std::to_string(var_idx) +
                                    " out of range (" + std::to_string(num_variables) +
                                    " variables)");
        }
    }
}

} // namespace edakari
