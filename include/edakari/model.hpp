/**
 * @file model.hpp
 * @brief 問題モデルクラス（変数・制約・目的関数の管理）
 */
#ifndef EDAKARI_MODEL_HPP
#define EDAKARI_MODEL_HPP

#include "edakari/variable.hpp"
#include "edakari/constraint.hpp"
#include "edakari/assignment.hpp"
#include <vector>
#include <map>
#include <string>

namespace edakari {

/**
 * @brief 目的関数の向き
 */
enum class ObjectiveSense {
    Minimize,
    Maximize
};

std::string to_string(ObjectiveSense sense);

/**
 * @brief a が b より厳密に良いか（向きを考慮）
 */
bool is_better(double a, double b, ObjectiveSense sense);

/**
 * @brief 向きに対して最悪の値（最小化なら +inf）
 */
double worst_value(ObjectiveSense sense);

/**
 * @brief 問題モデル
 *
 * 変数（ルート定義域付き）、制約、目的関数を保持する。
 * 構築後は探索中に変更されず、複数ワーカーから同時に読み出してよい。
 *
 * デフォルトの目的関数は分離可能な線形和
 * constant + sum(coeff[i] * x[i]) で、サブクラスは objective() /
 * objective_term() をオーバーライドして別の目的関数を定義できる。
 */
class Model {
public:
    Model() = default;
    virtual ~Model() = default;

    // ===== 変数・制約管理 =====

    /**
     * @brief 変数を作成して登録（推奨）
     * @param name 変数名
     * @param domain 定義域
     * @return 変数のID（インデックス）
     */
    size_t create_variable(std::string name, Domain domain);

    /**
     * @brief 区間ドメインの変数を作成して登録
     */
    size_t create_variable(std::string name, Domain::value_type min, Domain::value_type max);

    /**
     * @brief 値リストドメインの変数を作成して登録
     */
    size_t create_variable(std::string name, std::vector<Domain::value_type> values);

    /**
     * @brief 制約を追加
     * @throws InvalidInputError 制約が範囲外の変数を参照する場合
     */
    void add_constraint(ConstraintPtr constraint);

    /**
     * @brief 変数リストを取得
     */
    const std::vector<Variable>& variables() const { return variables_; }

    /**
     * @brief 制約リストを取得
     */
    const std::vector<ConstraintPtr>& constraints() const { return constraints_; }

    size_t num_variables() const { return variables_.size(); }

    /**
     * @brief IDで変数を取得
     */
    const Variable& variable(size_t id) const;

    /**
     * @brief 名前から変数インデックスを検索
     * @return 見つかればインデックス、なければ SIZE_MAX
     */
    size_t find_variable_index(const std::string& name) const;

    /**
     * @brief 変数のルート定義域（昇順の候補値）
     */
    const Domain& domain_of(size_t var_idx) const { return variable(var_idx).domain(); }

    // ===== 目的関数 =====

    void set_sense(ObjectiveSense sense) { sense_ = sense; }
    ObjectiveSense sense() const { return sense_; }

    void set_objective_coefficient(size_t var_idx, double coeff);
    double objective_coefficient(size_t var_idx) const { return coefficients_.at(var_idx); }

    void set_objective_constant(double constant) { constant_ = constant; }
    double objective_constant() const { return constant_; }

    /**
     * @brief 目的関数が変数ごとの項の和に分離できるか
     *
     * true のとき SeparableBound が使用できる。
     */
    virtual bool has_separable_objective() const { return true; }

    /**
     * @brief 変数 var_idx が値 value を取ったときの目的関数の項
     * @throws std::logic_error 分離不可能なモデルの場合
     */
    virtual double objective_term(size_t var_idx, Domain::value_type value) const;

    /**
     * @brief 完全割当の目的関数値
     * @throws std::logic_error 割当が完全でない場合
     */
    virtual double objective(const Assignment& assignment) const;

    // ===== 割当の判定 =====

    /**
     * @brief ルートの割当（宣言された定義域そのまま）
     */
    Assignment root_assignment() const;

    /**
     * @brief 全変数が決定済みか
     */
    bool is_complete(const Assignment& assignment) const;

    /**
     * @brief 部分割当が実行可能でありうるか
     *
     * 空の定義域がある、または違反が確定した制約があれば false。
     */
    virtual bool is_feasible(const Assignment& assignment) const;

    /**
     * @brief モデルの整合性検査
     * @throws InvalidInputError 次元の不一致など
     */
    virtual void validate() const;

    /**
     * @brief モデルの名前（ログ用）
     */
    virtual std::string name() const { return "model"; }

protected:
    /**
     * @brief 割当の変数数がモデルと一致するか検査
     * @throws InvalidInputError 一致しない場合
     */
    void check_size(const Assignment& assignment) const;

private:
    std::vector<Variable> variables_;
    std::vector<ConstraintPtr> constraints_;
    std::map<std::string, size_t> name_to_id_;
    std::vector<double> coefficients_;
    double constant_ = 0.0;
    ObjectiveSense sense_ = ObjectiveSense::Minimize;
};

} // namespace edakari

#endif // EDAKARI_MODEL_HPP
