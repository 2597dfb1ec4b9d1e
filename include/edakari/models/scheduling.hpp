/**
 * @file scheduling.hpp
 * @brief 単一機械スケジューリング問題モデル
 */
#ifndef EDAKARI_MODELS_SCHEDULING_HPP
#define EDAKARI_MODELS_SCHEDULING_HPP

#include "edakari/bound.hpp"
#include "edakari/model.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace edakari {

/**
 * @brief ジョブ
 */
struct Job {
    int64_t id = 0;
    int64_t processing_time = 1;            // > 0
    std::optional<int64_t> due_date;        // なければ納期遅れにならない
    double weight = 1.0;                    // > 0
    int64_t release_date = 0;               // >= 0
};

/**
 * @brief スケジューリングの目的関数
 */
enum class SchedulingObjective {
    WeightedCompletion,   // sum(w_j * C_j)
    WeightedTardiness     // sum(w_j * max(0, C_j - d_j))
};

std::string to_string(SchedulingObjective objective);

/**
 * @brief スケジュール上の1ジョブ（ガントチャートの1行）
 */
struct ScheduledJob {
    size_t position;
    size_t job;         // jobs() のインデックス
    int64_t start;
    int64_t finish;
    int64_t idle;       // 直前のジョブの終了からの空き時間
};

/**
 * @brief 1 | r_j | sum(w_j C_j) / sum(w_j T_j)
 *
 * 変数 s_k は位置 k で処理するジョブのインデックス（0..n-1）で、
 * AllDifferent 制約により順列になる。ジョブは位置順に中断なく処理され、
 * 各ジョブは max(直前の終了時刻, release_date) に開始する。最小化。
 */
class SchedulingModel : public Model {
public:
    /**
     * @throws InvalidInputError 処理時間・重み・リリース日が不正、ID が重複
     */
    explicit SchedulingModel(std::vector<Job> jobs,
                             SchedulingObjective objective = SchedulingObjective::WeightedCompletion);

    const std::vector<Job>& jobs() const { return jobs_; }
    size_t num_jobs() const { return jobs_.size(); }
    SchedulingObjective objective_kind() const { return objective_; }

    /**
     * @brief 処理順からスケジュールを作る
     * @param sequence 位置順のジョブインデックス
     * @throws InvalidInputError sequence がジョブの順列でない場合
     */
    std::vector<ScheduledJob> timeline(const std::vector<Domain::value_type>& sequence) const;

    /**
     * @brief 1ジョブのコスト（完了時刻 finish のとき）
     */
    double job_cost(size_t job, int64_t finish) const;

    bool has_separable_objective() const override { return false; }
    double objective_term(size_t var_idx, Domain::value_type value) const override;
    double objective(const Assignment& assignment) const override;

    void validate() const override;
    std::string name() const override { return "scheduling"; }

private:
    std::vector<Job> jobs_;
    SchedulingObjective objective_;
};

/**
 * @brief スケジューリングの下界
 *
 * 先頭から連続して決定済みの位置はそのまま評価し、残りのジョブは
 * - WeightedCompletion: 残りの最小リリース日から WSPT 順で処理する緩和
 * - WeightedTardiness: 各ジョブを最早開始時刻に置いたときの遅れ
 * で下から見積もる。
 */
class SchedulingBound : public BoundOracle {
public:
    std::string name() const override;

    /**
     * @throws InvalidInputError model が SchedulingModel でない場合
     */
    double bound(const Model& model, const Assignment& assignment) const override;
};

} // namespace edakari

#endif // EDAKARI_MODELS_SCHEDULING_HPP
