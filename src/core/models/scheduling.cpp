#include "edakari/models/scheduling.hpp"
#include "edakari/constraints/global.hpp"
#include "edakari/error.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <memory>
#include <set>
#include <stdexcept>

namespace edakari {

std::string to_string(SchedulingObjective objective) {
    switch (objective) {
        case SchedulingObjective::WeightedCompletion:
            return "weighted_completion";
        case SchedulingObjective::WeightedTardiness:
            return "weighted_tardiness";
    }
    return "unknown";
}

SchedulingModel::SchedulingModel(std::vector<Job> jobs, SchedulingObjective objective)
    : jobs_(std::move(jobs))
    , objective_(objective) {
    validate();

    const auto n = static_cast<Domain::value_type>(jobs_.size());
    std::vector<size_t> positions(jobs_.size());
    for (size_t k = 0; k < jobs_.size(); ++k) {
        create_variable("s" + std::to_string(k), 0, n - 1);
        positions[k] = k;
    }
    set_sense(ObjectiveSense::Minimize);
    if (jobs_.size() > 1) {
        add_constraint(std::make_shared<AllDifferentConstraint>(positions));
    }
}

void SchedulingModel::validate() const {
    std::set<int64_t> ids;
    for (const auto& job : jobs_) {
        if (job.processing_time <= 0) {
            throw InvalidInputError("scheduling: job " + std::to_string(job.id) +
                                    " has non-positive processing time");
        }
        if (!std::isfinite(job.weight) || job.weight <= 0.0) {
            throw InvalidInputError("scheduling: job " + std::to_string(job.id) +
                                    " has non-positive weight");
        }
        if (job.release_date < 0) {
            throw InvalidInputError("scheduling: job " + std::to_string(job.id) +
                                    " has negative release date");
        }
        if (!ids.insert(job.id).second) {
            throw InvalidInputError("scheduling: duplicate job id " + std::to_string(job.id));
        }
    }
    Model::validate();
}

std::vector<ScheduledJob> SchedulingModel::timeline(
        const std::vector<Domain::value_type>& sequence) const {
    if (sequence.size() != jobs_.size()) {
        throw InvalidInputError("timeline: sequence has " + std::to_string(sequence.size()) +
                                " entries for " + std::to_string(jobs_.size()) + " jobs");
    }
    std::vector<bool> used(jobs_.size(), false);
    std::vector<ScheduledJob> rows;
    rows.reserve(sequence.size());

    int64_t t = 0;
    for (size_t k = 0; k < sequence.size(); ++k) {
        auto j = sequence[k];
        if (j < 0 || static_cast<size_t>(j) >= jobs_.size() || used[j]) {
            throw InvalidInputError("timeline: sequence is not a permutation of the jobs");
        }
        used[j] = true;
        const auto& job = jobs_[j];
        int64_t start = std::max(t, job.release_date);
        int64_t finish = start + job.processing_time;
        rows.push_back(ScheduledJob{k, static_cast<size_t>(j), start, finish, start - t});
        t = finish;
    }
    return rows;
}

double SchedulingModel::job_cost(size_t job, int64_t finish) const {
    const auto& j = jobs_.at(job);
    if (objective_ == SchedulingObjective::WeightedCompletion) {
        return j.weight * static_cast<double>(finish);
    }
    if (!j.due_date) {
        return 0.0;
    }
    return j.weight * static_cast<double>(std::max<int64_t>(0, finish - *j.due_date));
}

double SchedulingModel::objective_term(size_t, Domain::value_type) const {
    throw std::logic_error("scheduling objective is not separable");
}

double SchedulingModel::objective(const Assignment& assignment) const {
    check_size(assignment);
    if (!assignment.is_complete()) {
        throw std::logic_error("objective requires a complete assignment");
    }
    double sum = 0.0;
    for (const auto& row : timeline(assignment.values())) {
        sum += job_cost(row.job, row.finish);
    }
    return sum;
}

std::string SchedulingBound::name() const {
    return "scheduling_wspt";
}

double SchedulingBound::bound(const Model& model, const Assignment& assignment) const {
    const auto* scheduling = dynamic_cast<const SchedulingModel*>(&model);
    if (scheduling == nullptr) {
        throw InvalidInputError("scheduling bound: " + model.name() +
                                " is not a scheduling model");
    }
    const auto& jobs = scheduling->jobs();
    const size_t n = jobs.size();

    // 先頭から連続して決定済みの位置
    std::vector<bool> used(n, false);
    double cost = 0.0;
    int64_t t = 0;
    for (size_t k = 0; k < assignment.size() && assignment.is_assigned(k); ++k) {
        auto j = assignment.value(k);
        if (j < 0 || static_cast<size_t>(j) >= n || used[j]) break;
        used[j] = true;
        const auto& job = jobs[j];
        t = std::max(t, job.release_date) + job.processing_time;
        cost += scheduling->job_cost(static_cast<size_t>(j), t);
    }

    std::vector<size_t> rest;
    for (size_t j = 0; j < n; ++j) {
        if (!used[j]) rest.push_back(j);
    }
    if (rest.empty()) {
        return cost;
    }

    if (scheduling->objective_kind() == SchedulingObjective::WeightedTardiness) {
        for (size_t j : rest) {
            const auto& job = jobs[j];
            cost += scheduling->job_cost(j, std::max(t, job.release_date) + job.processing_time);
        }
        return cost;
    }

    // WSPT: p_j / w_j の昇順
    std::stable_sort(rest.begin(), rest.end(), [&jobs](size_t a, size_t b) {
        return static_cast<double>(jobs[a].processing_time) * jobs[b].weight <
               static_cast<double>(jobs[b].processing_time) * jobs[a].weight;
    });
    int64_t earliest = std::numeric_limits<int64_t>::max();
    for (size_t j : rest) {
        earliest = std::min(earliest, jobs[j].release_date);
    }
    t = std::max(t, earliest);
    for (size_t j : rest) {
        t += jobs[j].processing_time;
        cost += scheduling->job_cost(j, t);
    }
    return cost;
}

} // namespace edakari
