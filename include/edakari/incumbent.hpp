/**
 * @file incumbent.hpp
 * @brief 暫定解（これまでの最良の完全・実行可能解）
 */
#ifndef EDAKARI_INCUMBENT_HPP
#define EDAKARI_INCUMBENT_HPP

#include "edakari/branching.hpp"
#include "edakari/model.hpp"
#include <atomic>
#include <chrono>
#include <mutex>
#include <optional>
#include <vector>

namespace edakari {

/**
 * @brief 暫定解の更新イベント
 */
struct IncumbentEvent {
    double objective;
    double elapsed_seconds;   // Incumbent の生成（reset）からの経過時間
};

/**
 * @brief 暫定解の一貫したコピー
 */
struct IncumbentSnapshot {
    std::vector<Domain::value_type> values;
    double objective;
    std::vector<BranchStep> path;   // ルートからの分枝決定（ウォームスタート解は空）
};

/**
 * @brief 暫定解の管理
 *
 * 更新は try_update() のみで、目的関数値が厳密に改善する場合に限り成功する。
 * 書き込みは mutex で直列化し、目的関数値は atomic で公開するため、
 * 読み出し側（枝刈り判定）はロックなしで常に完全な値を見る。
 */
class Incumbent {
public:
    explicit Incumbent(ObjectiveSense sense);

    Incumbent(const Incumbent&) = delete;
    Incumbent& operator=(const Incumbent&) = delete;

    /**
     * @brief 厳密に改善する場合（または未設定の場合）に暫定解を置き換える
     * @param path 解に至った分枝決定。探索ノードは解放されるため更新時に保存する
     * @return 置き換えたら true
     */
    bool try_update(std::vector<Domain::value_type> values, double objective,
                    std::vector<BranchStep> path = {});

    bool has_value() const { return has_value_.load(std::memory_order_acquire); }

    /**
     * @brief 暫定解の目的関数値（未設定なら向きに対する最悪値 ±inf）
     */
    double objective() const { return objective_.load(std::memory_order_acquire); }

    /**
     * @brief value が暫定解より厳密に良いか（未設定なら常に true）
     */
    bool improves(double value) const { return is_better(value, objective(), sense_); }

    /**
     * @brief 暫定解のコピー（未設定なら std::nullopt）
     */
    std::optional<IncumbentSnapshot> snapshot() const;

    /**
     * @brief 更新履歴
     */
    std::vector<IncumbentEvent> history() const;

    ObjectiveSense sense() const { return sense_; }

    /**
     * @brief 未設定状態に戻す
     */
    void reset();

private:
    ObjectiveSense sense_;
    mutable std::mutex mutex_;
    std::atomic<double> objective_;
    std::atomic<bool> has_value_{false};
    std::vector<Domain::value_type> values_;
    std::vector<BranchStep> path_;
    std::vector<IncumbentEvent> history_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace edakari

#endif // EDAKARI_INCUMBENT_HPP
