/**
 * @file frontier.hpp
 * @brief 未展開ノードの優先度付き集合
 */
#ifndef EDAKARI_FRONTIER_HPP
#define EDAKARI_FRONTIER_HPP

#include "edakari/model.hpp"
#include "edakari/node.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace edakari {

/**
 * @brief 探索順序
 */
enum class SearchOrder {
    BestBoundFirst,   // 限界値が最良のノードから
    DepthFirst        // 最後に挿入したノードから
};

std::string to_string(SearchOrder order);

/**
 * @brief フロンティアの要素
 */
struct FrontierEntry {
    NodeId node = NO_NODE;
    double bound = 0.0;
    size_t depth = 0;
    uint64_t seq = 0;   // 挿入順（insert() が設定）
};

/**
 * @brief 未展開ノードのフロンティア（二分ヒープ）
 *
 * BestBoundFirst: 限界値が良い順、同値なら深い順、さらに同じなら後に挿入した順。
 * DepthFirst: 後に挿入した順（LIFO）。
 * 順序方針は構築時に固定。排他制御は呼び出し側で行う。
 */
class Frontier {
public:
    Frontier(SearchOrder order, ObjectiveSense sense);

    /**
     * @brief ノードを挿入（O(log n)）
     */
    void insert(NodeId node, double bound, size_t depth);

    /**
     * @brief 最も有望なノードを取り出す（O(log n)）
     * @throws std::out_of_range 空の場合
     */
    FrontierEntry extract_best();

    bool is_empty() const { return heap_.empty(); }
    size_t size() const { return heap_.size(); }

    /**
     * @brief これまでの最大サイズ
     */
    size_t peak_size() const { return peak_size_; }

    /**
     * @brief フロンティア内で最良の限界値（O(n)、ギャップ報告用）
     */
    std::optional<double> best_bound() const;

    /**
     * @brief 全ノードを破棄（統計はリセットしない）
     */
    void clear() { heap_.clear(); }

    SearchOrder order() const { return comp_.order; }

private:
    /// a の優先度が b より低いとき true（std::push_heap 用）
    struct Compare {
        SearchOrder order;
        ObjectiveSense sense;
        bool operator()(const FrontierEntry& a, const FrontierEntry& b) const;
    };

    std::vector<FrontierEntry> heap_;
    Compare comp_;
    uint64_t next_seq_ = 0;
    size_t peak_size_ = 0;
};

} // namespace edakari

#endif // EDAKARI_FRONTIER_HPP
