/**
 * @file node.hpp
 * @brief 探索ノードとノードアリーナ
 */
#ifndef EDAKARI_NODE_HPP
#define EDAKARI_NODE_HPP

#include "edakari/assignment.hpp"
#include "edakari/branching.hpp"
#include <deque>
#include <mutex>
#include <vector>

namespace edakari {

using NodeId = size_t;

/// 親なし（ルート、ウォームスタート解）
constexpr NodeId NO_NODE = SIZE_MAX;

/**
 * @brief 探索ノード
 *
 * 限界値は生成時に計算済み。parent は経路復元専用のインデックスで、
 * 親ノードの変更には使わない。
 */
struct Node {
    NodeId id = NO_NODE;
    NodeId parent = NO_NODE;
    size_t depth = 0;
    double bound = 0.0;
    BranchStep step;          // 親からこのノードを作った分枝決定
    Assignment assignment;    // 展開・枝刈り後は解放される
    size_t live_children = 0; // このノードを親として参照する保持中の子
    bool released = false;
};

/**
 * @brief インデックスで参照するノードのアリーナ
 *
 * 所有権の循環を避けるため、親子関係はインデックスで表す。
 * 展開または枝刈りの後は割当を解放し、保持中の子がなければレコードも解放する。
 * レコードが解放されると、参照が無くなった祖先も順に解放される。
 * したがって保持されるのは未処理のノードとその祖先だけで、
 * その数はフロンティアの大きさ × 深さで抑えられる。
 * 解放したスロットは空きリストで再利用する。
 *
 * 要素は std::deque に置くため、create() 後も保持中のノードへの参照は有効。
 * 1つのノードを同時に扱うワーカーは1つだけ。
 */
class NodeArena {
public:
    /**
     * @brief ノードを作成
     * @return 新しいノードのID
     */
    NodeId create(NodeId parent, size_t depth, double bound,
                  BranchStep step, Assignment assignment);

    /**
     * @brief IDでノードを取得
     */
    const Node& at(NodeId id) const;

    /**
     * @brief 展開・枝刈りが済んだノードを解放
     *
     * 子を持たないノードはレコードごと解放し、参照が無くなった祖先も解放する。
     * @throws std::logic_error 解放済みのノードを指定した場合
     */
    void release(NodeId id);

    /**
     * @brief ルートからノードまでの分枝決定の列
     *
     * 未解放のノードに対してのみ有効（祖先は子が保持されている間は残る）。
     */
    std::vector<BranchStep> path_to(NodeId id) const;

    /**
     * @brief 保持中のノード数
     */
    size_t size() const;

    /**
     * @brief clear() 以降に同時に保持したノード数の最大値
     */
    size_t peak_size() const;

    void clear();

private:
    Node& checked(NodeId id);
    const Node& checked(NodeId id) const;

    mutable std::mutex mutex_;
    std::deque<Node> nodes_;
    std::vector<NodeId> free_;
    size_t peak_size_ = 0;
};

} // namespace edakari

#endif // EDAKARI_NODE_HPP
