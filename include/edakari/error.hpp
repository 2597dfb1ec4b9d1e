/**
 * @file error.hpp
 * @brief 例外クラス
 */
#ifndef EDAKARI_ERROR_HPP
#define EDAKARI_ERROR_HPP

#include <stdexcept>
#include <string>

namespace edakari {

/**
 * @brief 入力不正（次元の不一致、不正なオプション等）
 *
 * 探索開始前に送出され、部分的な結果は返さない。
 */
class InvalidInputError : public std::invalid_argument {
public:
    explicit InvalidInputError(const std::string& what)
        : std::invalid_argument(what) {}
};

/**
 * @brief ノードに紐づく探索時エラーの基底
 *
 * 問題のノードの深さと割当を保持し、再現に使えるようにする。
 */
class NodeError : public std::runtime_error {
public:
    NodeError(const std::string& what, size_t depth, std::string assignment)
        : std::runtime_error(what + " at depth " + std::to_string(depth) + " " + assignment)
        , depth_(depth)
        , assignment_(std::move(assignment)) {}

    size_t depth() const { return depth_; }
    const std::string& assignment() const { return assignment_; }

private:
    size_t depth_;
    std::string assignment_;
};

/**
 * @brief 上界・下界や目的関数値が有限でない、または許容的でない
 */
class NumericError : public NodeError {
public:
    using NodeError::NodeError;
};

/**
 * @brief 限界計算・分枝中に発生したその他の例外
 *
 * 元の例外は std::throw_with_nested で入れ子にされる。
 */
class SearchError : public NodeError {
public:
    using NodeError::NodeError;
};

} // namespace edakari

#endif // EDAKARI_ERROR_HPP
