/**
 * @file domain.hpp
 * @brief 整数定義域クラス（ソート済み値集合）
 */
#ifndef EDAKARI_DOMAIN_HPP
#define EDAKARI_DOMAIN_HPP

#include <vector>
#include <optional>
#include <cstdint>
#include <string>

namespace edakari {

/**
 * @brief 整数定義域を表すクラス
 *
 * 値は昇順・重複なしで保持する。分枝では定義域をコピーして絞り込むため、
 * ノードごとに独立した値を持つ（バックトラック用の Trail は持たない）。
 */
class Domain {
public:
    using value_type = int64_t;

    /// 区間から作る定義域の値の数の上限（値を全て保持するため）
    static constexpr size_t MAX_INTERVAL_SIZE = size_t(1) << 20;

    /**
     * @brief 空の定義域を作成
     */
    Domain() = default;

    /**
     * @brief 区間定義域を作成
     * @param min 最小値
     * @param max 最大値（min > max なら空）
     * @throws InvalidInputError 値の数が MAX_INTERVAL_SIZE を超える場合
     */
    Domain(value_type min, value_type max);

    /**
     * @brief 値リストから定義域を作成
     * @param values 定義域に含める値のリスト（重複・順序は問わない）
     */
    explicit Domain(std::vector<value_type> values);

    /**
     * @brief 定義域が空かどうか
     */
    bool empty() const { return values_.empty(); }

    /**
     * @brief 定義域のサイズを取得
     */
    size_t size() const { return values_.size(); }

    /**
     * @brief 最小値を取得
     */
    std::optional<value_type> min() const {
        return values_.empty() ? std::nullopt : std::optional<value_type>(values_.front());
    }

    /**
     * @brief 最大値を取得
     */
    std::optional<value_type> max() const {
        return values_.empty() ? std::nullopt : std::optional<value_type>(values_.back());
    }

    /**
     * @brief 値が定義域に含まれるか（二分探索）
     */
    bool contains(value_type value) const;

    /**
     * @brief 単一値に固定されているか
     */
    bool is_singleton() const { return values_.size() == 1; }

    /**
     * @brief i 番目（昇順）の値
     */
    value_type at(size_t i) const { return values_.at(i); }

    /**
     * @brief 全ての値を昇順で取得
     */
    const std::vector<value_type>& values() const { return values_; }

    /**
     * @brief 位置 [first, last) の値だけを持つ部分定義域
     */
    Domain slice(size_t first, size_t last) const;

    /**
     * @brief 他の定義域との和集合
     */
    Domain merged(const Domain& other) const;

    const value_type* begin() const { return values_.data(); }
    const value_type* end() const { return values_.data() + values_.size(); }

    bool operator==(const Domain& other) const { return values_ == other.values_; }
    bool operator!=(const Domain& other) const { return values_ != other.values_; }

    /**
     * @brief "{1,3,5}" 形式、連続区間なら "1..5" 形式の文字列
     */
    std::string to_string() const;

private:
    std::vector<value_type> values_;
};

} // namespace edakari

#endif // EDAKARI_DOMAIN_HPP
