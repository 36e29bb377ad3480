/**
 * @file feasibility.hpp
 * @brief 空き領域のセル数による充填可能性の判定
 */
#ifndef QUADRILLION_FEASIBILITY_HPP
#define QUADRILLION_FEASIBILITY_HPP

#include "quadrillion/shape.hpp"
#include <vector>

namespace quadrillion {

/**
 * @brief 空き領域のサイズに関する整除条件
 *
 * 図形の大半は unit_size セルで、例外的なサイズの図形（partial_sizes）が少数ある。
 * 空きセル総数 N は、partial_sizes のある部分集合 S について
 * N = unit_size * k + sum(S) と書けなければならない。
 * さらに各連結成分のサイズ c は、S のある部分集合 T について
 * c = unit_size * m + sum(T) と書けなければならない。
 *
 * 標準の図形セット（5セル×10、4セル×1、3セル×1）では
 * N mod 5 ∈ {0, 4, 3, 2} に対応する。
 */
struct FeasibilityRule {
    size_t unit_size = 5;
    std::vector<size_t> partial_sizes{4, 3};

    /// このサイズ以下の連結成分は、ある変数の候補値と完全に一致しなければならない
    size_t small_component_limit = 5;

    /**
     * @brief 図形セットから条件を導出
     *
     * 最も多いサイズ（同数なら大きい方）を unit_size とし、
     * それ以外の図形のサイズを partial_sizes とする。
     */
    static FeasibilityRule from_shapes(const std::vector<ShapePtr>& shapes);

    /**
     * @brief 空きセル総数と連結成分サイズが条件を満たすか
     * @param total_empty 空きセル総数
     * @param component_sizes 各連結成分のセル数
     */
    bool admits(size_t total_empty, const std::vector<size_t>& component_sizes) const;
};

} // namespace quadrillion

#endif // QUADRILLION_FEASIBILITY_HPP
