/**
 * @file cell.hpp
 * @brief ドット（セル）座標とセル集合のユーティリティ
 */
#ifndef QUADRILLION_CELL_HPP
#define QUADRILLION_CELL_HPP

#include <cstddef>
#include <set>
#include <utility>
#include <vector>

namespace quadrillion {

/**
 * @brief ドット座標 (row, column)
 */
using Cell = std::pair<int, int>;

/**
 * @brief セル集合（値セマンティクス。map のキーとしても使用可能）
 */
using CellSet = std::set<Cell>;

/**
 * @brief 軸平行な矩形領域
 */
struct Rect {
    int top = 0;
    int left = 0;
    int height = 0;
    int width = 0;

    /**
     * @brief 矩形内の全セルを取得
     */
    CellSet cells() const;
};

/**
 * @brief セル集合を平行移動
 * @param cells 元のセル集合
 * @param delta 移動量 (dy, dx)
 */
CellSet translated(const CellSet& cells, Cell delta);

/**
 * @brief a ⊆ b かどうか
 */
bool is_subset(const CellSet& a, const CellSet& b);

/**
 * @brief a と b が共通のセルを持たないかどうか
 */
bool are_disjoint(const CellSet& a, const CellSet& b);

/**
 * @brief a - b
 */
CellSet difference(const CellSet& a, const CellSet& b);

/**
 * @brief セル集合を覆う最小の矩形
 * @pre cells が空でないこと
 */
Rect bounding_box(const CellSet& cells);

/**
 * @brief 4近傍（上下左右）で連結な成分に分解
 *
 * 斜めの隣接は連結とみなさない。
 * 各成分は、成分内の最小セルの順に並ぶ。
 */
std::vector<CellSet> connected_components(const CellSet& cells);

/**
 * @brief セル集合のハッシュを seed に混ぜ込む
 */
size_t hash_cells(const CellSet& cells, size_t seed = 0);

} // namespace quadrillion

#endif // QUADRILLION_CELL_HPP
