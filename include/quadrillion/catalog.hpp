/**
 * @file catalog.hpp
 * @brief 標準の図形・グリッドセットと初期配置
 */
#ifndef QUADRILLION_CATALOG_HPP
#define QUADRILLION_CATALOG_HPP

#include "quadrillion/board.hpp"
#include <map>
#include <memory>
#include <string>

namespace quadrillion {
namespace catalog {

/**
 * @brief アイテム名 → 初期配置の上書き
 */
using PlacementOverrides = std::map<std::string, Placement>;

/**
 * @brief 標準のドット空間 (行数, 列数)
 *
 * 4枚のグリッドが原点に 8×8 の正方形を作り、図形はその右側に並ぶ。
 */
Cell dot_space();

/**
 * @brief 標準の図形 12 個（5セル×10、4セル×1、3セル×1、計57セル）
 */
std::vector<ShapePtr> make_shapes(const PlacementOverrides& overrides = {});

/**
 * @brief 標準のグリッド 4 枚（各面の閉じたドットは 2, 2, 2, 1 個）
 */
std::vector<GridPtr> make_grids(const PlacementOverrides& overrides = {});

/**
 * @brief 標準の盤面を作成
 * @throws std::runtime_error overrides に未知のアイテム名がある場合
 * @throws InitialConfigurationError 上書き後の初期配置が規則に違反する場合
 */
std::unique_ptr<Board> make_board(const PlacementOverrides& overrides = {});

} // namespace catalog
} // namespace quadrillion

#endif // QUADRILLION_CATALOG_HPP
