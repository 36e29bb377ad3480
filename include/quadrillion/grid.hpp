/**
 * @file grid.hpp
 * @brief 両面グリッド（表裏で閉じたドットのパターンが異なる盤面タイル）
 */
#ifndef QUADRILLION_GRID_HPP
#define QUADRILLION_GRID_HPP

#include "quadrillion/shape.hpp"

namespace quadrillion {

/**
 * @brief 両面グリッド
 *
 * 占有セル（cells()）は現在位置の矩形全体。
 * 図形を置ける開いたセル（open_cells()）は、矩形から
 * 現在の面の閉じたセルを除いたもの。
 * 反転回数が偶数なら表面、奇数なら裏面のパターンを回転・平行移動して使う。
 */
class Grid : public Shape {
public:
    static constexpr int DEFAULT_SIZE = 4;

    /**
     * @brief グリッドを作成
     * @param name グリッド名
     * @param closed_front 表面の閉じたセル
     * @param closed_back 裏面の閉じたセル
     * @param initial 初期配置
     * @throws InvalidGeometryError 閉じたセルが矩形の外にある場合
     */
    Grid(std::string name, const CellSet& closed_front, const CellSet& closed_back,
         Placement initial = Placement{},
         int height = DEFAULT_SIZE, int width = DEFAULT_SIZE);

    /**
     * @brief 指定配置での矩形全体
     */
    CellSet configured(const Placement& placement) const override;

    /**
     * @brief 現在の面で図形を置けるセル
     */
    CellSet open_cells() const { return open_cells_at(placement()); }

    /**
     * @brief 現在の面の閉じたセル
     */
    CellSet closed_cells() const { return transformed(placement()); }

    CellSet open_cells_at(const Placement& placement) const;

    bool front_up() const { return placement().flips == 0; }

    const CellSet& closed_front() const { return closed_front_; }
    const CellSet& closed_back() const { return closed_back_; }

    size_t identity_hash() const override;

protected:
    const CellSet& base_pattern(int flips) const override;
    bool same_identity(const Shape& other) const override;

private:
    CellSet closed_front_;
    CellSet closed_back_;
};

using GridPtr = std::shared_ptr<Grid>;

} // namespace quadrillion

#endif // QUADRILLION_GRID_HPP
