/**
 * @file board.hpp
 * @brief 盤面クラス（グリッドと図形の配置、pick/release による排他的な移動）
 */
#ifndef QUADRILLION_BOARD_HPP
#define QUADRILLION_BOARD_HPP

#include "quadrillion/grid.hpp"
#include "quadrillion/shape.hpp"
#include <memory>
#include <utility>
#include <vector>

namespace quadrillion {

/**
 * @brief 盤面
 *
 * 有限のドット空間にグリッドと図形を置く。
 * アイテムを動かす前に pick() でロックし、動かした後に release() で確定する。
 * release() は配置規則を検証し、違反していれば IllegalReleaseError を投げる。
 *
 * 配置規則:
 * - 全アイテムはドット空間の内側にあること
 * - 同種のアイテム同士は重ならないこと
 * - 図形はグリッドの開いたセルの上に完全に載るか、グリッドから完全に外れること
 * - 図形が載っているグリッドは pick できない
 */
class Board {
public:
    /**
     * @brief 盤面を作成し、全アイテムを初期配置に置く
     * @param dot_space ドット空間の (行数, 列数)
     * @param shapes 図形
     * @param grids グリッド
     * @throws InitialConfigurationError 初期配置が規則に違反する場合
     */
    Board(Cell dot_space, std::vector<ShapePtr> shapes, std::vector<GridPtr> grids);
    ~Board();

    Board(const Board&) = delete;
    Board& operator=(const Board&) = delete;

    /**
     * @brief 全アイテムを初期配置に戻す
     */
    void reset();

    /**
     * @brief アイテムを移動のためにロック
     * @param items 図形・グリッド（盤面に属さないものは無視）
     * @throws StateError 既に pick 中の場合
     * @throws IllegalPickError 図形が載っているグリッドを含む場合
     */
    void pick(const std::vector<ShapePtr>& items);

    /**
     * @brief pick したアイテムの配置を確定
     * @throws StateError pick 中でない場合
     * @throws IllegalReleaseError 配置規則に違反する場合（pick 状態は維持される）
     */
    void release();

    /**
     * @brief pick したアイテムを pick 時の配置に戻して release
     * @throws StateError pick 中でない場合
     * @throws InconsistentStateError 戻した配置が規則に違反する場合
     */
    void unpick();

    /**
     * @brief 指定セルにある（release 済みの）アイテム。図形が優先
     * @throws NoItemError アイテムが無い場合
     */
    ShapePtr get_at(Cell cell) const;

    /**
     * @brief pick 中でなく、空いた開セルが残っていないか
     */
    bool is_won() const;

    bool is_picked() const { return is_picked_; }

    Cell dot_space() const { return dot_space_; }

    const std::vector<ShapePtr>& shapes() const { return shapes_; }
    const std::vector<GridPtr>& grids() const { return grids_; }

    std::vector<GridPtr> released_grids() const;
    std::vector<ShapePtr> released_shapes() const;

    /**
     * @brief release 済みで、どのグリッドにも載っていない図形
     */
    std::vector<ShapePtr> released_unplaced_shapes() const;

    /**
     * @brief release 済みグリッドの開セルのうち、図形に覆われていないもの
     */
    CellSet released_empty_grids_dots() const;

private:
    class PlacementRules;
    class GridRules;
    class ShapeRules;

    Cell dot_space_;
    std::vector<ShapePtr> shapes_;
    std::vector<GridPtr> grids_;

    std::unique_ptr<GridRules> grid_rules_;
    std::unique_ptr<ShapeRules> shape_rules_;

    bool is_picked_ = false;
    std::vector<std::pair<ShapePtr, Placement>> momentos_;
};

} // namespace quadrillion

#endif // QUADRILLION_BOARD_HPP
