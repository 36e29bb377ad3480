#include "quadrillion/board.hpp"
#include "quadrillion/errors.hpp"
#include <algorithm>
#include <set>

namespace quadrillion {

// ============================================================================
// PlacementRules: 同種アイテムの pick/release 状態と共通の配置規則
// ============================================================================

class Board::PlacementRules {
public:
    PlacementRules(Cell dot_space, std::vector<ShapePtr> items)
        : dot_space_(dot_space)
        , items_(std::move(items))
    {
        // 作成直後は全アイテムが pick 状態
        for (const auto& item : items_) {
            picked_.insert(item.get());
        }
    }

    virtual ~PlacementRules() = default;

    /**
     * @brief 全アイテムを初期配置に戻して release
     */
    void reset() {
        for (const auto& item : items_) {
            item->reset();
        }
        try {
            release();
        } catch (const IllegalReleaseError&) {
            throw InitialConfigurationError("Initial configuration of items are not legal!");
        }
    }

    void release() {
        if (!is_release_possible()) {
            throw IllegalReleaseError("It is not possible to release the picked "
                                      "items with their current configuration!");
        }
        picked_.clear();
    }

    void pick(const std::vector<ShapePtr>& items) {
        if (!are_pickable(items)) {
            throw IllegalPickError("It is not possible to pick the selected items!");
        }
        picked_.clear();
        for (const auto& item : items) {
            picked_.insert(item.get());
        }
    }

    bool owns(const Shape* item) const {
        return std::any_of(items_.begin(), items_.end(),
                           [item](const ShapePtr& p) { return p.get() == item; });
    }

    bool is_picked(const Shape* item) const { return picked_.count(item) > 0; }

    bool is_on_board(const Shape& item) const {
        for (const auto& [y, x] : item.cells()) {
            if (y < 0 || x < 0 || y >= dot_space_.first || x >= dot_space_.second) {
                return false;
            }
        }
        return true;
    }

    bool is_overlapping_released_items(const Shape& item) const {
        for (const auto& other : items_) {
            if (other.get() == &item || is_picked(other.get())) continue;
            if (!are_disjoint(item.cells(), other->cells())) return true;
        }
        return false;
    }

    std::vector<ShapePtr> picked_items() const {
        std::vector<ShapePtr> result;
        for (const auto& item : items_) {
            if (is_picked(item.get())) result.push_back(item);
        }
        return result;
    }

    std::vector<ShapePtr> released_items() const {
        std::vector<ShapePtr> result;
        for (const auto& item : items_) {
            if (!is_picked(item.get())) result.push_back(item);
        }
        return result;
    }

    CellSet released_dots() const {
        CellSet result;
        for (const auto& item : items_) {
            if (is_picked(item.get())) continue;
            result.insert(item->cells().begin(), item->cells().end());
        }
        return result;
    }

    ShapePtr get_at(Cell cell) const {
        for (const auto& item : items_) {
            if (!is_picked(item.get()) && item->contains(cell)) return item;
        }
        return nullptr;
    }

protected:
    virtual bool is_release_possible() const {
        // pick 中のアイテム同士も重なってはならない
        CellSet picked_dots;
        size_t picked_count = 0;
        for (const auto& item : items_) {
            if (!is_picked(item.get())) continue;
            if (!is_on_board(*item) || is_overlapping_released_items(*item)) {
                return false;
            }
            picked_dots.insert(item->cells().begin(), item->cells().end());
            picked_count += item->size();
        }
        return picked_dots.size() == picked_count;
    }

    virtual bool are_pickable(const std::vector<ShapePtr>&) const { return true; }

    Cell dot_space_;
    std::vector<ShapePtr> items_;
    std::set<const Shape*> picked_;
};

// ============================================================================
// GridRules
// ============================================================================

class Board::GridRules : public Board::PlacementRules {
public:
    GridRules(Cell dot_space, const std::vector<GridPtr>& grids)
        : PlacementRules(dot_space, std::vector<ShapePtr>(grids.begin(), grids.end()))
        , grids_(grids) {}

    void set_shape_rules(const PlacementRules* shapes) { shapes_ = shapes; }

    CellSet released_open_dots() const {
        CellSet result;
        for (const auto& grid : grids_) {
            if (is_picked(grid.get())) continue;
            auto open = grid->open_cells();
            result.insert(open.begin(), open.end());
        }
        return result;
    }

    bool is_on_released_open_dots(const Shape& item) const {
        return is_subset(item.cells(), released_open_dots());
    }

    std::vector<GridPtr> released_grids() const {
        std::vector<GridPtr> result;
        for (const auto& grid : grids_) {
            if (!is_picked(grid.get())) result.push_back(grid);
        }
        return result;
    }

protected:
    bool is_release_possible() const override {
        if (!PlacementRules::is_release_possible()) return false;
        for (const auto& grid : grids_) {
            if (is_picked(grid.get()) && shapes_->is_overlapping_released_items(*grid)) {
                return false;
            }
        }
        return true;
    }

    bool are_pickable(const std::vector<ShapePtr>& grids) const override {
        bool all_picked = std::all_of(grids.begin(), grids.end(),
                                      [this](const ShapePtr& g) { return is_picked(g.get()); });
        if (all_picked) return true;
        return std::none_of(grids.begin(), grids.end(), [this](const ShapePtr& g) {
            return shapes_->is_overlapping_released_items(*g);
        });
    }

private:
    std::vector<GridPtr> grids_;
    const PlacementRules* shapes_ = nullptr;
};

// ============================================================================
// ShapeRules
// ============================================================================

class Board::ShapeRules : public Board::PlacementRules {
public:
    using PlacementRules::PlacementRules;

    void set_grid_rules(const GridRules* grids) { grids_ = grids; }

    std::vector<ShapePtr> released_unplaced_shapes() const {
        std::vector<ShapePtr> result;
        for (const auto& shape : items_) {
            if (!is_picked(shape.get()) && !grids_->is_overlapping_released_items(*shape)) {
                result.push_back(shape);
            }
        }
        return result;
    }

protected:
    bool is_release_possible() const override {
        if (!PlacementRules::is_release_possible()) return false;
        // 図形はグリッドの開セルに完全に載るか、グリッドから完全に外れる
        for (const auto& shape : items_) {
            if (!is_picked(shape.get())) continue;
            if (!grids_->is_on_released_open_dots(*shape)
                && grids_->is_overlapping_released_items(*shape)) {
                return false;
            }
        }
        return true;
    }

private:
    const GridRules* grids_ = nullptr;
};

// ============================================================================
// Board
// ============================================================================

Board::Board(Cell dot_space, std::vector<ShapePtr> shapes, std::vector<GridPtr> grids)
    : dot_space_(dot_space)
    , shapes_(std::move(shapes))
    , grids_(std::move(grids))
{
    reset();
}

Board::~Board() = default;

void Board::reset() {
    grid_rules_ = std::make_unique<GridRules>(dot_space_, grids_);
    shape_rules_ = std::make_unique<ShapeRules>(dot_space_, shapes_);
    grid_rules_->set_shape_rules(shape_rules_.get());
    shape_rules_->set_grid_rules(grid_rules_.get());

    is_picked_ = false;
    momentos_.clear();

    grid_rules_->reset();
    shape_rules_->reset();
}

void Board::pick(const std::vector<ShapePtr>& items) {
    if (is_picked_) {
        throw StateError("Cannot pick before releasing already picked items!");
    }

    std::vector<ShapePtr> shapes;
    std::vector<ShapePtr> grids;
    for (const auto& item : items) {
        if (shape_rules_->owns(item.get())) {
            shapes.push_back(item);
        } else if (grid_rules_->owns(item.get())) {
            grids.push_back(item);
        }
    }

    shape_rules_->pick(shapes);
    try {
        grid_rules_->pick(grids);
    } catch (const IllegalPickError&) {
        shape_rules_->release();
        throw;
    }

    momentos_.clear();
    for (const auto& item : shapes) momentos_.emplace_back(item, item->placement());
    for (const auto& item : grids) momentos_.emplace_back(item, item->placement());
    is_picked_ = true;
}

void Board::release() {
    if (!is_picked_) {
        throw StateError("Cannot release while no picked items!");
    }

    auto picked_grids = grid_rules_->picked_items();
    try {
        grid_rules_->release();
        shape_rules_->release();
    } catch (const IllegalReleaseError&) {
        grid_rules_->pick(picked_grids);
        throw;
    }
    is_picked_ = false;
}

void Board::unpick() {
    if (!is_picked_) {
        throw StateError("Cannot unpick while no picked items!");
    }

    for (const auto& [item, placement] : momentos_) {
        item->set_placement(placement);
    }
    try {
        release();
    } catch (const IllegalReleaseError&) {
        throw InconsistentStateError("Software error: momentos were not captured "
                                     "at legal configurations");
    }
}

ShapePtr Board::get_at(Cell cell) const {
    if (auto shape = shape_rules_->get_at(cell)) return shape;
    if (auto grid = grid_rules_->get_at(cell)) return grid;
    throw NoItemError("There is no item at dot (" + std::to_string(cell.first) + ", "
                      + std::to_string(cell.second) + ")");
}

bool Board::is_won() const {
    return !is_picked_ && released_empty_grids_dots().empty();
}

std::vector<GridPtr> Board::released_grids() const {
    return grid_rules_->released_grids();
}

std::vector<ShapePtr> Board::released_shapes() const {
    return shape_rules_->released_items();
}

std::vector<ShapePtr> Board::released_unplaced_shapes() const {
    return shape_rules_->released_unplaced_shapes();
}

CellSet Board::released_empty_grids_dots() const {
    return difference(grid_rules_->released_open_dots(), shape_rules_->released_dots());
}

} // namespace quadrillion
