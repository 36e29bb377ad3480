#include "quadrillion/grid.hpp"
#include "quadrillion/errors.hpp"

namespace quadrillion {

namespace {

bool inside_box(const CellSet& cells, int height, int width) {
    for (const auto& [y, x] : cells) {
        if (y < 0 || x < 0 || y >= height || x >= width) return false;
    }
    return true;
}

}  // namespace

Grid::Grid(std::string name, const CellSet& closed_front, const CellSet& closed_back,
           Placement initial, int height, int width)
    : Shape(std::move(name), height, width, initial)
    , closed_front_(closed_front)
    , closed_back_(closed_back)
{
    if (height <= 0 || width <= 0) {
        throw InvalidGeometryError("Grid '" + this->name() + "' must have a positive size");
    }
    if (!inside_box(closed_front_, height, width) || !inside_box(closed_back_, height, width)) {
        throw InvalidGeometryError("Grid '" + this->name() + "': closed cells must be of the form "
                                   "(row, column) with 0 <= row < height and 0 <= column < width");
    }
    reset();
}

CellSet Grid::configured(const Placement& placement) const {
    // 奇数回の回転では矩形の縦横が入れ替わる
    const bool swapped = placement.normalized().rotations % 2 == 1;
    Rect box{placement.location.first, placement.location.second,
             swapped ? width() : height(), swapped ? height() : width()};
    return box.cells();
}

CellSet Grid::open_cells_at(const Placement& placement) const {
    return difference(configured(placement), transformed(placement));
}

const CellSet& Grid::base_pattern(int flips) const {
    return flips % 2 ? closed_back_ : closed_front_;
}

bool Grid::same_identity(const Shape& other) const {
    const auto* grid = dynamic_cast<const Grid*>(&other);
    return grid != nullptr
        && closed_front_ == grid->closed_front_
        && closed_back_ == grid->closed_back_;
}

size_t Grid::identity_hash() const {
    // 表と裏で seed を連鎖させ、面の入れ替えを区別する
    size_t seed = hash_cells(closed_front_, closed_front_.size());
    return hash_cells(closed_back_, seed + closed_back_.size());
}

} // namespace quadrillion
