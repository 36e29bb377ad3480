#include "quadrillion/shape.hpp"
#include "quadrillion/errors.hpp"
#include <algorithm>
#include <tuple>
#include <typeinfo>

namespace quadrillion {

namespace {

int positive_mod(int value, int n) {
    int r = value % n;
    return r < 0 ? r + n : r;
}

}  // namespace

// ============================================================================
// Placement
// ============================================================================

Placement Placement::normalized() const {
    return Placement{positive_mod(flips, 2), positive_mod(rotations, 4), location};
}

bool Placement::operator<(const Placement& other) const {
    return std::tie(flips, rotations, location)
         < std::tie(other.flips, other.rotations, other.location);
}

// ============================================================================
// Shape
// ============================================================================

Shape::Shape(std::string name, const CellSet& cells, Placement initial)
    : name_(std::move(name))
    , initial_(initial)
{
    if (cells.empty()) {
        throw InvalidGeometryError("Shape '" + name_ + "' has no cells");
    }
    for (const auto& [y, x] : cells) {
        if (y < 0 || x < 0) {
            throw InvalidGeometryError("Shape '" + name_ + "': cells must be of the form "
                                       "(row, column) with row >= 0 and column >= 0");
        }
    }

    // 最小の row, column が 0 になるよう原点に寄せる
    auto box = bounding_box(cells);
    pattern_ = translated(cells, {-box.top, -box.left});
    height_ = box.height;
    width_ = box.width;

    for (const auto& [y, x] : pattern_) {
        flipped_pattern_.emplace(height_ - 1 - y, x);
    }

    reset();
}

Shape::Shape(std::string name, int height, int width, Placement initial)
    : name_(std::move(name))
    , height_(height)
    , width_(width)
    , initial_(initial) {}

void Shape::set_placement(const Placement& placement) {
    placement_ = placement.normalized();
    cells_ = configured(placement_);
}

void Shape::reset() {
    set_placement(initial_);
}

void Shape::flip() {
    Placement p = placement_;
    p.flips += 1;
    p.rotations = -p.rotations;
    set_placement(p);
}

void Shape::rotate(bool clockwise) {
    Placement p = placement_;
    p.rotations += clockwise ? 1 : -1;
    set_placement(p);
}

void Shape::move(Cell delta) {
    Placement p = placement_;
    p.location.first += delta.first;
    p.location.second += delta.second;
    set_placement(p);
}

CellSet Shape::configured(const Placement& placement) const {
    return transformed(placement);
}

const CellSet& Shape::base_pattern(int flips) const {
    return positive_mod(flips, 2) ? flipped_pattern_ : pattern_;
}

CellSet Shape::transformed(const Placement& placement) const {
    const int h = height_;
    const int w = width_;
    const auto [dy, dx] = placement.location;
    const int rotations = positive_mod(placement.rotations, 4);

    CellSet result;
    for (const auto& [y, x] : base_pattern(placement.flips)) {
        int ry = y;
        int rx = x;
        switch (rotations) {
            case 1:  ry = x;         rx = h - 1 - y; break;  // 時計回り 90
            case 2:  ry = h - 1 - y; rx = w - 1 - x; break;  // 180
            case 3:  ry = w - 1 - x; rx = y;         break;  // 反時計回り 90
            default: break;
        }
        result.emplace(ry + dy, rx + dx);
    }
    return result;
}

std::vector<Placement> Shape::unique_configs_at(Cell location) const {
    if (!unique_configs_ready_) {
        std::vector<CellSet> seen;
        std::vector<Placement> configs;
        for (int flips = 0; flips < 2; ++flips) {
            for (int rotations = 0; rotations < 4; ++rotations) {
                Placement config{flips, rotations, {0, 0}};
                auto dots = transformed(config);
                if (std::find(seen.begin(), seen.end(), dots) == seen.end()) {
                    seen.push_back(std::move(dots));
                    configs.push_back(config);
                }
            }
        }
        unique_configs_ = std::move(configs);
        unique_configs_ready_ = true;
    }

    std::vector<Placement> result = unique_configs_;
    for (auto& config : result) {
        config.location = location;
    }
    return result;
}

size_t Shape::symmetry_order() const {
    return 8 / unique_configs_at({0, 0}).size();
}

void Shape::set_cells(const CellSet& cells) {
    if (!cells.empty()) {
        auto box = bounding_box(cells);
        for (const auto& config : unique_configs_at({box.top, box.left})) {
            if (configured(config) == cells) {
                set_placement(config);
                return;
            }
        }
    }
    throw InvalidPlacementError("The given cells do not correspond to shape '" + name_ + "'");
}

bool Shape::same_identity(const Shape& other) const {
    return typeid(*this) == typeid(other) && pattern_ == other.pattern_;
}

size_t Shape::identity_hash() const {
    return hash_cells(pattern_, pattern_.size());
}

} // namespace quadrillion
