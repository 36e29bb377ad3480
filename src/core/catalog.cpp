#include "quadrillion/catalog.hpp"
#include <stdexcept>

namespace quadrillion {
namespace catalog {

namespace {

struct ShapeData {
    const char* name;
    CellSet cells;
    Placement placement;
};

struct GridData {
    const char* name;
    CellSet closed_front;
    CellSet closed_back;
    Placement placement;
};

// 図形は 4×4 の区画に1つずつ置く（行 0, 4, 8 / 列 10, 14, 18, 22）
const std::vector<ShapeData>& shape_table() {
    static const std::vector<ShapeData> table = {
        {"F", {{0, 1}, {0, 2}, {1, 0}, {1, 1}, {2, 1}},         {0, 0, {0, 10}}},
        {"L", {{0, 0}, {1, 0}, {2, 0}, {3, 0}, {3, 1}},         {0, 0, {0, 14}}},
        {"N", {{0, 1}, {1, 1}, {2, 0}, {2, 1}, {3, 0}},         {0, 0, {0, 18}}},
        {"P", {{0, 0}, {0, 1}, {1, 0}, {1, 1}, {2, 0}},         {0, 0, {0, 22}}},
        {"T", {{0, 0}, {0, 1}, {0, 2}, {1, 1}, {2, 1}},         {0, 0, {4, 10}}},
        {"U", {{0, 0}, {0, 2}, {1, 0}, {1, 1}, {1, 2}},         {0, 0, {4, 14}}},
        {"V", {{0, 0}, {1, 0}, {2, 0}, {2, 1}, {2, 2}},         {0, 0, {4, 18}}},
        {"W", {{0, 0}, {1, 0}, {1, 1}, {2, 1}, {2, 2}},         {0, 0, {4, 22}}},
        {"Y", {{0, 1}, {1, 0}, {1, 1}, {2, 1}, {3, 1}},         {0, 0, {8, 10}}},
        {"Z", {{0, 0}, {0, 1}, {1, 1}, {2, 1}, {2, 2}},         {0, 0, {8, 14}}},
        {"l", {{0, 0}, {1, 0}, {2, 0}, {2, 1}},                 {0, 0, {8, 18}}},
        {"v", {{0, 0}, {1, 0}, {1, 1}},                         {0, 0, {8, 22}}},
    };
    return table;
}

// どの面の組み合わせでも開セルは 64 - 7 = 57
const std::vector<GridData>& grid_table() {
    static const std::vector<GridData> table = {
        {"A", {{0, 0}, {2, 3}}, {{1, 2}, {3, 3}}, {0, 0, {0, 0}}},
        {"B", {{1, 1}, {3, 2}}, {{0, 3}, {2, 0}}, {0, 0, {0, 4}}},
        {"C", {{0, 2}, {3, 0}}, {{1, 1}, {2, 3}}, {0, 0, {4, 0}}},
        {"D", {{2, 1}},         {{0, 0}},         {0, 0, {4, 4}}},
    };
    return table;
}

Placement placement_for(const std::string& name, const Placement& default_placement,
                        const PlacementOverrides& overrides) {
    auto it = overrides.find(name);
    return it == overrides.end() ? default_placement : it->second;
}

}  // namespace

Cell dot_space() {
    return {12, 26};
}

std::vector<ShapePtr> make_shapes(const PlacementOverrides& overrides) {
    std::vector<ShapePtr> shapes;
    for (const auto& data : shape_table()) {
        shapes.push_back(std::make_shared<Shape>(
            data.name, data.cells, placement_for(data.name, data.placement, overrides)));
    }
    return shapes;
}

std::vector<GridPtr> make_grids(const PlacementOverrides& overrides) {
    std::vector<GridPtr> grids;
    for (const auto& data : grid_table()) {
        grids.push_back(std::make_shared<Grid>(
            data.name, data.closed_front, data.closed_back,
            placement_for(data.name, data.placement, overrides)));
    }
    return grids;
}

std::unique_ptr<Board> make_board(const PlacementOverrides& overrides) {
    for (const auto& [name, placement] : overrides) {
        bool known = false;
        for (const auto& data : shape_table()) known = known || name == data.name;
        for (const auto& data : grid_table()) known = known || name == data.name;
        if (!known) {
            throw std::runtime_error("Unknown item: " + name);
        }
    }
    return std::make_unique<Board>(dot_space(), make_shapes(overrides), make_grids(overrides));
}

} // namespace catalog
} // namespace quadrillion
