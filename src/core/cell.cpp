#include "quadrillion/cell.hpp"
#include <algorithm>
#include <functional>
#include <iterator>
#include <queue>

namespace quadrillion {

namespace {

// boost::hash_combine と同じ混合
inline void hash_combine(size_t& seed, size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

}  // namespace

CellSet Rect::cells() const {
    CellSet result;
    for (int y = top; y < top + height; ++y) {
        for (int x = left; x < left + width; ++x) {
            result.emplace_hint(result.end(), y, x);
        }
    }
    return result;
}

CellSet translated(const CellSet& cells, Cell delta) {
    CellSet result;
    for (const auto& [y, x] : cells) {
        result.emplace_hint(result.end(), y + delta.first, x + delta.second);
    }
    return result;
}

bool is_subset(const CellSet& a, const CellSet& b) {
    if (a.size() > b.size()) return false;
    return std::includes(b.begin(), b.end(), a.begin(), a.end());
}

bool are_disjoint(const CellSet& a, const CellSet& b) {
    // 両方ソート済みなのでマージ走査
    auto ia = a.begin();
    auto ib = b.begin();
    while (ia != a.end() && ib != b.end()) {
        if (*ia < *ib) {
            ++ia;
        } else if (*ib < *ia) {
            ++ib;
        } else {
            return false;
        }
    }
    return true;
}

CellSet difference(const CellSet& a, const CellSet& b) {
    CellSet result;
    std::set_difference(a.begin(), a.end(), b.begin(), b.end(),
                        std::inserter(result, result.end()));
    return result;
}

Rect bounding_box(const CellSet& cells) {
    int min_y = cells.begin()->first;
    int max_y = cells.rbegin()->first;
    int min_x = cells.begin()->second;
    int max_x = min_x;
    for (const auto& cell : cells) {
        min_x = std::min(min_x, cell.second);
        max_x = std::max(max_x, cell.second);
    }
    return Rect{min_y, min_x, max_y - min_y + 1, max_x - min_x + 1};
}

std::vector<CellSet> connected_components(const CellSet& cells) {
    std::vector<CellSet> components;
    CellSet seen;

    for (const auto& start : cells) {
        if (seen.count(start)) continue;

        // BFS
        CellSet component{start};
        std::queue<Cell> bfs_queue;
        bfs_queue.push(start);
        while (!bfs_queue.empty()) {
            auto [y, x] = bfs_queue.front();
            bfs_queue.pop();
            const Cell neighbors[] = {{y + 1, x}, {y - 1, x}, {y, x + 1}, {y, x - 1}};
            for (const auto& next : neighbors) {
                if (cells.count(next) && component.insert(next).second) {
                    bfs_queue.push(next);
                }
            }
        }

        seen.insert(component.begin(), component.end());
        components.push_back(std::move(component));
    }
    return components;
}

size_t hash_cells(const CellSet& cells, size_t seed) {
    for (const auto& [y, x] : cells) {
        hash_combine(seed, std::hash<int>{}(y));
        hash_combine(seed, std::hash<int>{}(x));
    }
    return seed;
}

} // namespace quadrillion
