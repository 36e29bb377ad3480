#include "quadrillion/feasibility.hpp"
#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>

namespace quadrillion {

FeasibilityRule FeasibilityRule::from_shapes(const std::vector<ShapePtr>& shapes) {
    std::map<size_t, size_t> histogram;
    for (const auto& shape : shapes) {
        histogram[shape->size()]++;
    }

    FeasibilityRule rule;
    rule.partial_sizes.clear();
    if (histogram.empty()) {
        return rule;
    }

    size_t best_count = 0;
    for (const auto& [size, count] : histogram) {
        if (count >= best_count) {
            rule.unit_size = size;
            best_count = count;
        }
    }
    for (const auto& shape : shapes) {
        if (shape->size() != rule.unit_size) {
            rule.partial_sizes.push_back(shape->size());
        }
    }
    std::sort(rule.partial_sizes.rbegin(), rule.partial_sizes.rend());
    rule.small_component_limit = rule.unit_size;
    return rule;
}

bool FeasibilityRule::admits(size_t total_empty, const std::vector<size_t>& component_sizes) const {
    if (unit_size == 0) {
        throw std::invalid_argument("FeasibilityRule: unit_size must be positive");
    }
    if (partial_sizes.size() >= 16) {
        throw std::invalid_argument("FeasibilityRule: too many partial sizes");
    }

    const unsigned n = static_cast<unsigned>(partial_sizes.size());
    auto subset_sum = [this](unsigned mask) {
        size_t sum = 0;
        for (unsigned i = 0; i < partial_sizes.size(); ++i) {
            if (mask & (1u << i)) sum += partial_sizes[i];
        }
        return sum;
    };

    for (unsigned mask = 0; mask < (1u << n); ++mask) {
        size_t partial_total = subset_sum(mask);
        if (total_empty < partial_total || (total_empty - partial_total) % unit_size != 0) {
            continue;
        }

        // mask の部分集合の和が、各成分に入り得る端数
        std::set<size_t> remainders;
        for (unsigned sub = mask;; sub = (sub - 1) & mask) {
            remainders.insert(subset_sum(sub));
            if (sub == 0) break;
        }

        bool all_admissible = std::all_of(
            component_sizes.begin(), component_sizes.end(), [&](size_t c) {
                return std::any_of(remainders.begin(), remainders.end(), [&](size_t r) {
                    return c >= r && (c - r) % unit_size == 0;
                });
            });
        if (all_admissible) {
            return true;
        }
    }
    return false;
}

} // namespace quadrillion
