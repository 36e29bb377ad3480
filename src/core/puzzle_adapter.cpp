#include "quadrillion/puzzle_adapter.hpp"
#include "quadrillion/errors.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>

namespace quadrillion {

PuzzleAdapter::PuzzleAdapter(Board& board, FeasibilityRule rule)
    : board_(board)
    , rule_(std::move(rule)) {}

void PuzzleAdapter::set_verbose(bool enabled) {
    verbose_ = enabled;
    solver_.set_verbose(enabled);
}

void PuzzleAdapter::set_feasibility_rule(FeasibilityRule rule) {
    rule_ = std::move(rule);
    // 条件が変わるとキャッシュの前提も変わる
    cached_solution_.clear();
}

// ============================================================================
// solve / help
// ============================================================================

void PuzzleAdapter::solve() {
    commit(get_solution());
}

void PuzzleAdapter::help() {
    auto solution = get_solution();
    // 変数ID最小の図形を1つだけ置く
    commit(ShapeCells{solution.front()});
}

void PuzzleAdapter::commit(const ShapeCells& solution) {
    try {
        for (const auto& [shape, cells] : solution) {
            shape->set_cells(cells);
        }
        board_.release();
    } catch (const InvalidPlacementError&) {
        board_.unpick();
        throw;
    } catch (const IllegalReleaseError&) {
        board_.unpick();
        throw;
    }
}

PuzzleAdapter::ShapeCells PuzzleAdapter::get_solution() {
    if (board_.is_won()) {
        throw StateError("The game is already solved!");
    }

    shapes_ = board_.released_unplaced_shapes();
    empty_cells_ = board_.released_empty_grids_dots();
    try {
        board_.pick(shapes_);
    } catch (const StateError&) {
        throw StateError("Cannot solve while items are picked.");
    }

    variables_.clear();
    for (VariableId var = 0; var < shapes_.size(); ++var) {
        variables_.push_back(var);
    }

    if (verbose_) {
        std::cerr << "[verbose] " << shapes_.size() << " unplaced shapes, "
                  << empty_cells_.size() << " empty cells\n";
    }

    if (shapes_.empty()) {
        board_.unpick();
        throw NoSolutionError("The current state of the game has no solution.");
    }

    if (!is_new_solution_needed()) {
        stats_.cache_hits++;
        if (verbose_) std::cerr << "[verbose] reusing cached solution\n";
        return adapt_solution();
    }

    auto start = std::chrono::steady_clock::now();
    std::optional<Assignment> assignment;
    try {
        extract_domains();
        assignment = solver_.solve(*this);
    } catch (...) {
        board_.unpick();
        throw;
    }
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;

    stats_.search_count++;
    stats_.last_search_seconds = elapsed.count();
    stats_.solver = solver_.stats();

    if (verbose_) {
        std::cerr << "[verbose] search took " << elapsed.count() << " seconds\n";
    }

    if (!assignment) {
        board_.unpick();
        throw NoSolutionError("The current state of the game has no solution.");
    }

    auto solution = to_shape_cells(*assignment);
    cache_solution(solution);
    return solution;
}

// ============================================================================
// 解のキャッシュ
// ============================================================================

bool PuzzleAdapter::is_new_solution_needed() const {
    if (cached_solution_.empty()) {
        return true;
    }
    for (const auto& shape : shapes_) {
        auto it = cached_solution_.find(shape.get());
        if (it == cached_solution_.end() || !is_subset(it->second, empty_cells_)) {
            return true;
        }
    }
    return false;
}

void PuzzleAdapter::cache_solution(const ShapeCells& solution) {
    cached_solution_.clear();
    for (const auto& shape : board_.shapes()) {
        cached_solution_[shape.get()] = shape->cells();
    }
    for (const auto& [shape, cells] : solution) {
        cached_solution_[shape.get()] = cells;
    }
}

PuzzleAdapter::ShapeCells PuzzleAdapter::adapt_solution() const {
    ShapeCells solution;
    for (const auto& shape : shapes_) {
        solution.emplace_back(shape, cached_solution_.at(shape.get()));
    }
    return solution;
}

PuzzleAdapter::ShapeCells PuzzleAdapter::to_shape_cells(const Assignment& assignment) const {
    ShapeCells solution;
    for (const auto& [var, value] : assignment) {
        solution.emplace_back(shapes_[var], candidates_[var][value]);
    }
    return solution;
}

// ============================================================================
// ドメイン構築
// ============================================================================

void PuzzleAdapter::extract_domains() {
    const size_t n = shapes_.size();
    candidates_.assign(n, {});
    candidate_index_.assign(n, {});
    domains_.clear();

    if (!empty_cells_.empty() && is_valid_empty_cells(empty_cells_, nullptr)) {
        const auto anchors = bounding_box(empty_cells_).cells();
        for (VariableId var = 0; var < n; ++var) {
            const auto& shape = *shapes_[var];
            for (const auto& location : anchors) {
                for (const auto& config : shape.unique_configs_at(location)) {
                    auto cells = shape.configured(config);
                    if (!is_subset(cells, empty_cells_)) continue;
                    if (!is_valid_empty_cells(difference(empty_cells_, cells), nullptr)) continue;
                    if (candidate_index_[var].count(cells)) continue;

                    candidate_index_[var].emplace(cells, candidates_[var].size());
                    candidates_[var].push_back(std::move(cells));
                }
            }
        }
    } else if (verbose_) {
        std::cerr << "[verbose] empty cells cannot be filled\n";
    }

    stats_.domain_values = 0;
    for (VariableId var = 0; var < n; ++var) {
        std::vector<ValueId> values(candidates_[var].size());
        for (ValueId value = 0; value < values.size(); ++value) {
            values[value] = value;
        }
        stats_.domain_values += values.size();
        if (verbose_) {
            std::cerr << "[verbose] domain of " << shapes_[var]->name() << ": "
                      << values.size() << " values\n";
        }
        domains_.emplace(var, std::move(values));
    }
}

// ============================================================================
// ConstraintProblem
// ============================================================================

bool PuzzleAdapter::register_current_assignments(Assignment& assignments, const Domains& domains) {
    current_assignments_cells_.clear();
    for (const auto& [var, value] : assignments) {
        const auto& cells = candidates_[var][value];
        current_assignments_cells_.insert(cells.begin(), cells.end());
    }

    std::vector<CellSet> small_components;
    if (!is_valid_empty_cells(difference(empty_cells_, current_assignments_cells_),
                              &small_components)) {
        return false;
    }
    return infer_small_components(assignments, domains, small_components);
}

bool PuzzleAdapter::is_consistent_assignment(const Literal& assignment) const {
    return are_disjoint(current_assignments_cells_,
                        candidates_[assignment.var_idx][assignment.value]);
}

bool PuzzleAdapter::is_valid_empty_cells(const CellSet& empty,
                                         std::vector<CellSet>* small_components) const {
    auto components = connected_components(empty);

    std::vector<size_t> sizes;
    sizes.reserve(components.size());
    for (const auto& component : components) {
        sizes.push_back(component.size());
    }
    if (!rule_.admits(empty.size(), sizes)) {
        return false;
    }

    if (small_components) {
        small_components->clear();
        for (auto& component : components) {
            if (component.size() <= rule_.small_component_limit) {
                small_components->push_back(std::move(component));
            }
        }
    }
    return true;
}

bool PuzzleAdapter::infer_small_components(Assignment& assignments, const Domains& domains,
                                           const std::vector<CellSet>& small_components) {
    if (small_components.empty()) {
        return true;
    }

    Assignment found;
    for (const auto& component : small_components) {
        for (const auto& [var, values] : domains) {
            if (assignments.count(var) || found.count(var)) continue;

            auto it = candidate_index_[var].find(component);
            if (it == candidate_index_[var].end()) continue;
            // ドメインの値は昇順を保っている
            if (std::binary_search(values.begin(), values.end(), it->second)) {
                found.emplace(var, it->second);
                break;
            }
        }
    }

    // 割り当てられない成分がある、または同じ変数を2つの成分が必要とする
    if (found.size() != small_components.size()) {
        return false;
    }

    for (const auto& [var, value] : found) {
        assignments.emplace(var, value);
        const auto& cells = candidates_[var][value];
        current_assignments_cells_.insert(cells.begin(), cells.end());
    }
    return true;
}

} // namespace quadrillion
