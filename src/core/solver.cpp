#include "quadrillion/solver.hpp"
#include <algorithm>
#include <iostream>
#include <limits>

namespace quadrillion {

std::optional<Assignment> Solver::solve(ConstraintProblem& problem) {
    num_variables_ = problem.variables().size();
    stats_ = SolverStats{};

    const auto& domains = problem.domains();

    // 全変数のドメインが空でないことを確認（空なら探索しない）
    size_t total_values = 0;
    for (VariableId var : problem.variables()) {
        auto it = domains.find(var);
        if (it == domains.end() || it->second.empty()) {
            if (verbose_) {
                std::cerr << "[verbose] variable " << var << " has an empty domain\n";
            }
            return std::nullopt;
        }
        total_values += it->second.size();
    }

    if (verbose_) {
        std::cerr << "[verbose] search start: " << num_variables_ << " variables, "
                  << total_values << " values\n";
    }

    Assignment assignments;
    bool found = search(problem, assignments, domains, 0);

    if (verbose_) {
        std::cerr << "[verbose] search " << (found ? "succeeded" : "exhausted")
                  << ": nodes=" << stats_.node_count
                  << " fails=" << stats_.fail_count
                  << " max_depth=" << stats_.max_depth
                  << " inferred=" << stats_.inferred_count << "\n";
    }

    if (!found) {
        return std::nullopt;
    }
    return assignments;
}

bool Solver::search(ConstraintProblem& problem, Assignment& assignments, const Domains& domains,
                    size_t depth) {
    stats_.node_count++;
    stats_.max_depth = std::max(stats_.max_depth, depth);

    if (assignments.size() == num_variables_) {
        return true;
    }
    if (domains.empty()) {
        return false;
    }

    auto selected = select_variable(assignments, domains);
    if (!selected) {
        return false;
    }
    VariableId var = *selected;

    // この呼び出し以前から存在するキー（ソート済み）
    std::vector<VariableId> old_vars;
    old_vars.reserve(assignments.size());
    for (const auto& [v, value] : assignments) {
        old_vars.push_back(v);
    }

    for (ValueId value : domains.at(var)) {
        assignments[var] = value;
        size_t before = assignments.size();

        auto new_domains = forward_check(problem, assignments, domains);
        stats_.inferred_count += assignments.size() - before;

        if (new_domains && search(problem, assignments, *new_domains, depth + 1)) {
            return true;
        }

        // バックトラック: この呼び出しで追加された変数のみ取り除く
        for (auto it = assignments.begin(); it != assignments.end();) {
            if (!std::binary_search(old_vars.begin(), old_vars.end(), it->first)) {
                it = assignments.erase(it);
            } else {
                ++it;
            }
        }
        stats_.fail_count++;
    }

    return false;
}

std::optional<Domains> Solver::forward_check(ConstraintProblem& problem, Assignment& assignments,
                                            const Domains& domains) {
    if (!problem.register_current_assignments(assignments, domains)) {
        return std::nullopt;
    }

    Domains new_domains;
    for (const auto& [var, values] : domains) {
        if (assignments.count(var)) continue;

        std::vector<ValueId> filtered;
        filtered.reserve(values.size());
        for (ValueId value : values) {
            if (problem.is_consistent_assignment(Literal{var, value})) {
                filtered.push_back(value);
            }
        }
        stats_.pruned_count += values.size() - filtered.size();

        if (filtered.empty()) {
            return std::nullopt;
        }
        new_domains.emplace(var, std::move(filtered));
    }
    return new_domains;
}

std::optional<VariableId> Solver::select_variable(const Assignment& assignments,
                                                  const Domains& domains) const {
    std::optional<VariableId> best;
    size_t best_size = std::numeric_limits<size_t>::max();
    // map は ID 昇順なので、同数の場合は最小IDが残る
    for (const auto& [var, values] : domains) {
        if (assignments.count(var)) continue;
        if (values.size() < best_size) {
            best = var;
            best_size = values.size();
        }
    }
    return best;
}

} // namespace quadrillion
