#include <catch2/catch.hpp>
#include "quadrillion/cell.hpp"
#include "quadrillion/problem.hpp"
#include "quadrillion/solver.hpp"
#include <map>
#include <stdexcept>
#include <vector>

using namespace quadrillion;

namespace {

/**
 * 各変数が候補のセル集合から1つを選び、全体で重ならないように置く問題。
 * 推論は行わない。forward check 後のドメインに、前のステップで
 * 確定したセルと重なる値が残っていないかを検査する。
 */
class CellPackingProblem : public ConstraintProblem {
public:
    explicit CellPackingProblem(std::vector<std::vector<CellSet>> candidates)
        : candidates_(std::move(candidates))
    {
        for (VariableId var = 0; var < candidates_.size(); ++var) {
            variables_.push_back(var);
            std::vector<ValueId> values;
            for (ValueId value = 0; value < candidates_[var].size(); ++value) {
                values.push_back(value);
            }
            domains_.emplace(var, std::move(values));
        }
    }

    const std::vector<VariableId>& variables() const override { return variables_; }
    const Domains& domains() const override { return domains_; }

    bool register_current_assignments(Assignment& assignments, const Domains& domains) override {
        register_calls++;

        // domains に無い割当済み変数は、前のステップで前方検査済み
        CellSet earlier;
        for (const auto& [var, value] : assignments) {
            if (!domains.count(var)) {
                earlier.insert(candidates_[var][value].begin(), candidates_[var][value].end());
            }
        }
        for (const auto& [var, values] : domains) {
            if (assignments.count(var)) continue;
            for (ValueId value : values) {
                if (!are_disjoint(earlier, candidates_[var][value])) stale_values++;
            }
        }

        committed_.clear();
        for (const auto& [var, value] : assignments) {
            committed_.insert(candidates_[var][value].begin(), candidates_[var][value].end());
        }
        return true;
    }

    bool is_consistent_assignment(const Literal& assignment) const override {
        return are_disjoint(committed_, candidates_[assignment.var_idx][assignment.value]);
    }

    const CellSet& cells(VariableId var, ValueId value) const { return candidates_[var][value]; }

    size_t register_calls = 0;
    size_t stale_values = 0;

private:
    std::vector<std::vector<CellSet>> candidates_;
    std::vector<VariableId> variables_;
    Domains domains_;
    CellSet committed_;
};

/**
 * 変数 0 を割り当てると、変数 1 を同じ値に推論で確定させる問題。
 * 変数 2 は変数 0 が 1 のときのみ値を持てる。
 */
class InferringProblem : public ConstraintProblem {
public:
    InferringProblem() : variables_{0, 1, 2}, domains_{{0, {0, 1}}, {1, {0, 1}}, {2, {0, 1, 2}}} {}

    const std::vector<VariableId>& variables() const override { return variables_; }
    const Domains& domains() const override { return domains_; }

    bool register_current_assignments(Assignment& assignments, const Domains&) override {
        if (assignments.count(0) && !assignments.count(1)) {
            assignments.emplace(1, assignments.at(0));
        }
        assignments_ = assignments;
        return true;
    }

    bool is_consistent_assignment(const Literal& assignment) const override {
        if (assignment.var_idx == 2) {
            auto it = assignments_.find(0);
            return it != assignments_.end() && it->second == 1;
        }
        return true;
    }

private:
    std::vector<VariableId> variables_;
    Domains domains_;
    Assignment assignments_;
};

/**
 * register_current_assignments が例外を投げる問題
 */
class ThrowingProblem : public ConstraintProblem {
public:
    ThrowingProblem() : variables_{0}, domains_{{0, {0}}} {}

    const std::vector<VariableId>& variables() const override { return variables_; }
    const Domains& domains() const override { return domains_; }

    bool register_current_assignments(Assignment&, const Domains&) override {
        throw std::runtime_error("register failed");
    }

    bool is_consistent_assignment(const Literal&) const override { return true; }

private:
    std::vector<VariableId> variables_;
    Domains domains_;
};

bool pairwise_disjoint(const CellPackingProblem& problem, const Assignment& assignment) {
    CellSet seen;
    size_t total = 0;
    for (const auto& [var, value] : assignment) {
        const auto& cells = problem.cells(var, value);
        seen.insert(cells.begin(), cells.end());
        total += cells.size();
    }
    return seen.size() == total;
}

}  // namespace

// ============================================================================
// Solver tests
// ============================================================================

TEST_CASE("Solver finds a complete disjoint assignment", "[solver]") {
    // 1×4 の帯を、長さ 1, 1, 2 の区間で埋める
    CellPackingProblem problem({
        {{{0, 0}}, {{0, 1}}, {{0, 2}}, {{0, 3}}},
        {{{0, 0}}, {{0, 1}}, {{0, 2}}, {{0, 3}}},
        {{{0, 0}, {0, 1}}, {{0, 1}, {0, 2}}, {{0, 2}, {0, 3}}},
    });

    Solver solver;
    auto result = solver.solve(problem);

    REQUIRE(result.has_value());
    REQUIRE(result->size() == 3);
    for (VariableId var : problem.variables()) {
        REQUIRE(result->count(var) == 1);
    }
    REQUIRE(pairwise_disjoint(problem, *result));
    REQUIRE(problem.stale_values == 0);
    REQUIRE(solver.stats().node_count > 0);
}

TEST_CASE("Solver forward check removes overlapping values", "[solver]") {
    CellPackingProblem problem({
        {{{0, 0}, {0, 1}}, {{1, 0}, {1, 1}}},
        {{{0, 0}, {1, 0}}, {{0, 1}, {1, 1}}, {{0, 0}, {0, 1}}},
        {{{0, 0}, {1, 0}}, {{0, 1}, {1, 1}}, {{1, 0}, {1, 1}}},
        {{{2, 0}}, {{2, 1}}},
    });

    Solver solver;
    auto result = solver.solve(problem);

    REQUIRE(!result.has_value());
    REQUIRE(problem.register_calls > 0);
    REQUIRE(problem.stale_values == 0);
    REQUIRE(solver.stats().pruned_count > 0);
}

TEST_CASE("Solver reports no solution for unsatisfiable problems", "[solver]") {
    // 2 つの変数が同じ唯一のセルを必要とする
    CellPackingProblem problem({
        {{{0, 0}}},
        {{{0, 0}}},
    });

    Solver solver;
    REQUIRE(!solver.solve(problem).has_value());
    REQUIRE(solver.stats().fail_count > 0);
}

TEST_CASE("Solver fails immediately on an empty initial domain", "[solver]") {
    CellPackingProblem problem({
        {{{0, 0}}, {{0, 1}}},
        {},
    });

    Solver solver;
    REQUIRE(!solver.solve(problem).has_value());
    REQUIRE(solver.stats().node_count == 0);
    REQUIRE(problem.register_calls == 0);
}

TEST_CASE("Solver with no variables returns an empty assignment", "[solver]") {
    CellPackingProblem problem(std::vector<std::vector<CellSet>>{});

    Solver solver;
    auto result = solver.solve(problem);
    REQUIRE(result.has_value());
    REQUIRE(result->empty());
}

TEST_CASE("Solver keeps inferred assignments and undoes them on backtrack", "[solver]") {
    InferringProblem problem;

    Solver solver;
    auto result = solver.solve(problem);

    REQUIRE(result.has_value());
    REQUIRE(result->size() == 3);
    REQUIRE(result->at(0) == 1);
    // 最初の分岐で推論された 1 = 0 は取り消され、1 = 1 が推論し直される
    REQUIRE(result->at(1) == 1);
    REQUIRE(solver.stats().inferred_count == 2);
    REQUIRE(solver.stats().fail_count >= 1);
}

TEST_CASE("Solver result does not depend on stats from a previous run", "[solver]") {
    CellPackingProblem problem({
        {{{0, 0}}, {{0, 1}}},
        {{{0, 0}}, {{0, 1}}},
    });

    Solver solver;
    auto first = solver.solve(problem);
    auto first_nodes = solver.stats().node_count;
    auto second = solver.solve(problem);

    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(*first == *second);
    REQUIRE(solver.stats().node_count == first_nodes);
}

TEST_CASE("Solver is reusable after a problem throws", "[solver]") {
    Solver solver;

    {
        ThrowingProblem failing;
        REQUIRE_THROWS_AS(solver.solve(failing), std::runtime_error);
    }

    CellPackingProblem problem({
        {{{0, 0}}, {{0, 1}}},
        {{{0, 0}}, {{0, 1}}},
    });
    auto result = solver.solve(problem);

    REQUIRE(result.has_value());
    REQUIRE(result->size() == 2);
    REQUIRE(result->at(0) != result->at(1));
    REQUIRE(solver.stats().node_count == 3);
}
