/**
 * @file solver.hpp
 * @brief バックトラック探索ソルバー（MRV変数選択、前方検査）
 */
#ifndef QUADRILLION_SOLVER_HPP
#define QUADRILLION_SOLVER_HPP

#include "quadrillion/problem.hpp"
#include <optional>

namespace quadrillion {

/**
 * @brief ソルバー統計情報
 */
struct SolverStats {
    size_t node_count = 0;
    size_t fail_count = 0;
    size_t max_depth = 0;
    size_t inferred_count = 0;   // register_current_assignments による推論割当
    size_t pruned_count = 0;     // 前方検査で除去された値
};

/**
 * @brief 汎用バックトラック探索ソルバー
 *
 * 深さ優先探索で、未割当変数のうちドメインが最小のもの（MRV）を選び、
 * 仮割当のたびに前方検査でドメインを絞り込む。
 * 解が無いことは例外ではなく std::nullopt で返す。
 */
class Solver {
public:
    Solver() = default;

    /**
     * @brief 解を1つ探索
     * @param problem 解く問題
     * @return 全変数の割当、解が無ければstd::nullopt
     */
    std::optional<Assignment> solve(ConstraintProblem& problem);

    /**
     * @brief 統計情報を取得
     */
    const SolverStats& stats() const { return stats_; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

private:
    /**
     * @brief 再帰探索
     *
     * 失敗時、この呼び出しで assignments に追加されたキー（推論分を含む）のみを取り除く。
     *
     * @return 完全な割当が得られたらtrue
     */
    bool search(ConstraintProblem& problem, Assignment& assignments, const Domains& domains,
                size_t depth);

    /**
     * @brief 前方検査
     * @return 未割当変数の絞り込み後のドメイン、矛盾ならstd::nullopt
     */
    std::optional<Domains> forward_check(ConstraintProblem& problem, Assignment& assignments,
                                         const Domains& domains);

    /**
     * @brief 次に割り当てる変数を選択（MRV、同数なら最小ID）
     * @return 未割当変数が無ければstd::nullopt
     */
    std::optional<VariableId> select_variable(const Assignment& assignments, const Domains& domains) const;

    size_t num_variables_ = 0;

    bool verbose_ = false;
    SolverStats stats_;
};

} // namespace quadrillion

#endif // QUADRILLION_SOLVER_HPP
