/**
 * @file puzzle_adapter.hpp
 * @brief 盤面を制約充足問題として解くアダプタ
 */
#ifndef QUADRILLION_PUZZLE_ADAPTER_HPP
#define QUADRILLION_PUZZLE_ADAPTER_HPP

#include "quadrillion/board.hpp"
#include "quadrillion/feasibility.hpp"
#include "quadrillion/problem.hpp"
#include "quadrillion/solver.hpp"
#include <map>
#include <utility>
#include <vector>

namespace quadrillion {

/**
 * @brief アダプタ統計情報
 */
struct AdapterStats {
    size_t search_count = 0;
    size_t cache_hits = 0;
    size_t domain_values = 0;          // 直近の探索の初期ドメイン値の総数
    double last_search_seconds = 0.0;
    SolverStats solver;                // 直近の探索のソルバー統計
};

/**
 * @brief 盤面のパズルを ConstraintProblem として提供するアダプタ
 *
 * - 変数: 盤面に置かれていない図形
 * - 値: 図形が占有し得るセル集合（空いた開セルに完全に含まれるもの）
 * - 整合性: 値が現在の割当で占有済みのセルと重ならないこと
 * - 推論: 残りの空き領域を連結成分に分け、小さな成分はそれと一致する
 *   候補値を持つ変数に割り当てる
 *
 * 得られた解はキャッシュし、未配置図形の解のセルがすべてまだ空いていれば
 * 再探索せずに使い回す。
 *
 * 同一の盤面に対して solve() / help() を同時に呼んではならない。
 * 探索中は対象の図形を Board::pick() でロックする。
 */
class PuzzleAdapter : public ConstraintProblem {
public:
    /**
     * @brief 図形と占有セルの組（変数ID順）
     */
    using ShapeCells = std::vector<std::pair<ShapePtr, CellSet>>;

    explicit PuzzleAdapter(Board& board, FeasibilityRule rule = FeasibilityRule{});

    /**
     * @brief 全ての未配置図形を解の位置に置く
     * @throws StateError 盤面が既に解かれている、または pick 中の場合
     * @throws NoSolutionError 解が存在しない場合（盤面は元に戻る）
     */
    void solve();

    /**
     * @brief 未配置図形のうち1つだけを解の位置に置く（ヒント）
     * @throws StateError 盤面が既に解かれている、または pick 中の場合
     * @throws NoSolutionError 解が存在しない場合（盤面は元に戻る）
     */
    void help();

    // ===== ConstraintProblem =====

    const std::vector<VariableId>& variables() const override { return variables_; }
    const Domains& domains() const override { return domains_; }
    bool register_current_assignments(Assignment& assignments, const Domains& domains) override;
    bool is_consistent_assignment(const Literal& assignment) const override;

    // ===== 変数・値の対応 =====

    const ShapePtr& shape_of(VariableId var) const { return shapes_.at(var); }
    const CellSet& candidate(VariableId var, ValueId value) const { return candidates_.at(var).at(value); }

    // ===== 設定 =====

    void set_verbose(bool enabled);
    void set_feasibility_rule(FeasibilityRule rule);
    const FeasibilityRule& feasibility_rule() const { return rule_; }

    const AdapterStats& stats() const { return stats_; }

    bool has_cached_solution() const { return !cached_solution_.empty(); }

    /**
     * @brief キャッシュされた解を破棄
     */
    void clear_cache() { cached_solution_.clear(); }

private:
    /**
     * @brief 解を取得（必要な場合のみ探索）
     *
     * 戻った時点で盤面は対象図形を pick した状態。
     */
    ShapeCells get_solution();

    /**
     * @brief 解のセルに図形を置いて release。失敗したら unpick して再送出
     */
    void commit(const ShapeCells& solution);

    bool is_new_solution_needed() const;
    void cache_solution(const ShapeCells& solution);
    ShapeCells adapt_solution() const;
    ShapeCells to_shape_cells(const Assignment& assignment) const;

    /**
     * @brief 初期ドメインを構築
     *
     * 空きセルを覆う最小の矩形内の各位置について、各図形の正準配置のうち
     * 空きセルに完全に含まれ、残りの空き領域が充填可能なものを候補とする。
     */
    void extract_domains();

    /**
     * @brief 空き領域が充填可能か（整除条件）
     * @param small_components 小さな連結成分の出力先（nullptr 可）
     */
    bool is_valid_empty_cells(const CellSet& empty, std::vector<CellSet>* small_components) const;

    /**
     * @brief 小さな連結成分をそれぞれ未割当変数の候補値に対応付け、割当に追加
     * @return 対応付けられない成分があればfalse
     */
    bool infer_small_components(Assignment& assignments, const Domains& domains,
                                const std::vector<CellSet>& small_components);

    Board& board_;
    Solver solver_;
    FeasibilityRule rule_;
    bool verbose_ = false;
    AdapterStats stats_;

    // 現在の探索の問題
    std::vector<ShapePtr> shapes_;
    std::vector<VariableId> variables_;
    CellSet empty_cells_;
    std::vector<std::vector<CellSet>> candidates_;
    std::vector<std::map<CellSet, ValueId>> candidate_index_;
    Domains domains_;

    // register_current_assignments で登録された占有セル
    CellSet current_assignments_cells_;

    // 全図形のセル（最後に見つけた解のスナップショット）
    std::map<const Shape*, CellSet> cached_solution_;
};

} // namespace quadrillion

#endif // QUADRILLION_PUZZLE_ADAPTER_HPP
