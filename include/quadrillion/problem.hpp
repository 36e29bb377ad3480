/**
 * @file problem.hpp
 * @brief 制約充足問題の抽象インターフェース
 */
#ifndef QUADRILLION_PROBLEM_HPP
#define QUADRILLION_PROBLEM_HPP

#include <cstddef>
#include <map>
#include <vector>

namespace quadrillion {

/**
 * @brief 変数ID（問題側が意味を与える）
 */
using VariableId = size_t;

/**
 * @brief 値ID（問題側が意味を与える）
 */
using ValueId = size_t;

/**
 * @brief 割当（変数 → 値）
 */
using Assignment = std::map<VariableId, ValueId>;

/**
 * @brief 各変数の残り候補値
 *
 * 値の並び順は探索の効率にのみ影響し、結果の正しさには影響しない。
 */
using Domains = std::map<VariableId, std::vector<ValueId>>;

/**
 * @brief リテラル（変数IDと値のペア）
 */
struct Literal {
    VariableId var_idx;
    ValueId value;

    bool operator==(const Literal& other) const {
        return var_idx == other.var_idx && value == other.value;
    }
};

/**
 * @brief 探索エンジンが扱う制約充足問題
 *
 * Solver はこのインターフェースのみを通して問題を扱い、
 * 変数や値の具体的な意味（図形・盤面など）は知らない。
 */
class ConstraintProblem {
public:
    virtual ~ConstraintProblem() = default;

    /**
     * @brief 探索対象の全変数
     */
    virtual const std::vector<VariableId>& variables() const = 0;

    /**
     * @brief 各変数の初期ドメイン（ノード整合済み）
     */
    virtual const Domains& domains() const = 0;

    /**
     * @brief 現在の割当を登録し、推論を行う
     *
     * 推論で値が確定した変数は assignments に追加してよい。
     *
     * @param assignments 現在の割当（推論結果が追加される）
     * @param domains 現在のドメイン
     * @return この割当では解が存在しないと判明したらfalse
     */
    virtual bool register_current_assignments(Assignment& assignments,
                                              const Domains& domains) = 0;

    /**
     * @brief 値が登録済みの割当と矛盾しないか
     * @param assignment (変数, 値)。変数は登録済みの割当に含まれないこと
     */
    virtual bool is_consistent_assignment(const Literal& assignment) const = 0;
};

} // namespace quadrillion

#endif // QUADRILLION_PROBLEM_HPP
