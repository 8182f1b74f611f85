/**
 * @file solver.hpp
 * @brief クロスワードCSPソルバー（ノード整合、AC-3、MRV/次数/LCV付きバックトラック）
 */
#ifndef CROSSWORD_CSP_SOLVER_HPP
#define CROSSWORD_CSP_SOLVER_HPP

#include "crossword_csp/assignment.hpp"
#include "crossword_csp/domain.hpp"
#include "crossword_csp/puzzle.hpp"
#include <optional>
#include <utility>
#include <vector>

namespace crossword_csp {

/**
 * @brief アーク（順序付きスロット対 (x, y)）
 */
using Arc = std::pair<size_t, size_t>;

/**
 * @brief ソルバー統計情報
 */
struct SolverStats {
    size_t node_pruned = 0;     // ノード整合で除去した値の数
    size_t revise_count = 0;    // revise() の呼び出し回数
    size_t arc_pruned = 0;      // AC-3 で除去した値の数
    size_t assignments = 0;     // 試した仮割り当ての数
    size_t backtracks = 0;      // 取り消した仮割り当ての数
    size_t max_depth = 0;
};

/**
 * @brief クロスワードCSPソルバー
 *
 * 1回の solve() ごとにドメインストアを作り直す。処理の流れ：
 * - ノード整合（長さ制約）でドメインを絞る
 * - AC-3 で全アークを整合させる（空ドメインなら解なし）
 * - MRV → 次数 → スロット順で変数を、LCV で値を選びバックトラック探索
 *
 * 探索中の推論（set_inference）を有効にすると、仮割り当てごとに
 * 隣接アークで AC-3 を回し、取り消し時に削除を元に戻す。
 */
class Solver {
public:
    /**
     * @brief puzzle はソルバーより長く生存すること（一時オブジェクトは受け付けない）
     */
    explicit Solver(const Puzzle& puzzle);
    Solver(Puzzle&&) = delete;

    /**
     * @brief ノード整合 → AC-3 → バックトラック探索で最初の解を求める
     * @return 解が見つかればその解、なければstd::nullopt
     */
    std::optional<Assignment> solve();

    // ===== 整合性 =====

    /**
     * @brief ドメインストアを語彙全体で初期化し直す
     */
    void reset_domains();

    /**
     * @brief 各スロットのドメインから長さの合わない単語を除去
     */
    void enforce_node_consistency();

    /**
     * @brief x のドメインを y に対してアーク整合にする
     * @return x のドメインから値を除去したらtrue
     */
    bool revise(size_t x, size_t y);

    /**
     * @brief 重なりを持つ全アークから AC-3 を実行
     * @return 全ドメインが空でなければtrue、空ドメインが生じたらfalse
     */
    bool ac3();

    /**
     * @brief 指定アークを初期キューとして AC-3 を実行
     */
    bool ac3(const std::vector<Arc>& arcs);

    // ===== 探索 =====

    /**
     * @brief 全スロットが割り当て済みか
     */
    bool assignment_complete(const PartialAssignment& assignment) const;

    /**
     * @brief 割り当て済みスロット同士が矛盾しないか
     *
     * 単語が互いに異なり、重なりを持つ全ての割り当て済みスロット対で
     * 共有マスの文字が一致すること。
     */
    bool consistent(const PartialAssignment& assignment) const;

    /**
     * @brief 未割り当てスロットを選択（MRV → 次数 → スロット順）
     * @pre 未割り当てスロットが存在すること
     */
    size_t select_unassigned_variable(const PartialAssignment& assignment) const;

    /**
     * @brief スロットの候補単語を LCV 順に並べる
     *
     * 未割り当ての隣接スロットについて、そのドメイン中で候補と異なる単語の数を
     * 合計し、小さい順に並べる（同数は列挙順を保つ）。
     */
    std::vector<size_t> order_domain_values(size_t slot_idx,
                                            const PartialAssignment& assignment) const;

    /**
     * @brief バックトラック探索
     * @param assignment 部分割り当て（成功時は完全割り当てになる）
     * @return 完全割り当てが見つかればtrue
     */
    bool backtrack(PartialAssignment& assignment);

    /**
     * @brief 部分割り当てを単語の解に変換
     */
    Assignment to_assignment(const PartialAssignment& assignment) const;

    // ===== アクセサ・設定 =====

    const Puzzle& puzzle() const { return puzzle_; }

    DomainStore& domains() { return domains_; }
    const DomainStore& domains() const { return domains_; }

    /**
     * @brief 統計情報を取得
     */
    const SolverStats& stats() const { return stats_; }

    /**
     * @brief 探索中の推論（仮割り当てごとの AC-3）を有効/無効にする
     */
    void set_inference(bool enabled) { inference_ = enabled; }

    /**
     * @brief verbose モードを有効/無効にする
     */
    void set_verbose(bool enabled) { verbose_ = enabled; }

private:
    /**
     * @brief 仮割り当て後の推論（ドメインを単語に絞り、隣接アークで AC-3）
     * @return 矛盾がなければtrue
     */
    bool infer(size_t slot_idx, size_t word_id);

    const Puzzle& puzzle_;
    DomainStore domains_;
    SolverStats stats_;

    bool inference_ = false;
    bool verbose_ = false;
};

} // namespace crossword_csp

#endif // CROSSWORD_CSP_SOLVER_HPP
