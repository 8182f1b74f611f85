/**
 * @file puzzle.hpp
 * @brief クロスワード盤面モデル（スロット、語彙、重なり関係）
 */
#ifndef CROSSWORD_CSP_PUZZLE_HPP
#define CROSSWORD_CSP_PUZZLE_HPP

#include "crossword_csp/slot.hpp"
#include <optional>
#include <string>
#include <vector>

namespace crossword_csp {

/**
 * @brief クロスワード盤面モデル
 *
 * 盤面構造から導出したスロット集合・語彙・スロット間の重なり関係を保持する。
 * 構築後は不変で、ソルバーは参照するだけ。
 *
 * スロットは長さ2以上の記入可能マスの最大連で、開始マスの行優先順
 * （同じマスでは縦が先）に並ぶ。スロットは以降このインデックスで参照する。
 */
class Puzzle {
public:
    /**
     * @brief 盤面構造と単語リストからモデルを構築
     * @param structure 行ごとの記入可能フラグ（行長が揃っていなければ不可マスで補う）
     * @param words 候補単語（大文字化・空行除去・重複除去・ソートされる）
     */
    Puzzle(std::vector<std::vector<bool>> structure, const std::vector<std::string>& words);

    // ===== 盤面 =====

    size_t height() const { return height_; }
    size_t width() const { return width_; }

    /**
     * @brief マスが記入可能か
     */
    bool is_open(size_t row, size_t col) const { return structure_[row][col]; }

    const std::vector<std::vector<bool>>& structure() const { return structure_; }

    // ===== スロット =====

    const std::vector<Slot>& slots() const { return slots_; }
    const Slot& slot(size_t idx) const { return slots_[idx]; }
    size_t slot_count() const { return slots_.size(); }

    /**
     * @brief スロットのインデックスを検索
     * @return 見つかればインデックス、なければ SIZE_MAX
     */
    size_t find_slot(const Slot& slot) const;

    // ===== 語彙 =====

    const std::vector<std::string>& words() const { return words_; }
    const std::string& word(size_t word_id) const { return words_[word_id]; }
    size_t word_count() const { return words_.size(); }

    /**
     * @brief 単語IDを検索
     * @return 見つかればID、なければ SIZE_MAX
     */
    size_t find_word(const std::string& word) const;

    // ===== 重なり・隣接 =====

    /**
     * @brief 2スロットの重なり位置（a 側, b 側の文字インデックス）
     * @return 共有マスがなければ std::nullopt
     */
    const std::optional<Overlap>& overlap(size_t a, size_t b) const {
        return overlaps_[a * slots_.size() + b];
    }

    /**
     * @brief 重なりを持つ他スロットのインデックス（昇順）
     */
    const std::vector<size_t>& neighbors(size_t slot_idx) const { return neighbors_[slot_idx]; }

    /**
     * @brief 重なりを持つ順序付きスロット対の総数
     */
    size_t arc_count() const;

private:
    void derive_slots();
    void compute_overlaps();

    size_t height_ = 0;
    size_t width_ = 0;
    std::vector<std::vector<bool>> structure_;
    std::vector<Slot> slots_;
    std::vector<std::string> words_;

    // 重なり行列（slots_.size() x slots_.size()、対称）
    std::vector<std::optional<Overlap>> overlaps_;
    std::vector<std::vector<size_t>> neighbors_;
};

} // namespace crossword_csp

#endif // CROSSWORD_CSP_PUZZLE_HPP
