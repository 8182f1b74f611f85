/**
 * @file assignment.hpp
 * @brief 割り当て（スロット → 単語）
 */
#ifndef CROSSWORD_CSP_ASSIGNMENT_HPP
#define CROSSWORD_CSP_ASSIGNMENT_HPP

#include "crossword_csp/slot.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace crossword_csp {

/**
 * @brief 解を表す型
 */
using Assignment = std::map<Slot, std::string>;

/**
 * @brief 探索中の部分割り当て
 *
 * スロットインデックス → 単語ID。未割り当ては NO_WORD。
 */
class PartialAssignment {
public:
    static constexpr size_t NO_WORD = SIZE_MAX;

    explicit PartialAssignment(size_t slot_count)
        : words_(slot_count, NO_WORD) {}

    bool is_assigned(size_t slot_idx) const { return words_[slot_idx] != NO_WORD; }

    /**
     * @brief 割り当てられた単語ID（未割り当てなら NO_WORD）
     */
    size_t word(size_t slot_idx) const { return words_[slot_idx]; }

    void assign(size_t slot_idx, size_t word_id) {
        if (words_[slot_idx] == NO_WORD) ++count_;
        words_[slot_idx] = word_id;
    }

    void unassign(size_t slot_idx) {
        if (words_[slot_idx] != NO_WORD) --count_;
        words_[slot_idx] = NO_WORD;
    }

    /**
     * @brief 割り当て済みスロット数
     */
    size_t count() const { return count_; }

    size_t slot_count() const { return words_.size(); }

    bool complete() const { return count_ == words_.size(); }

private:
    std::vector<size_t> words_;
    size_t count_ = 0;
};

} // namespace crossword_csp

#endif // CROSSWORD_CSP_ASSIGNMENT_HPP
