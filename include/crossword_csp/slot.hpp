/**
 * @file slot.hpp
 * @brief スロット（CSP変数）と重なり位置の定義
 */
#ifndef CROSSWORD_CSP_SLOT_HPP
#define CROSSWORD_CSP_SLOT_HPP

#include <cstddef>
#include <ostream>
#include <tuple>

namespace crossword_csp {

/**
 * @brief スロットの向き
 */
enum class Direction {
    Across,  // 横
    Down     // 縦
};

/**
 * @brief 盤面上の単語スロット
 *
 * 連続した記入可能マスの最大連を表す。開始位置・向き・長さの4属性が
 * 全て一致する場合に等しい。
 */
struct Slot {
    size_t row;
    size_t col;
    Direction direction;
    size_t length;

    /**
     * @brief k 文字目のマスの行
     */
    size_t row_at(size_t k) const { return row + (direction == Direction::Down ? k : 0); }

    /**
     * @brief k 文字目のマスの列
     */
    size_t col_at(size_t k) const { return col + (direction == Direction::Across ? k : 0); }

    bool operator==(const Slot& other) const {
        return row == other.row && col == other.col &&
               direction == other.direction && length == other.length;
    }

    bool operator!=(const Slot& other) const { return !(*this == other); }

    // std::map のキーに使うための全順序（行, 列, 向き, 長さ）
    bool operator<(const Slot& other) const {
        return std::tie(row, col, direction, length) <
               std::tie(other.row, other.col, other.direction, other.length);
    }
};

/**
 * @brief 2スロットの交差位置
 *
 * first 側の単語の index_a 文字目と second 側の単語の index_b 文字目が同じマスを共有する。
 */
struct Overlap {
    size_t index_a;
    size_t index_b;

    bool operator==(const Overlap& other) const {
        return index_a == other.index_a && index_b == other.index_b;
    }
};

inline const char* to_string(Direction direction) {
    return direction == Direction::Across ? "across" : "down";
}

inline std::ostream& operator<<(std::ostream& os, const Slot& slot) {
    return os << "(" << slot.row << ", " << slot.col << ") "
              << to_string(slot.direction) << " : " << slot.length;
}

} // namespace crossword_csp

#endif // CROSSWORD_CSP_SLOT_HPP
