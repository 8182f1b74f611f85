/**
 * @file render.hpp
 * @brief 解の盤面化とテキスト出力
 */
#ifndef CROSSWORD_CSP_RENDER_HPP
#define CROSSWORD_CSP_RENDER_HPP

#include "crossword_csp/assignment.hpp"
#include "crossword_csp/puzzle.hpp"
#include <ostream>
#include <vector>

namespace crossword_csp {

/**
 * @brief 文字盤面（height x width、文字のないマスは '\0'）
 */
using LetterGrid = std::vector<std::vector<char>>;

/**
 * @brief 割り当ての単語を盤面に配置
 */
LetterGrid letter_grid(const Puzzle& puzzle, const Assignment& assignment);

/**
 * @brief 盤面をテキストで出力（不可マスは █、空きマスは空白）
 */
void print_grid(std::ostream& os, const Puzzle& puzzle, const Assignment& assignment);

} // namespace crossword_csp

#endif // CROSSWORD_CSP_RENDER_HPP
