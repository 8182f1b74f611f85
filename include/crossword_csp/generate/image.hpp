/**
 * @file image.hpp
 * @brief 解の盤面を画像として保存
 */
#ifndef CROSSWORD_CSP_GENERATE_IMAGE_HPP
#define CROSSWORD_CSP_GENERATE_IMAGE_HPP

#include "crossword_csp/assignment.hpp"
#include "crossword_csp/puzzle.hpp"
#include <string>

namespace crossword_csp {
namespace generate {

/// 1マスの一辺（ピクセル）
constexpr int CELL_SIZE = 100;

/// マスの枠線の太さ（ピクセル）
constexpr int CELL_BORDER = 2;

/**
 * @brief 盤面を画像ファイルとして保存（形式は拡張子で決まる）
 *
 * 黒地に記入可能マスを白で塗り、割り当てられた文字を中央に描く。
 *
 * @throws std::runtime_error 書き込みに失敗した場合
 */
void save_image(const Puzzle& puzzle, const Assignment& assignment, const std::string& filename);

} // namespace generate
} // namespace crossword_csp

#endif // CROSSWORD_CSP_GENERATE_IMAGE_HPP
