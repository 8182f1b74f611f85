/**
 * @file loader.hpp
 * @brief 盤面構造ファイル・単語リストの読み込み
 */
#ifndef CROSSWORD_CSP_GENERATE_LOADER_HPP
#define CROSSWORD_CSP_GENERATE_LOADER_HPP

#include "crossword_csp/puzzle.hpp"
#include <string>
#include <vector>

namespace crossword_csp {
namespace generate {

/**
 * @brief 盤面構造ファイルを読み込む
 * @return 行ごとの記入可能フラグ（'_' が記入可能）
 * @throws std::runtime_error ファイルが開けない、または構造が空の場合
 */
std::vector<std::vector<bool>> parse_structure_file(const std::string& filename);

/**
 * @brief 盤面構造を文字列から読み込む
 */
std::vector<std::vector<bool>> parse_structure_string(const std::string& input);

/**
 * @brief 単語リストファイルを読み込む（1行1単語、空行は無視）
 * @throws std::runtime_error ファイルが開けない場合
 */
std::vector<std::string> read_words_file(const std::string& filename);

/**
 * @brief 盤面構造ファイルと単語リストからモデルを構築
 */
Puzzle load_puzzle(const std::string& structure_file, const std::string& words_file);

} // namespace generate
} // namespace crossword_csp

#endif // CROSSWORD_CSP_GENERATE_LOADER_HPP
