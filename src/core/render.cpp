#include "crossword_csp/render.hpp"

namespace crossword_csp {

LetterGrid letter_grid(const Puzzle& puzzle, const Assignment& assignment) {
    LetterGrid letters(puzzle.height(), std::vector<char>(puzzle.width(), '\0'));
    for (const auto& [slot, word] : assignment) {
        for (size_t k = 0; k < word.size(); ++k) {
            size_t r = slot.row_at(k);
            size_t c = slot.col_at(k);
            if (r < puzzle.height() && c < puzzle.width()) {
                letters[r][c] = word[k];
            }
        }
    }
    return letters;
}

void print_grid(std::ostream& os, const Puzzle& puzzle, const Assignment& assignment) {
    LetterGrid letters = letter_grid(puzzle, assignment);
    for (size_t i = 0; i < puzzle.height(); ++i) {
        for (size_t j = 0; j < puzzle.width(); ++j) {
            if (puzzle.is_open(i, j)) {
                os << (letters[i][j] != '\0' ? letters[i][j] : ' ');
            } else {
                os << "█";
            }
        }
        os << "\n";
    }
}

} // namespace crossword_csp
