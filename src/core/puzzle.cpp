#include "crossword_csp/puzzle.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <utility>

namespace crossword_csp {

Puzzle::Puzzle(std::vector<std::vector<bool>> structure, const std::vector<std::string>& words)
    : height_(structure.size())
    , structure_(std::move(structure)) {
    for (const auto& row : structure_) {
        width_ = std::max(width_, row.size());
    }
    // 短い行は不可マスで埋める
    for (auto& row : structure_) {
        row.resize(width_, false);
    }

    words_.reserve(words.size());
    for (const auto& w : words) {
        if (w.empty()) continue;
        std::string upper = w;
        std::transform(upper.begin(), upper.end(), upper.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        words_.push_back(std::move(upper));
    }
    std::sort(words_.begin(), words_.end());
    words_.erase(std::unique(words_.begin(), words_.end()), words_.end());

    derive_slots();
    compute_overlaps();
}

void Puzzle::derive_slots() {
    for (size_t i = 0; i < height_; ++i) {
        for (size_t j = 0; j < width_; ++j) {
            if (!structure_[i][j]) continue;

            // 縦スロットの開始マス
            bool starts_down = (i == 0 || !structure_[i - 1][j]);
            if (starts_down) {
                size_t length = 1;
                while (i + length < height_ && structure_[i + length][j]) {
                    ++length;
                }
                if (length > 1) {
                    slots_.push_back(Slot{i, j, Direction::Down, length});
                }
            }

            // 横スロットの開始マス
            bool starts_across = (j == 0 || !structure_[i][j - 1]);
            if (starts_across) {
                size_t length = 1;
                while (j + length < width_ && structure_[i][j + length]) {
                    ++length;
                }
                if (length > 1) {
                    slots_.push_back(Slot{i, j, Direction::Across, length});
                }
            }
        }
    }
}

void Puzzle::compute_overlaps() {
    const size_t n = slots_.size();
    overlaps_.assign(n * n, std::nullopt);
    neighbors_.assign(n, {});

    for (size_t a = 0; a < n; ++a) {
        for (size_t b = a + 1; b < n; ++b) {
            const Slot& sa = slots_[a];
            const Slot& sb = slots_[b];
            // 同じ向きの最大連はマスを共有しない
            if (sa.direction == sb.direction) continue;

            for (size_t k = 0; k < sa.length; ++k) {
                size_t r = sa.row_at(k);
                size_t c = sa.col_at(k);
                if (sb.direction == Direction::Down) {
                    if (c != sb.col || r < sb.row || r >= sb.row + sb.length) continue;
                    size_t l = r - sb.row;
                    overlaps_[a * n + b] = Overlap{k, l};
                    overlaps_[b * n + a] = Overlap{l, k};
                } else {
                    if (r != sb.row || c < sb.col || c >= sb.col + sb.length) continue;
                    size_t l = c - sb.col;
                    overlaps_[a * n + b] = Overlap{k, l};
                    overlaps_[b * n + a] = Overlap{l, k};
                }
                break;
            }
        }
    }

    for (size_t a = 0; a < n; ++a) {
        for (size_t b = 0; b < n; ++b) {
            if (overlaps_[a * n + b]) {
                neighbors_[a].push_back(b);
            }
        }
    }
}

size_t Puzzle::find_slot(const Slot& slot) const {
    auto it = std::find(slots_.begin(), slots_.end(), slot);
    if (it == slots_.end()) {
        return SIZE_MAX;
    }
    return static_cast<size_t>(it - slots_.begin());
}

size_t Puzzle::find_word(const std::string& word) const {
    auto it = std::lower_bound(words_.begin(), words_.end(), word);
    if (it == words_.end() || *it != word) {
        return SIZE_MAX;
    }
    return static_cast<size_t>(it - words_.begin());
}

size_t Puzzle::arc_count() const {
    size_t count = 0;
    for (const auto& ns : neighbors_) {
        count += ns.size();
    }
    return count;
}

} // namespace crossword_csp
