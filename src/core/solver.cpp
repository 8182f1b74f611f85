#include "crossword_csp/solver.hpp"
#include <algorithm>
#include <array>
#include <deque>
#include <iostream>

namespace crossword_csp {

Solver::Solver(const Puzzle& puzzle)
    : puzzle_(puzzle)
    , domains_(puzzle) {}

std::optional<Assignment> Solver::solve() {
    stats_ = SolverStats{};
    reset_domains();

    enforce_node_consistency();
    if (verbose_) {
        std::cerr << "[verbose] node consistency done: " << puzzle_.slot_count() << " slots, "
                  << stats_.node_pruned << " values pruned, "
                  << domains_.total_size() << " remaining\n";
    }

    if (!ac3()) {
        if (verbose_) std::cerr << "[verbose] ac3 failed: empty domain\n";
        return std::nullopt;  // 解なし
    }
    if (verbose_) {
        std::cerr << "[verbose] ac3 done: " << stats_.revise_count << " revisions, "
                  << stats_.arc_pruned << " values pruned, "
                  << domains_.total_size() << " remaining\n";
    }

    PartialAssignment assignment(puzzle_.slot_count());
    bool found = backtrack(assignment);
    if (verbose_) {
        std::cerr << "[verbose] search " << (found ? "succeeded" : "exhausted")
                  << ": " << stats_.assignments << " assignments, "
                  << stats_.backtracks << " backtracks\n";
    }
    if (!found) {
        return std::nullopt;
    }
    return to_assignment(assignment);
}

// ===== 整合性 =====

void Solver::reset_domains() {
    domains_ = DomainStore(puzzle_);
}

void Solver::enforce_node_consistency() {
    for (size_t s = 0; s < puzzle_.slot_count(); ++s) {
        const size_t length = puzzle_.slot(s).length;
        Domain& domain = domains_[s];
        size_t k = 0;
        while (k < domain.size()) {
            if (puzzle_.word(domain[k]).size() != length) {
                domain.remove_at(k);
                ++stats_.node_pruned;
            } else {
                ++k;
            }
        }
    }
}

bool Solver::revise(size_t x, size_t y) {
    const auto& overlap = puzzle_.overlap(x, y);
    if (!overlap) {
        return false;
    }
    ++stats_.revise_count;
    const size_t i = overlap->index_a;
    const size_t j = overlap->index_b;

    // y のドメインが j 文字目に持つ文字
    std::array<bool, 256> supported{};
    for (auto wy : domains_[y]) {
        const std::string& word = puzzle_.word(wy);
        if (j < word.size()) {
            supported[static_cast<unsigned char>(word[j])] = true;
        }
    }

    bool revised = false;
    Domain& dx = domains_[x];
    size_t k = 0;
    while (k < dx.size()) {
        const std::string& word = puzzle_.word(dx[k]);
        if (i < word.size() && supported[static_cast<unsigned char>(word[i])]) {
            ++k;
        } else {
            // 末尾の値が k に来るので k は進めない
            dx.remove_at(k);
            ++stats_.arc_pruned;
            revised = true;
        }
    }
    return revised;
}

bool Solver::ac3() {
    std::vector<Arc> arcs;
    arcs.reserve(puzzle_.arc_count());
    for (size_t x = 0; x < puzzle_.slot_count(); ++x) {
        for (size_t y : puzzle_.neighbors(x)) {
            arcs.emplace_back(x, y);
        }
    }
    return ac3(arcs);
}

bool Solver::ac3(const std::vector<Arc>& arcs) {
    std::deque<Arc> queue(arcs.begin(), arcs.end());

    while (!queue.empty()) {
        Arc arc = queue.front();
        queue.pop_front();
        const size_t x = arc.first;
        const size_t y = arc.second;

        if (!revise(x, y)) {
            continue;
        }
        if (domains_[x].empty()) {
            return false;
        }
        // x が縮んだので、x を支えにしていた隣接スロットを再検査
        for (size_t z : puzzle_.neighbors(x)) {
            if (z != y) {
                queue.emplace_back(z, x);
            }
        }
    }
    return true;
}

// ===== 探索 =====

bool Solver::assignment_complete(const PartialAssignment& assignment) const {
    return assignment.complete();
}

bool Solver::consistent(const PartialAssignment& assignment) const {
    const size_t n = puzzle_.slot_count();
    for (size_t a = 0; a < n; ++a) {
        if (!assignment.is_assigned(a)) continue;
        const size_t wa = assignment.word(a);

        for (size_t b = a + 1; b < n; ++b) {
            if (!assignment.is_assigned(b)) continue;
            const size_t wb = assignment.word(b);

            // 同じ単語は2回使えない
            if (wa == wb) {
                return false;
            }
            const auto& overlap = puzzle_.overlap(a, b);
            if (!overlap) continue;

            const std::string& word_a = puzzle_.word(wa);
            const std::string& word_b = puzzle_.word(wb);
            if (overlap->index_a >= word_a.size() || overlap->index_b >= word_b.size()) {
                return false;
            }
            if (word_a[overlap->index_a] != word_b[overlap->index_b]) {
                return false;
            }
        }
    }
    return true;
}

size_t Solver::select_unassigned_variable(const PartialAssignment& assignment) const {
    size_t best = SIZE_MAX;
    for (size_t s = 0; s < puzzle_.slot_count(); ++s) {
        if (assignment.is_assigned(s)) continue;
        if (best == SIZE_MAX) {
            best = s;
            continue;
        }
        size_t size = domains_[s].size();
        size_t best_size = domains_[best].size();
        if (size < best_size ||
            (size == best_size && puzzle_.neighbors(s).size() > puzzle_.neighbors(best).size())) {
            best = s;
        }
    }
    return best;
}

std::vector<size_t> Solver::order_domain_values(size_t slot_idx,
                                                const PartialAssignment& assignment) const {
    std::vector<std::pair<size_t, size_t>> counted;  // (除外数, 単語ID)
    counted.reserve(domains_[slot_idx].size());

    for (auto word_id : domains_[slot_idx]) {
        size_t count = 0;
        for (size_t neighbor : puzzle_.neighbors(slot_idx)) {
            if (assignment.is_assigned(neighbor)) continue;
            const Domain& nd = domains_[neighbor];
            count += nd.size() - (nd.contains(word_id) ? 1 : 0);
        }
        counted.emplace_back(count, word_id);
    }

    std::stable_sort(counted.begin(), counted.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    std::vector<size_t> ordered;
    ordered.reserve(counted.size());
    for (const auto& [count, word_id] : counted) {
        ordered.push_back(word_id);
    }
    return ordered;
}

bool Solver::backtrack(PartialAssignment& assignment) {
    if (assignment_complete(assignment)) {
        return true;
    }

    const size_t var = select_unassigned_variable(assignment);
    const size_t depth = assignment.count() + 1;
    if (depth > stats_.max_depth) {
        stats_.max_depth = depth;
    }

    // 推論でドメインが変わっても順序は固定
    for (size_t value : order_domain_values(var, assignment)) {
        assignment.assign(var, value);
        ++stats_.assignments;

        if (consistent(assignment)) {
            if (inference_) {
                auto saved = domains_.snapshot();
                if (infer(var, value) && backtrack(assignment)) {
                    return true;
                }
                domains_.restore(saved);
            } else if (backtrack(assignment)) {
                return true;
            }
        }

        assignment.unassign(var);
        ++stats_.backtracks;
    }
    return false;
}

bool Solver::infer(size_t slot_idx, size_t word_id) {
    if (!domains_[slot_idx].assign(word_id)) {
        return false;
    }
    std::vector<Arc> arcs;
    arcs.reserve(puzzle_.neighbors(slot_idx).size());
    for (size_t z : puzzle_.neighbors(slot_idx)) {
        arcs.emplace_back(z, slot_idx);
    }
    return ac3(arcs);
}

Assignment Solver::to_assignment(const PartialAssignment& assignment) const {
    Assignment result;
    for (size_t s = 0; s < assignment.slot_count(); ++s) {
        if (assignment.is_assigned(s)) {
            result.emplace(puzzle_.slot(s), puzzle_.word(assignment.word(s)));
        }
    }
    return result;
}

} // namespace crossword_csp
