#include <catch2/catch_test_macros.hpp>
#include "crossword_csp/puzzle.hpp"
#include "crossword_csp/solver.hpp"
#include <random>
#include <set>
#include <string>
#include <type_traits>
#include <vector>

using namespace crossword_csp;

namespace {

std::vector<std::vector<bool>> grid(const std::vector<std::string>& rows) {
    std::vector<std::vector<bool>> structure;
    for (const auto& row : rows) {
        std::vector<bool> cells;
        for (char c : row) cells.push_back(c == '_');
        structure.push_back(cells);
    }
    return structure;
}

const std::vector<std::string> CROSSING = {
    "___",
    "#_#",
    "#_#",
};

const std::vector<std::string> FOUR_SLOTS = {
    "#___#",
    "#_##_",
    "#_##_",
    "#_##_",
    "#____",
};

const std::vector<std::string> FOUR_SLOT_WORDS = {
    "CRANE", "HORSE", "ZEBRA", "CAT", "DOG",
    "EASY", "TINY", "FISH", "TREE", "BEST", "COLD",
};

// 解が盤面の全制約を満たすか
void require_valid_solution(const Puzzle& puzzle, const Assignment& assignment) {
    REQUIRE(assignment.size() == puzzle.slot_count());

    std::set<std::string> used;
    for (const auto& [slot, word] : assignment) {
        REQUIRE(word.size() == slot.length);
        REQUIRE(puzzle.find_word(word) != SIZE_MAX);
        used.insert(word);
    }
    REQUIRE(used.size() == assignment.size());

    for (size_t a = 0; a < puzzle.slot_count(); ++a) {
        for (size_t b : puzzle.neighbors(a)) {
            const auto& ov = puzzle.overlap(a, b);
            const std::string& wa = assignment.at(puzzle.slot(a));
            const std::string& wb = assignment.at(puzzle.slot(b));
            REQUIRE(wa[ov->index_a] == wb[ov->index_b]);
        }
    }
}

// 長さ・重複・重なりだけを見て全割り当てを列挙し、解が存在するか調べる
bool exhaustive_solvable(const Puzzle& puzzle, std::vector<size_t>& chosen, size_t s) {
    if (s == puzzle.slot_count()) {
        return true;
    }
    for (size_t w = 0; w < puzzle.word_count(); ++w) {
        const std::string& word = puzzle.word(w);
        if (word.size() != puzzle.slot(s).length) continue;

        bool ok = true;
        for (size_t t = 0; t < s && ok; ++t) {
            if (chosen[t] == w) {
                ok = false;
            } else if (const auto& ov = puzzle.overlap(s, t)) {
                ok = word[ov->index_a] == puzzle.word(chosen[t])[ov->index_b];
            }
        }
        if (!ok) continue;

        chosen[s] = w;
        if (exhaustive_solvable(puzzle, chosen, s + 1)) {
            return true;
        }
    }
    return false;
}

// 3x3 盤面と、2文字のアルファベットからなる 2〜3 文字の語彙
Puzzle random_puzzle(std::mt19937& rng) {
    std::vector<std::vector<bool>> structure(3, std::vector<bool>(3));
    for (auto& row : structure) {
        for (size_t c = 0; c < row.size(); ++c) {
            row[c] = rng() % 10 < 7;
        }
    }

    std::vector<std::string> words;
    const size_t word_count = 4 + rng() % 7;
    for (size_t k = 0; k < word_count; ++k) {
        std::string word(2 + rng() % 2, 'A');
        for (auto& ch : word) {
            ch = (rng() % 2 == 0) ? 'A' : 'B';
        }
        words.push_back(word);
    }
    return Puzzle(structure, words);
}

}  // namespace

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("Solver refers to a puzzle that outlives it", "[search]") {
    static_assert(std::is_constructible_v<Solver, const Puzzle&>);
    static_assert(!std::is_constructible_v<Solver, Puzzle&&>);

    Puzzle puzzle(grid({"___"}), {"CAT", "DOG"});
    Solver solver(puzzle);
    REQUIRE(&solver.puzzle() == &puzzle);
    REQUIRE(solver.solve().has_value());
}

// ============================================================================
// consistent
// ============================================================================

TEST_CASE("consistent checks distinctness and overlaps", "[search][consistent]") {
    Puzzle puzzle(grid(CROSSING), {"CAT", "ART", "TIE"});
    Solver solver(puzzle);
    const size_t art = puzzle.find_word("ART");
    const size_t cat = puzzle.find_word("CAT");
    const size_t tie = puzzle.find_word("TIE");

    PartialAssignment assignment(puzzle.slot_count());

    SECTION("empty assignment") {
        REQUIRE(solver.consistent(assignment));
    }

    SECTION("single slot") {
        assignment.assign(0, tie);
        REQUIRE(solver.consistent(assignment));
    }

    SECTION("agreeing overlap") {
        assignment.assign(0, cat);
        assignment.assign(1, art);
        REQUIRE(solver.consistent(assignment));
    }

    SECTION("conflicting overlap") {
        // CAT の 'A' と TIE の 'T'
        assignment.assign(0, cat);
        assignment.assign(1, tie);
        REQUIRE(!solver.consistent(assignment));
    }

    SECTION("same word twice") {
        Puzzle parallel(grid({"___", "###", "___"}), {"CAT"});
        Solver parallel_solver(parallel);
        PartialAssignment twice(2);
        twice.assign(0, 0);
        twice.assign(1, 0);
        REQUIRE(!parallel_solver.consistent(twice));
    }
}

// ============================================================================
// Variable and value ordering
// ============================================================================

TEST_CASE("select_unassigned_variable uses MRV then degree", "[search][heuristic]") {
    Puzzle puzzle(grid(FOUR_SLOTS), {"ONE", "TWO", "SIX"});
    Solver solver(puzzle);
    PartialAssignment assignment(puzzle.slot_count());

    SECTION("equal domains pick the highest degree, first in slot order") {
        // slot 0 と slot 3 が次数 2
        REQUIRE(solver.select_unassigned_variable(assignment) == 0);
        assignment.assign(0, 0);
        REQUIRE(solver.select_unassigned_variable(assignment) == 3);
        assignment.assign(3, 1);
        REQUIRE(solver.select_unassigned_variable(assignment) == 1);
    }

    SECTION("fewest remaining values wins over degree") {
        solver.domains()[2].remove(0);
        REQUIRE(solver.select_unassigned_variable(assignment) == 2);
    }
}

TEST_CASE("order_domain_values sorts by values ruled out", "[search][heuristic]") {
    Puzzle puzzle(grid(CROSSING), {"CAT", "ART", "TIE"});
    Solver solver(puzzle);
    solver.enforce_node_consistency();
    PartialAssignment assignment(puzzle.slot_count());

    auto words = [&puzzle](const std::vector<size_t>& ids) {
        std::vector<std::string> result;
        for (auto id : ids) result.push_back(puzzle.word(id));
        return result;
    };

    SECTION("ties keep domain order") {
        REQUIRE(words(solver.order_domain_values(0, assignment)) ==
                std::vector<std::string>{"ART", "CAT", "TIE"});
    }

    SECTION("a word absent from the neighbor rules out more") {
        // 縦のドメインから ART を除くと、ART は縦の2語を全て除外する
        solver.domains()[1].remove(puzzle.find_word("ART"));
        REQUIRE(words(solver.order_domain_values(0, assignment)) ==
                std::vector<std::string>{"CAT", "TIE", "ART"});
    }

    SECTION("assigned neighbors are ignored") {
        solver.domains()[1].remove(puzzle.find_word("ART"));
        assignment.assign(1, puzzle.find_word("TIE"));
        REQUIRE(words(solver.order_domain_values(0, assignment)) ==
                std::vector<std::string>{"ART", "CAT", "TIE"});
    }
}

// ============================================================================
// solve
// ============================================================================

TEST_CASE("solve a single slot", "[search][solve]") {
    Puzzle puzzle(grid({"___"}), {"CAT", "DOG", "ABC", "HORSE"});
    Solver solver(puzzle);

    auto result = solver.solve();
    REQUIRE(result.has_value());
    REQUIRE(result->size() == 1);

    const std::string& word = result->at(Slot{0, 0, Direction::Across, 3});
    REQUIRE(word.size() == 3);
    REQUIRE((word == "CAT" || word == "DOG" || word == "ABC"));
}

TEST_CASE("solve two crossing slots", "[search][solve]") {
    Puzzle puzzle(grid(CROSSING), {"CAT", "ART", "TIE"});
    Solver solver(puzzle);

    auto result = solver.solve();
    REQUIRE(result.has_value());
    require_valid_solution(puzzle, *result);
    REQUIRE(result->at(Slot{0, 0, Direction::Across, 3}) == "CAT");
    REQUIRE(result->at(Slot{0, 1, Direction::Down, 3}) == "ART");
}

TEST_CASE("solve reports no solution when slots need the same word", "[search][solve]") {
    Puzzle puzzle(grid({"___", "###", "___"}), {"CAT", "DOGS"});
    Solver solver(puzzle);

    auto result = solver.solve();
    REQUIRE(!result.has_value());
    // AC-3 は成功し、探索で失敗する
    REQUIRE(solver.stats().assignments > 0);
}

TEST_CASE("solve reports no solution when AC-3 fails", "[search][solve]") {
    Puzzle puzzle(grid(CROSSING), {"CAT", "DOG"});
    Solver solver(puzzle);

    REQUIRE(!solver.solve().has_value());
    REQUIRE(solver.domains().has_empty());
    REQUIRE(solver.stats().assignments == 0);
}

TEST_CASE("solve a puzzle without slots", "[search][solve]") {
    Puzzle puzzle(grid({"_#", "#_"}), {"CAT"});
    Solver solver(puzzle);

    auto result = solver.solve();
    REQUIRE(result.has_value());
    REQUIRE(result->empty());
}

TEST_CASE("solve a four slot puzzle", "[search][solve]") {
    Puzzle puzzle(grid(FOUR_SLOTS), FOUR_SLOT_WORDS);

    SECTION("without inference") {
        Solver solver(puzzle);
        auto result = solver.solve();
        REQUIRE(result.has_value());
        require_valid_solution(puzzle, *result);
        REQUIRE(result->at(puzzle.slot(0)) == "CRANE");
        REQUIRE(result->at(puzzle.slot(1)) == "CAT");
        // EASY は横で使うので縦は TINY
        REQUIRE(result->at(puzzle.slot(2)) == "TINY");
        REQUIRE(result->at(puzzle.slot(3)) == "EASY");
    }

    SECTION("with inference") {
        Solver solver(puzzle);
        solver.set_inference(true);
        auto result = solver.solve();
        REQUIRE(result.has_value());
        require_valid_solution(puzzle, *result);
        REQUIRE(result->at(puzzle.slot(2)) == "TINY");
    }
}

TEST_CASE("solve is deterministic", "[search][solve]") {
    // 解が複数ある語彙
    Puzzle puzzle(grid(FOUR_SLOTS), {
        "CRANE", "CHAIR", "SHEEP", "STORE",
        "CAT", "COW", "SUN", "SKY",
        "EASY", "ROSE", "RAIN", "PLAY", "TINY", "NOSE", "EYES", "RUNS",
    });

    Solver first(puzzle);
    Solver second(puzzle);
    auto a = first.solve();
    auto b = second.solve();

    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(*a == *b);
    require_valid_solution(puzzle, *a);

    // 同じソルバーで解き直しても同じ結果
    auto c = first.solve();
    REQUIRE(a == c);
}

TEST_CASE("inference does not change solvability", "[search][solve][inference]") {
    SECTION("unsatisfiable stays unsatisfiable and domains are restored") {
        Puzzle puzzle(grid({"___", "###", "___"}), {"CAT", "DOGS"});
        Solver solver(puzzle);
        solver.set_inference(true);

        REQUIRE(!solver.solve().has_value());
        // 探索中の削除は全て取り消されている
        REQUIRE(solver.domains()[0].size() == 1);
        REQUIRE(solver.domains()[1].size() == 1);
    }

    SECTION("search with inference never tries more assignments") {
        Puzzle puzzle(grid(FOUR_SLOTS), FOUR_SLOT_WORDS);
        Solver plain(puzzle);
        Solver inferring(puzzle);
        inferring.set_inference(true);

        REQUIRE(plain.solve().has_value());
        REQUIRE(inferring.solve().has_value());
        REQUIRE(inferring.stats().assignments <= plain.stats().assignments);
    }
}

TEST_CASE("solve agrees with exhaustive search on small grids", "[search][solve]") {
    std::mt19937 rng(12345);

    for (int trial = 0; trial < 300; ++trial) {
        Puzzle puzzle = random_puzzle(rng);
        std::vector<size_t> chosen(puzzle.slot_count(), 0);
        const bool expected = exhaustive_solvable(puzzle, chosen, 0);

        for (bool inference : {false, true}) {
            Solver solver(puzzle);
            solver.set_inference(inference);
            auto result = solver.solve();

            REQUIRE(result.has_value() == expected);
            if (result) {
                require_valid_solution(puzzle, *result);
            }
        }
    }
}
