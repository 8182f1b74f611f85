#include "crossword_csp/generate/image.hpp"
#include "crossword_csp/generate/loader.hpp"
#include "crossword_csp/render.hpp"
#include "crossword_csp/solver.hpp"
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " [-s] [-v] [-i] <structure> <words> [output]\n";
    std::cerr << "  -s      Print solver statistics to stderr\n";
    std::cerr << "  -v      Verbose mode (print propagation/search progress)\n";
    std::cerr << "  -i      Maintain arc consistency during search\n";
    std::cerr << "  output  Save the solved grid as an image (e.g. output.png)\n";
}

bool g_print_stats = false;
bool g_verbose = false;
bool g_inference = false;

void print_stats(const crossword_csp::Solver& solver) {
    if (!g_print_stats) return;
    const auto& s = solver.stats();
    std::cerr << "Stats: node_pruned=" << s.node_pruned
              << " revisions=" << s.revise_count
              << " arc_pruned=" << s.arc_pruned
              << " assignments=" << s.assignments
              << " backtracks=" << s.backtracks
              << " max_depth=" << s.max_depth
              << "\n";
}

int main(int argc, char* argv[]) {
    std::vector<const char*> positional;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-s") == 0) {
            g_print_stats = true;
        } else if (std::strcmp(argv[i], "-v") == 0) {
            g_verbose = true;
        } else if (std::strcmp(argv[i], "-i") == 0) {
            g_inference = true;
        } else if (std::strcmp(argv[i], "-h") == 0 ||
                   std::strcmp(argv[i], "--help") == 0) {
            print_usage(argv[0]);
            return 0;
        } else if (argv[i][0] != '-') {
            positional.push_back(argv[i]);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (positional.size() != 2 && positional.size() != 3) {
        print_usage(argv[0]);
        return 1;
    }
    const std::string structure_file = positional[0];
    const std::string words_file = positional[1];
    const std::string output_file = positional.size() == 3 ? positional[2] : "";

    try {
        auto puzzle = crossword_csp::generate::load_puzzle(structure_file, words_file);

        crossword_csp::Solver solver(puzzle);
        solver.set_verbose(g_verbose);
        solver.set_inference(g_inference);

        auto assignment = solver.solve();
        print_stats(solver);

        if (!assignment) {
            std::cout << "No solution.\n";
            return 0;
        }

        crossword_csp::print_grid(std::cout, puzzle, *assignment);
        if (!output_file.empty()) {
            crossword_csp::generate::save_image(puzzle, *assignment, output_file);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
