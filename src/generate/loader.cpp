#include "crossword_csp/generate/loader.hpp"
#include "structure_scanner.hpp"
#include "parser.hpp"
#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace crossword_csp {
namespace generate {

namespace {

std::vector<std::vector<bool>> finish(ParserContext& ctx, int result) {
    if (result != 0 || ctx.has_error) {
        throw std::runtime_error("Parse error: " + ctx.error_message);
    }
    size_t width = 0;
    for (const auto& row : ctx.rows) {
        if (row.size() > width) width = row.size();
    }
    if (ctx.rows.empty() || width == 0) {
        throw std::runtime_error("Parse error: empty structure");
    }
    return std::move(ctx.rows);
}

}  // namespace

std::vector<std::vector<bool>> parse_structure_file(const std::string& filename) {
    FILE* file = fopen(filename.c_str(), "r");
    if (!file) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    yyscan_t scanner;
    yylex_init(&scanner);
    yyset_in(file, scanner);

    ParserContext ctx;
    int result = yyparse(scanner, &ctx);

    yylex_destroy(scanner);
    fclose(file);

    return finish(ctx, result);
}

std::vector<std::vector<bool>> parse_structure_string(const std::string& input) {
    yyscan_t scanner;
    yylex_init(&scanner);

    YY_BUFFER_STATE buffer = yy_scan_string(input.c_str(), scanner);

    ParserContext ctx;
    int result = yyparse(scanner, &ctx);

    yy_delete_buffer(buffer, scanner);
    yylex_destroy(scanner);

    return finish(ctx, result);
}

std::vector<std::string> read_words_file(const std::string& filename) {
    std::ifstream in(filename);
    if (!in) {
        throw std::runtime_error("Cannot open file: " + filename);
    }

    std::vector<std::string> words;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            words.push_back(line);
        }
    }
    return words;
}

Puzzle load_puzzle(const std::string& structure_file, const std::string& words_file) {
    auto structure = parse_structure_file(structure_file);
    auto words = read_words_file(words_file);
    return Puzzle(std::move(structure), words);
}

} // namespace generate
} // namespace crossword_csp
