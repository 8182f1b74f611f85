/**
 * @file structure_scanner.hpp
 * @brief 盤面構造パーサー（flex/bison）の関数宣言
 */
#ifndef CROSSWORD_CSP_STRUCTURE_SCANNER_HPP
#define CROSSWORD_CSP_STRUCTURE_SCANNER_HPP

#include <cstdio>

// Forward declarations for flex/bison
typedef void* yyscan_t;
struct ParserContext;

// Flex functions
int yylex_init(yyscan_t* scanner);
int yylex_destroy(yyscan_t scanner);
void yyset_in(FILE* in, yyscan_t scanner);
struct yy_buffer_state;
typedef struct yy_buffer_state* YY_BUFFER_STATE;
YY_BUFFER_STATE yy_scan_string(const char* str, yyscan_t scanner);
void yy_delete_buffer(YY_BUFFER_STATE buffer, yyscan_t scanner);

// Bison function
int yyparse(yyscan_t scanner, ParserContext* ctx);

#endif // CROSSWORD_CSP_STRUCTURE_SCANNER_HPP
