//! # Debug Commands
//!
//! Print the output of each front-end stage to stdout. Errors go to stderr
//! as `Error: <message>` with exit code 1.

#include "cmd_debug.hpp"

#include "codegen/codegen.hpp"
#include "lexer/lexer.hpp"
#include "parser/parser.hpp"
#include "utils.hpp"

#include <iostream>

namespace wolf::cli {

int run_lex(const std::string& path) {
    auto source = load_source(path);
    if (!source) {
        return 1;
    }

    lexer::Lexer lex(*source);
    while (true) {
        auto next = lex.next_token();
        if (is_err(next)) {
            print_error(unwrap_err(next).message);
            return 1;
        }

        const auto& token = unwrap(next);
        std::cout << token.line() << ":" << token.column() << " "
                  << lexer::token_kind_name(token.kind);
        if (token.is(lexer::TokenKind::Identifier) || token.is(lexer::TokenKind::IntLiteral)) {
            std::cout << " `" << token.lexeme << "`";
        }
        std::cout << "\n";

        if (token.is_eof()) {
            break;
        }
    }
    return 0;
}

int run_parse(const std::string& path) {
    auto source = load_source(path);
    if (!source) {
        return 1;
    }

    auto program = parser::parse_source(*source);
    if (is_err(program)) {
        print_error(parser::frontend_error_message(unwrap_err(program)));
        return 1;
    }

    parser::AstPrinter printer;
    std::cout << printer.print(unwrap(program));
    return 0;
}

int run_ir(const std::string& path) {
    auto source = load_source(path);
    if (!source) {
        return 1;
    }

    auto program = parser::parse_source(*source);
    if (is_err(program)) {
        print_error(parser::frontend_error_message(unwrap_err(program)));
        return 1;
    }

    auto func = codegen::lower_program(unwrap(program));
    if (is_err(func)) {
        print_error(unwrap_err(func).message);
        return 1;
    }

    ir::IrPrinter printer;
    std::cout << printer.print_function(unwrap(func));

    auto llvm_ir = codegen::render_llvm_ir(unwrap(program));
    if (is_err(llvm_ir)) {
        print_error(unwrap_err(llvm_ir).message);
        return 1;
    }
    std::cout << "\n" << unwrap(llvm_ir);
    return 0;
}

} // namespace wolf::cli
