#include <olympiac/lex/Lexer.hpp>
#include <olympiac/diag/Diagnostic.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace {

    using olympiac::syntax::TokenKind;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static bool expect_kinds_(const std::vector<olympiac::Token>& toks, const std::vector<TokenKind>& kinds) {
        if (toks.size() != kinds.size()) {
            std::cerr << "  - token count mismatch: got " << toks.size() << ", expected " << kinds.size() << "\n";
            return false;
        }
        for (size_t i = 0; i < kinds.size(); ++i) {
            if (toks[i].kind != kinds[i]) {
                std::cerr << "  - token[" << i << "] '" << toks[i].lexeme << "' is "
                          << olympiac::syntax::token_kind_name(toks[i].kind) << ", expected "
                          << olympiac::syntax::token_kind_name(kinds[i]) << "\n";
                return false;
            }
        }
        return true;
    }

    static bool test_athlete_line_categories() {
        const std::string src = "Deportista Ana 10 20 30 Atletismo Chile";
        olympiac::diag::Bag bag;
        olympiac::Lexer lx(src, 1, &bag);
        const auto toks = lx.lex_all();

        bool ok = true;
        ok &= expect_kinds_(toks, {
            TokenKind::kEntityDecl, TokenKind::kIdent,
            TokenKind::kIntLit, TokenKind::kIntLit, TokenKind::kIntLit,
            TokenKind::kIdent, TokenKind::kIdent,
        });
        ok &= require_(!bag.has_error(), "plain athlete line must lex cleanly");
        if (toks.size() == 7) {
            ok &= require_(toks[1].lexeme == "Ana", "identifier lexeme must be the name");
            ok &= require_(toks[2].span.line == 1 && toks[2].span.col == 16, "first stat must be at 1:16");
            ok &= require_(toks[6].span.len == 5, "span length must be the byte length");
        }
        return ok;
    }

    static bool test_call_token_requires_adjacent_paren() {
        const std::string src = "narrar(Ana)\nnarrar (Ana)\nComparar(A, B)\ninput(x)";
        olympiac::Lexer lx(src, 1);
        const auto toks = lx.lex_all();

        bool ok = true;
        ok &= expect_kinds_(toks, {
            TokenKind::kFuncCall, TokenKind::kIdent, TokenKind::kPunct,
            TokenKind::kIdent, TokenKind::kPunct, TokenKind::kIdent, TokenKind::kPunct,
            TokenKind::kFuncCall, TokenKind::kIdent, TokenKind::kPunct, TokenKind::kIdent, TokenKind::kPunct,
            TokenKind::kFuncCall, TokenKind::kIdent, TokenKind::kPunct,
        });
        if (toks.size() == 15) {
            ok &= require_(toks[0].lexeme == "narrar(", "call token must include the open paren");
            ok &= require_(toks[3].lexeme == "narrar", "detached call word must stay an identifier");
            ok &= require_(toks[3].span.line == 2, "second line must be tracked");
            ok &= require_(toks[7].lexeme == "Comparar(", "Comparar( must be a call token");
        }
        return ok;
    }

    static bool test_keywords_are_case_sensitive() {
        const std::string src = "si SI entonces Repetir repetir FinRep vs True False empate listaRes InicioCarrera finCarr";
        olympiac::Lexer lx(src, 1);
        const auto toks = lx.lex_all();

        return expect_kinds_(toks, {
            TokenKind::kControlFlow, TokenKind::kIdent, TokenKind::kControlFlow,
            TokenKind::kControlFlow, TokenKind::kIdent, TokenKind::kControlFlow,
            TokenKind::kSpecialOp, TokenKind::kBoolLit, TokenKind::kBoolLit,
            TokenKind::kTieMarker, TokenKind::kResultMarker,
            TokenKind::kDomainKeyword, TokenKind::kDomainKeyword,
        });
    }

    static bool test_operators_and_punct() {
        const std::string src = "a == b != c <= d >= e < f > g + - * / % ( ) , : { } [ ] .";
        olympiac::Lexer lx(src, 1);
        const auto toks = lx.lex_all();

        bool ok = true;
        ok &= expect_kinds_(toks, {
            TokenKind::kIdent, TokenKind::kCompareOp, TokenKind::kIdent, TokenKind::kCompareOp,
            TokenKind::kIdent, TokenKind::kCompareOp, TokenKind::kIdent, TokenKind::kCompareOp,
            TokenKind::kIdent, TokenKind::kCompareOp, TokenKind::kIdent, TokenKind::kCompareOp,
            TokenKind::kIdent,
            TokenKind::kArithOp, TokenKind::kArithOp, TokenKind::kArithOp, TokenKind::kArithOp, TokenKind::kArithOp,
            TokenKind::kPunct, TokenKind::kPunct, TokenKind::kPunct, TokenKind::kPunct,
            TokenKind::kPunct, TokenKind::kPunct, TokenKind::kPunct, TokenKind::kPunct, TokenKind::kPunct,
        });
        if (toks.size() > 5) {
            ok &= require_(toks[1].lexeme == "==", "'==' must be one token");
            ok &= require_(toks[5].lexeme == "<=", "'<=' must be one token");
        }
        return ok;
    }

    static bool test_comment_runs_to_end_of_line() {
        const std::string src = "; hola mundo\nnarrar(x) ; otro\n";
        olympiac::Lexer lx(src, 1);
        const auto toks = lx.lex_all();

        bool ok = true;
        ok &= expect_kinds_(toks, {
            TokenKind::kComment,
            TokenKind::kFuncCall, TokenKind::kIdent, TokenKind::kPunct,
            TokenKind::kComment,
        });
        if (toks.size() == 5) {
            ok &= require_(toks[0].lexeme == "; hola mundo", "comment lexeme must exclude the newline");
            ok &= require_(toks[4].span.line == 2 && toks[4].span.col == 11, "trailing comment position");
        }
        return ok;
    }

    static bool test_quoted_text_is_identifier_class() {
        const std::string src = "narrar(\"hola mundo\")";
        olympiac::Lexer lx(src, 1);
        const auto toks = lx.lex_all();

        bool ok = true;
        ok &= expect_kinds_(toks, {TokenKind::kFuncCall, TokenKind::kIdent, TokenKind::kPunct});
        if (toks.size() == 3) {
            ok &= require_(toks[1].lexeme == "\"hola mundo\"", "quoted text keeps its quotes");
        }
        return ok;
    }

    static bool test_unterminated_text_reported() {
        const std::string src = "narrar(\"sin cierre\nnarrar(x)";
        olympiac::diag::Bag bag;
        olympiac::Lexer lx(src, 1, &bag);
        const auto toks = lx.lex_all();

        bool ok = true;
        ok &= require_(bag.count_code(olympiac::diag::Code::kLexUnterminatedText) == 1,
                       "unterminated text must be reported once");
        ok &= require_(!toks.empty() && toks.back().lexeme == ")", "lexing must continue on the next line");
        return ok;
    }

    static bool test_unknown_char_skipped() {
        const std::string src = "Deportista @ Ana # 1";
        olympiac::diag::Bag bag;
        olympiac::Lexer lx(src, 1, &bag);
        const auto toks = lx.lex_all();

        bool ok = true;
        ok &= require_(bag.count_code(olympiac::diag::Code::kLexUnknownChar) == 2, "each unknown byte is reported");
        ok &= expect_kinds_(toks, {TokenKind::kEntityDecl, TokenKind::kIdent, TokenKind::kIntLit});
        if (!bag.diags().empty()) {
            ok &= require_(bag.diags()[0].args().size() == 1 && bag.diags()[0].args()[0] == "@",
                           "unknown char diagnostic carries the byte");
        }
        return ok;
    }

    static bool test_empty_source() {
        olympiac::Lexer lx("", 1);
        return require_(lx.lex_all().empty(), "empty source yields no tokens");
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"athlete_line_categories", test_athlete_line_categories},
        {"call_token_requires_adjacent_paren", test_call_token_requires_adjacent_paren},
        {"keywords_are_case_sensitive", test_keywords_are_case_sensitive},
        {"operators_and_punct", test_operators_and_punct},
        {"comment_runs_to_end_of_line", test_comment_runs_to_end_of_line},
        {"quoted_text_is_identifier_class", test_quoted_text_is_identifier_class},
        {"unterminated_text_reported", test_unterminated_text_reported},
        {"unknown_char_skipped", test_unknown_char_skipped},
        {"empty_source", test_empty_source},
    };

    int failed = 0;
    for (const auto& c : cases) {
        std::cout << "[TEST] " << c.name << "\n";
        if (!c.fn()) {
            ++failed;
            std::cout << "  -> FAIL\n";
        } else {
            std::cout << "  -> PASS\n";
        }
    }

    if (failed != 0) {
        std::cout << "\nFAILED " << failed << " test(s)\n";
        return 1;
    }
    std::cout << "\nALL TESTS PASSED\n";
    return 0;
}
