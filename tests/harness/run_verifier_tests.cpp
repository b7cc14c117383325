#include <olympiac/lex/Lexer.hpp>
#include <olympiac/parse/Parser.hpp>
#include <olympiac/verify/Verifier.hpp>
#include <olympiac/diag/Render.hpp>
#include <olympiac/text/SourceManager.hpp>

#include <iostream>
#include <string>
#include <vector>


namespace {

    using olympiac::ast::NodeId;
    using olympiac::ast::NodeKind;
    using olympiac::diag::Code;
    namespace ty = olympiac::ty;

    struct Run {
        std::string src;
        std::vector<olympiac::Token> tokens;
        olympiac::ast::AstArena ast;
        olympiac::diag::Bag bag;
        NodeId root = olympiac::ast::k_invalid_node;
        olympiac::verify::VerifyResult res;
    };

    static void run_(Run& r, std::string src) {
        r.src = std::move(src);
        olympiac::Lexer lx(r.src, /*file_id=*/1, &r.bag);
        r.tokens = lx.lex_all();

        olympiac::Parser parser(r.tokens, r.ast, &r.bag);
        r.root = parser.parse_program();

        olympiac::verify::Verifier v(r.ast, r.bag);
        r.res = v.verify(r.root);
    }

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static uint32_t count_(const olympiac::verify::VerifyResult& res, Code c) {
        uint32_t n = 0;
        for (const auto& d : res.errors) {
            if (d.code() == c) ++n;
        }
        return n;
    }

    static void dump_errors_(const olympiac::verify::VerifyResult& res) {
        for (const auto& d : res.errors) {
            std::cerr << "    " << olympiac::diag::code_name(d.code()) << " line " << d.line() << ": "
                      << olympiac::diag::render_message(d, olympiac::diag::Language::kEn) << "\n";
        }
    }

    static NodeId find_first_(const olympiac::ast::AstArena& ast, NodeKind k) {
        for (NodeId i = 0; i < ast.size(); ++i) {
            if (ast.node(i).kind == k) return i;
        }
        return olympiac::ast::k_invalid_node;
    }

    static bool test_declared_athlete_narrated_clean() {
        Run r;
        run_(r, "Deportista A 1 2 3 Futbol P\nnarrar(A)\n");

        bool ok = true;
        ok &= require_(r.res.ok && r.res.errors.empty(), "program must verify clean");
        if (!ok) dump_errors_(r.res);

        const NodeId nar = find_first_(r.ast, NodeKind::kNarrate);
        if (nar == olympiac::ast::k_invalid_node) return require_(false, "Narrate produced");
        const auto& d = r.res.decorations[nar];
        ok &= require_(d.visited, "narrate decorated");
        ok &= require_(d.arg_types.size() == 1 && d.arg_types[0] == ty::entity("Deportista"),
                       "argument type comes from the table");

        const NodeId decl = find_first_(r.ast, NodeKind::kAthleteDecl);
        ok &= require_(r.res.decorations[decl].definition == "A", "declaration decorated with the athlete name");
        ok &= require_(r.res.decorations[decl].ref.has_value()
                    && r.res.decorations[decl].ref->name == "A", "declaration carries its table entry");
        ok &= require_(r.res.snapshots.size() == 1, "one snapshot per successful declaration");
        return ok;
    }

    static bool test_use_before_declaration() {
        Run r;
        run_(r, "narrar(X)\nDeportista X 1 2 3 Futbol P\n");

        bool ok = true;
        ok &= require_(r.res.errors.size() == 1, "exactly one semantic error");
        ok &= require_(count_(r.res, Code::kUndeclaredName) == 1, "error is use-before-declaration");
        ok &= require_(!r.res.ok, "result not ok");
        if (!r.res.errors.empty()) {
            ok &= require_(r.res.errors[0].line() == 1, "reported on the use line");
        }
        return ok;
    }

    static bool test_duplicate_same_scope() {
        Run r;
        run_(r, "Deportista A 1 2 3 F P\nDeportista A 4 5 6 G Q\n");

        bool ok = true;
        ok &= require_(count_(r.res, Code::kDuplicateDecl) == 1, "second declaration is a duplicate");
        if (!r.res.errors.empty()) {
            const auto& args = r.res.errors[0].args();
            ok &= require_(args.size() == 2 && args[0] == "A" && args[1] == "0", "duplicate names the level");
            ok &= require_(r.res.errors[0].line() == 2, "reported on the second declaration");
        }
        ok &= require_(r.res.table.symbols().size() == 1, "first entry kept");
        return ok;
    }

    static bool test_nested_redeclaration_shadows() {
        Run r;
        run_(r,
            "Deportista A 1 2 3 F P\n"
            "si 1 == 1 entonces {\n"
            "  Deportista A 4 5 6 G Q\n"
            "} endif\n");

        bool ok = true;
        ok &= require_(r.res.errors.empty(), "redeclaration in inner scope is allowed");
        ok &= require_(r.res.table.shadowings().size() == 1, "shadowing recorded");
        if (!ok) dump_errors_(r.res);
        return ok;
    }

    static bool test_scope_ends_with_block() {
        Run r;
        run_(r,
            "si 1 == 1 entonces {\n"
            "  Deportista B 1 2 3 F P\n"
            "  narrar(B)\n"
            "} endif\n"
            "narrar(B)\n");

        bool ok = true;
        ok &= require_(count_(r.res, Code::kUndeclaredName) == 1, "only the use after the block fails");
        if (!r.res.errors.empty()) {
            ok &= require_(r.res.errors[0].line() == 5, "failure is on the outer use");
        }

        ok &= require_(r.res.scope_trace.size() == 2, "one enter and one exit");
        if (r.res.scope_trace.size() == 2) {
            ok &= require_(r.res.scope_trace[0].kind == olympiac::verify::ScopeEventKind::kEnter
                        && r.res.scope_trace[0].level == 1, "enter level 1");
            ok &= require_(r.res.scope_trace[1].kind == olympiac::verify::ScopeEventKind::kExit
                        && r.res.scope_trace[1].level == 1, "exit level 1");
        }

        // 블록 안 선언 시점의 스냅샷은 두 스코프를 모두 보여 준다
        ok &= require_(r.res.snapshots.size() == 1 && r.res.snapshots[0].table.size() == 2,
                       "snapshot taken inside the block sees both scopes");
        return ok;
    }

    static bool test_else_shares_conditional_scope() {
        Run r;
        run_(r,
            "si 1 == 1 entonces {\n"
            "  Deportista C 1 2 3 F P\n"
            "} sino {\n"
            "  narrar(C)\n"
            "} endif\n");

        bool ok = true;
        ok &= require_(r.res.errors.empty(), "else branch sees declarations of the same conditional");
        ok &= require_(r.res.scope_trace.size() == 2, "else opens no scope of its own");
        if (!ok) dump_errors_(r.res);
        return ok;
    }

    static bool test_text_plus_number() {
        Run r;
        run_(r, "Repetir ( \"uno\" + 1 ) [ ] FinRep\n");

        bool ok = true;
        ok &= require_(count_(r.res, Code::kAddTextAndNumber) == 1, "text + number is rejected");
        ok &= require_(r.res.errors.size() == 1, "no other errors");

        const NodeId bin = find_first_(r.ast, NodeKind::kBinaryOp);
        if (bin == olympiac::ast::k_invalid_node) return require_(false, "BinaryOp produced");
        const auto& d = r.res.decorations[bin];
        ok &= require_(d.type.is_unknown(), "result type is unknown");
        ok &= require_(d.lhs.is_string() && d.rhs.is_int(), "operand types recorded");
        return ok;
    }

    static bool test_arithmetic_types() {
        Run r;
        run_(r, "Repetir ( 2 * 3 + 1 ) [ ] FinRep\nRepetir ( \"a\" + \"b\" ) [ ] FinRep\n");

        bool ok = true;
        ok &= require_(r.res.errors.empty(), "well-typed expressions");

        std::vector<NodeId> bins;
        for (NodeId i = 0; i < r.ast.size(); ++i) {
            if (r.ast.node(i).kind == NodeKind::kBinaryOp) bins.push_back(i);
        }
        ok &= require_(bins.size() == 3, "three binary nodes");
        if (bins.size() == 3) {
            ok &= require_(r.res.decorations[bins[0]].type.is_int(), "2 * 3 is int");
            ok &= require_(r.res.decorations[bins[1]].type.is_int(), "(2 * 3) + 1 is int");
            ok &= require_(r.res.decorations[bins[2]].type.is_string(), "text + text is text");
        }
        return ok;
    }

    static bool test_comparar_rules() {
        Run r;
        run_(r,
            "Deportista A 1 2 3 F P\n"
            "Deportista B 4 5 6 F P\n"
            "Comparar(A, B)\n"
            "Comparar(A)\n"
            "Comparar(A, 5)\n");

        bool ok = true;
        ok &= require_(count_(r.res, Code::kArityMismatch) == 1, "single argument call is an arity error");
        ok &= require_(count_(r.res, Code::kArgNotEntity) == 1, "number argument is rejected");
        ok &= require_(r.res.errors.size() == 2, "valid call adds nothing");

        for (const auto& d : r.res.errors) {
            if (d.code() == Code::kArgNotEntity) {
                ok &= require_(d.line() == 5 && d.args()[0] == "2" && d.args()[1] == "int", "argument position and type");
            }
        }

        const NodeId call = find_first_(r.ast, NodeKind::kInvocation);
        if (call != olympiac::ast::k_invalid_node) {
            ok &= require_(r.res.decorations[call].type.is_int(), "comparar returns int");
        }
        return ok;
    }

    static bool test_comparar_undeclared_reports_once() {
        Run r;
        run_(r, "Comparar(Z, Y)\n");

        bool ok = true;
        ok &= require_(count_(r.res, Code::kUndeclaredName) == 2, "each undeclared argument reported");
        ok &= require_(count_(r.res, Code::kArgNotEntity) == 0, "no entity complaint on top");
        return ok;
    }

    static bool test_input_args_not_resolved() {
        Run r;
        run_(r, "input(valor)\ninput(a, b)\n");

        bool ok = true;
        ok &= require_(count_(r.res, Code::kUndeclaredName) == 0, "input arguments are not looked up");
        ok &= require_(count_(r.res, Code::kArityMismatch) == 1, "input takes exactly one argument");
        return ok;
    }

    static bool test_free_result_slots() {
        Run r;
        run_(r, "Resultado 3 -\nResultado - 4\n");

        bool ok = true;
        ok &= require_(count_(r.res, Code::kResultMissingSecond) == 1, "missing second number");
        ok &= require_(count_(r.res, Code::kResultMissingFirst) == 1, "missing first number");

        const NodeId res = find_first_(r.ast, NodeKind::kResult);
        if (res != olympiac::ast::k_invalid_node) {
            ok &= require_(!r.res.decorations[res].complete, "incomplete result decoration");
        }
        return ok;
    }

    static bool test_result_inside_competition() {
        Run r;
        run_(r, "InicioCarrera\nResultado 1\nfinCarr\n");

        bool ok = true;
        ok &= require_(count_(r.res, Code::kCompetitionResultIncomplete) == 1, "incomplete result reported by the block");
        ok &= require_(count_(r.res, Code::kResultMissingSecond) == 0, "no slot-level error inside a block");
        for (const auto& d : r.res.errors) {
            if (d.code() == Code::kCompetitionResultIncomplete) {
                ok &= require_(d.args().size() == 2 && d.args()[0] == "InicioCarrera"
                            && d.args()[1] == "second number", "names the block and the slot");
            }
        }
        return ok;
    }

    static bool test_match_rules() {
        bool ok = true;
        {
            Run r;
            run_(r, "Brasil vs Peru\nempate\nResultado 1 - 1\nfinact\n");
            ok &= require_(r.res.errors.empty(), "complete match is clean");
        }
        {
            Run r;
            run_(r, "Brasil vs Peru\nfinact\n");
            ok &= require_(count_(r.res, Code::kCompetitionMissingResult) == 1, "match without result");
            ok &= require_(r.bag.count_code(Code::kMissingResult) == 1, "parser also flags it");
        }
        {
            Run r;
            run_(r, "Brasil vs\nResultado 1 - 0\nfinact\n");
            ok &= require_(count_(r.res, Code::kMatchMissingCountry) == 1, "missing away country");
            if (!r.res.errors.empty()) {
                ok &= require_(r.res.errors[0].args()[0] == "away", "names the missing side");
            }
        }
        return ok;
    }

    static bool test_block_rules() {
        bool ok = true;
        {
            Run r;
            run_(r, "InicioCarrera\nResultado 1 - 0\n");
            ok &= require_(count_(r.res, Code::kCompetitionUnterminated) == 1, "unterminated race");
        }
        {
            Run r;
            run_(r, "InicioRutina\nResultado 1 - 0\nResultado 2 - 0\nfinRuti\n");
            ok &= require_(count_(r.res, Code::kCompetitionMultipleResults) == 1, "two results in one routine");
            if (!r.res.errors.empty()) {
                ok &= require_(r.res.errors[0].args()[1] == "2", "reports the result count");
            }
        }
        return ok;
    }

    static bool test_list_method_call() {
        Run r;
        run_(r, "Lista Deportista equipo\nequipo . agregar\n");

        bool ok = true;
        ok &= require_(r.res.errors.empty(), "method on a list is not a name lookup");
        if (!ok) dump_errors_(r.res);

        NodeId method = olympiac::ast::k_invalid_node;
        for (NodeId i = 0; i < r.ast.size(); ++i) {
            const auto& n = r.ast.node(i);
            if (n.kind == NodeKind::kIdentifier && n.text == "agregar") method = i;
        }
        if (method == olympiac::ast::k_invalid_node) return require_(false, "method identifier produced");
        ok &= require_(r.res.decorations[method].method_of == "equipo", "method owner recorded");

        const NodeId decl = find_first_(r.ast, NodeKind::kListDecl);
        ok &= require_(r.res.decorations[decl].type == ty::list("Deportista"), "list type");
        return ok;
    }

    static bool test_bulk_load_declares_nothing() {
        Run r;
        run_(r, "Lista Deportista X 1 2 3 Sport Country\nnarrar(X)\n");

        bool ok = true;
        ok &= require_(count_(r.res, Code::kUndeclaredName) == 1, "loaded athletes are not named symbols");
        const NodeId bulk = find_first_(r.ast, NodeKind::kBulkLoad);
        if (bulk != olympiac::ast::k_invalid_node) {
            ok &= require_(r.res.decorations[bulk].count == 1, "bulk load count");
            ok &= require_(r.res.decorations[bulk].type == ty::list("Deportista"), "bulk load type");
            ok &= require_(r.res.decorations[bulk].definition.empty(), "bulk load names no definition");
        }
        return ok;
    }

    static bool test_syntax_error_node_is_silent() {
        Run r;
        run_(r, "Deportista Ana 1 2 Futbol Chile\n");

        bool ok = true;
        ok &= require_(r.bag.count_code(Code::kIncompleteAthleteDecl) == 1, "parser reports the broken declaration");
        ok &= require_(r.res.errors.empty(), "verifier adds nothing for an error node");
        ok &= require_(!r.res.table.lookup("Ana").has_value(), "broken declaration declares nothing");
        return ok;
    }

    static bool test_long_binary_chain_does_not_overflow() {
        std::string src = "si 1";
        src.reserve(400100);
        for (int i = 0; i < 100000; ++i) src += " + 1";
        src += " entonces {\n narrar(\"ok\")\n} endif\n";

        Run r;
        run_(r, src);

        bool ok = true;
        ok &= require_(r.bag.count_code(Code::kNestingTooDeep) == 1, "overlong chain reported as nesting");
        ok &= require_(r.res.errors.empty(), "no semantic errors from the bounded chain");
        const NodeId c = find_first_(r.ast, NodeKind::kConditional);
        ok &= require_(c != olympiac::ast::k_invalid_node && r.res.decorations[c].visited, "conditional decorated");
        const NodeId nar = find_first_(r.ast, NodeKind::kNarrate);
        ok &= require_(nar != olympiac::ast::k_invalid_node && r.res.decorations[nar].visited, "body still verified");
        if (!ok) dump_errors_(r.res);
        return ok;
    }

    static bool test_oversized_result_score_is_present() {
        Run r;
        run_(r, "Resultado 99999999999999999999 - 1\n");

        bool ok = true;
        ok &= require_(r.bag.count_code(Code::kIntOutOfRange) == 1, "literal reported as out of range");
        ok &= require_(count_(r.res, Code::kResultMissingFirst) == 0, "score is not reported missing");
        const NodeId res = find_first_(r.ast, NodeKind::kResult);
        ok &= require_(res != olympiac::ast::k_invalid_node && r.res.decorations[res].complete, "result complete");
        if (!ok) dump_errors_(r.res);
        return ok;
    }

    static bool test_verify_is_independent_per_call() {
        const std::string src = "narrar(X)\nDeportista X 1 2 3 F P\n";
        std::vector<olympiac::Token> tokens;
        olympiac::ast::AstArena ast;
        {
            olympiac::Lexer lx(src, 1);
            tokens = lx.lex_all();
        }
        olympiac::Parser parser(tokens, ast);
        const NodeId root = parser.parse_program();

        olympiac::verify::Verifier v(ast);
        const auto first = v.verify(root);
        const auto second = v.verify(root);

        bool ok = true;
        ok &= require_(first.errors.size() == 1 && second.errors.size() == 1, "same result on every call");
        ok &= require_(second.table.symbols().size() == 1, "table rebuilt from scratch");

        const auto empty = v.verify(olympiac::ast::k_invalid_node);
        ok &= require_(empty.ok && empty.errors.empty(), "invalid root verifies trivially");
        return ok;
    }

    static bool test_render_languages() {
        Run r;
        run_(r, "narrar(X)\n");
        if (r.res.errors.empty()) return require_(false, "error produced");

        const auto& d = r.res.errors[0];
        bool ok = true;
        ok &= require_(olympiac::diag::render_message(d, olympiac::diag::Language::kEn)
                       == "identifier 'X' used before being declared", "english message");
        ok &= require_(olympiac::diag::render_message(d, olympiac::diag::Language::kEs)
                       == "Identificador 'X' usado antes de ser declarado.", "spanish message");

        olympiac::SourceManager sm;
        const uint32_t fid = sm.add("t.oly", r.src);
        ok &= require_(fid == 1, "first file id");
        const std::string text = olympiac::diag::render_one(d, olympiac::diag::Language::kEn, sm);
        ok &= require_(text.find("error[UndeclaredName]") != std::string::npos, "header line");
        ok &= require_(text.find(" --> t.oly:1:8") != std::string::npos, "location line");
        ok &= require_(text.find("narrar(X)") != std::string::npos, "source line");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"declared_athlete_narrated_clean", test_declared_athlete_narrated_clean},
        {"use_before_declaration", test_use_before_declaration},
        {"duplicate_same_scope", test_duplicate_same_scope},
        {"nested_redeclaration_shadows", test_nested_redeclaration_shadows},
        {"scope_ends_with_block", test_scope_ends_with_block},
        {"else_shares_conditional_scope", test_else_shares_conditional_scope},
        {"text_plus_number", test_text_plus_number},
        {"arithmetic_types", test_arithmetic_types},
        {"comparar_rules", test_comparar_rules},
        {"comparar_undeclared_reports_once", test_comparar_undeclared_reports_once},
        {"input_args_not_resolved", test_input_args_not_resolved},
        {"free_result_slots", test_free_result_slots},
        {"result_inside_competition", test_result_inside_competition},
        {"match_rules", test_match_rules},
        {"block_rules", test_block_rules},
        {"list_method_call", test_list_method_call},
        {"bulk_load_declares_nothing", test_bulk_load_declares_nothing},
        {"syntax_error_node_is_silent", test_syntax_error_node_is_silent},
        {"long_binary_chain_does_not_overflow", test_long_binary_chain_does_not_overflow},
        {"oversized_result_score_is_present", test_oversized_result_score_is_present},
        {"verify_is_independent_per_call", test_verify_is_independent_per_call},
        {"render_languages", test_render_languages},
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
