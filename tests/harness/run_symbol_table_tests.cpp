#include <olympiac/sema/SymbolTable.hpp>
#include <olympiac/ty/Type.hpp>

#include <iostream>
#include <string>
#include <utility>


namespace {

    using olympiac::sema::SymbolTable;
    namespace ty = olympiac::ty;

    static bool require_(bool cond, const char* msg) {
        if (cond) return true;
        std::cerr << "  - " << msg << "\n";
        return false;
    }

    static bool test_global_declare_and_lookup() {
        SymbolTable t;

        bool ok = true;
        ok &= require_(t.current_level() == 0, "fresh table starts at global level");

        const auto r = t.declare("Ana", ty::entity("Deportista"), 0, 3);
        ok &= require_(r.ok && !r.is_duplicate && !r.is_shadowing, "first declaration succeeds");
        ok &= require_(r.level == 0, "declared at global level");

        const auto hit = t.lookup("Ana");
        ok &= require_(hit.has_value(), "lookup finds declared name");
        if (hit) {
            const auto& s = t.symbol(*hit);
            ok &= require_(s.type.to_string() == "entity:Deportista", "type is kept");
            ok &= require_(s.decl_line == 3, "declaration line is kept");
        }
        ok &= require_(!t.lookup("Luis").has_value(), "unknown name misses");
        return ok;
    }

    static bool test_duplicate_in_same_scope_keeps_first() {
        SymbolTable t;
        (void)t.declare("X", ty::entity("Deportista"), 0, 1);
        const auto r = t.declare("X", ty::list("Deportista"), 1, 2);

        bool ok = true;
        ok &= require_(!r.ok && r.is_duplicate, "same-scope redeclaration is a duplicate");
        ok &= require_(t.symbols().size() == 1, "duplicate does not insert");
        const auto hit = t.lookup("X");
        ok &= require_(hit && t.symbol(*hit).decl_line == 1, "first entry is unchanged");
        return ok;
    }

    static bool test_nested_scope_shadows_and_hides() {
        SymbolTable t;
        (void)t.declare("A", ty::entity("Deportista"), 0, 1);

        bool ok = true;
        ok &= require_(t.enter_scope() == 1, "enter returns new level");

        const auto r = t.declare("A", ty::int_(), 1, 4);
        ok &= require_(r.ok && r.is_shadowing, "outer name can be shadowed");
        ok &= require_(t.shadowings().size() == 1 && t.shadowings()[0].line == 4, "shadowing is recorded");

        (void)t.declare("B", ty::string_(), 2, 5);
        const auto inner = t.lookup("A");
        ok &= require_(inner && t.symbol(*inner).scope_level == 1, "inner A wins inside scope");
        ok &= require_(!t.lookup_in_current("Zeta").has_value(), "lookup_in_current misses");

        ok &= require_(t.exit_scope() == 1, "exit returns the level left");
        ok &= require_(t.current_level() == 0, "back at global");

        const auto outer = t.lookup("A");
        ok &= require_(outer && t.symbol(*outer).scope_level == 0, "outer A visible again");
        ok &= require_(!t.lookup("B").has_value(), "inner names vanish with their scope");
        return ok;
    }

    static bool test_exit_global_is_noop() {
        SymbolTable t;
        (void)t.declare("A", ty::int_(), 0, 1);

        bool ok = true;
        ok &= require_(t.exit_scope() == 0, "exiting global reports level 0");
        ok &= require_(t.current_level() == 0, "global is never popped");
        ok &= require_(t.lookup("A").has_value(), "global names survive");
        return ok;
    }

    static bool test_snapshot_is_deep_copy() {
        SymbolTable t;
        (void)t.declare("Ana", ty::entity("Deportista"), 0, 1);
        (void)t.enter_scope();
        (void)t.declare("equipo", ty::list("Deportista"), 1, 2);

        const auto snap = t.snapshot();

        bool ok = true;
        ok &= require_(snap.size() == 2, "one entry per live scope");
        if (snap.size() == 2) {
            ok &= require_(snap[0].level == 0 && snap[0].entries.size() == 1, "global scope");
            ok &= require_(snap[1].level == 1 && snap[1].entries[0].name == "equipo", "nested scope");
            ok &= require_(snap[1].entries[0].type == "list:Deportista", "record type string");
        }

        // 이후 변경은 스냅샷에 영향 없음
        (void)t.declare("extra", ty::int_(), 3, 3);
        (void)t.exit_scope();
        ok &= require_(snap[1].entries.size() == 1, "snapshot does not follow later changes");

        const std::string text = olympiac::sema::to_string(snap);
        ok &= require_(text.find("[scope 0]:\n  - Ana: entity:Deportista (line 1)\n") != std::string::npos,
                       "rendered global scope");
        ok &= require_(text.find("[scope 1]:\n  - equipo: list:Deportista (line 2)\n") != std::string::npos,
                       "rendered nested scope");
        return ok;
    }

    static bool test_declaration_order_preserved() {
        SymbolTable t;
        (void)t.declare("zeta", ty::int_(), 0, 1);
        (void)t.declare("alfa", ty::int_(), 1, 2);
        (void)t.declare("mu", ty::int_(), 2, 3);

        const auto snap = t.snapshot();
        bool ok = true;
        ok &= require_(snap.size() == 1 && snap[0].entries.size() == 3, "three entries");
        if (ok) {
            ok &= require_(snap[0].entries[0].name == "zeta"
                        && snap[0].entries[1].name == "alfa"
                        && snap[0].entries[2].name == "mu", "entries follow declaration order");
        }
        return ok;
    }

    static bool test_names_outlive_caller_buffers() {
        SymbolTable t;
        {
            std::string tmp = "temporal_name_that_is_long_enough";
            (void)t.declare(tmp, ty::int_(), 0, 1);
            tmp.assign(tmp.size(), 'x');
        }

        bool ok = true;
        ok &= require_(t.lookup("temporal_name_that_is_long_enough").has_value(), "table owns its keys");

        SymbolTable moved = std::move(t);
        ok &= require_(moved.lookup("temporal_name_that_is_long_enough").has_value(), "keys survive a move");
        return ok;
    }

    static bool test_type_tags() {
        bool ok = true;
        ok &= require_(ty::list("").to_string() == "list:unknown", "empty element type");
        ok &= require_(ty::parse("entity:Deportista") == ty::entity("Deportista"), "parse entity tag");
        ok &= require_(ty::parse("list:Pais") == ty::list("Pais"), "parse list tag");
        ok &= require_(ty::parse("bool").to_string() == "bool", "parse bool");
        ok &= require_(ty::parse("float").is_unknown(), "unknown tag");
        return ok;
    }

} // namespace

int main() {
    struct Case {
        const char* name;
        bool (*fn)();
    };

    const Case cases[] = {
        {"global_declare_and_lookup", test_global_declare_and_lookup},
        {"duplicate_in_same_scope_keeps_first", test_duplicate_in_same_scope_keeps_first},
        {"nested_scope_shadows_and_hides", test_nested_scope_shadows_and_hides},
        {"exit_global_is_noop", test_exit_global_is_noop},
        {"snapshot_is_deep_copy", test_snapshot_is_deep_copy},
        {"declaration_order_preserved", test_declaration_order_preserved},
        {"names_outlive_caller_buffers", test_names_outlive_caller_buffers},
        {"type_tags", test_type_tags},
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
