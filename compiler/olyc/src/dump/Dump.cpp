// compiler/olyc/src/dump/Dump.cpp
#include <olyc/dump/Dump.hpp>

#include <olympiac/diag/Render.hpp>
#include <olympiac/syntax/TokenKind.hpp>


namespace olyc::dump {

    using olympiac::ast::AttrField;
    using olympiac::ast::AttrValue;

    namespace {

        void indent_(std::ostream& os, int indent) {
            for (int i = 0; i < indent; ++i) os << "  ";
        }

        AttrValue map_(std::vector<AttrField> fields) {
            AttrValue m{};
            m.kind = AttrValue::Kind::kMap;
            m.fields = std::move(fields);
            return m;
        }

        AttrValue list_(std::vector<AttrValue> items) {
            AttrValue l{};
            l.kind = AttrValue::Kind::kList;
            l.items = std::move(items);
            return l;
        }

        AttrValue record_value_(const olympiac::sema::SymbolRecord& r) {
            return map_({
                {"nombre", olympiac::ast::attr_text(r.name)},
                {"tipo", olympiac::ast::attr_text(r.type)},
                {"linea", olympiac::ast::attr_int(r.line)},
                {"nivel", olympiac::ast::attr_int(r.level)},
            });
        }

        AttrValue table_value_(const olympiac::sema::TableSnapshot& snap) {
            std::vector<AttrField> scopes;
            for (const auto& s : snap) {
                std::vector<AttrValue> entries;
                for (const auto& e : s.entries) entries.push_back(record_value_(e));
                scopes.push_back({"scope " + std::to_string(s.level), list_(std::move(entries))});
            }
            return map_(std::move(scopes));
        }

    } // namespace

    void dump_tokens(std::ostream& os, const std::vector<olympiac::Token>& tokens) {
        os << "TOKENS:\n";
        for (const auto& t : tokens) {
            os << "  " << olympiac::syntax::token_kind_name(t.kind)
               << " '" << t.lexeme << "'"
               << " [" << t.span.line << ":" << t.span.col << "]\n";
        }
    }

    void dump_ast(std::ostream& os, const olympiac::ast::AstArena& ast, olympiac::ast::NodeId id, int indent) {
        if (id == olympiac::ast::k_invalid_node || id >= ast.size()) return;

        const auto& n = ast.node(id);
        indent_(os, indent);
        os << "<\"" << olympiac::ast::node_kind_name(n.kind) << "\", \"" << n.text << "\", "
           << olympiac::ast::to_json(olympiac::ast::attrs_of(ast, id)) << ">\n";

        // 링크 노드(조건식, else, 첫 empate/Resultado 등)는 라벨을 붙여 출력
        switch (n.kind) {
            case olympiac::ast::NodeKind::kConditional:
            case olympiac::ast::NodeKind::kLoop:
            case olympiac::ast::NodeKind::kLoopUntil:
                if (n.a != olympiac::ast::k_invalid_node) {
                    indent_(os, indent + 1);
                    os << "Cond:\n";
                    dump_ast(os, ast, n.a, indent + 2);
                }
                break;
            case olympiac::ast::NodeKind::kBinaryOp:
            case olympiac::ast::NodeKind::kUnaryOp:
                dump_ast(os, ast, n.a, indent + 1);
                dump_ast(os, ast, n.b, indent + 1);
                break;
            default:
                break;
        }

        for (uint32_t i = 0; i < n.child_count; ++i) {
            dump_ast(os, ast, ast.child(id, i), indent + 1);
        }

        if (n.kind == olympiac::ast::NodeKind::kConditional && n.b != olympiac::ast::k_invalid_node) {
            dump_ast(os, ast, n.b, indent + 1);
        }
    }

    AttrValue decoration_value(const olympiac::verify::Decoration& d) {
        using olympiac::ast::attr_int;
        using olympiac::ast::attr_null;
        using olympiac::ast::attr_text;

        std::vector<AttrField> f;
        f.push_back({"tipo", attr_text(d.type.to_string())});
        if (!d.definition.empty()) f.push_back({"definicion", attr_text(d.definition)});
        if (d.count != 0) f.push_back({"cantidad", attr_int(d.count)});
        if (!d.arg_types.empty()) {
            std::vector<AttrValue> ts;
            for (const auto& t : d.arg_types) ts.push_back(attr_text(t.to_string()));
            f.push_back({"arg_types", list_(std::move(ts))});
        }
        if (!d.lhs.is_unknown() || !d.rhs.is_unknown()) {
            f.push_back({"left", attr_text(d.lhs.to_string())});
            f.push_back({"right", attr_text(d.rhs.to_string())});
        }
        if (d.ref) f.push_back({"ref", record_value_(*d.ref)});
        if (!d.method_of.empty()) f.push_back({"method_of", attr_text(d.method_of)});
        if (!d.complete) f.push_back({"completo", attr_int(0)});
        if (f.empty()) f.push_back({"ref", attr_null()});
        return map_(std::move(f));
    }

    void dump_decorated(std::ostream& os,
                        const olympiac::ast::AstArena& ast,
                        olympiac::ast::NodeId root,
                        const olympiac::verify::VerifyResult& res,
                        olympiac::diag::Language lang) {
        os << "DECORATED AST:\n";

        // 전위 순회 (자식 슬라이스 + 링크)
        std::vector<std::pair<olympiac::ast::NodeId, int>> stack;
        if (root != olympiac::ast::k_invalid_node && root < ast.size()) stack.push_back({root, 0});

        while (!stack.empty()) {
            const auto [id, level] = stack.back();
            stack.pop_back();

            const auto& n = ast.node(id);
            indent_(os, level);
            os << "<\"" << olympiac::ast::node_kind_name(n.kind) << "\", \"" << n.text << "\", "
               << olympiac::ast::to_json(olympiac::ast::attrs_of(ast, id)) << ">\n";

            if (id < res.decorations.size() && res.decorations[id].visited) {
                indent_(os, level + 1);
                os << "decorado: " << olympiac::ast::to_json(decoration_value(res.decorations[id])) << "\n";
            }

            std::vector<olympiac::ast::NodeId> next;
            if (n.kind != olympiac::ast::NodeKind::kProgram && !olympiac::ast::is_competition(n.kind)) {
                if (n.a != olympiac::ast::k_invalid_node) next.push_back(n.a);
            }
            for (uint32_t i = 0; i < n.child_count; ++i) next.push_back(ast.child(id, i));
            if (n.kind == olympiac::ast::NodeKind::kConditional || n.kind == olympiac::ast::NodeKind::kBinaryOp) {
                if (n.b != olympiac::ast::k_invalid_node) next.push_back(n.b);
            }
            for (auto it = next.rbegin(); it != next.rend(); ++it) stack.push_back({*it, level + 1});
        }

        if (res.errors.empty()) {
            os << "\nno semantic errors.\n";
            return;
        }
        os << "\nsemantic errors:\n";
        for (const auto& e : res.errors) {
            os << "  line " << e.line() << ": " << olympiac::diag::render_message(e, lang) << "\n";
        }
    }

    void dump_table(std::ostream& os, const olympiac::verify::VerifyResult& res) {
        os << "SYMBOL TABLE:\n" << olympiac::sema::to_string(res.table.snapshot());

        if (res.snapshots.empty()) return;
        os << "\nSNAPSHOTS:\n";
        for (const auto& s : res.snapshots) {
            os << "-- after " << olympiac::ast::node_kind_name(s.kind) << " (line " << s.line << ")\n"
               << olympiac::sema::to_string(s.table);
        }
    }

    void dump_scope_trace(std::ostream& os, const olympiac::verify::VerifyResult& res) {
        os << "SCOPE TRACE:\n";
        for (const auto& e : res.scope_trace) {
            os << "  " << (e.kind == olympiac::verify::ScopeEventKind::kEnter ? "enter" : "exit")
               << " level " << e.level << " (line " << e.line << ")\n";
        }
    }

    std::string export_json(const olympiac::ast::AstArena& ast,
                            const olympiac::verify::VerifyResult& res,
                            olympiac::diag::Language lang) {
        using olympiac::ast::attr_int;
        using olympiac::ast::attr_text;

        // decorations: node id -> 데코레이션 (방문한 노드만)
        std::vector<AttrField> decos;
        for (uint32_t id = 0; id < res.decorations.size() && id < ast.size(); ++id) {
            const auto& d = res.decorations[id];
            if (!d.visited) continue;
            AttrValue v = decoration_value(d);
            v.fields.insert(v.fields.begin(), AttrField{"nodo", attr_text(olympiac::ast::node_kind_name(ast.node(id).kind))});
            decos.push_back({std::to_string(id), std::move(v)});
        }

        std::vector<AttrValue> errors;
        for (const auto& e : res.errors) {
            errors.push_back(map_({
                {"code", attr_text(olympiac::diag::code_name(e.code()))},
                {"message", attr_text(olympiac::diag::render_message(e, lang))},
                {"line", attr_int(e.line())},
                {"col", attr_int(e.col())},
                {"severity", attr_text(olympiac::diag::severity_name(e.severity()))},
            }));
        }

        std::vector<AttrValue> snaps;
        for (const auto& s : res.snapshots) {
            snaps.push_back(map_({
                {"node", attr_text(olympiac::ast::node_kind_name(s.kind))},
                {"line", attr_int(s.line)},
                {"table", table_value_(s.table)},
            }));
        }

        return olympiac::ast::to_json(map_({
            {"decorations", map_(std::move(decos))},
            {"errors", list_(std::move(errors))},
            {"snapshots", list_(std::move(snaps))},
        })) + "\n";
    }

} // namespace olyc::dump
