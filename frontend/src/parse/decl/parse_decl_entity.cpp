// frontend/src/parse/decl/parse_decl_entity.cpp
#include <olympiac/parse/Parser.hpp>
#include <olympiac/syntax/TokenKind.hpp>
#include <olympiac/diag/DiagCode.hpp>


namespace olympiac {

    using syntax::TokenKind;
    using ast::NodeId;
    using ast::NodeKind;

    // --------------------
    // Deportista <name> <int> <int> <int> <sport> <country>
    // --------------------

    ast::NodeId Parser::parse_athlete_decl() {
        const Token& dep = *cursor_.bump();

        ast::AthleteTuple t{};
        t.span = dep.span;

        // 빠진 필드는 소비하지 않고 다음 필드로 넘어간다.
        std::string missing;
        const auto note_missing = [&](std::string_view field) {
            if (!missing.empty()) missing += ", ";
            missing += field;
        };

        if (at_kind(TokenKind::kIdent)) t.name = cursor_.bump()->lexeme;
        else note_missing("nombre");

        static constexpr std::string_view kStatNames[3] = {"stat1", "stat2", "stat3"};
        for (int i = 0; i < 3; ++i) {
            if (at_kind(TokenKind::kIntLit)) {
                t.stats[i] = parse_int_(*cursor_.bump());
                if (!t.stats[i].has) note_missing(kStatNames[i]);
            } else {
                note_missing(kStatNames[i]);
            }
        }

        if (at_kind(TokenKind::kIdent)) t.sport = cursor_.bump()->lexeme;
        else note_missing("deporte");

        if (at_kind(TokenKind::kIdent)) t.country = cursor_.bump()->lexeme;
        else note_missing("pais");

        ast::Node n{};
        n.kind = NodeKind::kAthleteDecl;
        n.span = dep.span;
        n.text = dep.lexeme;
        n.athlete_begin = ast_.add_athlete(t);
        n.athlete_count = 1;

        if (missing.empty()) return ast_.add_node(n);

        // 불완전 선언: 에러 노드로 강등 (모은 필드는 유지)
        n.kind = NodeKind::kSyntaxError;
        n.recovered_kind = NodeKind::kAthleteDecl;
        n.missing = ast_.add_owned_string(missing);
        const NodeId id = ast_.add_node(n);

        const std::string_view shown = t.name.empty() ? std::string_view("?") : t.name;
        diag_report(diag::Code::kIncompleteAthleteDecl, dep.span, {shown, missing});
        synchronize();
        return id;
    }

    // --------------------
    // Lista [Type] <name>
    // Lista Deportista (<name> <int> <int> <int> <sport> <country>)+
    // --------------------

    bool Parser::try_athlete_tuple_(ast::AthleteTuple& out) {
        if (!at_kind(TokenKind::kIdent)
            || !at_kind(TokenKind::kIntLit, 1)
            || !at_kind(TokenKind::kIntLit, 2)
            || !at_kind(TokenKind::kIntLit, 3)
            || !at_kind(TokenKind::kIdent, 4)
            || !at_kind(TokenKind::kIdent, 5)) {
            return false;
        }

        const Token& name = *cursor_.bump();
        out.name = name.lexeme;
        out.span = name.span;
        for (int i = 0; i < 3; ++i) {
            out.stats[i] = parse_int_(*cursor_.bump());
        }
        out.sport = cursor_.bump()->lexeme;
        out.country = cursor_.bump()->lexeme;
        return true;
    }

    ast::NodeId Parser::parse_list_or_bulk() {
        const Token& lista = *cursor_.bump();

        // Deportista 다음이 식별자이고 그 뒤 세 토큰이 정수면 일괄 적재
        const bool looks_bulk =
            at_kw(TokenKind::kEntityDecl, "deportista")
            && at_kind(TokenKind::kIdent, 1)
            && at_kind(TokenKind::kIntLit, 2)
            && at_kind(TokenKind::kIntLit, 3)
            && at_kind(TokenKind::kIntLit, 4);

        if (!looks_bulk) return parse_list_decl_(lista);

        const size_t save = cursor_.pos();
        cursor_.bump(); // Deportista

        std::vector<ast::AthleteTuple> tuples;
        while (at_kind(TokenKind::kIdent)) {
            const size_t tuple_start = cursor_.pos();
            ast::AthleteTuple t{};
            if (!try_athlete_tuple_(t)) {
                cursor_.rewind(tuple_start);
                break;
            }
            tuples.push_back(t);
        }

        if (tuples.empty()) {
            cursor_.rewind(save);
            return parse_list_decl_(lista);
        }

        ast::Node n{};
        n.kind = NodeKind::kBulkLoad;
        n.span = lista.span;
        n.text = "Lista Deportista";
        n.athlete_begin = static_cast<uint32_t>(ast_.athletes().size());
        n.athlete_count = static_cast<uint32_t>(tuples.size());
        for (const auto& t : tuples) ast_.add_athlete(t);
        return ast_.add_node(n);
    }

    ast::NodeId Parser::parse_list_decl_(const Token& lista) {
        ast::Node n{};
        n.kind = NodeKind::kListDecl;
        n.span = lista.span;
        n.text = lista.lexeme;

        if (at_kind(TokenKind::kIdent) || at_kind(TokenKind::kEntityDecl)) {
            n.list_type = cursor_.bump()->lexeme;
        }
        if (at_kind(TokenKind::kIdent)) {
            n.list_name = cursor_.bump()->lexeme;
        } else {
            const Token* got = cursor_.peek();
            diag_report(diag::Code::kListNameExpected, got ? got->span : here_(),
                        {got ? got->lexeme : std::string_view("EOF")});
        }
        return ast_.add_node(n);
    }

} // namespace olympiac
