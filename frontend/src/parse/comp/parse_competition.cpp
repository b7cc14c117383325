// frontend/src/parse/comp/parse_competition.cpp
#include <olympiac/parse/Parser.hpp>
#include <olympiac/syntax/TokenKind.hpp>
#include <olympiac/diag/DiagCode.hpp>

#include <string>


namespace olympiac {

    using syntax::TokenKind;
    using ast::NodeId;
    using ast::NodeKind;

    // 경기 본문: 동작 명령 + empate + Resultado + listaRes (종료 키워드 전까지)
    Parser::CompetitionBody Parser::parse_competition_body_() {
        CompetitionBody body{};

        while (!cursor_.at_end()) {
            const Token* t = cursor_.peek();
            if (stop_competition_body_(t)) break;

            if (t->kind == TokenKind::kTieMarker) {
                const NodeId tie = make_leaf_(NodeKind::kTie, *cursor_.bump());
                if (body.tie_count == 0) {
                    body.tie = tie;
                    body.kids.push_back(tie);
                } else {
                    // 첫 번째 empate만 유지
                    diag_report_warn(diag::Code::kDuplicateTie, t->span);
                }
                ++body.tie_count;
                continue;
            }

            if (is_kw(t, TokenKind::kDomainType, "resultado")) {
                const NodeId r = parse_result();
                body.kids.push_back(r);
                if (body.result_count == 0) body.result = r;
                else diag_report(diag::Code::kDuplicateResult, t->span);
                ++body.result_count;
                continue;
            }

            if (t->kind == TokenKind::kResultMarker) {
                body.kids.push_back(make_leaf_(NodeKind::kResultExtra, *cursor_.bump()));
                continue;
            }

            const size_t before = cursor_.pos();
            const NodeId c = parse_command();
            if (c != ast::k_invalid_node) body.kids.push_back(c);
            if (cursor_.pos() == before) {
                diag_report(diag::Code::kUnexpectedToken, t->span, {t->lexeme});
                cursor_.bump();
            }
        }
        return body;
    }

    void Parser::finish_competition_(NodeId id, CompetitionBody& body,
                                     std::string_view end_kw, std::string_view block_name,
                                     std::string_view end_shown) {
        bool terminated = false;
        if (at_kw(TokenKind::kDomainKeyword, end_kw)) {
            cursor_.bump();
            terminated = true;
        } else {
            diag_report(diag::Code::kMissingTerminator, here_(), {block_name, end_shown});
        }

        if (body.result_count == 0) {
            diag_report(diag::Code::kMissingResult, ast_.node(id).span, {block_name, end_shown});
        }

        ast::Node& n = ast_.node_mut(id);
        n.terminated = terminated;
        n.a = body.tie;
        n.b = body.result;
        n.tie_count = body.tie_count;
        n.result_count = body.result_count;
        ast_.commit_children(id, body.kids);
    }

    // --------------------
    // <Pais> vs <Pais> ... [empate] Resultado a - b [listaRes] finact
    // --------------------

    ast::NodeId Parser::parse_match() {
        const Token& home = *cursor_.bump();
        const Token& vs = *cursor_.bump();

        ast::Node n{};
        n.kind = NodeKind::kMatch;
        n.span = home.span;
        n.home = home.lexeme;

        if (at_kind(TokenKind::kIdent)) {
            n.away = cursor_.bump()->lexeme;
        } else {
            const Token* got = cursor_.peek();
            if (!got) diag_report(diag::Code::kUnexpectedEof, here_(), {"pais"});
            else diag_report(diag::Code::kExpectedToken, got->span, {"pais", got->lexeme});
        }

        std::string label(home.lexeme);
        label += ' ';
        label += vs.lexeme;
        if (!n.away.empty()) {
            label += ' ';
            label += n.away;
        }
        n.text = ast_.add_owned_string(std::move(label));
        const NodeId id = ast_.add_node(n);

        CompetitionBody body = parse_competition_body_();
        finish_competition_(id, body, "finact", "partido", "finact");
        return id;
    }

    // --------------------
    // InicioCarrera ... finCarr / InicioRutina ... finRuti / InicioCombate ... finComb
    // --------------------

    ast::NodeId Parser::parse_block_competition(NodeKind kind, std::string_view end_kw, std::string_view end_shown) {
        const Token& start = *cursor_.bump();

        ast::Node n{};
        n.kind = kind;
        n.span = start.span;
        n.text = start.lexeme;
        const NodeId id = ast_.add_node(n);

        CompetitionBody body = parse_competition_body_();
        finish_competition_(id, body, end_kw, start.lexeme, end_shown);
        return id;
    }

    // --------------------
    // Resultado [int] [-] [int]
    // --------------------

    ast::NodeId Parser::parse_result() {
        const Token& res = *cursor_.bump();

        ast::Node n{};
        n.kind = NodeKind::kResult;
        n.span = res.span;
        n.text = res.lexeme;

        if (at_kind(TokenKind::kIntLit)) {
            n.score[0] = parse_int_(*cursor_.bump());
        }

        const Token* dash = cursor_.peek();
        if (dash && dash->kind == TokenKind::kArithOp && dash->lexeme == "-") {
            cursor_.bump();
            n.has_dash = true;
        }

        if (at_kind(TokenKind::kIntLit)) {
            const Token& second = *cursor_.peek();
            if (!n.has_dash && n.score[0].has) {
                diag_report(diag::Code::kExpectedToken, second.span, {"-", second.lexeme});
            }
            n.score[1] = parse_int_(*cursor_.bump());
        }

        return ast_.add_node(n);
    }

    // --------------------
    // 기타 도메인 키워드: 종료 키워드/경계까지 명령을 흡수
    // --------------------

    ast::NodeId Parser::parse_action_stub() {
        const Token& kw = *cursor_.bump();

        ast::Node n{};
        n.kind = NodeKind::kActionStub;
        n.span = kw.span;
        n.text = kw.lexeme;
        const NodeId id = ast_.add_node(n);

        const bool is_prep = is_kw(&kw, TokenKind::kDomainKeyword, "preparacion");

        std::vector<NodeId> kids;
        if (is_prep) parse_block_body_(kids, &Parser::stop_prep_body_);
        else parse_block_body_(kids, &Parser::stop_stub_body_);

        bool terminated = false;
        if (is_prep) {
            if (at_kw(TokenKind::kDomainKeyword, "finprep")) {
                cursor_.bump();
                terminated = true;
            } else {
                diag_report(diag::Code::kMissingTerminator, here_(), {kw.lexeme, "finprep"});
            }
        }

        ast_.node_mut(id).terminated = terminated;
        ast_.commit_children(id, kids);
        return id;
    }

} // namespace olympiac
