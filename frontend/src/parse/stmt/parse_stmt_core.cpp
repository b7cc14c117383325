// frontend/src/parse/stmt/parse_stmt_core.cpp
#include <olympiac/parse/Parser.hpp>
#include <olympiac/syntax/TokenKind.hpp>
#include <olympiac/diag/DiagCode.hpp>


namespace olympiac {

    using syntax::TokenKind;
    using ast::NodeId;
    using ast::NodeKind;

    namespace {
        struct DepthScope {
            uint32_t& d;
            explicit DepthScope(uint32_t& x) : d(x) { ++d; }
            ~DepthScope() { --d; }
        };
    } // namespace

    ast::NodeId Parser::parse_program() {
        ast::Node root{};
        root.kind = NodeKind::kProgram;
        root.text = "Programa";
        if (const Token* first = cursor_.peek()) {
            root.span = first->span;
        }
        const NodeId root_id = ast_.add_node(root);

        std::vector<NodeId> kids;
        while (!cursor_.at_end()) {
            const size_t before = cursor_.pos();

            const NodeId c = parse_command();
            if (c != ast::k_invalid_node) kids.push_back(c);

            // 진행이 없으면 현재 토큰을 버리고 계속 (무한 루프 방지)
            if (cursor_.pos() == before) {
                const Token* t = cursor_.peek();
                diag_report(diag::Code::kUnexpectedToken, t->span, {t->lexeme});
                cursor_.bump();
            }
        }

        ast_.commit_children(root_id, kids);
        ast_.set_syntax_diags(emitted_);
        return root_id;
    }

    ast::NodeId Parser::parse_command() {
        const Token* t = cursor_.peek();
        if (!t) return ast::k_invalid_node;

        switch (t->kind) {
            case TokenKind::kComment:
                return make_leaf_(NodeKind::kComment, *cursor_.bump());

            case TokenKind::kEntityDecl:
                if (is_kw(t, TokenKind::kEntityDecl, "deportista")) return parse_athlete_decl();
                if (is_kw(t, TokenKind::kEntityDecl, "lista")) return parse_list_or_bulk();
                return make_leaf_(NodeKind::kUnknown, *cursor_.bump());

            case TokenKind::kControlFlow: {
                if (is_kw(t, TokenKind::kControlFlow, "si")
                    || is_kw(t, TokenKind::kControlFlow, "repetir")
                    || is_kw(t, TokenKind::kControlFlow, "repetirhasta")) {
                    if (!enter_compound_()) return make_leaf_(NodeKind::kUnknown, *cursor_.bump());
                    DepthScope guard(depth_);
                    if (is_kw(t, TokenKind::kControlFlow, "si")) return parse_conditional();
                    if (is_kw(t, TokenKind::kControlFlow, "repetir")) return parse_loop();
                    return parse_loop_until();
                }
                if (is_kw(t, TokenKind::kControlFlow, "sino") || is_kw(t, TokenKind::kControlFlow, "entonces")) {
                    diag_report(diag::Code::kUnexpectedToken, t->span, {t->lexeme});
                    return make_leaf_(NodeKind::kUnknown, *cursor_.bump());
                }
                // 짝 없는 FinRep / FinRepHasta / endif
                return make_leaf_(NodeKind::kClose, *cursor_.bump());
            }

            case TokenKind::kFuncCall:
                return parse_invocation();

            case TokenKind::kDomainKeyword: {
                if (is_terminator_kw_(t)) return make_leaf_(NodeKind::kClose, *cursor_.bump());

                if (!enter_compound_()) return make_leaf_(NodeKind::kUnknown, *cursor_.bump());
                DepthScope guard(depth_);
                if (is_kw(t, TokenKind::kDomainKeyword, "iniciocarrera")) {
                    return parse_block_competition(NodeKind::kRace, "fincarr", "finCarr");
                }
                if (is_kw(t, TokenKind::kDomainKeyword, "iniciorutina")) {
                    return parse_block_competition(NodeKind::kRoutine, "finruti", "finRuti");
                }
                if (is_kw(t, TokenKind::kDomainKeyword, "iniciocombate")) {
                    return parse_block_competition(NodeKind::kCombat, "fincomb", "finComb");
                }
                return parse_action_stub();
            }

            case TokenKind::kDomainType:
                if (is_kw(t, TokenKind::kDomainType, "resultado")) return parse_result();
                return make_leaf_(NodeKind::kUnknown, *cursor_.bump());

            case TokenKind::kResultMarker:
                return make_leaf_(NodeKind::kResultExtra, *cursor_.bump());

            case TokenKind::kTieMarker:
                return make_leaf_(NodeKind::kTie, *cursor_.bump());

            case TokenKind::kIdent:
                if (at_kind(TokenKind::kSpecialOp, 1)) {
                    if (!enter_compound_()) return make_leaf_(NodeKind::kUnknown, *cursor_.bump());
                    DepthScope guard(depth_);
                    return parse_match();
                }
                return make_leaf_(NodeKind::kIdentifier, *cursor_.bump());

            case TokenKind::kPunct:
                return make_leaf_(NodeKind::kSymbol, *cursor_.bump());

            case TokenKind::kCompareOp:
            case TokenKind::kSpecialOp:
            case TokenKind::kArithOp:
            case TokenKind::kIntLit:
            case TokenKind::kBoolLit:
                return make_leaf_(NodeKind::kUnknown, *cursor_.bump());
        }
        return make_leaf_(NodeKind::kUnknown, *cursor_.bump());
    }

    void Parser::parse_block_body_(std::vector<NodeId>& out, bool (Parser::*stop)(const Token*) const) {
        while (!cursor_.at_end()) {
            const Token* t = cursor_.peek();
            if ((this->*stop)(t)) break;

            const size_t before = cursor_.pos();
            const NodeId c = parse_command();
            if (c != ast::k_invalid_node) out.push_back(c);

            if (cursor_.pos() == before) {
                diag_report(diag::Code::kUnexpectedToken, t->span, {t->lexeme});
                cursor_.bump();
            }
        }
    }

    // ---- body stop predicates ----

    bool Parser::stop_then_body_(const Token* t) const {
        return (t->kind == TokenKind::kPunct && t->lexeme == "}")
            || is_kw(t, TokenKind::kControlFlow, "sino")
            || is_kw(t, TokenKind::kControlFlow, "endif");
    }

    bool Parser::stop_brace_body_(const Token* t) const {
        return (t->kind == TokenKind::kPunct && t->lexeme == "}")
            || is_kw(t, TokenKind::kControlFlow, "endif");
    }

    bool Parser::stop_bracket_body_(const Token* t) const {
        return (t->kind == TokenKind::kPunct && t->lexeme == "]")
            || is_kw(t, TokenKind::kControlFlow, "finrep")
            || is_kw(t, TokenKind::kControlFlow, "finrephasta")
            || is_kw(t, TokenKind::kControlFlow, "finrephast");
    }

    bool Parser::stop_prep_body_(const Token* t) const {
        return is_terminator_kw_(t) || is_boundary_(t)
            || is_control_closer_(t) || is_block_closer_(t);
    }

    // 다른 동작 키워드는 중첩 stub으로 흡수된다 (preparacion 과 같은 정지 조건)
    bool Parser::stop_stub_body_(const Token* t) const {
        return stop_prep_body_(t);
    }

    bool Parser::stop_competition_body_(const Token* t) const {
        return is_terminator_kw_(t) || is_control_closer_(t)
            || (t->kind == TokenKind::kPunct && (t->lexeme == "}" || t->lexeme == "]"));
    }

    // --------------------
    // si <cond> entonces { ... } [sino { ... }] endif
    // --------------------

    ast::NodeId Parser::parse_conditional() {
        const Token& si = *cursor_.bump();

        ast::Node n{};
        n.kind = NodeKind::kConditional;
        n.span = si.span;
        n.text = si.lexeme;
        const NodeId id = ast_.add_node(n);

        const NodeId cond = parse_condition();

        // 첫 번째 구분자 실패 이후로는 같은 구문에서 추가 진단을 내지 않는다.
        bool degraded = false;
        if (!expect_kw(TokenKind::kControlFlow, "entonces", "entonces")) {
            degraded = true;
            if (!at_punct('{')) synchronize();
        }
        if (!expect_punct('{', !degraded)) {
            if (!degraded) synchronize();
            degraded = true;
        }

        std::vector<NodeId> then_kids;
        parse_block_body_(then_kids, &Parser::stop_then_body_);

        NodeId else_id = ast::k_invalid_node;
        if (at_punct('}')) {
            cursor_.bump();
            if (at_kw(TokenKind::kControlFlow, "sino")) {
                else_id = parse_else_(degraded);
            }
        } else if (at_kw(TokenKind::kControlFlow, "sino")) {
            // { ... sino { ... } } endif
            else_id = parse_else_(degraded);
            if (!expect_punct('}', !degraded)) degraded = true;
        } else {
            if (!expect_punct('}', !degraded)) degraded = true;
        }

        if (!expect_kw(TokenKind::kControlFlow, "endif", "endif", !degraded)) {
            if (!degraded) synchronize();
        }

        ast::Node& out = ast_.node_mut(id);
        out.a = cond;
        out.b = else_id;
        ast_.commit_children(id, then_kids);
        return id;
    }

    ast::NodeId Parser::parse_else_(bool& degraded) {
        const Token& sino = *cursor_.bump();

        ast::Node n{};
        n.kind = NodeKind::kElse;
        n.span = sino.span;
        n.text = sino.lexeme;
        const NodeId id = ast_.add_node(n);

        if (!expect_punct('{', !degraded)) degraded = true;

        std::vector<NodeId> kids;
        parse_block_body_(kids, &Parser::stop_brace_body_);

        if (!expect_punct('}', !degraded)) degraded = true;

        ast_.commit_children(id, kids);
        return id;
    }

    // --------------------
    // Repetir ( <count> ) [ ... ] FinRep
    // --------------------

    ast::NodeId Parser::parse_loop() {
        const Token& rep = *cursor_.bump();

        ast::Node n{};
        n.kind = NodeKind::kLoop;
        n.span = rep.span;
        n.text = rep.lexeme;
        const NodeId id = ast_.add_node(n);

        bool degraded = false;
        if (!expect_punct('(')) degraded = true;

        NodeId count = ast::k_invalid_node;
        if (!cursor_.at_end() && !at_punct(')') && !at_punct('[')) {
            count = parse_condition();
        } else if (!degraded) {
            diag_report(diag::Code::kExpectedExpression, here_(), {"Repetir"});
            degraded = true;
        }

        if (!expect_punct(')', !degraded)) degraded = true;
        if (!expect_punct('[', !degraded)) degraded = true;

        std::vector<NodeId> kids;
        parse_block_body_(kids, &Parser::stop_bracket_body_);

        if (!expect_punct(']', !degraded)) degraded = true;
        if (!expect_kw(TokenKind::kControlFlow, "finrep", "FinRep", !degraded)) {
            if (!degraded) synchronize();
        }

        ast_.node_mut(id).a = count;
        ast_.commit_children(id, kids);
        return id;
    }

    // --------------------
    // RepetirHasta ( <cond> ) [ ... ] FinRepHasta
    // --------------------

    ast::NodeId Parser::parse_loop_until() {
        const Token& rep = *cursor_.bump();

        ast::Node n{};
        n.kind = NodeKind::kLoopUntil;
        n.span = rep.span;
        n.text = rep.lexeme;
        const NodeId id = ast_.add_node(n);

        bool degraded = false;
        if (!expect_punct('(')) degraded = true;

        NodeId cond = ast::k_invalid_node;
        if (!cursor_.at_end() && !at_punct(')') && !at_punct('[')) {
            cond = parse_condition();
        } else if (!degraded) {
            diag_report(diag::Code::kExpectedExpression, here_(), {"RepetirHasta"});
            degraded = true;
        }

        if (!expect_punct(')', !degraded)) degraded = true;
        if (!expect_punct('[', !degraded)) degraded = true;

        std::vector<NodeId> kids;
        parse_block_body_(kids, &Parser::stop_bracket_body_);

        if (!expect_punct(']', !degraded)) degraded = true;

        // 구버전 철자 FinRepHast 도 허용
        if (at_kw(TokenKind::kControlFlow, "finrephast")) {
            cursor_.bump();
        } else if (!expect_kw(TokenKind::kControlFlow, "finrephasta", "FinRepHasta", !degraded)) {
            if (!degraded) synchronize();
        }

        ast_.node_mut(id).a = cond;
        ast_.commit_children(id, kids);
        return id;
    }

} // namespace olympiac
