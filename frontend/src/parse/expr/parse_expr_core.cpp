// frontend/src/parse/expr/parse_expr_core.cpp
#include <olympiac/parse/Parser.hpp>
#include <olympiac/syntax/TokenKind.hpp>
#include <olympiac/diag/DiagCode.hpp>

#include <string>
#include <vector>


namespace olympiac {

    using syntax::TokenKind;
    using ast::NodeId;
    using ast::NodeKind;

    namespace {

        // 0 = 이항 연산자 아님
        int binary_prec_(const Token* t) {
            if (!t) return 0;
            if (t->kind == TokenKind::kCompareOp) return 1;
            if (t->kind != TokenKind::kArithOp) return 0;
            if (t->lexeme == "+" || t->lexeme == "-") return 2;
            return 3; // * / %
        }

        struct DepthScope {
            uint32_t& d;
            explicit DepthScope(uint32_t& x) : d(x) { ++d; }
            ~DepthScope() { --d; }
        };

    } // namespace

    ast::NodeId Parser::parse_expr() {
        return parse_expr_bin_(1);
    }

    // Condition := Expression. 비교는 이항 우선순위 1에서 처리된다.
    ast::NodeId Parser::parse_condition() {
        return parse_expr_bin_(1);
    }

    // 이항 체인은 루프로 쌓이지만 트리 높이는 연산자 수만큼 자란다.
    // 연산자마다 depth_를 1씩 점유해 중첩 상한을 함께 적용한다.
    ast::NodeId Parser::parse_expr_bin_(int min_prec) {
        NodeId lhs = parse_expr_unary_();
        uint32_t held = 0;

        for (;;) {
            const Token* op = cursor_.peek();
            const int prec = binary_prec_(op);
            if (prec == 0 || prec < min_prec) break;

            if (!enter_compound_()) {
                lhs = flatten_overflow_chain_(lhs, min_prec);
                break;
            }
            ++depth_;
            ++held;

            cursor_.bump();
            const NodeId rhs = parse_expr_bin_(prec + 1);

            ast::Node n{};
            n.kind = NodeKind::kBinaryOp;
            n.span = (lhs != ast::k_invalid_node) ? ast_.node(lhs).span : op->span;
            n.text = op->lexeme;
            n.op = op->lexeme;
            n.a = lhs;
            n.b = rhs;
            lhs = ast_.add_node(n);
        }

        depth_ -= held;
        return lhs;
    }

    // 상한을 넘은 나머지 체인: 피연산자는 소비만 하고 트리에 붙이지 않는다.
    ast::NodeId Parser::flatten_overflow_chain_(ast::NodeId lhs, int min_prec) {
        const Token* first = cursor_.peek();

        ast::Node e{};
        e.kind = NodeKind::kSyntaxError;
        e.recovered_kind = NodeKind::kBinaryOp;
        e.span = first->span;
        e.text = first->lexeme;

        for (;;) {
            const Token* op = cursor_.peek();
            const int prec = binary_prec_(op);
            if (prec == 0 || prec < min_prec) break;
            cursor_.bump();
            (void)parse_expr_unary_();
        }

        const NodeId id = ast_.add_node(e);
        if (lhs != ast::k_invalid_node) {
            std::vector<NodeId> kids{lhs};
            ast_.commit_children(id, kids);
        }
        return id;
    }

    ast::NodeId Parser::parse_expr_unary_() {
        const Token* t = cursor_.peek();
        if (t && t->kind == TokenKind::kArithOp && (t->lexeme == "-" || t->lexeme == "+")) {
            if (!enter_compound_()) {
                ast::Node e{};
                e.kind = NodeKind::kSyntaxError;
                e.recovered_kind = NodeKind::kUnaryOp;
                e.span = t->span;
                e.text = t->lexeme;
                cursor_.bump();
                return ast_.add_node(e);
            }
            DepthScope guard(depth_);

            cursor_.bump();
            const NodeId operand = parse_expr_unary_();

            ast::Node n{};
            n.kind = NodeKind::kUnaryOp;
            n.span = t->span;
            n.text = t->lexeme;
            n.op = t->lexeme;
            n.a = operand;
            return ast_.add_node(n);
        }
        return parse_expr_primary_();
    }

    ast::NodeId Parser::parse_expr_primary_() {
        const Token* t = cursor_.peek();

        if (!t) {
            diag_report(diag::Code::kUnexpectedEof, here_(), {"expresion"});
            ast::Node e{};
            e.kind = NodeKind::kSyntaxError;
            e.recovered_kind = NodeKind::kName;
            e.span = here_();
            return ast_.add_node(e);
        }

        switch (t->kind) {
            case TokenKind::kIntLit: {
                cursor_.bump();
                ast::Node n{};
                n.kind = NodeKind::kNumber;
                n.span = t->span;
                n.text = t->lexeme;
                const ast::OptInt v = parse_int_(*t);
                n.int_value = v.value;
                return ast_.add_node(n);
            }

            case TokenKind::kBoolLit:
                return make_leaf_(NodeKind::kBool, *cursor_.bump());

            case TokenKind::kIdent:
                return make_leaf_(NodeKind::kName, *cursor_.bump());

            case TokenKind::kFuncCall:
                return parse_invocation();

            default:
                break;
        }

        if (at_punct('(')) {
            if (!enter_compound_()) {
                return make_leaf_(NodeKind::kSyntaxError, *cursor_.bump());
            }
            DepthScope guard(depth_);

            cursor_.bump();
            const NodeId inner = parse_expr_bin_(1);
            expect_punct(')');
            return inner;
        }

        // 표현식 자리에 올 수 없는 토큰
        diag_report(diag::Code::kExpectedExpression, t->span, {t->lexeme});

        ast::Node e{};
        e.kind = NodeKind::kSyntaxError;
        e.recovered_kind = NodeKind::kName;
        e.span = t->span;
        e.text = t->lexeme;
        // 앵커 토큰은 바깥 구문 몫으로 남긴다
        if (!is_anchor_(0)) cursor_.bump();
        return ast_.add_node(e);
    }

    // --------------------
    // narrar( ... ) / input( ... ) / Comparar( ... ) / 기타 호출
    // --------------------

    ast::NodeId Parser::parse_invocation() {
        const Token& f = *cursor_.bump();

        std::string_view name = f.lexeme;
        if (!name.empty() && name.back() == '(') name.remove_suffix(1);
        while (!name.empty() && (name.back() == ' ' || name.back() == '\t')) name.remove_suffix(1);

        const std::string lname = lower_(name);

        ast::Node n{};
        n.kind = (lname == "narrar") ? NodeKind::kNarrate
               : (lname == "input")  ? NodeKind::kDirect
               : NodeKind::kInvocation;
        n.span = f.span;
        n.text = f.lexeme;
        n.callee = name;
        n.closed = false;
        n.arg_begin = static_cast<uint32_t>(ast_.args().size());

        uint32_t argc = 0;
        while (!cursor_.at_end()) {
            const Token* t = cursor_.peek();
            if (at_punct(')')) {
                cursor_.bump();
                n.closed = true;
                break;
            }
            if (at_punct(',')) {
                cursor_.bump();
                continue;
            }
            // ')' 누락: 다음 줄의 문장 시작에서 멈춘다
            if (t->span.line > f.span.line && is_anchor_(0)) break;

            ast::Arg a{};
            a.text = t->lexeme;
            a.span = t->span;
            a.kind = t->kind;
            ast_.add_arg(a);
            ++argc;
            cursor_.bump();
        }
        n.arg_count = argc;

        if (!n.closed) {
            diag_report(diag::Code::kMissingCloseParen, here_(), {name});
        }
        if (n.kind == NodeKind::kNarrate && argc != 1) {
            diag_report_warn(diag::Code::kNarrateArity, f.span, {std::to_string(argc)});
        }
        return ast_.add_node(n);
    }

} // namespace olympiac
