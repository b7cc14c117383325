// frontend/src/verify/verify_entry.cpp
#include <olympiac/verify/Verifier.hpp>
#include <olympiac/diag/DiagCode.hpp>


namespace olympiac::verify {

    using ast::NodeId;
    using ast::NodeKind;

    VerifyResult Verifier::verify(NodeId root) {
        // -----------------------------
        // HARD RESET (매 호출 독립 보장)
        // -----------------------------
        result_ = VerifyResult{};
        error_depth_ = 0;

        // decoration 테이블: AST 노드 수에 맞춰 리셋
        result_.decorations.assign(ast_.size(), Decoration{});

        if (root == ast::k_invalid_node || root >= ast_.size()) {
            result_.ok = true;
            return std::move(result_);
        }

        visit_(root);

        result_.ok = result_.errors.empty();
        return std::move(result_);
    }

    void Verifier::diag_(diag::Code code, Span sp, std::initializer_list<std::string_view> args) {
        diag::Diagnostic d(diag::Severity::kError, code, sp);
        for (auto a : args) d.add_arg(a);
        if (diag_bag_) diag_bag_->add(d);
        result_.errors.push_back(std::move(d));
    }

    Decoration& Verifier::deco_(NodeId id) {
        Decoration& d = result_.decorations[id];
        d.visited = true;
        return d;
    }

    const ty::Type& Verifier::type_of_(NodeId id) {
        static const ty::Type kUnknown{};
        if (id == ast::k_invalid_node || id >= result_.decorations.size()) return kUnknown;
        return result_.decorations[id].type;
    }

    void Verifier::enter_scope_(uint32_t line) {
        const uint32_t lv = result_.table.enter_scope();
        result_.scope_trace.push_back(ScopeEvent{ScopeEventKind::kEnter, lv, line});
    }

    void Verifier::exit_scope_(uint32_t line) {
        const uint32_t lv = result_.table.exit_scope();
        result_.scope_trace.push_back(ScopeEvent{ScopeEventKind::kExit, lv, line});
    }

    void Verifier::record_snapshot_(NodeId id) {
        const ast::Node& n = ast_.node(id);
        SnapshotEntry e{};
        e.node = id;
        e.kind = n.kind;
        e.line = n.span.line;
        e.table = result_.table.snapshot();
        result_.snapshots.push_back(std::move(e));
    }

    // --------------------
    // walk
    // --------------------

    void Verifier::visit_children_(NodeId id, bool in_competition) {
        const ast::Node& n = ast_.node(id);
        for (uint32_t i = 0; i < n.child_count; ++i) {
            const NodeId c = ast_.child(id, i);
            const ast::Node& cn = ast_.node(c);

            // obj . method 패턴: 바로 앞 형제가 '.', 그 앞이 식별자
            if (cn.kind == NodeKind::kIdentifier && i >= 2) {
                const ast::Node& dot = ast_.node(ast_.child(id, i - 1));
                const ast::Node& obj = ast_.node(ast_.child(id, i - 2));
                if (dot.kind == NodeKind::kSymbol && dot.text == "."
                    && obj.kind == NodeKind::kIdentifier) {
                    visit_identifier_(c, obj.text);
                    continue;
                }
            }

            if (cn.kind == NodeKind::kResult) {
                visit_result_(c, in_competition);
                continue;
            }

            visit_(c);
        }
    }

    void Verifier::visit_scoped_(NodeId id) {
        const ast::Node& n = ast_.node(id);
        enter_scope_(n.span.line);

        if (n.a != ast::k_invalid_node) visit_(n.a);
        visit_children_(id);

        // else 분기는 조건문 스코프를 공유한다
        if (n.kind == NodeKind::kConditional && n.b != ast::k_invalid_node) {
            deco_(n.b).type = ty::void_();
            visit_children_(n.b);
        }

        exit_scope_(n.span.line);
        deco_(id).type = ty::void_();
    }

    void Verifier::visit_(NodeId id) {
        if (id == ast::k_invalid_node) return;
        const ast::Node& n = ast_.node(id);

        switch (n.kind) {
            case NodeKind::kProgram:
                visit_children_(id);
                deco_(id).type = ty::void_();
                return;

            case NodeKind::kAthleteDecl: visit_athlete_(id); return;
            case NodeKind::kListDecl:    visit_list_(id); return;
            case NodeKind::kBulkLoad:    visit_bulk_(id); return;
            case NodeKind::kSyntaxError: visit_error_(id); return;

            case NodeKind::kConditional:
            case NodeKind::kLoop:
            case NodeKind::kLoopUntil:
                visit_scoped_(id);
                return;

            case NodeKind::kElse:
                // 조건문 밖에서 만난 Else (정상 트리에서는 visit_scoped_가 처리)
                visit_children_(id);
                deco_(id).type = ty::void_();
                return;

            case NodeKind::kInvocation: visit_call_(id); return;
            case NodeKind::kNarrate:    visit_narrate_(id); return;
            case NodeKind::kDirect:     visit_direct_(id); return;

            case NodeKind::kBinaryOp: visit_binary_(id); return;
            case NodeKind::kUnaryOp:  visit_unary_(id); return;

            case NodeKind::kNumber:
                deco_(id).type = ty::int_();
                return;
            case NodeKind::kBool:
                deco_(id).type = ty::bool_();
                return;
            case NodeKind::kName:
            case NodeKind::kIdentifier: {
                const ty::Type t = resolve_name_(id, n.text, n.span);
                deco_(id).type = t;
                return;
            }

            case NodeKind::kMatch:
            case NodeKind::kRace:
            case NodeKind::kRoutine:
            case NodeKind::kCombat:
                visit_competition_(id);
                return;

            case NodeKind::kResult:
                visit_result_(id, false);
                return;

            case NodeKind::kActionStub:
                visit_children_(id);
                deco_(id).type = ty::void_();
                return;

            case NodeKind::kComment:
            case NodeKind::kSymbol:
            case NodeKind::kClose:
            case NodeKind::kResultExtra:
            case NodeKind::kTie:
                deco_(id).type = ty::void_();
                return;

            case NodeKind::kUnknown:
                deco_(id).type = ty::unknown();
                return;
        }
    }

} // namespace olympiac::verify
