// frontend/src/verify/verify_decl.cpp
#include <olympiac/verify/Verifier.hpp>
#include <olympiac/diag/DiagCode.hpp>

#include <string>


namespace olympiac::verify {

    using ast::NodeId;

    // Deportista <name> ... : entity:Deportista 로 선언
    void Verifier::visit_athlete_(NodeId id) {
        const ast::Node& n = ast_.node(id);
        Decoration& d = deco_(id);
        d.type = ty::entity("Deportista");

        if (n.athlete_count != 1) return;
        const ast::AthleteTuple& t = ast_.athletes()[n.athlete_begin];
        if (t.name.empty()) return;
        d.definition = std::string(t.name);

        auto ins = result_.table.declare(t.name, ty::entity("Deportista"), id, n.span.line);
        if (ins.is_duplicate) {
            diag_(diag::Code::kDuplicateDecl, n.span, {t.name, std::to_string(ins.level)});
            return;
        }
        result_.decorations[id].ref = result_.table.record(ins.symbol_id);
        record_snapshot_(id);
    }

    // Lista [Type] <name> : list:<Type|unknown>
    void Verifier::visit_list_(NodeId id) {
        const ast::Node& n = ast_.node(id);
        const ty::Type lt = ty::list(n.list_type);

        Decoration& d = deco_(id);
        d.type = lt;
        d.definition = std::string(n.list_name);

        if (n.list_name.empty()) return;

        auto ins = result_.table.declare(n.list_name, lt, id, n.span.line);
        if (ins.is_duplicate) {
            diag_(diag::Code::kDuplicateDecl, n.span, {n.list_name, std::to_string(ins.level)});
            return;
        }
        result_.decorations[id].ref = result_.table.record(ins.symbol_id);
        record_snapshot_(id);
    }

    // Lista Deportista (tuple)+ : 이름 없는 선수 목록
    void Verifier::visit_bulk_(NodeId id) {
        const ast::Node& n = ast_.node(id);
        Decoration& d = deco_(id);
        d.type = ty::list("Deportista");
        d.count = n.athlete_count;
        record_snapshot_(id);
    }

    // 구문 오류 노드: 하위의 식별자 오류는 억제하고 계속 내려간다
    void Verifier::visit_error_(NodeId id) {
        ++error_depth_;
        visit_children_(id);
        --error_depth_;
        deco_(id).type = ty::unknown();
    }

} // namespace olympiac::verify
