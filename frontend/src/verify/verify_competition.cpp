// frontend/src/verify/verify_competition.cpp
#include <olympiac/verify/Verifier.hpp>
#include <olympiac/diag/DiagCode.hpp>

#include <string>


namespace olympiac::verify {

    using ast::NodeId;
    using ast::NodeKind;

    namespace {
        std::string missing_slots_(const ast::Node& r) {
            std::string out;
            if (!r.score[0].has) out = "first number";
            if (!r.score[1].has) {
                if (!out.empty()) out += ", ";
                out += "second number";
            }
            return out;
        }
    } // namespace

    // Resultado a - b
    // 경기 블록 안에서는 슬롯 단위 오류 대신 경기 쪽에서 한 번에 보고한다.
    void Verifier::visit_result_(NodeId id, bool in_competition) {
        const ast::Node& n = ast_.node(id);
        Decoration& d = deco_(id);
        d.type = ty::void_();
        d.complete = n.score[0].has && n.score[1].has;

        if (in_competition) return;

        if (!n.score[0].has) diag_(diag::Code::kResultMissingFirst, n.span);
        if (!n.score[1].has) diag_(diag::Code::kResultMissingSecond, n.span);
    }

    void Verifier::visit_competition_(NodeId id) {
        const ast::Node& n = ast_.node(id);
        visit_children_(id, /*in_competition=*/true);

        const std::string_view label = (n.kind == NodeKind::kMatch) ? std::string_view("partido") : n.text;

        if (n.kind == NodeKind::kMatch) {
            if (n.home.empty()) diag_(diag::Code::kMatchMissingCountry, n.span, {"home"});
            if (n.away.empty()) diag_(diag::Code::kMatchMissingCountry, n.span, {"away"});
        }

        if (n.result_count == 0) {
            diag_(diag::Code::kCompetitionMissingResult, n.span, {label});
        } else if (n.result_count > 1) {
            diag_(diag::Code::kCompetitionMultipleResults, n.span, {label, std::to_string(n.result_count)});
        } else if (n.b != ast::k_invalid_node) {
            const ast::Node& r = ast_.node(n.b);
            if (!(r.score[0].has && r.score[1].has)) {
                diag_(diag::Code::kCompetitionResultIncomplete, r.span, {label, missing_slots_(r)});
            }
        }

        if (!n.terminated) {
            diag_(diag::Code::kCompetitionUnterminated, n.span, {label});
        }

        deco_(id).type = ty::void_();
    }

} // namespace olympiac::verify
