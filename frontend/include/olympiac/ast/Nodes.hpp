// frontend/include/olympiac/ast/Nodes.hpp
#pragma once
#include <olympiac/text/Span.hpp>
#include <olympiac/syntax/TokenKind.hpp>
#include <olympiac/diag/Diagnostic.hpp>

#include <cstdint>
#include <deque>
#include <string>
#include <string_view>
#include <vector>


namespace olympiac::ast {

    using NodeId = uint32_t;
    inline constexpr NodeId k_invalid_node = 0xFFFF'FFFFu;

    enum class NodeKind : uint8_t {
        kProgram,

        // ---- commands ----
        kComment,
        kAthleteDecl,
        kListDecl,
        kBulkLoad,
        kConditional,
        kElse,
        kLoop,
        kLoopUntil,
        kNarrate,
        kDirect,        // input(...)
        kIdentifier,    // 명령 위치의 bare identifier
        kSymbol,        // 명령 위치의 구두점
        kClose,         // 짝 없는 FinRep / FinRepHasta / endif

        // ---- competition ----
        kMatch,
        kRace,
        kRoutine,
        kCombat,
        kResult,
        kResultExtra,
        kTie,
        kActionStub,

        // ---- expr ----
        kInvocation,
        kBinaryOp,
        kUnaryOp,
        kNumber,
        kBool,
        kName,

        // ---- recovery ----
        kSyntaxError,
        kUnknown,
    };

    inline constexpr std::string_view node_kind_name(NodeKind k) {
        switch (k) {
            case NodeKind::kProgram:     return "Program";
            case NodeKind::kComment:     return "Comment";
            case NodeKind::kAthleteDecl: return "AthleteDecl";
            case NodeKind::kListDecl:    return "ListDecl";
            case NodeKind::kBulkLoad:    return "BulkLoad";
            case NodeKind::kConditional: return "Conditional";
            case NodeKind::kElse:        return "Else";
            case NodeKind::kLoop:        return "Loop";
            case NodeKind::kLoopUntil:   return "LoopUntil";
            case NodeKind::kNarrate:     return "Narrate";
            case NodeKind::kDirect:      return "Direct";
            case NodeKind::kIdentifier:  return "Identifier";
            case NodeKind::kSymbol:      return "Symbol";
            case NodeKind::kClose:       return "Close";
            case NodeKind::kMatch:       return "Match";
            case NodeKind::kRace:        return "Race";
            case NodeKind::kRoutine:     return "Routine";
            case NodeKind::kCombat:      return "Combat";
            case NodeKind::kResult:      return "Result";
            case NodeKind::kResultExtra: return "ResultExtra";
            case NodeKind::kTie:         return "Tie";
            case NodeKind::kActionStub:  return "ActionStub";
            case NodeKind::kInvocation:  return "Invocation";
            case NodeKind::kBinaryOp:    return "BinaryOp";
            case NodeKind::kUnaryOp:     return "UnaryOp";
            case NodeKind::kNumber:      return "Number";
            case NodeKind::kBool:        return "Bool";
            case NodeKind::kName:        return "Name";
            case NodeKind::kSyntaxError: return "SyntaxError";
            case NodeKind::kUnknown:     return "Unknown";
        }
        return "Unknown";
    }

    inline constexpr bool is_competition(NodeKind k) {
        return k == NodeKind::kMatch || k == NodeKind::kRace
            || k == NodeKind::kRoutine || k == NodeKind::kCombat;
    }

    // 값이 없을 수 있는 정수 슬롯 (Resultado 점수, 선수 스탯)
    struct OptInt {
        bool has = false;
        int64_t value = 0;
    };

    // Deportista <name> <s1> <s2> <s3> <sport> <country>
    struct AthleteTuple {
        std::string_view name{};
        OptInt stats[3]{};
        std::string_view sport{};
        std::string_view country{};
        Span span{};

        bool complete() const {
            return !name.empty() && stats[0].has && stats[1].has && stats[2].has
                && !sport.empty() && !country.empty();
        }
    };

    // 호출 인자: 원시 토큰 1개
    struct Arg {
        std::string_view text{};
        Span span{};
        syntax::TokenKind kind = syntax::TokenKind::kIdent;
    };

    struct Node {
        NodeKind kind = NodeKind::kUnknown;
        Span span{};
        std::string_view text{};      // content label (원문 토큰 또는 합성 문자열)

        // ---- generic links ----
        // Conditional: a=condition, b=Else
        // Loop: a=count expr / LoopUntil: a=condition
        // BinaryOp: a=lhs, b=rhs / UnaryOp: a=operand
        // competition: a=first Tie, b=first Result
        NodeId a = k_invalid_node;
        NodeId b = k_invalid_node;

        // children slice (children_에 대한 범위)
        uint32_t child_begin = 0;
        uint32_t child_count = 0;

        // ---- AthleteDecl / BulkLoad (athletes_ slice) ----
        uint32_t athlete_begin = 0;
        uint32_t athlete_count = 0;

        // ---- ListDecl ----
        std::string_view list_type{};  // 비어 있으면 타입 생략
        std::string_view list_name{};  // 비어 있으면 이름 없음

        // ---- Invocation / Narrate / Direct (args_ slice) ----
        std::string_view callee{};     // '(' 제외한 호출 이름
        uint32_t arg_begin = 0;
        uint32_t arg_count = 0;
        bool closed = true;            // ')' 로 닫혔는지

        // ---- BinaryOp / UnaryOp ----
        std::string_view op{};

        // ---- Number ----
        int64_t int_value = 0;

        // ---- Result ----
        OptInt score[2]{};
        bool has_dash = false;

        // ---- competition ----
        std::string_view home{};       // Match 전용
        std::string_view away{};
        bool terminated = false;
        uint32_t result_count = 0;
        uint32_t tie_count = 0;

        // ---- SyntaxError ----
        NodeKind recovered_kind = NodeKind::kUnknown; // 어떤 구문이 깨졌는지
        std::string_view missing{};
    };

    class AstArena {
    public:
        NodeId add_node(const Node& n) {  nodes_.push_back(n); return static_cast<NodeId>(nodes_.size() - 1);  }

        uint32_t add_child(NodeId id) {  children_.push_back(id); return static_cast<uint32_t>(children_.size() - 1);  }
        uint32_t add_athlete(const AthleteTuple& t) {  athletes_.push_back(t); return static_cast<uint32_t>(athletes_.size() - 1);  }
        uint32_t add_arg(const Arg& a) {  args_.push_back(a); return static_cast<uint32_t>(args_.size() - 1);  }

        std::string_view add_owned_string(std::string s) {
            owned_strings_.push_back(std::move(s));
            return owned_strings_.back();
        }

        // 자식 목록을 한 번에 커밋한다 (slice는 항상 연속)
        void commit_children(NodeId parent, const std::vector<NodeId>& kids) {
            Node& n = nodes_[parent];
            n.child_begin = static_cast<uint32_t>(children_.size());
            n.child_count = static_cast<uint32_t>(kids.size());
            for (NodeId k : kids) children_.push_back(k);
        }

        // accessors
        const Node& node(NodeId id) const {  return nodes_[id];  }
        Node& node_mut(NodeId id) {  return nodes_[id];  }
        const std::vector<Node>& nodes() const {  return nodes_;  }
        uint32_t size() const {  return static_cast<uint32_t>(nodes_.size());  }

        const std::vector<NodeId>& children() const {  return children_;  }
        NodeId child(NodeId parent, uint32_t i) const {
            return children_[nodes_[parent].child_begin + i];
        }

        const std::vector<AthleteTuple>& athletes() const {  return athletes_;  }
        const std::vector<Arg>& args() const {  return args_;  }

        // root(Program)에 붙는 구문 진단 목록
        void set_syntax_diags(std::vector<diag::Diagnostic> ds) {  syntax_diags_ = std::move(ds);  }
        const std::vector<diag::Diagnostic>& syntax_diags() const {  return syntax_diags_;  }

    private:
        std::vector<Node> nodes_;
        std::vector<NodeId> children_;
        std::vector<AthleteTuple> athletes_;
        std::vector<Arg> args_;
        std::deque<std::string> owned_strings_;
        std::vector<diag::Diagnostic> syntax_diags_;
    };

} // namespace olympiac::ast
