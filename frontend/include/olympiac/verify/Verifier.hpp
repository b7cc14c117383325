// frontend/include/olympiac/verify/Verifier.hpp
#pragma once
#include <olympiac/ast/Nodes.hpp>
#include <olympiac/sema/SymbolTable.hpp>
#include <olympiac/ty/Type.hpp>
#include <olympiac/text/Span.hpp>
#include <olympiac/diag/Diagnostic.hpp>

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>


namespace olympiac::verify {

    // 노드별 의미 정보. AST는 건드리지 않고 NodeId로 인덱싱되는 사이드 테이블에 둔다.
    struct Decoration {
        bool visited = false;
        ty::Type type{};

        std::string definition{};              // 선언 노드: 선언한 것 (Deportista / 리스트 이름)
        uint32_t count = 0;                    // BulkLoad: 적재된 선수 수
        std::vector<ty::Type> arg_types{};     // 호출 노드
        ty::Type lhs{};                        // BinaryOp
        ty::Type rhs{};
        std::optional<sema::SymbolRecord> ref{}; // 이름 참조가 가리키는 엔트리 (복사본)
        std::string method_of{};               // obj . method 패턴에서 obj 이름
        bool complete = true;                  // Result: 두 점수가 모두 있는지
    };

    // 선언 직후의 테이블 상태
    struct SnapshotEntry {
        ast::NodeId node = ast::k_invalid_node;
        ast::NodeKind kind = ast::NodeKind::kUnknown;
        uint32_t line = 0;
        sema::TableSnapshot table{};
    };

    enum class ScopeEventKind : uint8_t { kEnter, kExit };

    struct ScopeEvent {
        ScopeEventKind kind = ScopeEventKind::kEnter;
        uint32_t level = 0;
        uint32_t line = 0;
    };

    struct VerifyResult {
        bool ok = true;
        std::vector<Decoration> decorations;   // ast.nodes() index에 대응
        std::vector<diag::Diagnostic> errors;  // 발견 순서
        sema::SymbolTable table;               // 최종 테이블 (global scope)
        std::vector<SnapshotEntry> snapshots;
        std::vector<ScopeEvent> scope_trace;
    };

    // 내장 호출 규칙 (테이블 기반)
    struct Builtin {
        std::string_view name;   // 소문자
        int arity = -1;          // -1 = 가변
        ty::Kind ret = ty::Kind::kVoid;
        bool args_must_be_entities = false;
        bool resolve_args = true; // false면 인자를 조회/검사하지 않음 (input)
    };

    /// @brief 소문자 이름으로 내장 호출 규칙 조회
    const Builtin* find_builtin(std::string_view lower_name);

    /// @brief 따옴표 텍스트 -> string, 숫자 -> int, 선언된 이름 -> 그 타입, 나머지 -> unknown
    ty::Type resolve_arg_type(std::string_view text, const sema::SymbolTable& table);

    /// @brief 따옴표/숫자가 아닌 순수 식별자 텍스트인지
    bool is_bare_identifier(std::string_view text);

    class Verifier {
    public:
        explicit Verifier(const ast::AstArena& ast) : ast_(ast) {}
        Verifier(const ast::AstArena& ast, diag::Bag& bag) : ast_(ast), diag_bag_(&bag) {}

        // Program 노드 하나를 검증. 매 호출 독립.
        VerifyResult verify(ast::NodeId root);

    private:
        void diag_(diag::Code code, Span sp, std::initializer_list<std::string_view> args = {});

        Decoration& deco_(ast::NodeId id);
        const ty::Type& type_of_(ast::NodeId id);

        void enter_scope_(uint32_t line);
        void exit_scope_(uint32_t line);
        void record_snapshot_(ast::NodeId id);

        // ---- walk ----
        void visit_(ast::NodeId id);
        void visit_children_(ast::NodeId id, bool in_competition = false);
        void visit_scoped_(ast::NodeId id);

        // ---- declarations ----
        void visit_athlete_(ast::NodeId id);
        void visit_list_(ast::NodeId id);
        void visit_bulk_(ast::NodeId id);
        void visit_error_(ast::NodeId id);

        // ---- names / expr ----
        ty::Type resolve_name_(ast::NodeId id, std::string_view text, Span sp);
        void visit_identifier_(ast::NodeId id, std::string_view method_owner);
        void visit_binary_(ast::NodeId id);
        void visit_unary_(ast::NodeId id);
        void visit_call_(ast::NodeId id);
        void visit_narrate_(ast::NodeId id);
        void visit_direct_(ast::NodeId id);
        void check_arg_resolves_(const ast::Arg& a);

        // ---- competition ----
        void visit_result_(ast::NodeId id, bool in_competition);
        void visit_competition_(ast::NodeId id);

        const ast::AstArena& ast_;
        diag::Bag* diag_bag_ = nullptr;

        VerifyResult result_{};
        uint32_t error_depth_ = 0;  // SyntaxError 하위에서는 식별자 오류를 내지 않는다
    };

} // namespace olympiac::verify
