// frontend/include/olympiac/parse/Parser.hpp
#pragma once
#include <olympiac/parse/Cursor.hpp>
#include <olympiac/ast/Nodes.hpp>
#include <olympiac/diag/Diagnostic.hpp>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>


namespace olympiac {

    struct ParserOptions {
        uint32_t sync_step_limit = 500; // synchronize() 1회당 최대 skip 수
        uint32_t max_diags = 256;       // 기록할 구문 진단 상한 (파싱은 계속)
        uint32_t max_depth = 256;       // 복합 구문 중첩 상한
    };

    // 에러 허용 재귀 하강 파서.
    // 어떤 입력이든 Program 노드를 돌려주고, 구문 진단은 root(arena)와 bag에 남긴다.
    class Parser {
    public:
        Parser(const std::vector<Token>& tokens,
               ast::AstArena& ast,
               diag::Bag* diags = nullptr,
               ParserOptions opt = {})
            : cursor_(tokens), ast_(ast), diags_(diags), opt_(opt) {}

        // 스트림 끝까지 command를 반복 파싱하여 Program 노드 생성
        ast::NodeId parse_program();

        // 표현식 1개 (테스트/도구용)
        ast::NodeId parse_expr();

        /// @brief 복구 예산이 소진되어 나머지 토큰을 버렸는지
        bool recovery_exhausted() const {  return recovery_exhausted_;  }

    private:
        // --------------------
        // diag & small helpers
        // --------------------

        //  진단을 기록 (message/line/col 기준 중복 제거, max_diags 처리 포함)
        void diag_report(diag::Code code, Span span, std::initializer_list<std::string_view> args = {});
        /// @brief 경고 진단을 기록한다
        void diag_report_warn(diag::Code code, Span span, std::initializer_list<std::string_view> args = {});
        void diag_push_(diag::Severity sev, diag::Code code, Span span, std::initializer_list<std::string_view> args);

        /// @brief 현재 위치 span. 끝이면 마지막 토큰 위치
        Span here_() const;

        static std::string lower_(std::string_view s);
        ast::OptInt parse_int_(const Token& t);

        // 키워드 비교는 카테고리 + 대소문자 무시 lexeme
        static bool is_kw(const Token* t, syntax::TokenKind k, std::string_view kw_lower);
        bool at_kw(syntax::TokenKind k, std::string_view kw_lower, size_t look = 0) const;
        bool at_punct(char c, size_t look = 0) const;
        bool at_kind(syntax::TokenKind k, size_t look = 0) const;

        //  기대 토큰을 소비, 실패 시 ExpectedToken / UnexpectedEof (report=false면 조용히)
        const Token* expect_kw(syntax::TokenKind k, std::string_view kw_lower, std::string_view shown, bool report = true);
        const Token* expect_punct(char c, bool report = true);

        //  다음 동기화 앵커까지 skip
        void synchronize();
        bool is_anchor_(size_t look) const;
        bool starts_line_(size_t look) const;

        bool is_terminator_kw_(const Token* t) const;
        bool is_block_closer_(const Token* t) const;
        bool is_boundary_(const Token* t) const;
        bool is_control_closer_(const Token* t) const;
        bool enter_compound_();   // 중첩 상한 검사 (초과 시 진단 1회)

        ast::NodeId make_leaf_(ast::NodeKind kind, const Token& t);

        // --------------------
        // commands
        // --------------------
        ast::NodeId parse_command();
        void parse_block_body_(std::vector<ast::NodeId>& out,
                               bool (Parser::*stop)(const Token*) const);

        bool stop_then_body_(const Token* t) const;
        bool stop_brace_body_(const Token* t) const;
        bool stop_bracket_body_(const Token* t) const;
        bool stop_stub_body_(const Token* t) const;
        bool stop_prep_body_(const Token* t) const;
        bool stop_competition_body_(const Token* t) const;

        ast::NodeId parse_conditional();
        ast::NodeId parse_else_(bool& degraded);
        ast::NodeId parse_loop();
        ast::NodeId parse_loop_until();

        // --------------------
        // declarations
        // --------------------
        ast::NodeId parse_athlete_decl();
        ast::NodeId parse_list_or_bulk();
        bool try_athlete_tuple_(ast::AthleteTuple& out);
        ast::NodeId parse_list_decl_(const Token& lista_tok);

        // --------------------
        // expr / invocation
        // --------------------
        ast::NodeId parse_condition();
        ast::NodeId parse_expr_bin_(int min_prec);
        ast::NodeId flatten_overflow_chain_(ast::NodeId lhs, int min_prec);
        ast::NodeId parse_expr_unary_();
        ast::NodeId parse_expr_primary_();
        ast::NodeId parse_invocation();

        // --------------------
        // competition
        // --------------------
        ast::NodeId parse_match();
        ast::NodeId parse_block_competition(ast::NodeKind kind, std::string_view end_kw, std::string_view end_shown);
        struct CompetitionBody {
            std::vector<ast::NodeId> kids;
            ast::NodeId tie = ast::k_invalid_node;
            ast::NodeId result = ast::k_invalid_node;
            uint32_t tie_count = 0;
            uint32_t result_count = 0;
        };
        CompetitionBody parse_competition_body_();
        void finish_competition_(ast::NodeId id, CompetitionBody& body,
                                 std::string_view end_kw, std::string_view block_name,
                                 std::string_view end_shown);
        ast::NodeId parse_result();
        ast::NodeId parse_action_stub();

        Cursor cursor_;
        ast::AstArena& ast_;
        diag::Bag* diags_ = nullptr;
        ParserOptions opt_{};

        std::vector<diag::Diagnostic> emitted_;
        std::unordered_set<std::string> seen_diag_keys_;
        uint32_t recorded_count_ = 0;
        bool too_many_errors_emitted_ = false;
        bool depth_reported_ = false;
        bool recovery_exhausted_ = false;

        uint32_t depth_ = 0;
    };

} // namespace olympiac
