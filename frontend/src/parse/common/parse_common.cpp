// frontend/src/parse/common/parse_common.cpp
#include <olympiac/parse/Parser.hpp>
#include <olympiac/syntax/TokenKind.hpp>
#include <olympiac/diag/DiagCode.hpp>
#include <olympiac/diag/Render.hpp>

#include <cctype>
#include <charconv>
#include <limits>


namespace olympiac {

    using syntax::TokenKind;

    std::string Parser::lower_(std::string_view s) {
        std::string out(s);
        for (char& c : out) {
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return out;
    }

    // 범위를 넘는 리터럴은 진단 후 INT64_MAX로 포화시킨다 (누락으로 취급하지 않음)
    ast::OptInt Parser::parse_int_(const Token& t) {
        ast::OptInt out{};
        const std::string_view s = t.lexeme;
        int64_t v = 0;
        auto [p, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
        if (ec == std::errc::result_out_of_range) {
            diag_report(diag::Code::kIntOutOfRange, t.span, {s});
            out.has = true;
            out.value = std::numeric_limits<int64_t>::max();
            return out;
        }
        if (ec == std::errc() && p == s.data() + s.size()) {
            out.has = true;
            out.value = v;
        }
        return out;
    }

    // --------------------
    // diagnostics
    // --------------------

    void Parser::diag_push_(diag::Severity sev, diag::Code code, Span span,
                            std::initializer_list<std::string_view> args) {
        diag::Diagnostic d(sev, code, span);
        for (auto a : args) d.add_arg(a);

        // (message, line, col) 가 같으면 한 번만 기록한다.
        std::string key = diag::render_message(d, diag::Language::kEn);
        key += '\x1f';
        key += std::to_string(span.line);
        key += ':';
        key += std::to_string(span.col);
        if (!seen_diag_keys_.insert(std::move(key)).second) return;

        if (recorded_count_ >= opt_.max_diags) {
            if (!too_many_errors_emitted_) {
                too_many_errors_emitted_ = true;
                diag::Diagnostic stop(diag::Severity::kFatal, diag::Code::kTooManyErrors, span);
                stop.add_arg_int(static_cast<int>(opt_.max_diags));
                emitted_.push_back(stop);
                if (diags_) diags_->add(std::move(stop));
            }
            return;
        }
        ++recorded_count_;

        emitted_.push_back(d);
        if (diags_) diags_->add(std::move(d));
    }

    void Parser::diag_report(diag::Code code, Span span, std::initializer_list<std::string_view> args) {
        diag_push_(diag::Severity::kError, code, span, args);
    }

    void Parser::diag_report_warn(diag::Code code, Span span, std::initializer_list<std::string_view> args) {
        diag_push_(diag::Severity::kWarning, code, span, args);
    }

    Span Parser::here_() const {
        if (const Token* t = cursor_.peek()) return t->span;
        if (const Token* p = cursor_.prev()) {
            Span sp = p->span;
            sp.col += sp.len;
            sp.len = 0;
            return sp;
        }
        return Span{};
    }

    // --------------------
    // token predicates
    // --------------------

    bool Parser::is_kw(const Token* t, TokenKind k, std::string_view kw_lower) {
        if (!t || t->kind != k) return false;
        if (t->lexeme.size() != kw_lower.size()) return false;
        for (size_t i = 0; i < kw_lower.size(); ++i) {
            const char c = static_cast<char>(std::tolower(static_cast<unsigned char>(t->lexeme[i])));
            if (c != kw_lower[i]) return false;
        }
        return true;
    }

    bool Parser::at_kw(TokenKind k, std::string_view kw_lower, size_t look) const {
        return is_kw(cursor_.peek(look), k, kw_lower);
    }

    bool Parser::at_punct(char c, size_t look) const {
        const Token* t = cursor_.peek(look);
        return t && t->kind == TokenKind::kPunct && t->lexeme.size() == 1 && t->lexeme[0] == c;
    }

    bool Parser::at_kind(TokenKind k, size_t look) const {
        const Token* t = cursor_.peek(look);
        return t && t->kind == k;
    }

    bool Parser::is_terminator_kw_(const Token* t) const {
        return is_kw(t, TokenKind::kDomainKeyword, "finact")
            || is_kw(t, TokenKind::kDomainKeyword, "fincarr")
            || is_kw(t, TokenKind::kDomainKeyword, "finruti")
            || is_kw(t, TokenKind::kDomainKeyword, "finprep")
            || is_kw(t, TokenKind::kDomainKeyword, "fincomb");
    }

    bool Parser::is_block_closer_(const Token* t) const {
        if (!t || t->kind != TokenKind::kPunct || t->lexeme.size() != 1) return false;
        const char c = t->lexeme[0];
        return c == '}' || c == ']' || c == ')';
    }

    bool Parser::is_boundary_(const Token* t) const {
        return is_kw(t, TokenKind::kDomainType, "resultado")
            || (t && t->kind == TokenKind::kResultMarker)
            || (t && t->kind == TokenKind::kTieMarker);
    }

    bool Parser::is_control_closer_(const Token* t) const {
        return is_kw(t, TokenKind::kControlFlow, "finrep")
            || is_kw(t, TokenKind::kControlFlow, "finrephasta")
            || is_kw(t, TokenKind::kControlFlow, "finrephast")
            || is_kw(t, TokenKind::kControlFlow, "endif")
            || is_kw(t, TokenKind::kControlFlow, "sino");
    }

    bool Parser::starts_line_(size_t look) const {
        const Token* t = cursor_.peek(look);
        if (!t) return false;

        const Token* before = nullptr;
        if (look > 0) before = cursor_.peek(look - 1);
        else before = cursor_.prev();

        if (!before) return true;
        return t->span.line > before->span.line;
    }

    bool Parser::is_anchor_(size_t look) const {
        const Token* t = cursor_.peek(look);
        if (!t) return true;

        switch (t->kind) {
            case TokenKind::kEntityDecl:
            case TokenKind::kControlFlow:
            case TokenKind::kDomainKeyword:
                return true;
            case TokenKind::kFuncCall:
                return starts_line_(look);
            case TokenKind::kPunct:
                return is_block_closer_(t);
            default:
                break;
        }

        if (!starts_line_(look)) return false;
        if (is_boundary_(t)) return true;

        // "<Pais> vs" 로 시작하는 새 줄
        return t->kind == TokenKind::kIdent && at_kind(TokenKind::kSpecialOp, look + 1);
    }

    // --------------------
    // expect / recovery
    // --------------------

    const Token* Parser::expect_kw(TokenKind k, std::string_view kw_lower, std::string_view shown, bool report) {
        if (at_kw(k, kw_lower)) return cursor_.bump();

        if (report) {
            const Token* got = cursor_.peek();
            if (!got) diag_report(diag::Code::kUnexpectedEof, here_(), {shown});
            else diag_report(diag::Code::kExpectedToken, got->span, {shown, got->lexeme});
        }
        return nullptr;
    }

    const Token* Parser::expect_punct(char c, bool report) {
        if (at_punct(c)) return cursor_.bump();

        if (report) {
            static constexpr std::string_view kPunctText = "(){}[],.:";
            const size_t i = kPunctText.find(c);
            const std::string_view shown = (i == std::string_view::npos) ? std::string_view("?") : kPunctText.substr(i, 1);
            const Token* got = cursor_.peek();
            if (!got) diag_report(diag::Code::kUnexpectedEof, here_(), {shown});
            else diag_report(diag::Code::kExpectedToken, got->span, {shown, got->lexeme});
        }
        return nullptr;
    }

    void Parser::synchronize() {
        uint32_t steps = 0;
        while (!cursor_.at_end()) {
            if (is_anchor_(0)) return;

            // 예산 초과: 나머지 스트림은 버린다
            if (steps >= opt_.sync_step_limit) {
                cursor_.skip_to_end();
                recovery_exhausted_ = true;
                return;
            }
            cursor_.bump();
            ++steps;
        }
    }

    bool Parser::enter_compound_() {
        if (depth_ < opt_.max_depth) return true;
        if (!depth_reported_) {
            depth_reported_ = true;
            diag_report(diag::Code::kNestingTooDeep, here_(), {std::to_string(opt_.max_depth)});
        }
        return false;
    }

    ast::NodeId Parser::make_leaf_(ast::NodeKind kind, const Token& t) {
        ast::Node n{};
        n.kind = kind;
        n.span = t.span;
        n.text = t.lexeme;
        return ast_.add_node(n);
    }

} // namespace olympiac
