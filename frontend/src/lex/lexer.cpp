// frontend/src/lex/lexer.cpp
#include <olympiac/lex/Lexer.hpp>
#include <olympiac/syntax/TokenKind.hpp>

#include <array>
#include <cctype>


namespace olympiac {

    using syntax::TokenKind;

    namespace {

        struct Keyword {
            std::string_view text;
            TokenKind kind;
        };

        // 대소문자 구분 (스캐너 규칙 그대로)
        constexpr std::array<Keyword, 34> kKeywords = {{
            {"Deportista", TokenKind::kEntityDecl},
            {"Lista", TokenKind::kEntityDecl},

            {"Pais", TokenKind::kDomainType},
            {"Deporte", TokenKind::kDomainType},
            {"Resultado", TokenKind::kDomainType},

            {"RepetirHasta", TokenKind::kControlFlow},
            {"FinRepHasta", TokenKind::kControlFlow},
            {"FinRepHast", TokenKind::kControlFlow},
            {"Repetir", TokenKind::kControlFlow},
            {"FinRep", TokenKind::kControlFlow},
            {"si", TokenKind::kControlFlow},
            {"entonces", TokenKind::kControlFlow},
            {"sino", TokenKind::kControlFlow},
            {"endif", TokenKind::kControlFlow},

            {"preparacion", TokenKind::kDomainKeyword},
            {"finprep", TokenKind::kDomainKeyword},
            {"InicioCarrera", TokenKind::kDomainKeyword},
            {"correr", TokenKind::kDomainKeyword},
            {"finCarr", TokenKind::kDomainKeyword},
            {"InicioRutina", TokenKind::kDomainKeyword},
            {"ejecutar", TokenKind::kDomainKeyword},
            {"finRuti", TokenKind::kDomainKeyword},
            {"InicioCombate", TokenKind::kDomainKeyword},
            {"combatir", TokenKind::kDomainKeyword},
            {"finComb", TokenKind::kDomainKeyword},
            {"finact", TokenKind::kDomainKeyword},
            {"ceremonia_medallas", TokenKind::kDomainKeyword},
            {"competencia_oficial", TokenKind::kDomainKeyword},
            {"partido_clasificatorio", TokenKind::kDomainKeyword},

            {"listaRes", TokenKind::kResultMarker},
            {"empate", TokenKind::kTieMarker},
            {"vs", TokenKind::kSpecialOp},
            {"True", TokenKind::kBoolLit},
            {"False", TokenKind::kBoolLit},
        }};

        // '(' 가 바로 붙을 때만 호출 토큰
        bool is_call_word_(std::string_view w) {
            return w == "narrar" || w == "Comparar" || w == "input";
        }

        bool is_word_start_(unsigned char c) {
            return std::isalpha(c) || c == '_' || c >= 0x80;
        }

        bool is_word_continue_(unsigned char c) {
            return std::isalnum(c) || c == '_' || c >= 0x80;
        }

    } // namespace

    Lexer::Lexer(std::string_view source, std::uint32_t file_id, diag::Bag* diags)
        : source_(source), file_id_(file_id), diags_(diags) {}

    char Lexer::peek(size_t k) const {
        size_t i = pos_ + k;
        if (i >= source_.size()) return '\0';
        return source_[i];
    }

    bool Lexer::eof() const {
        return pos_ >= source_.size();
    }

    char Lexer::bump() {
        if (eof()) return '\0';
        const char c = source_[pos_++];
        if (c == '\n') {
            ++line_;
            line_start_ = pos_;
        }
        return c;
    }

    Span Lexer::span_from_(size_t lo, uint32_t line, uint32_t col) const {
        Span sp{};
        sp.file_id = file_id_;
        sp.line = line;
        sp.col = col;
        sp.len = static_cast<uint32_t>(pos_ - lo);
        return sp;
    }

    void Lexer::report_(diag::Code code, Span sp, std::string_view a0) {
        if (!diags_) return;
        diag::Diagnostic d(diag::Severity::kError, code, sp);
        if (!a0.empty()) d.add_arg(a0);
        diags_->add(std::move(d));
    }

    void Lexer::skip_ws() {
        while (!eof()) {
            const char c = peek();
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v') {
                bump();
                continue;
            }
            break;
        }
    }

    // ';' 부터 줄 끝까지
    Token Lexer::lex_comment() {
        const size_t lo = pos_;
        const uint32_t line = line_;
        const uint32_t col = static_cast<uint32_t>(pos_ - line_start_) + 1;
        while (!eof() && peek() != '\n') bump();

        std::string_view text = source_.substr(lo, pos_ - lo);
        while (!text.empty() && text.back() == '\r') text.remove_suffix(1);

        Token t{};
        t.kind = TokenKind::kComment;
        t.span = span_from_(lo, line, col);
        t.lexeme = text;
        return t;
    }

    Token Lexer::lex_number() {
        const size_t lo = pos_;
        const uint32_t col = static_cast<uint32_t>(pos_ - line_start_) + 1;
        while (std::isdigit(static_cast<unsigned char>(peek()))) bump();

        Token t{};
        t.kind = TokenKind::kIntLit;
        t.span = span_from_(lo, line_, col);
        t.lexeme = source_.substr(lo, pos_ - lo);
        return t;
    }

    Token Lexer::lex_word() {
        const size_t lo = pos_;
        const uint32_t col = static_cast<uint32_t>(pos_ - line_start_) + 1;
        while (!eof() && is_word_continue_(static_cast<unsigned char>(peek()))) bump();

        const std::string_view w = source_.substr(lo, pos_ - lo);

        Token t{};
        t.kind = TokenKind::kIdent;

        if (is_call_word_(w) && peek() == '(') {
            bump();
            t.kind = TokenKind::kFuncCall;
        } else {
            for (const auto& kw : kKeywords) {
                if (kw.text == w) {
                    t.kind = kw.kind;
                    break;
                }
            }
        }

        t.span = span_from_(lo, line_, col);
        t.lexeme = source_.substr(lo, pos_ - lo);
        return t;
    }

    // "..." 한 줄 텍스트. 따옴표를 포함한 채 식별자 카테고리로 낸다.
    Token Lexer::lex_text() {
        const size_t lo = pos_;
        const uint32_t col = static_cast<uint32_t>(pos_ - line_start_) + 1;
        bump(); // opening quote

        bool closed = false;
        while (!eof() && peek() != '\n') {
            if (bump() == '"') {
                closed = true;
                break;
            }
        }

        Token t{};
        t.kind = TokenKind::kIdent;
        t.span = span_from_(lo, line_, col);
        t.lexeme = source_.substr(lo, pos_ - lo);
        if (!closed) report_(diag::Code::kLexUnterminatedText, t.span);
        return t;
    }

    bool Lexer::lex_operator_or_punct(Token& out) {
        const size_t lo = pos_;
        const uint32_t col = static_cast<uint32_t>(pos_ - line_start_) + 1;
        const char c0 = peek();
        const char c1 = peek(1);

        TokenKind kind{};
        size_t n = 0;

        if ((c0 == '=' || c0 == '!' || c0 == '<' || c0 == '>') && c1 == '=') {
            kind = TokenKind::kCompareOp;
            n = 2;
        } else if (c0 == '<' || c0 == '>') {
            kind = TokenKind::kCompareOp;
            n = 1;
        } else if (c0 == '+' || c0 == '-' || c0 == '*' || c0 == '/' || c0 == '%') {
            kind = TokenKind::kArithOp;
            n = 1;
        } else if (c0 == '(' || c0 == ')' || c0 == ',' || c0 == ':' || c0 == '{'
                || c0 == '}' || c0 == '[' || c0 == ']' || c0 == '.') {
            kind = TokenKind::kPunct;
            n = 1;
        } else {
            return false;
        }

        for (size_t i = 0; i < n; ++i) bump();
        out.kind = kind;
        out.span = span_from_(lo, line_, col);
        out.lexeme = source_.substr(lo, n);
        return true;
    }

    std::vector<Token> Lexer::lex_all() {
        std::vector<Token> out;
        out.reserve(source_.size() / 4 + 1);

        while (true) {
            skip_ws();
            if (eof()) break;

            const unsigned char c = static_cast<unsigned char>(peek());

            if (c == ';') {
                out.push_back(lex_comment());
                continue;
            }
            if (std::isdigit(c)) {
                out.push_back(lex_number());
                continue;
            }
            if (is_word_start_(c)) {
                out.push_back(lex_word());
                continue;
            }
            if (c == '"') {
                out.push_back(lex_text());
                continue;
            }

            Token t{};
            if (lex_operator_or_punct(t)) {
                out.push_back(t);
                continue;
            }

            // 분류 불가 문자: 진단 후 skip
            const size_t lo = pos_;
            const uint32_t col = static_cast<uint32_t>(pos_ - line_start_) + 1;
            bump();
            report_(diag::Code::kLexUnknownChar, span_from_(lo, line_, col), source_.substr(lo, 1));
        }

        return out;
    }

} // namespace olympiac
