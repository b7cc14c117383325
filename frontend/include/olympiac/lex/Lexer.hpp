// frontend/include/olympiac/lex/Lexer.hpp
#pragma once
#include <olympiac/lex/Token.hpp>
#include <olympiac/diag/Diagnostic.hpp>

#include <cstdint>
#include <string_view>
#include <vector>


namespace olympiac {

    // .oly 소스를 분류된 토큰 스트림으로 바꾼다.
    // 토큰의 lexeme은 source를 가리키므로 source가 토큰보다 오래 살아야 한다.
    class Lexer {
    public:
        Lexer(std::string_view source, std::uint32_t file_id)
            : Lexer(source, file_id, nullptr) {}

        Lexer(std::string_view source, std::uint32_t file_id, diag::Bag* diags);

        std::vector<Token> lex_all();

    private:
        char peek(size_t k = 0) const;
        bool eof() const;
        char bump();

        Span span_from_(size_t lo, uint32_t line, uint32_t col) const;

        void skip_ws();

        Token lex_comment();
        Token lex_number();
        Token lex_word();
        Token lex_text();
        bool lex_operator_or_punct(Token& out);

        void report_(diag::Code code, Span sp, std::string_view a0 = {});

        std::string_view source_;
        uint32_t file_id_ = 0;
        size_t pos_ = 0;
        uint32_t line_ = 1;
        size_t line_start_ = 0;

        diag::Bag* diags_ = nullptr;
    };

} // namespace olympiac
