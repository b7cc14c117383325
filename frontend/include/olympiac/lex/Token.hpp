// frontend/include/olympiac/lex/Token.hpp
#pragma once
#include <string_view>
#include <olympiac/text/Span.hpp>
#include <olympiac/syntax/TokenKind.hpp>


namespace olympiac {

    struct Token {
        syntax::TokenKind kind = syntax::TokenKind::kIdent;
        Span span{};
        std::string_view lexeme{};
    };

} // namespace olympiac
