// frontend/include/olympiac/syntax/TokenKind.hpp
#pragma once
#include <string_view>
#include <cstdint>


namespace olympiac::syntax {

    // 스캐너가 분류해 넘겨주는 토큰 카테고리 (닫힌 집합)
    enum class TokenKind : uint8_t {
        kComment = 0,     // ';' ... EOL
        kEntityDecl,      // Deportista | Lista
        kDomainType,      // Pais | Deporte | Resultado
        kControlFlow,     // Repetir, FinRep, RepetirHasta, FinRepHasta, si, entonces, sino, endif
        kFuncCall,        // "narrar(" 처럼 '('까지 포함한 호출 토큰
        kDomainKeyword,   // InicioCarrera, finact, preparacion ...
        kResultMarker,    // listaRes
        kTieMarker,       // empate
        kCompareOp,       // == != >= <= > <
        kSpecialOp,       // vs
        kArithOp,         // + - * / %
        kIntLit,
        kBoolLit,         // True | False
        kIdent,           // 이름 (따옴표 텍스트 포함)
        kPunct,           // ( ) , : { } [ ] .
    };

    inline constexpr std::string_view token_kind_name(TokenKind k) {
        switch (k) {
            case TokenKind::kComment:       return "comment";
            case TokenKind::kEntityDecl:    return "entity-decl";
            case TokenKind::kDomainType:    return "domain-type";
            case TokenKind::kControlFlow:   return "control-flow";
            case TokenKind::kFuncCall:      return "func-call";
            case TokenKind::kDomainKeyword: return "domain-keyword";
            case TokenKind::kResultMarker:  return "result-marker";
            case TokenKind::kTieMarker:     return "tie-marker";
            case TokenKind::kCompareOp:     return "compare-op";
            case TokenKind::kSpecialOp:     return "special-op";
            case TokenKind::kArithOp:       return "arith-op";
            case TokenKind::kIntLit:        return "int-lit";
            case TokenKind::kBoolLit:       return "bool-lit";
            case TokenKind::kIdent:         return "ident";
            case TokenKind::kPunct:         return "punct";
        }
        return "unknown";
    }

} // namespace olympiac::syntax
