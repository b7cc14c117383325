// compiler/olyc/include/olyc/dump/Dump.hpp
#pragma once

#include <olympiac/ast/Nodes.hpp>
#include <olympiac/ast/Attrs.hpp>
#include <olympiac/diag/DiagCode.hpp>
#include <olympiac/lex/Token.hpp>
#include <olympiac/verify/Verifier.hpp>

#include <ostream>
#include <string>
#include <vector>

namespace olyc::dump {

    /// @brief 토큰 목록을 출력한다.
    void dump_tokens(std::ostream& os, const std::vector<olympiac::Token>& tokens);

    /// @brief AST를 전위 순회로 출력한다: `<"Kind", "text", {attrs}>`
    void dump_ast(std::ostream& os, const olympiac::ast::AstArena& ast, olympiac::ast::NodeId id, int indent);

    /// @brief 검증 결과가 붙은 AST와 의미 오류 목록을 출력한다.
    void dump_decorated(std::ostream& os,
                        const olympiac::ast::AstArena& ast,
                        olympiac::ast::NodeId root,
                        const olympiac::verify::VerifyResult& res,
                        olympiac::diag::Language lang);

    /// @brief 최종 심볼 테이블과 선언별 스냅샷을 출력한다.
    void dump_table(std::ostream& os, const olympiac::verify::VerifyResult& res);

    /// @brief 스코프 진입/이탈 기록을 출력한다.
    void dump_scope_trace(std::ostream& os, const olympiac::verify::VerifyResult& res);

    /// @brief 데코레이션 1개를 속성 맵으로 펼친다.
    olympiac::ast::AttrValue decoration_value(const olympiac::verify::Decoration& d);

    /// @brief decorations / errors / snapshots 를 하나의 JSON 문서로 만든다.
    std::string export_json(const olympiac::ast::AstArena& ast,
                            const olympiac::verify::VerifyResult& res,
                            olympiac::diag::Language lang);

} // namespace olyc::dump
