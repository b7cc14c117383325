// frontend/include/olympiac/diag/Render.hpp
#pragma once
#include <olympiac/diag/Diagnostic.hpp>
#include <olympiac/text/SourceManager.hpp>

#include <string>
#include <string_view>


namespace olympiac::diag {

    /// @brief 코드 이름 (예: "UndeclaredName")
    std::string_view code_name(Code c);

    std::string_view severity_name(Severity s);

    /// @brief 템플릿에 인자를 채워 메시지 본문만 만든다.
    std::string render_message(const Diagnostic& d, Language lang);

    std::string render_one(const Diagnostic& d, Language lang, const SourceManager& sm);

    /// @brief 진단을 렌더링하되, 에러 라인 주변 컨텍스트를 함께 출력
    std::string render_one_context(const Diagnostic& d, Language lang, const SourceManager& sm, uint32_t context_lines);

} // namespace olympiac::diag
