// compiler/olyc/include/olyc/driver/Driver.hpp
#pragma once

#include <olyc/cli/Options.hpp>

#include <olympiac/diag/Diagnostic.hpp>
#include <olympiac/text/SourceManager.hpp>

#include <cstdint>
#include <ostream>
#include <string>

namespace olyc::driver {

    /// @brief 단일 입력 파일에 대해 lex -> parse -> verify 를 실행한다.
    /// @return 0 = 오류 없음, 1 = 오류 또는 입력 실패
    int run(const cli::Options& opt);

    /// @brief 메모리상의 소스에 대해 같은 파이프라인을 실행한다 (테스트/도구용).
    int run_source(const cli::Options& opt,
                   const std::string& name,
                   std::string source,
                   std::ostream& out,
                   std::ostream& err);

    /// @brief 진단 목록을 text/json 형식으로 출력한다.
    /// @return bag에 error/fatal이 있으면 1
    int flush_diags(std::ostream& err,
                    const olympiac::diag::Bag& bag,
                    olympiac::diag::Language lang,
                    const olympiac::SourceManager& sm,
                    uint32_t context_lines,
                    cli::DiagFormat format);

} // namespace olyc::driver
