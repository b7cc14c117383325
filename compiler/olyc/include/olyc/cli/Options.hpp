// compiler/olyc/include/olyc/cli/Options.hpp
#pragma once

#include <olympiac/diag/DiagCode.hpp>

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace olyc::cli {

    /// @brief `olyc` 실행 모드.
    enum class Mode : uint8_t {
        kUsage,
        kVersion,
        kCheck,
    };

    /// @brief CLI 진단 출력 포맷.
    enum class DiagFormat : uint8_t {
        kText,
        kJson,
    };

    /// @brief `-Xolyc`로만 접근 가능한 내부 개발 옵션.
    struct InternalOptions {
        bool token_dump = false;
        bool ast_dump = false;
        bool decorated_dump = false;
        bool table_dump = false;
        bool table_trace = false;
    };

    /// @brief `olyc` 최종 실행 옵션.
    struct Options {
        Mode mode = Mode::kUsage;

        std::vector<std::string> inputs{};
        bool syntax_only = false;
        DiagFormat diag_format = DiagFormat::kText;
        std::string export_json_path{};

        bool has_xolyc = false;
        InternalOptions internal{};

        olympiac::diag::Language lang = olympiac::diag::Language::kEn;
        uint32_t context_lines = 2;
        uint32_t max_errors = 256;

        bool ok = true;
        std::string error{};
    };

    /// @brief `olyc` CLI 사용법을 출력한다.
    void print_usage(std::ostream& os);

    /// @brief CLI 인자를 파싱해 실행 옵션 구조체로 변환한다.
    Options parse_options(int argc, char** argv);

    /// @brief 이미 분리된 인자 목록(프로그램 이름 제외)을 파싱한다.
    Options parse_options(const std::vector<std::string>& args);

} // namespace olyc::cli
