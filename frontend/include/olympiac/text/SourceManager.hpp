// frontend/include/olympiac/text/SourceManager.hpp
#pragma once
#include <olympiac/text/Span.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>


namespace olympiac {

    struct Snippet {
        std::string_view line_text{};
        uint32_t line_no = 1;           // 1-based
        uint32_t col = 1;               // 1-based
        uint32_t caret_cols_before = 0; // number of spaces before '^'
        uint32_t caret_cols_len = 1;    // number of '^'
    };

    struct SnippetBlock {
        uint32_t first_line_no = 1;             // 1-based
        std::vector<std::string_view> lines;    // [first_line_no ...]
        uint32_t caret_line_offset = 0;         // lines[]에서 캐럿이 찍힐 줄 (0-based)
        uint32_t caret_cols_before = 0;
        uint32_t caret_cols_len = 1;
        uint32_t col = 1;
    };

    class SourceManager {
    public:
        // 파일을 등록하고 file_id 반환 (0은 "소스 없음" 예약)
        uint32_t add(std::string name, std::string content);

        std::string_view name(uint32_t file_id) const;
        std::string_view content(uint32_t file_id) const;

        uint32_t line_count(uint32_t file_id) const;
        std::string_view line_text(uint32_t file_id, uint32_t line) const;

        Snippet snippet_for_span(const Span& sp) const;

        /// @brief span 기준으로 여러 줄 컨텍스트 스니펫을 생성한다.
        /// @param context_lines 위/아래로 추가로 보여줄 줄 수
        SnippetBlock snippet_block_for_span(const Span& sp, uint32_t context_lines) const;

    private:
        struct File {
            std::string name;
            std::string content;
            std::vector<uint32_t> line_starts; // byte offsets, includes 0
        };

        static std::vector<uint32_t> build_line_starts(std::string_view s);
        static uint32_t display_width_between(std::string_view s, uint32_t byte_lo, uint32_t byte_hi);

        const File* file_(uint32_t file_id) const;

        std::vector<File> files_;
    };

} // namespace olympiac
