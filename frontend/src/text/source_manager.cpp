// frontend/src/text/source_manager.cpp
#include <olympiac/text/SourceManager.hpp>

#include <algorithm>


namespace olympiac {

    // UTF-8 continuation byte는 폭 0, 나머지는 1로 센다 (스페인어 악센트 정도면 충분)
    uint32_t SourceManager::display_width_between(std::string_view s, uint32_t byte_lo, uint32_t byte_hi) {
        uint32_t w = 0;
        for (uint32_t i = byte_lo; i < byte_hi && i < s.size(); ++i) {
            const unsigned char c = static_cast<unsigned char>(s[i]);
            if ((c & 0xC0) != 0x80) ++w;
        }
        return w;
    }

    std::vector<uint32_t> SourceManager::build_line_starts(std::string_view s) {
        std::vector<uint32_t> starts;
        starts.push_back(0);

        for (uint32_t i = 0; i < s.size(); ++i) {
            if (s[i] == '\n') starts.push_back(i + 1);
        }
        return starts;
    }

    uint32_t SourceManager::add(std::string name, std::string content) {
        // [0] = "소스 없음" 슬롯
        if (files_.empty()) files_.push_back(File{"<tokens>", {}, {0}});

        File f;
        f.name = std::move(name);
        f.content = std::move(content);
        f.line_starts = build_line_starts(f.content);
        files_.push_back(std::move(f));

        return static_cast<uint32_t>(files_.size() - 1);
    }

    const SourceManager::File* SourceManager::file_(uint32_t file_id) const {
        if (file_id == 0 || file_id >= files_.size()) return nullptr;
        return &files_[file_id];
    }

    std::string_view SourceManager::name(uint32_t file_id) const {
        const File* f = file_(file_id);
        return f ? std::string_view(f->name) : std::string_view("<tokens>");
    }

    std::string_view SourceManager::content(uint32_t file_id) const {
        const File* f = file_(file_id);
        return f ? std::string_view(f->content) : std::string_view{};
    }

    uint32_t SourceManager::line_count(uint32_t file_id) const {
        const File* f = file_(file_id);
        return f ? static_cast<uint32_t>(f->line_starts.size()) : 0;
    }

    std::string_view SourceManager::line_text(uint32_t file_id, uint32_t line) const {
        const File* f = file_(file_id);
        if (!f || line == 0 || line > f->line_starts.size()) return {};

        const uint32_t idx = line - 1;
        const uint32_t lo = f->line_starts[idx];
        uint32_t hi = (idx + 1 < f->line_starts.size())
            ? f->line_starts[idx + 1] - 1
            : static_cast<uint32_t>(f->content.size());
        if (hi > lo && f->content[hi - 1] == '\r') --hi;
        return std::string_view(f->content).substr(lo, hi - lo);
    }

    Snippet SourceManager::snippet_for_span(const Span& sp) const {
        Snippet sn;
        sn.line_no = sp.line;
        sn.col = sp.col;
        sn.line_text = line_text(sp.file_id, sp.line);
        if (sn.line_text.empty()) return sn;

        const uint32_t lo = (sp.col > 0) ? sp.col - 1 : 0;
        const uint32_t hi = std::min<uint32_t>(lo + sp.len, static_cast<uint32_t>(sn.line_text.size()));

        sn.caret_cols_before = display_width_between(sn.line_text, 0, lo);
        sn.caret_cols_len = display_width_between(sn.line_text, lo, hi);
        if (sn.caret_cols_len == 0) sn.caret_cols_len = 1;
        return sn;
    }

    SnippetBlock SourceManager::snippet_block_for_span(const Span& sp, uint32_t context_lines) const {
        SnippetBlock blk;
        const uint32_t n = line_count(sp.file_id);
        if (n == 0 || sp.line == 0 || sp.line > n) return blk;

        const uint32_t first = (sp.line > context_lines) ? sp.line - context_lines : 1;
        const uint32_t last = std::min<uint32_t>(n, sp.line + context_lines);

        blk.first_line_no = first;
        for (uint32_t l = first; l <= last; ++l) blk.lines.push_back(line_text(sp.file_id, l));
        blk.caret_line_offset = sp.line - first;

        const Snippet sn = snippet_for_span(sp);
        blk.caret_cols_before = sn.caret_cols_before;
        blk.caret_cols_len = sn.caret_cols_len;
        blk.col = sp.col;
        return blk;
    }

} // namespace olympiac
