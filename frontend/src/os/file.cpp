// frontend/src/os/file.cpp
#include <olympiac/os/File.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>


namespace olympiac {

    static void normalize_newlines_inplace(std::string& s) {
        // CRLF -> LF, 단독 CR -> LF (줄 번호가 어긋나지 않게)
        std::string out;
        out.reserve(s.size());

        for (size_t i = 0; i < s.size(); ++i) {
            const char c = s[i];
            if (c == '\r') {
                if (i + 1 < s.size() && s[i + 1] == '\n') continue;
                out.push_back('\n');
                continue;
            }
            out.push_back(c);
        }

        s.swap(out);
    }

    bool open_file(const std::string& path, std::string& out_content, std::string& out_error) {
        out_error.clear();
        out_content.clear();

        std::FILE* fp = std::fopen(path.c_str(), "rb");
        if (!fp) {
            out_error = std::string("cannot open file '") + path + "': " + std::strerror(errno);
            return false;
        }

        std::fseek(fp, 0, SEEK_END);
        const long sz = std::ftell(fp);
        std::fseek(fp, 0, SEEK_SET);

        if (sz < 0) {
            std::fclose(fp);
            out_error = "cannot read size of file '" + path + "'";
            return false;
        }

        out_content.resize(static_cast<size_t>(sz));
        const size_t n = std::fread(out_content.data(), 1, out_content.size(), fp);
        std::fclose(fp);

        if (n != out_content.size()) {
            out_error = "short read on file '" + path + "'";
            return false;
        }

        normalize_newlines_inplace(out_content);
        return true;
    }

    bool write_file(const std::string& path, const std::string& content, std::string& out_error) {
        out_error.clear();

        std::FILE* fp = std::fopen(path.c_str(), "wb");
        if (!fp) {
            out_error = std::string("cannot write file '") + path + "': " + std::strerror(errno);
            return false;
        }

        const size_t n = std::fwrite(content.data(), 1, content.size(), fp);
        const bool closed = (std::fclose(fp) == 0);
        if (n != content.size() || !closed) {
            out_error = "short write on file '" + path + "'";
            return false;
        }
        return true;
    }

} // namespace olympiac
