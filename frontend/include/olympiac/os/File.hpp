// frontend/include/olympiac/os/File.hpp
#pragma once
#include <string>


namespace olympiac {

    /// @brief 파일 전체를 읽는다. CRLF/CR은 LF로 정규화된다.
    bool open_file(const std::string& path, std::string& out_content, std::string& out_error);

    /// @brief 문자열을 파일에 쓴다 (덮어쓰기).
    bool write_file(const std::string& path, const std::string& content, std::string& out_error);

} // namespace olympiac
