// frontend/include/olympiac/text/Span.hpp
#pragma once
#include <cstdint>


namespace olympiac {

    // 토큰/노드 위치. line/col은 1-based, len은 바이트 길이.
    struct Span {
        uint32_t file_id = 0;
        uint32_t line = 0;
        uint32_t col = 0;
        uint32_t len = 0;
    };

} // namespace olympiac
