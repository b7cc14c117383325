// frontend/include/olympiac/ast/Attrs.hpp
#pragma once
#include <olympiac/ast/Nodes.hpp>

#include <cstdint>
#include <string>
#include <vector>


namespace olympiac::ast {

    struct AttrField;

    // 노드 속성 값: null | int | text | list | map
    struct AttrValue {
        enum class Kind : uint8_t { kNull, kInt, kText, kList, kMap };

        Kind kind = Kind::kNull;
        int64_t i = 0;
        std::string text{};
        std::vector<AttrValue> items{};   // kList
        std::vector<AttrField> fields{};  // kMap (삽입 순서 유지)
    };

    struct AttrField {
        std::string name;
        AttrValue value;
    };

    using Attrs = std::vector<AttrField>;

    AttrValue attr_null();
    AttrValue attr_int(int64_t v);
    AttrValue attr_text(std::string_view s);
    AttrValue attr_opt(const OptInt& v);

    /// @brief 노드의 속성을 순서 있는 맵으로 펼친다 (dump/export 용).
    Attrs attrs_of(const AstArena& ast, NodeId id);

    /// @brief JSON 표기로 직렬화
    std::string to_json(const AttrValue& v);
    std::string to_json(const Attrs& attrs);

} // namespace olympiac::ast
