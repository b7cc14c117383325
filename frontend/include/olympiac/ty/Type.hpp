// frontend/include/olympiac/ty/Type.hpp
#pragma once
#include <cstdint>
#include <string>
#include <string_view>


namespace olympiac::ty {

    enum class Kind : uint8_t {
        kUnknown,
        kInt,
        kString,
        kBool,
        kVoid,
        kEntity,   // entity:<Name>  (예: entity:Deportista)
        kList,     // list:<Elem>    (예: list:Deportista, list:unknown)
    };

    // 데코레이션/심볼 테이블이 들고 다니는 타입 태그.
    // entity/list만 param을 가진다.
    struct Type {
        Kind kind = Kind::kUnknown;
        std::string param{};

        bool is_unknown() const {  return kind == Kind::kUnknown;  }
        bool is_int() const     {  return kind == Kind::kInt;      }
        bool is_string() const  {  return kind == Kind::kString;   }
        bool is_entity() const  {  return kind == Kind::kEntity;   }
        bool is_list() const    {  return kind == Kind::kList;     }

        std::string to_string() const;

        friend bool operator==(const Type& a, const Type& b) {
            return a.kind == b.kind && a.param == b.param;
        }
        friend bool operator!=(const Type& a, const Type& b) {  return !(a == b);  }
    };

    inline Type unknown()   {  return Type{Kind::kUnknown, {}};  }
    inline Type int_()      {  return Type{Kind::kInt, {}};      }
    inline Type string_()   {  return Type{Kind::kString, {}};   }
    inline Type bool_()     {  return Type{Kind::kBool, {}};     }
    inline Type void_()     {  return Type{Kind::kVoid, {}};     }

    inline Type entity(std::string_view name) {  return Type{Kind::kEntity, std::string(name)};  }

    /// @brief 요소 타입이 비어 있으면 list:unknown
    inline Type list(std::string_view elem) {
        return Type{Kind::kList, elem.empty() ? std::string("unknown") : std::string(elem)};
    }

    /// @brief "int", "entity:Deportista" 같은 태그 문자열을 Type으로. 모르는 문자열은 unknown.
    Type parse(std::string_view tag);

} // namespace olympiac::ty
