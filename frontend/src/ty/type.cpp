// frontend/src/ty/type.cpp
#include <olympiac/ty/Type.hpp>


namespace olympiac::ty {

    std::string Type::to_string() const {
        switch (kind) {
            case Kind::kUnknown: return "unknown";
            case Kind::kInt:     return "int";
            case Kind::kString:  return "string";
            case Kind::kBool:    return "bool";
            case Kind::kVoid:    return "void";
            case Kind::kEntity:  return "entity:" + param;
            case Kind::kList:    return "list:" + param;
        }
        return "unknown";
    }

    Type parse(std::string_view tag) {
        if (tag == "int") return int_();
        if (tag == "string") return string_();
        if (tag == "bool") return bool_();
        if (tag == "void") return void_();
        if (tag.starts_with("entity:")) return entity(tag.substr(7));
        if (tag.starts_with("list:")) return list(tag.substr(5));
        return unknown();
    }

} // namespace olympiac::ty
