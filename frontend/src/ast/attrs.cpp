// frontend/src/ast/attrs.cpp
#include <olympiac/ast/Attrs.hpp>

#include <sstream>


namespace olympiac::ast {

    AttrValue attr_null() {  return AttrValue{};  }

    AttrValue attr_int(int64_t v) {
        AttrValue a{};
        a.kind = AttrValue::Kind::kInt;
        a.i = v;
        return a;
    }

    AttrValue attr_text(std::string_view s) {
        AttrValue a{};
        a.kind = AttrValue::Kind::kText;
        a.text = std::string(s);
        return a;
    }

    AttrValue attr_opt(const OptInt& v) {
        return v.has ? attr_int(v.value) : attr_null();
    }

    namespace {

        AttrValue opt_text_(std::string_view s) {
            return s.empty() ? attr_null() : attr_text(s);
        }

        AttrValue athlete_map_(const AthleteTuple& t) {
            AttrValue m{};
            m.kind = AttrValue::Kind::kMap;
            m.fields.push_back({"nombre", opt_text_(t.name)});
            m.fields.push_back({"stat1", attr_opt(t.stats[0])});
            m.fields.push_back({"stat2", attr_opt(t.stats[1])});
            m.fields.push_back({"stat3", attr_opt(t.stats[2])});
            m.fields.push_back({"deporte", opt_text_(t.sport)});
            m.fields.push_back({"pais", opt_text_(t.country)});
            return m;
        }

        void args_list_(const AstArena& ast, const Node& n, Attrs& out) {
            AttrValue lst{};
            lst.kind = AttrValue::Kind::kList;
            for (uint32_t i = 0; i < n.arg_count; ++i) {
                lst.items.push_back(attr_text(ast.args()[n.arg_begin + i].text));
            }
            out.push_back({"args", std::move(lst)});
        }

        void json_escape_(std::ostringstream& os, std::string_view s) {
            os << '"';
            for (char c : s) {
                switch (c) {
                    case '\\': os << "\\\\"; break;
                    case '"': os << "\\\""; break;
                    case '\n': os << "\\n"; break;
                    case '\r': os << "\\r"; break;
                    case '\t': os << "\\t"; break;
                    default: os << c; break;
                }
            }
            os << '"';
        }

        void write_(std::ostringstream& os, const AttrValue& v);

        void write_fields_(std::ostringstream& os, const std::vector<AttrField>& fs) {
            os << '{';
            for (size_t i = 0; i < fs.size(); ++i) {
                if (i) os << ", ";
                json_escape_(os, fs[i].name);
                os << ": ";
                write_(os, fs[i].value);
            }
            os << '}';
        }

        void write_(std::ostringstream& os, const AttrValue& v) {
            switch (v.kind) {
                case AttrValue::Kind::kNull: os << "null"; break;
                case AttrValue::Kind::kInt: os << v.i; break;
                case AttrValue::Kind::kText: json_escape_(os, v.text); break;
                case AttrValue::Kind::kList:
                    os << '[';
                    for (size_t i = 0; i < v.items.size(); ++i) {
                        if (i) os << ", ";
                        write_(os, v.items[i]);
                    }
                    os << ']';
                    break;
                case AttrValue::Kind::kMap:
                    write_fields_(os, v.fields);
                    break;
            }
        }

    } // namespace

    Attrs attrs_of(const AstArena& ast, NodeId id) {
        Attrs out;
        if (id == k_invalid_node || id >= ast.size()) return out;

        const Node& n = ast.node(id);
        switch (n.kind) {
            case NodeKind::kAthleteDecl:
                if (n.athlete_count == 1) {
                    out = athlete_map_(ast.athletes()[n.athlete_begin]).fields;
                }
                break;

            case NodeKind::kBulkLoad: {
                AttrValue lst{};
                lst.kind = AttrValue::Kind::kList;
                for (uint32_t i = 0; i < n.athlete_count; ++i) {
                    lst.items.push_back(athlete_map_(ast.athletes()[n.athlete_begin + i]));
                }
                out.push_back({"deportistas", std::move(lst)});
                break;
            }

            case NodeKind::kListDecl:
                out.push_back({"tipo", opt_text_(n.list_type)});
                out.push_back({"nombre", opt_text_(n.list_name)});
                break;

            case NodeKind::kInvocation:
            case NodeKind::kNarrate:
            case NodeKind::kDirect:
                out.push_back({"nombre", attr_text(n.callee)});
                args_list_(ast, n, out);
                if (!n.closed) out.push_back({"cerrado", attr_int(0)});
                break;

            case NodeKind::kBinaryOp:
            case NodeKind::kUnaryOp:
                out.push_back({"op", attr_text(n.op)});
                break;

            case NodeKind::kNumber:
                out.push_back({"valor", attr_int(n.int_value)});
                break;

            case NodeKind::kResult:
                out.push_back({"local", attr_opt(n.score[0])});
                out.push_back({"visitante", attr_opt(n.score[1])});
                break;

            case NodeKind::kMatch:
                out.push_back({"local", opt_text_(n.home)});
                out.push_back({"visitante", opt_text_(n.away)});
                out.push_back({"terminado", attr_int(n.terminated ? 1 : 0)});
                break;

            case NodeKind::kRace:
            case NodeKind::kRoutine:
            case NodeKind::kCombat:
            case NodeKind::kActionStub:
                out.push_back({"terminado", attr_int(n.terminated ? 1 : 0)});
                break;

            case NodeKind::kSyntaxError:
                out.push_back({"recuperado", attr_text(node_kind_name(n.recovered_kind))});
                if (!n.missing.empty()) out.push_back({"faltante", attr_text(n.missing)});
                if (n.athlete_count == 1) {
                    out.push_back({"parcial", athlete_map_(ast.athletes()[n.athlete_begin])});
                }
                break;

            case NodeKind::kProgram:
            case NodeKind::kComment:
            case NodeKind::kConditional:
            case NodeKind::kElse:
            case NodeKind::kLoop:
            case NodeKind::kLoopUntil:
            case NodeKind::kIdentifier:
            case NodeKind::kSymbol:
            case NodeKind::kClose:
            case NodeKind::kResultExtra:
            case NodeKind::kTie:
            case NodeKind::kBool:
            case NodeKind::kName:
            case NodeKind::kUnknown:
                break;
        }
        return out;
    }

    std::string to_json(const AttrValue& v) {
        std::ostringstream os;
        write_(os, v);
        return os.str();
    }

    std::string to_json(const Attrs& attrs) {
        std::ostringstream os;
        write_fields_(os, attrs);
        return os.str();
    }

} // namespace olympiac::ast
