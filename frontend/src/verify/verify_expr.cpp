// frontend/src/verify/verify_expr.cpp
#include <olympiac/verify/Verifier.hpp>
#include <olympiac/diag/DiagCode.hpp>

#include <array>
#include <cctype>
#include <string>


namespace olympiac::verify {

    using ast::NodeId;

    namespace {

        constexpr std::array<Builtin, 3> kBuiltins = {{
            {"comparar", 2, ty::Kind::kInt, true, true},
            {"narrar", -1, ty::Kind::kVoid, false, true},
            {"input", 1, ty::Kind::kVoid, false, false},
        }};

        std::string lower_(std::string_view s) {
            std::string out(s);
            for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            return out;
        }

        bool is_quoted_(std::string_view s) {
            return s.size() >= 2 && s.front() == '"' && s.back() == '"';
        }

        bool is_digits_(std::string_view s) {
            if (s.empty()) return false;
            for (char c : s) {
                if (!std::isdigit(static_cast<unsigned char>(c))) return false;
            }
            return true;
        }

        bool is_arith_(std::string_view op) {
            return op == "+" || op == "-" || op == "*" || op == "/" || op == "%";
        }

    } // namespace

    const Builtin* find_builtin(std::string_view lower_name) {
        for (const auto& b : kBuiltins) {
            if (b.name == lower_name) return &b;
        }
        return nullptr;
    }

    bool is_bare_identifier(std::string_view text) {
        if (text.empty() || is_digits_(text)) return false;
        for (char ch : text) {
            const unsigned char c = static_cast<unsigned char>(ch);
            if (!(std::isalnum(c) || c == '_' || c >= 0x80)) return false;
        }
        return true;
    }

    ty::Type resolve_arg_type(std::string_view text, const sema::SymbolTable& table) {
        if (is_quoted_(text)) return ty::string_();
        if (is_digits_(text)) return ty::int_();
        if (auto sid = table.lookup(text)) return table.symbol(*sid).type;
        return ty::unknown();
    }

    // --------------------
    // names
    // --------------------

    ty::Type Verifier::resolve_name_(NodeId id, std::string_view text, Span sp) {
        if (is_quoted_(text)) return ty::string_();
        if (is_digits_(text)) return ty::int_();

        if (auto sid = result_.table.lookup(text)) {
            result_.decorations[id].ref = result_.table.record(*sid);
            return result_.table.symbol(*sid).type;
        }

        if (error_depth_ == 0) {
            diag_(diag::Code::kUndeclaredName, sp, {text});
        }
        return ty::unknown();
    }

    void Verifier::visit_identifier_(NodeId id, std::string_view method_owner) {
        const ast::Node& n = ast_.node(id);

        // 리스트 객체의 메서드 이름은 심볼로 조회하지 않는다
        if (auto sid = result_.table.lookup(method_owner)) {
            if (result_.table.symbol(*sid).type.is_list()) {
                Decoration& d = deco_(id);
                d.type = ty::unknown();
                d.method_of = std::string(method_owner);
                return;
            }
        }

        const ty::Type t = resolve_name_(id, n.text, n.span);
        deco_(id).type = t;
    }

    void Verifier::check_arg_resolves_(const ast::Arg& a) {
        if (!is_bare_identifier(a.text)) return;
        if (result_.table.lookup(a.text)) return;
        if (error_depth_ == 0) diag_(diag::Code::kUndeclaredName, a.span, {a.text});
    }

    // --------------------
    // expr
    // --------------------

    void Verifier::visit_binary_(NodeId id) {
        const ast::Node& n = ast_.node(id);
        visit_(n.a);
        visit_(n.b);

        const ty::Type l = type_of_(n.a);
        const ty::Type r = type_of_(n.b);

        ty::Type out = ty::unknown();
        if (n.op == "+" && ((l.is_string() && r.is_int()) || (l.is_int() && r.is_string()))) {
            diag_(diag::Code::kAddTextAndNumber, n.span);
        } else if (l.is_int() && r.is_int() && is_arith_(n.op)) {
            out = ty::int_();
        } else if (n.op == "+" && l.is_string() && r.is_string()) {
            out = ty::string_();
        }

        Decoration& d = deco_(id);
        d.lhs = l;
        d.rhs = r;
        d.type = out;
    }

    void Verifier::visit_unary_(NodeId id) {
        const ast::Node& n = ast_.node(id);
        visit_(n.a);
        const ty::Type t = type_of_(n.a);
        deco_(id).type = t.is_int() ? ty::int_() : ty::unknown();
    }

    // --------------------
    // calls
    // --------------------

    void Verifier::visit_call_(NodeId id) {
        const ast::Node& n = ast_.node(id);
        const std::string lname = lower_(n.callee);
        const Builtin* b = find_builtin(lname);

        std::vector<ty::Type> arg_types;
        arg_types.reserve(n.arg_count);

        if (b && b->arity >= 0 && static_cast<uint32_t>(b->arity) != n.arg_count) {
            diag_(diag::Code::kArityMismatch, n.span,
                  {n.callee, std::to_string(b->arity), std::to_string(n.arg_count)});
        }

        for (uint32_t i = 0; i < n.arg_count; ++i) {
            const ast::Arg& a = ast_.args()[n.arg_begin + i];
            const ty::Type t = resolve_arg_type(a.text, result_.table);
            arg_types.push_back(t);

            if (b && !b->resolve_args) continue;

            // 미선언 식별자는 "선언 전 사용" 한 건만 보고한다
            if (is_bare_identifier(a.text) && !result_.table.lookup(a.text)) {
                if (error_depth_ == 0) diag_(diag::Code::kUndeclaredName, a.span, {a.text});
                continue;
            }

            if (b && b->args_must_be_entities && !t.is_entity()) {
                diag_(diag::Code::kArgNotEntity, a.span, {std::to_string(i + 1), t.to_string()});
            }
        }

        Decoration& d = deco_(id);
        d.type = b ? ty::Type{b->ret, {}} : ty::unknown();
        d.arg_types = std::move(arg_types);
        d.definition = std::string(n.callee);
    }

    void Verifier::visit_narrate_(NodeId id) {
        const ast::Node& n = ast_.node(id);

        std::vector<ty::Type> arg_types;
        arg_types.reserve(n.arg_count);
        for (uint32_t i = 0; i < n.arg_count; ++i) {
            const ast::Arg& a = ast_.args()[n.arg_begin + i];
            arg_types.push_back(resolve_arg_type(a.text, result_.table));
            check_arg_resolves_(a);
        }

        Decoration& d = deco_(id);
        d.type = ty::void_();
        d.arg_types = std::move(arg_types);
    }

    // input(...) : 인자 수만 검사
    void Verifier::visit_direct_(NodeId id) {
        const ast::Node& n = ast_.node(id);
        const Builtin* b = find_builtin("input");

        if (b && static_cast<uint32_t>(b->arity) != n.arg_count) {
            diag_(diag::Code::kArityMismatch, n.span,
                  {n.callee, std::to_string(b->arity), std::to_string(n.arg_count)});
        }

        std::vector<ty::Type> arg_types;
        for (uint32_t i = 0; i < n.arg_count; ++i) {
            arg_types.push_back(resolve_arg_type(ast_.args()[n.arg_begin + i].text, result_.table));
        }

        Decoration& d = deco_(id);
        d.type = ty::void_();
        d.arg_types = std::move(arg_types);
    }

} // namespace olympiac::verify
