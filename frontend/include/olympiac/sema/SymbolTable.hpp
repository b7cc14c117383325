// frontend/include/olympiac/sema/SymbolTable.hpp
#pragma once
#include <olympiac/text/Span.hpp>
#include <olympiac/ty/Type.hpp>
#include <olympiac/ast/Nodes.hpp>

#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>


namespace olympiac::sema {

    // 심볼 1개 엔트리
    struct Symbol {
        std::string_view name{};        // owned_names_ 를 가리킨다
        ty::Type type{};

        ast::NodeId decl_node = ast::k_invalid_node;
        uint32_t decl_line = 0;
        uint32_t scope_level = 0;       // 0 = global
        uint32_t owner_scope = 0;       // 소속 스코프 id (디버그/정책용)
    };

    // shadowing 기록 (허용하되 남겨 둔다)
    struct Shadowing {
        uint32_t old_symbol = 0;
        uint32_t new_symbol = 0;
        uint32_t line = 0;
    };

    // snapshot: 스코프 레벨 -> 선언 순서대로의 레코드 (deep copy)
    struct SymbolRecord {
        std::string name;
        std::string type;
        uint32_t line = 0;
        uint32_t level = 0;
    };

    struct ScopeSnapshot {
        uint32_t level = 0;
        std::vector<SymbolRecord> entries;
    };

    using TableSnapshot = std::vector<ScopeSnapshot>;

    /// @brief "[scope N]:\n  - name: type (line L)" 형식
    std::string to_string(const TableSnapshot& snap);

    // unordered_map for string_view
    struct SvHash {
        size_t operator()(std::string_view s) const noexcept {
            // FNV-1a (간단)
            size_t h = 1469598103934665603ull;
            for (unsigned char c : s) {
                h ^= (size_t)c;
                h *= 1099511628211ull;
            }
            return h;
        }
    };
    struct SvEq {
        bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
    };

    struct Scope {
        uint32_t parent = 0xFFFF'FFFFu;
        uint32_t level = 0;
        std::unordered_map<std::string_view, uint32_t, SvHash, SvEq> table;
        std::vector<uint32_t> order;    // 선언 순서
    };

    // 심볼 테이블: 스코프 스택 + 심볼 저장소
    class SymbolTable {
    public:
        SymbolTable() {
            scopes_.reserve(64);
            symbols_.reserve(256);

            // [0] 글로벌 스코프
            Scope g{};
            g.parent = kNoScope;
            g.level = 0;
            scopes_.push_back(std::move(g));
            scope_stack_.push_back(0);
        }

        // 키가 owned_names_ 를 가리키므로 복사는 금지, 이동만 허용
        SymbolTable(const SymbolTable&) = delete;
        SymbolTable& operator=(const SymbolTable&) = delete;
        SymbolTable(SymbolTable&&) = default;
        SymbolTable& operator=(SymbolTable&&) = default;

        static constexpr uint32_t kNoScope = 0xFFFF'FFFFu;

        // 현재 스코프 id / 깊이
        uint32_t current_scope() const { return scope_stack_.empty() ? 0 : scope_stack_.back(); }
        uint32_t current_level() const { return scopes_[current_scope()].level; }

        // 스코프 push, 새 레벨 반환
        uint32_t enter_scope() {
            Scope s{};
            s.parent = current_scope();
            s.level = current_level() + 1;
            scopes_.push_back(std::move(s));
            uint32_t id = (uint32_t)scopes_.size() - 1;
            scope_stack_.push_back(id);
            return scopes_[id].level;
        }

        // 스코프 pop (글로벌은 pop 금지), 빠져나온 레벨 반환
        uint32_t exit_scope() {
            const uint32_t lv = current_level();
            if (scope_stack_.size() <= 1) return lv;
            scope_stack_.pop_back();
            return lv;
        }

        // 심볼 조회(현재 스코프 체인)
        // 찾으면 symbol id, 아니면 nullopt
        std::optional<uint32_t> lookup(std::string_view name) const {
            uint32_t s = current_scope();
            while (s != kNoScope) {
                const auto& m = scopes_[s].table;
                auto it = m.find(name);
                if (it != m.end()) return it->second;
                s = scopes_[s].parent;
            }
            return std::nullopt;
        }

        // 같은 스코프 내 중복 여부(duplicate 체크용)
        std::optional<uint32_t> lookup_in_current(std::string_view name) const {
            const auto& m = scopes_[current_scope()].table;
            auto it = m.find(name);
            if (it == m.end()) return std::nullopt;
            return it->second;
        }

        // 선언:
        // - 같은 스코프에 있으면 duplicate (기존 엔트리는 그대로)
        // - 바깥 스코프에 있으면 shadowing 기록(허용)
        struct InsertResult {
            bool ok = false;
            bool is_duplicate = false;
            bool is_shadowing = false;
            uint32_t symbol_id = 0;
            uint32_t shadowed_symbol_id = 0;
            uint32_t level = 0;
        };

        InsertResult declare(std::string_view name, ty::Type type, ast::NodeId node, uint32_t line) {
            InsertResult r{};
            r.level = current_level();

            // duplicate (same scope)
            if (auto dup = lookup_in_current(name)) {
                r.ok = false;
                r.is_duplicate = true;
                r.symbol_id = *dup;
                return r;
            }

            // shadowing (outer scopes)
            if (auto outer = lookup(name)) {
                r.is_shadowing = true;
                r.shadowed_symbol_id = *outer;
            }

            owned_names_.emplace_back(name);
            const std::string_view key = owned_names_.back();

            Symbol sym{};
            sym.name = key;
            sym.type = std::move(type);
            sym.decl_node = node;
            sym.decl_line = line;
            sym.scope_level = current_level();
            sym.owner_scope = current_scope();

            symbols_.push_back(std::move(sym));
            uint32_t sid = (uint32_t)symbols_.size() - 1;
            scopes_[current_scope()].table.emplace(key, sid);
            scopes_[current_scope()].order.push_back(sid);

            r.ok = true;
            r.symbol_id = sid;

            if (r.is_shadowing) {
                Shadowing sh{};
                sh.old_symbol = r.shadowed_symbol_id;
                sh.new_symbol = sid;
                sh.line = line;
                shadowings_.push_back(sh);
            }
            return r;
        }

        const Symbol& symbol(uint32_t id) const { return symbols_[id]; }

        SymbolRecord record(uint32_t id) const {
            const Symbol& s = symbols_[id];
            return SymbolRecord{std::string(s.name), s.type.to_string(), s.decl_line, s.scope_level};
        }

        // 살아 있는 스코프(스택) 전체를 깊은 복사
        TableSnapshot snapshot() const {
            TableSnapshot out;
            out.reserve(scope_stack_.size());
            for (uint32_t sid : scope_stack_) {
                ScopeSnapshot ss{};
                ss.level = scopes_[sid].level;
                for (uint32_t sym : scopes_[sid].order) ss.entries.push_back(record(sym));
                out.push_back(std::move(ss));
            }
            return out;
        }

        const std::vector<Symbol>& symbols() const { return symbols_; }
        const std::vector<Shadowing>& shadowings() const { return shadowings_; }

    private:
        std::vector<Scope> scopes_;
        std::vector<uint32_t> scope_stack_;

        std::vector<Symbol> symbols_;
        std::vector<Shadowing> shadowings_;
        std::deque<std::string> owned_names_;
    };

} // namespace olympiac::sema
