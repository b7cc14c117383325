// compiler/olyc/src/cli/Options.cpp
#include <olyc/cli/Options.hpp>

#include <charconv>
#include <limits>
#include <optional>
#include <string_view>
#include <vector>

namespace olyc::cli {

    namespace {

        /// @brief `-Xolyc` 내부 옵션 하나를 파싱한다.
        bool parse_internal_opt_(Options& out, std::string_view token) {
            if (token == "-token-dump") {
                out.internal.token_dump = true;
                return true;
            }
            if (token == "-ast-dump") {
                out.internal.ast_dump = true;
                return true;
            }
            if (token == "-decorated-dump") {
                out.internal.decorated_dump = true;
                return true;
            }
            if (token == "-table-dump") {
                out.internal.table_dump = true;
                return true;
            }
            if (token == "-table-trace") {
                out.internal.table_trace = true;
                return true;
            }
            return false;
        }

        /// @brief 음이 아닌 10진수 전체를 읽는다. 범위를 넘으면 uint32 최대값으로 자른다.
        std::optional<uint32_t> parse_u32_(std::string_view text) {
            if (text.empty()) return std::nullopt;
            uint64_t v = 0;
            const auto [p, ec] = std::from_chars(text.data(), text.data() + text.size(), v);
            if (ec == std::errc::result_out_of_range) return std::numeric_limits<uint32_t>::max();
            if (ec != std::errc() || p != text.data() + text.size()) return std::nullopt;
            if (v > std::numeric_limits<uint32_t>::max()) return std::numeric_limits<uint32_t>::max();
            return static_cast<uint32_t>(v);
        }

        /// @brief 옵션 다음의 필수 값을 읽는다.
        std::optional<std::string_view> read_next_(
            const std::vector<std::string_view>& args,
            size_t& i
        ) {
            if (i + 1 >= args.size()) return std::nullopt;
            ++i;
            return args[i];
        }

        /// @brief `--name <v>` 또는 `--name=<v>` 형태의 값을 꺼낸다.
        /// @return 옵션이 일치하지 않으면 false. 값 누락은 out.ok=false 로 보고한다.
        bool read_value_opt_(
            Options& out,
            const std::vector<std::string_view>& args,
            size_t& i,
            std::string_view name,
            std::string_view& value
        ) {
            const auto a = args[i];
            if (a == name) {
                const auto v = read_next_(args, i);
                if (!v || v->empty()) {
                    out.ok = false;
                    out.error = std::string(name) + " requires a value";
                    return true;
                }
                value = *v;
                return true;
            }
            if (a.size() > name.size() && a.substr(0, name.size()) == name && a[name.size()] == '=') {
                value = a.substr(name.size() + 1);
                if (value.empty()) {
                    out.ok = false;
                    out.error = std::string(name) + " requires a value";
                }
                return true;
            }
            return false;
        }

        /// @brief `--diag-format[=]text|json` 값을 파싱한다.
        bool parse_diag_format_(
            Options& out,
            const std::vector<std::string_view>& args,
            size_t& i
        ) {
            std::string_view value{};
            if (!read_value_opt_(out, args, i, "--diag-format", value)) return false;
            if (!out.ok) return true;

            if (value == "text") {
                out.diag_format = DiagFormat::kText;
                return true;
            }
            if (value == "json") {
                out.diag_format = DiagFormat::kJson;
                return true;
            }

            out.ok = false;
            out.error = "unsupported --diag-format value: " + std::string(value);
            return true;
        }

        /// @brief `--lang[=]en|es` 값을 파싱한다.
        bool parse_lang_(
            Options& out,
            const std::vector<std::string_view>& args,
            size_t& i
        ) {
            std::string_view value{};
            if (!read_value_opt_(out, args, i, "--lang", value)) return false;
            if (!out.ok) return true;

            if (value == "en") {
                out.lang = olympiac::diag::Language::kEn;
                return true;
            }
            if (value == "es") {
                out.lang = olympiac::diag::Language::kEs;
                return true;
            }

            out.ok = false;
            out.error = "unsupported --lang value: " + std::string(value) + " (expected en or es)";
            return true;
        }

        /// @brief `-fmax-errors=N` / `-fcontext=N` 형식의 숫자 옵션을 읽는다.
        bool parse_number_flag_(Options& out, std::string_view arg, std::string_view prefix, uint32_t& field) {
            if (arg.size() < prefix.size() || arg.substr(0, prefix.size()) != prefix) return false;

            const auto v = parse_u32_(arg.substr(prefix.size()));
            if (!v) {
                out.ok = false;
                out.error = std::string(prefix) + " requires a valid number";
                return true;
            }
            field = *v;
            return true;
        }

    } // namespace

    void print_usage(std::ostream& os) {
        os
            << "olyc [options] <input.oly>\n"
            << "  olyc carrera.oly\n"
            << "  olyc --version\n"
            << "\n"
            << "General options:\n"
            << "  -h, --help\n"
            << "  --version\n"
            << "  -fsyntax-only        Parse only (no symbol table / verification)\n"
            << "  --diag-format text|json\n"
            << "  --lang en|es          Diagnostic language\n"
            << "  --context <N>         Context line count for diagnostics (alias: -fcontext=<N>)\n"
            << "  -fmax-errors=<N>      Cap on recorded syntax diagnostics\n"
            << "  --export-json <path>  Write decorated AST, errors and table snapshots\n"
            << "\n"
            << "Developer-only options (must be passed through -Xolyc):\n"
            << "  -Xolyc -token-dump\n"
            << "  -Xolyc -ast-dump\n"
            << "  -Xolyc -decorated-dump\n"
            << "  -Xolyc -table-dump\n"
            << "  -Xolyc -table-trace\n";
    }

    Options parse_options(const std::vector<std::string>& raw) {
        Options out{};
        if (raw.empty()) {
            out.mode = Mode::kUsage;
            return out;
        }

        std::vector<std::string_view> args;
        args.reserve(raw.size());
        for (const auto& s : raw) args.emplace_back(s);

        out.mode = Mode::kCheck;

        for (size_t i = 0; i < args.size(); ++i) {
            const auto a = args[i];

            if (a == "-h" || a == "--help") {
                out.mode = Mode::kUsage;
                return out;
            }

            if (a == "--version") {
                out.mode = Mode::kVersion;
                return out;
            }

            if (a == "-fsyntax-only") {
                out.syntax_only = true;
                continue;
            }

            if (parse_diag_format_(out, args, i)) {
                if (!out.ok) return out;
                continue;
            }

            if (parse_lang_(out, args, i)) {
                if (!out.ok) return out;
                continue;
            }

            std::string_view value{};
            if (read_value_opt_(out, args, i, "--context", value)) {
                if (!out.ok) return out;
                const auto n = parse_u32_(value);
                if (!n) {
                    out.ok = false;
                    out.error = "--context requires a valid number";
                    return out;
                }
                out.context_lines = *n;
                continue;
            }

            if (read_value_opt_(out, args, i, "--export-json", value)) {
                if (!out.ok) return out;
                out.export_json_path = std::string(value);
                continue;
            }

            if (parse_number_flag_(out, a, "-fcontext=", out.context_lines)) {
                if (!out.ok) return out;
                continue;
            }

            if (parse_number_flag_(out, a, "-fmax-errors=", out.max_errors)) {
                if (!out.ok) return out;
                if (out.max_errors < 1) out.max_errors = 1;
                continue;
            }

            if (a == "-Xolyc") {
                const auto v = read_next_(args, i);
                if (!v) {
                    out.ok = false;
                    out.error = "-Xolyc requires one internal argument";
                    return out;
                }
                out.has_xolyc = true;
                if (!parse_internal_opt_(out, *v)) {
                    out.ok = false;
                    out.error = "unknown -Xolyc argument: " + std::string(*v);
                    return out;
                }
                continue;
            }

            if (!a.empty() && a[0] == '-') {
                out.ok = false;
                out.error = "unknown option: " + std::string(a);
                return out;
            }

            out.inputs.push_back(std::string(a));
        }

        if (out.inputs.empty()) {
            out.ok = false;
            out.error = "no input file";
            return out;
        }

        if (out.inputs.size() > 1) {
            out.ok = false;
            out.error = "multiple input files are not supported";
            return out;
        }

        if (out.syntax_only && (out.internal.decorated_dump || out.internal.table_dump || out.internal.table_trace)) {
            out.ok = false;
            out.error = "-fsyntax-only cannot be combined with -Xolyc verification dumps";
            return out;
        }

        return out;
    }

    Options parse_options(int argc, char** argv) {
        std::vector<std::string> args;
        if (argc > 1) args.reserve(static_cast<size_t>(argc - 1));
        for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
        return parse_options(args);
    }

} // namespace olyc::cli
