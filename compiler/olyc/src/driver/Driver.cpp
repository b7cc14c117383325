// compiler/olyc/src/driver/Driver.cpp
#include <olyc/driver/Driver.hpp>
#include <olyc/dump/Dump.hpp>

#include <olympiac/diag/Render.hpp>
#include <olympiac/lex/Lexer.hpp>
#include <olympiac/os/File.hpp>
#include <olympiac/parse/Parser.hpp>
#include <olympiac/verify/Verifier.hpp>

#include <iomanip>
#include <iostream>
#include <sstream>
#include <string_view>

namespace olyc::driver {

    namespace {

        std::string json_escape_(std::string_view s) {
            std::string out;
            out.reserve(s.size() + 8);
            for (const char ch : s) {
                switch (ch) {
                    case '\"': out += "\\\""; break;
                    case '\\': out += "\\\\"; break;
                    case '\b': out += "\\b"; break;
                    case '\f': out += "\\f"; break;
                    case '\n': out += "\\n"; break;
                    case '\r': out += "\\r"; break;
                    case '\t': out += "\\t"; break;
                    default:
                        if (static_cast<unsigned char>(ch) < 0x20) {
                            std::ostringstream oss;
                            oss << "\\u" << std::hex << std::uppercase
                                << std::setw(4) << std::setfill('0')
                                << static_cast<int>(static_cast<unsigned char>(ch));
                            out += oss.str();
                        } else {
                            out.push_back(ch);
                        }
                        break;
                }
            }
            return out;
        }

    } // namespace

    int flush_diags(std::ostream& err,
                    const olympiac::diag::Bag& bag,
                    olympiac::diag::Language lang,
                    const olympiac::SourceManager& sm,
                    uint32_t context_lines,
                    cli::DiagFormat format) {
        if (bag.diags().empty()) return 0;

        if (format == cli::DiagFormat::kText) {
            for (const auto& d : bag.diags()) {
                err << olympiac::diag::render_one_context(d, lang, sm, context_lines) << "\n";
            }
            return bag.has_error() ? 1 : 0;
        }

        err << "[\n";
        bool first = true;
        for (const auto& d : bag.diags()) {
            const auto sp = d.span();

            if (!first) err << ",\n";
            first = false;

            err << "  {";
            err << "\"severity\":\"" << olympiac::diag::severity_name(d.severity()) << "\",";
            err << "\"code\":\"" << json_escape_(olympiac::diag::code_name(d.code())) << "\",";
            err << "\"message\":\"" << json_escape_(olympiac::diag::render_message(d, lang)) << "\",";
            err << "\"file\":\"" << json_escape_(sm.name(sp.file_id)) << "\",";
            err << "\"line\":" << sp.line << ",";
            err << "\"col\":" << sp.col << ",";
            err << "\"args\":[";
            for (size_t i = 0; i < d.args().size(); ++i) {
                if (i != 0) err << ",";
                err << "\"" << json_escape_(d.args()[i]) << "\"";
            }
            err << "]";
            err << "}";
        }
        err << "\n]\n";
        return bag.has_error() ? 1 : 0;
    }

    int run_source(const cli::Options& opt,
                   const std::string& name,
                   std::string source,
                   std::ostream& out,
                   std::ostream& err) {
        olympiac::SourceManager sm;
        const uint32_t fid = sm.add(name, std::move(source));
        const std::string_view text = sm.content(fid);

        olympiac::diag::Bag bag;

        // 1) lex
        olympiac::Lexer lex(text, fid, &bag);
        const auto tokens = lex.lex_all();
        if (opt.internal.token_dump) dump::dump_tokens(out, tokens);

        // 2) parse
        olympiac::ast::AstArena ast;
        olympiac::ParserOptions popt{};
        popt.max_diags = opt.max_errors;

        olympiac::Parser parser(tokens, ast, &bag, popt);
        const auto root = parser.parse_program();

        if (parser.recovery_exhausted()) {
            err << "note: error recovery budget exhausted; the rest of '" << name << "' was skipped\n";
        }
        if (opt.internal.ast_dump) {
            out << "AST:\n";
            dump::dump_ast(out, ast, root, 0);
        }

        // 3) verify
        if (!opt.syntax_only) {
            olympiac::verify::Verifier verifier(ast, bag);
            const auto res = verifier.verify(root);

            if (opt.internal.decorated_dump) dump::dump_decorated(out, ast, root, res, opt.lang);
            if (opt.internal.table_dump) dump::dump_table(out, res);
            if (opt.internal.table_trace) dump::dump_scope_trace(out, res);

            if (!opt.export_json_path.empty()) {
                std::string io_err;
                if (!olympiac::write_file(opt.export_json_path, dump::export_json(ast, res, opt.lang), io_err)) {
                    err << "error: " << io_err << "\n";
                    flush_diags(err, bag, opt.lang, sm, opt.context_lines, opt.diag_format);
                    return 1;
                }
                out << "decorations exported to: " << opt.export_json_path << "\n";
            }
        }

        return flush_diags(err, bag, opt.lang, sm, opt.context_lines, opt.diag_format);
    }

    int run(const cli::Options& opt) {
        switch (opt.mode) {
            case cli::Mode::kCheck: {
                if (opt.inputs.empty()) {
                    std::cerr << "error: no input file\n";
                    return 1;
                }
                const auto& input = opt.inputs.front();

                std::string src;
                std::string io_err;
                if (!olympiac::open_file(input, src, io_err)) {
                    std::cerr << "error: " << io_err << "\n";
                    return 1;
                }
                return run_source(opt, input, std::move(src), std::cout, std::cerr);
            }
            case cli::Mode::kUsage:
            case cli::Mode::kVersion:
            default:
                return 0;
        }
    }

} // namespace olyc::driver
