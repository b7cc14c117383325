// frontend/src/diag/render.cpp
#include <olympiac/diag/Render.hpp>

#include <sstream>


namespace olympiac::diag {

    static constexpr uint32_t digits10(uint32_t v) {
        uint32_t d = 1;
        while (v >= 10) { v /= 10; ++d; }
        return d;
    }

    static std::string replace_all(std::string s, std::string_view from, std::string_view to) {
        size_t pos = 0;
        while ((pos = s.find(from, pos)) != std::string::npos) {
            s.replace(pos, from.size(), to);
            pos += to.size();
        }

        return s;
    }

    static std::string format_template(std::string templ, const std::vector<std::string>& args) {
        for (size_t i = 0; i < args.size(); ++i) {
            std::string key = "{" + std::to_string(i) + "}";
            templ = replace_all(std::move(templ), key, args[i]);
        }
        return templ;
    }

    std::string_view code_name(Code c) {
        switch (c) {
            case Code::kLexUnknownChar: return "LexUnknownChar";
            case Code::kLexUnterminatedText: return "LexUnterminatedText";
            case Code::kExpectedToken: return "ExpectedToken";
            case Code::kUnexpectedToken: return "UnexpectedToken";
            case Code::kUnexpectedEof: return "UnexpectedEof";
            case Code::kTooManyErrors: return "TooManyErrors";
            case Code::kNestingTooDeep: return "NestingTooDeep";
            case Code::kExpectedExpression: return "ExpectedExpression";
            case Code::kMissingCloseParen: return "MissingCloseParen";
            case Code::kIntOutOfRange: return "IntOutOfRange";
            case Code::kIncompleteAthleteDecl: return "IncompleteAthleteDecl";
            case Code::kListNameExpected: return "ListNameExpected";
            case Code::kNarrateArity: return "NarrateArity";
            case Code::kMissingTerminator: return "MissingTerminator";
            case Code::kMissingResult: return "MissingResult";
            case Code::kDuplicateResult: return "DuplicateResult";
            case Code::kDuplicateTie: return "DuplicateTie";
            case Code::kDuplicateDecl: return "DuplicateDecl";
            case Code::kUndeclaredName: return "UndeclaredName";
            case Code::kArgNotEntity: return "ArgNotEntity";
            case Code::kArityMismatch: return "ArityMismatch";
            case Code::kAddTextAndNumber: return "AddTextAndNumber";
            case Code::kResultMissingFirst: return "ResultMissingFirst";
            case Code::kResultMissingSecond: return "ResultMissingSecond";
            case Code::kMatchMissingCountry: return "MatchMissingCountry";
            case Code::kCompetitionMissingResult: return "CompetitionMissingResult";
            case Code::kCompetitionMultipleResults: return "CompetitionMultipleResults";
            case Code::kCompetitionResultIncomplete: return "CompetitionResultIncomplete";
            case Code::kCompetitionUnterminated: return "CompetitionUnterminated";
        }
        return "Unknown";
    }

    std::string_view severity_name(Severity s) {
        switch (s) {
            case Severity::kError:   return "error";
            case Severity::kWarning: return "warning";
            case Severity::kFatal:   return "fatal";
        }
        return "error";
    }

    static std::string template_en(Code c) {
        switch (c) {
            case Code::kLexUnknownChar: return "unknown character '{0}'";
            case Code::kLexUnterminatedText: return "unterminated text literal";
            case Code::kExpectedToken: return "expected '{0}' but found '{1}'";
            case Code::kUnexpectedToken: return "unexpected token '{0}'";
            case Code::kUnexpectedEof: return "unexpected end of input; expected {0}";
            case Code::kTooManyErrors: return "too many syntax errors (limit {0}); further diagnostics suppressed";
            case Code::kNestingTooDeep: return "blocks nested deeper than {0} levels";
            case Code::kExpectedExpression: return "expected an expression but found '{0}'";
            case Code::kMissingCloseParen: return "call to '{0}' is missing its closing ')'";
            case Code::kIntOutOfRange: return "integer literal '{0}' is out of range";
            case Code::kIncompleteAthleteDecl: return "incomplete declaration of athlete '{0}': missing {1}";
            case Code::kListNameExpected: return "list declaration requires a name (found '{0}')";
            case Code::kNarrateArity: return "narrar expects exactly 1 argument, found {0}";
            case Code::kMissingTerminator: return "'{0}' block is missing its closing '{1}'";
            case Code::kMissingResult: return "'{0}' block requires a 'Resultado' before '{1}'";
            case Code::kDuplicateResult: return "a second 'Resultado' in the same block";
            case Code::kDuplicateTie: return "repeated 'empate' ignored; the first one is kept";
            case Code::kDuplicateDecl: return "duplicate declaration: '{0}' already exists in the current scope (level {1})";
            case Code::kUndeclaredName: return "identifier '{0}' used before being declared";
            case Code::kArgNotEntity: return "argument {0} of Comparar must be an entity; found '{1}'";
            case Code::kArityMismatch: return "call to {0} has wrong arity: expected {1}, found {2}";
            case Code::kAddTextAndNumber: return "cannot add text and number";
            case Code::kResultMissingFirst: return "Resultado is missing its first number";
            case Code::kResultMissingSecond: return "Resultado is missing its second number";
            case Code::kMatchMissingCountry: return "match is missing its {0} country";
            case Code::kCompetitionMissingResult: return "'{0}' has no Resultado before its closing keyword";
            case Code::kCompetitionMultipleResults: return "'{0}' has {1} Resultado entries; exactly one is allowed";
            case Code::kCompetitionResultIncomplete: return "the Resultado closing '{0}' is incomplete (missing {1})";
            case Code::kCompetitionUnterminated: return "'{0}' is not closed by its end keyword";
        }
        return "unknown diagnostic";
    }

    static std::string template_es(Code c) {
        switch (c) {
            case Code::kLexUnknownChar: return "caracter desconocido '{0}'";
            case Code::kLexUnterminatedText: return "texto sin cerrar";
            case Code::kExpectedToken: return "se esperaba '{0}' pero se encontro '{1}'";
            case Code::kUnexpectedToken: return "token inesperado '{0}'";
            case Code::kUnexpectedEof: return "fin de entrada inesperado; se esperaba {0}";
            case Code::kTooManyErrors: return "demasiados errores de sintaxis (limite {0}); se omiten los siguientes";
            case Code::kNestingTooDeep: return "bloques anidados a mas de {0} niveles";
            case Code::kExpectedExpression: return "se esperaba una expresion pero se encontro '{0}'";
            case Code::kMissingCloseParen: return "a la llamada '{0}' le falta ')'";
            case Code::kIntOutOfRange: return "el entero '{0}' esta fuera de rango";
            case Code::kIncompleteAthleteDecl: return "declaracion incompleta del deportista '{0}': falta {1}";
            case Code::kListNameExpected: return "la declaracion de lista requiere un nombre (se encontro '{0}')";
            case Code::kNarrateArity: return "narrar espera exactamente 1 argumento, se encontraron {0}";
            case Code::kMissingTerminator: return "al bloque '{0}' le falta su cierre '{1}'";
            case Code::kMissingResult: return "el bloque '{0}' requiere un 'Resultado' antes de '{1}'";
            case Code::kDuplicateResult: return "segundo 'Resultado' en el mismo bloque";
            case Code::kDuplicateTie: return "'empate' repetido ignorado; se conserva el primero";
            case Code::kDuplicateDecl: return "Declaracion duplicada: '{0}' ya existe en el scope actual (nivel {1})";
            case Code::kUndeclaredName: return "Identificador '{0}' usado antes de ser declarado.";
            case Code::kArgNotEntity: return "Argumento {0} de Comparar debe ser una entidad; encontrado '{1}'";
            case Code::kArityMismatch: return "Llamada a {0} con aridad incorrecta: esperado {1}, encontrado {2}";
            case Code::kAddTextAndNumber: return "No se puede sumar texto con numero";
            case Code::kResultMissingFirst: return "Falta el primer numero en Resultado";
            case Code::kResultMissingSecond: return "Falta el segundo numero en Resultado";
            case Code::kMatchMissingCountry: return "al partido le falta el pais {0}";
            case Code::kCompetitionMissingResult: return "'{0}' no tiene Resultado antes de su cierre";
            case Code::kCompetitionMultipleResults: return "'{0}' tiene {1} Resultado; solo se permite uno";
            case Code::kCompetitionResultIncomplete: return "el Resultado de '{0}' esta incompleto (falta {1})";
            case Code::kCompetitionUnterminated: return "'{0}' no se cierra con su palabra final";
        }
        return "diagnostico desconocido";
    }

    std::string render_message(const Diagnostic& d, Language lang) {
        std::string msg = (lang == Language::kEs) ? template_es(d.code()) : template_en(d.code());
        return format_template(std::move(msg), d.args());
    }

    std::string render_one(const Diagnostic& d, Language lang, const SourceManager& sm) {
        std::string msg = render_message(d, lang);

        const auto sp = d.span();
        auto sn = sm.snippet_for_span(sp);

        std::ostringstream oss;
        oss << severity_name(d.severity()) << "[" << code_name(d.code()) << "]: " << msg << "\n";
        oss << " --> " << sm.name(sp.file_id) << ":" << sp.line << ":" << sp.col << "\n";

        // 소스가 없는 스트림(테스트/외부 토큰)은 위치만 출력
        if (sn.line_text.empty()) return oss.str();

        oss << "  |\n";
        oss << sn.line_no << " | " << sn.line_text << "\n";
        oss << "  | ";

        // spaces to caret
        for (uint32_t i = 0; i < sn.caret_cols_before; ++i) oss << ' ';

        // underline
        for (uint32_t i = 0; i < sn.caret_cols_len; ++i) oss << '^';
        oss << "\n";

        return oss.str();
    }

    std::string render_one_context(const Diagnostic& d, Language lang, const SourceManager& sm, uint32_t context_lines) {
        std::string msg = render_message(d, lang);

        const auto sp = d.span();

        // 컨텍스트 스니펫
        auto blk = sm.snippet_block_for_span(sp, context_lines);

        std::ostringstream out;
        out << severity_name(d.severity()) << "[" << code_name(d.code()) << "]: " << msg << "\n";
        out << " --> " << sm.name(sp.file_id) << ":" << sp.line << ":" << sp.col << "\n";
        if (blk.lines.empty()) return out.str();

        uint32_t last_line_no = blk.first_line_no + static_cast<uint32_t>(blk.lines.size()) - 1;
        uint32_t w = digits10(last_line_no);

        out << "  |\n";
        for (uint32_t i = 0; i < blk.lines.size(); ++i) {
            uint32_t line_no = blk.first_line_no + i;

            // "  12 | code..."
            out << std::string(2, ' ');
            {
                std::string num = std::to_string(line_no);
                out << std::string(w - static_cast<uint32_t>(num.size()), ' ') << num;
            }
            out << " | " << blk.lines[i] << "\n";

            if (i == blk.caret_line_offset) {
                out << std::string(2, ' ');
                out << std::string(w, ' ') << " | ";
                out << std::string(blk.caret_cols_before, ' ');
                out << std::string(blk.caret_cols_len, '^') << "\n";
            }
        }

        return out.str();
    }

} // namespace olympiac::diag
