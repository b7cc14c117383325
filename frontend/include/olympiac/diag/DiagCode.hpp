// frontend/include/olympiac/diag/DiagCode.hpp
#pragma once
#include <cstdint>


namespace olympiac::diag {

    enum class Severity : uint8_t {
        kError,
        kWarning,
        kFatal,
    };

    enum class Language : uint8_t {
        kEn,
        kEs,
    };

    enum class Code : uint16_t {
        // lexer
        kLexUnknownChar,       // 분류할 수 없는 바이트
        kLexUnterminatedText,  // '"' 가 줄 안에서 닫히지 않음

        // generic parse
        kExpectedToken,
        kUnexpectedToken,
        kUnexpectedEof,
        kTooManyErrors,
        kNestingTooDeep,
        kExpectedExpression,
        kMissingCloseParen,
        kIntOutOfRange,        // int64 범위를 넘는 정수 리터럴

        // declarations
        kIncompleteAthleteDecl,
        kListNameExpected,

        // invocation
        kNarrateArity,         // warning

        // competition blocks
        kMissingTerminator,
        kMissingResult,
        kDuplicateResult,
        kDuplicateTie,         // warning (첫 번째 empate 유지)

        // ---- semantic ----
        kDuplicateDecl,
        kUndeclaredName,
        kArgNotEntity,
        kArityMismatch,
        kAddTextAndNumber,
        kResultMissingFirst,
        kResultMissingSecond,
        kMatchMissingCountry,
        kCompetitionMissingResult,
        kCompetitionMultipleResults,
        kCompetitionResultIncomplete,
        kCompetitionUnterminated,
    };

} // namespace olympiac::diag
