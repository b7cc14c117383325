// frontend/include/olympiac/diag/Diagnostic.hpp
#pragma once
#include <olympiac/text/Span.hpp>
#include <olympiac/diag/DiagCode.hpp>

#include <string>
#include <string_view>
#include <vector>


namespace olympiac::diag {

    class Diagnostic {
    public:
        Diagnostic(Severity severity, Code code, Span span)
            : severity_(severity), code_(code), span_(span) {}

        void add_arg(std::string_view s) {  args_.emplace_back(s);  }
        void add_arg_int(int v)          {  args_.emplace_back(std::to_string(v));  }

        Severity severity() const   {  return severity_;    }
        Code code() const           {  return code_;        }
        Span span() const           {  return span_;        }
        uint32_t line() const       {  return span_.line;   }
        uint32_t col() const        {  return span_.col;    }
        const std::vector<std::string>& args() const {  return args_;  }

        bool is_error() const {
            return severity_ == Severity::kError || severity_ == Severity::kFatal;
        }

    private:
        Severity severity_{Severity::kError};
        Code code_{Code::kUnexpectedToken};
        Span span_{};
        std::vector<std::string> args_;
    };

    class Bag {
    public:
        void add(Diagnostic d) {
            if (d.severity() == Severity::kError) ++error_count_;
            if (d.severity() == Severity::kWarning) ++warning_count_;
            if (d.severity() == Severity::kFatal) ++fatal_count_;
            diags_.push_back(std::move(d));
        }

        bool has_error() const {
            return error_count_ != 0 || fatal_count_ != 0;
        }

        bool has_fatal() const {
            return fatal_count_ != 0;
        }

        bool has_code(Code c) const {
            for (const auto& d : diags_) {
                if (d.code() == c) return true;
            }
            return false;
        }

        uint32_t count_code(Code c) const {
            uint32_t n = 0;
            for (const auto& d : diags_) {
                if (d.code() == c) ++n;
            }
            return n;
        }

        const std::vector<Diagnostic>& diags() const {  return diags_;  }

        uint32_t error_count() const   {  return error_count_;  }
        uint32_t warning_count() const {  return warning_count_;  }
        uint32_t fatal_count() const   {  return fatal_count_;  }

        uint32_t issue_count() const {  return error_count_ + fatal_count_;  }

    private:
        std::vector<Diagnostic> diags_;
        uint32_t error_count_ = 0;
        uint32_t warning_count_ = 0;
        uint32_t fatal_count_ = 0;
    };

} // namespace olympiac::diag
