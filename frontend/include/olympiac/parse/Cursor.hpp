// frontend/include/olympiac/parse/Cursor.hpp
#pragma once
#include <olympiac/lex/Token.hpp>

#include <vector>


namespace olympiac {

    // 토큰 스트림 커서. EOF 토큰이 없으므로 끝은 커서 소진으로 판단한다.
    class Cursor {
    public:
        explicit Cursor(const std::vector<Token>& tokens) :tokens_(tokens) {}

        /// @brief k번째 뒤 토큰. 범위를 넘으면 nullptr
        const Token* peek(size_t k = 0) const {
            size_t i = pos_ + k;
            if (i >= tokens_.size()) return nullptr;
            return &tokens_[i];
        }

        bool at_end() const {  return pos_ >= tokens_.size();  }

        /// @brief 직전에 consume된 토큰 (없으면 nullptr)
        const Token* prev() const {
            if (pos_ == 0 || tokens_.empty()) return nullptr;
            size_t i = pos_ - 1;
            if (i >= tokens_.size()) return &tokens_.back();
            return &tokens_[i];
        }

        const Token* bump() {
            if (pos_ >= tokens_.size()) return nullptr;
            return &tokens_[pos_++];
        }

        size_t pos() const      {  return pos_;  }
        void rewind(size_t p)   {  pos_ = p;     }
        void skip_to_end()      {  pos_ = tokens_.size();  }

    private:
        const std::vector<Token>& tokens_;
        size_t pos_ = 0;
    };

} // namespace olympiac
