// SPDX-License-Identifier: GPL-3.0-or-later
/*
 * Live Themes - editor color theme previewer
 * Copyright (C) 2026 Live Themes contributors
 */

#include "strip_comments.hpp"

#include <optional>

namespace livethemes::json {

namespace {

/**
 * @brief Single-use scanner over one input document
 *
 * Each state has its own step function. A step consumes the character at
 * the cursor (and at most one character of lookahead) and returns the next
 * state.
 */
class Scanner {
public:
    Scanner(std::string_view input, const StripOptions& options)
        : input_(input), options_(options) {
        output_.reserve(input.size());
    }

    auto run() -> std::string {
        while (pos_ < input_.size()) {
            switch (state_) {
                case ScanState::Normal:
                    state_ = stepNormal();
                    break;
                case ScanState::InString:
                    state_ = stepString();
                    break;
                case ScanState::InLineComment:
                    state_ = stepLineComment();
                    break;
                case ScanState::InBlockComment:
                    state_ = stepBlockComment();
                    break;
            }
        }
        return std::move(output_);
    }

private:
    std::string_view input_;
    StripOptions options_;
    std::string output_;
    std::size_t pos_ = 0;
    ScanState state_ = ScanState::Normal;
    // Output index of a comma that may turn out to be trailing.
    std::optional<std::size_t> pendingComma_;

    [[nodiscard]] auto current() const -> char { return input_[pos_]; }

    [[nodiscard]] auto lookahead() const -> char {
        return pos_ + 1 < input_.size() ? input_[pos_ + 1] : '\0';
    }

    void copy(char c) { output_.push_back(c); }

    // Only \n and the \r of a \r\n pair survive as line breaks.
    void strip(char c) {
        if (!options_.whitespace) {
            return;
        }
        const bool lineBreak =
            c == '\n' || (c == '\r' && lookahead() == '\n');
        output_.push_back(lineBreak ? c : ' ');
    }

    void dropPendingComma() {
        if (options_.whitespace) {
            output_[*pendingComma_] = ' ';
        } else {
            output_.erase(*pendingComma_, 1);
        }
        pendingComma_.reset();
    }

    void trackComma(char c) {
        if (!options_.trailingCommas) {
            return;
        }
        if (pendingComma_ && (c == '}' || c == ']')) {
            dropPendingComma();
        } else if (c == ',') {
            pendingComma_ = output_.size();
        } else if (!detail::isJsonWhitespace(c)) {
            pendingComma_.reset();
        }
    }

    auto stepNormal() -> ScanState {
        const char c = current();

        if (c == '/' && (lookahead() == '/' || lookahead() == '*')) {
            const auto next = lookahead() == '/' ? ScanState::InLineComment
                                                 : ScanState::InBlockComment;
            strip(c);
            strip(lookahead());
            pos_ += 2;
            return next;
        }

        trackComma(c);
        copy(c);
        ++pos_;
        return c == '"' ? ScanState::InString : ScanState::Normal;
    }

    auto stepString() -> ScanState {
        const char c = current();
        copy(c);
        const bool terminates =
            c == '"' && !detail::isEscapedQuote(input_, pos_);
        ++pos_;
        return terminates ? ScanState::Normal : ScanState::InString;
    }

    auto stepLineComment() -> ScanState {
        const char c = current();

        if (c == '\r' && lookahead() == '\n') {
            copy('\r');
            copy('\n');
            pos_ += 2;
            return ScanState::Normal;
        }
        if (c == '\n') {
            copy('\n');
            ++pos_;
            return ScanState::Normal;
        }

        strip(c);
        ++pos_;
        return ScanState::InLineComment;
    }

    auto stepBlockComment() -> ScanState {
        const char c = current();

        if (c == '*' && lookahead() == '/') {
            strip('*');
            strip('/');
            pos_ += 2;
            return ScanState::Normal;
        }

        strip(c);
        ++pos_;
        return ScanState::InBlockComment;
    }
};

}  // namespace

namespace detail {

auto countPrecedingBackslashes(std::string_view text, std::size_t pos) noexcept
    -> std::size_t {
    std::size_t count = 0;
    while (pos > 0 && pos <= text.size() && text[pos - 1] == '\\') {
        ++count;
        --pos;
    }
    return count;
}

}  // namespace detail

auto stripComments(std::string_view input, const StripOptions& options)
    -> std::string {
    if (input.empty()) {
        return {};
    }
    return Scanner(input, options).run();
}

}  // namespace livethemes::json
