/*
  parse_result.h

  This file is part of cmdtok, a command line tokenizer

  MIT License

  Copyright (c) 2026 Caden Finley

  Permission is hereby granted, free of charge, to any person obtaining a copy
  of this software and associated documentation files (the "Software"), to deal
  in the Software without restriction, including without limitation the rights
  to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
  copies of the Software, and to permit persons to whom the Software is
  furnished to do so, subject to the following conditions:

  The above copyright notice and this permission notice shall be included in all
  copies or substantial portions of the Software.

  THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
  IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
  FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
  AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
  LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
  OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
  SOFTWARE.
*/

#pragma once

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

#include "parser/cursor.h"

struct ParseFailure {};

template <typename T>
struct ParseSuccess {
    T value;
    Cursor remainder;
};

// Outcome of running a parser at a cursor. Failure is its own alternative, so a
// success carrying a default T and a default Cursor is still a success.
template <typename T>
class ParseResult {
   public:
    ParseResult() : state_(ParseFailure{}) {
    }
    ParseResult(T value, const Cursor& remainder)
        : state_(ParseSuccess<T>{std::move(value), remainder}) {
    }

    static ParseResult<T> success(T value, const Cursor& remainder) {
        return ParseResult<T>(std::move(value), remainder);
    }
    static ParseResult<T> empty() {
        return ParseResult<T>();
    }

    bool is_success() const {
        return std::holds_alternative<ParseSuccess<T>>(state_);
    }
    bool is_empty() const {
        return std::holds_alternative<ParseFailure>(state_);
    }

    const T& value() const {
        if (is_empty())
            throw std::runtime_error("Attempted to access value of empty ParseResult");
        return std::get<ParseSuccess<T>>(state_).value;
    }

    T& value() {
        if (is_empty())
            throw std::runtime_error("Attempted to access value of empty ParseResult");
        return std::get<ParseSuccess<T>>(state_).value;
    }

    const Cursor& remainder() const {
        if (is_empty())
            throw std::runtime_error("Attempted to access remainder of empty ParseResult");
        return std::get<ParseSuccess<T>>(state_).remainder;
    }

   private:
    std::variant<ParseSuccess<T>, ParseFailure> state_;
};

template <typename T>
ParseResult<T> Cursor::advance(T value, size_t length) const {
    if (length > remaining_length()) {
        throw std::out_of_range("Cursor::advance by " + std::to_string(length) +
                                " moves past the end of the range");
    }
    return ParseResult<T>::success(std::move(value), Cursor(text_, start_ + length, end_));
}
