/*
  grammar.h

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

#include <functional>
#include <utility>
#include <vector>

#include "parser/cursor.h"
#include "parser/parse_result.h"

template <typename T>
using Parser = std::function<ParseResult<T>(const Cursor&)>;

// Pair produced by sequencing two parsers.
template <typename L, typename D>
struct Chain {
    L left;
    D down;
};

namespace grammar {

inline Parser<char> any_char() {
    return [](const Cursor& cursor) -> ParseResult<char> {
        if (cursor.is_end()) {
            return ParseResult<char>::empty();
        }
        return cursor.advance(cursor.peek(0), 1);
    };
}

inline Parser<char> ch(char expected) {
    return [expected](const Cursor& cursor) -> ParseResult<char> {
        if (cursor.is_end() || cursor.peek(0) != expected) {
            return ParseResult<char>::empty();
        }
        return cursor.advance(expected, 1);
    };
}

// Zero or more. Never fails. A match that consumes nothing ends the
// repetition so a nullable parser cannot loop forever.
template <typename T>
Parser<std::vector<T>> repeat(Parser<T> parser) {
    return [parser](const Cursor& cursor) -> ParseResult<std::vector<T>> {
        std::vector<T> values;
        Cursor position = cursor;
        while (true) {
            ParseResult<T> result = parser(position);
            if (result.is_empty() || result.remainder().start() == position.start()) {
                break;
            }
            values.push_back(std::move(result.value()));
            position = result.remainder();
        }
        return ParseResult<std::vector<T>>::success(std::move(values), position);
    };
}

template <typename T>
Parser<std::vector<T>> repeat1(Parser<T> parser) {
    Parser<std::vector<T>> many = repeat(std::move(parser));
    return [many](const Cursor& cursor) -> ParseResult<std::vector<T>> {
        ParseResult<std::vector<T>> result = many(cursor);
        if (result.value().empty()) {
            return ParseResult<std::vector<T>>::empty();
        }
        return result;
    };
}

}  // namespace grammar
