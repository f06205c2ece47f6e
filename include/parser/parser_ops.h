/*
  parser_ops.h

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

#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include "parser/grammar.h"

namespace grammar {

// Sequencing. The second parser starts where the first stopped; if either
// fails the whole sequence fails and nothing is consumed.
template <typename L, typename D>
Parser<Chain<L, D>> then(Parser<L> first, Parser<D> second) {
    return [first, second](const Cursor& cursor) -> ParseResult<Chain<L, D>> {
        ParseResult<L> left = first(cursor);
        if (left.is_empty()) {
            return ParseResult<Chain<L, D>>::empty();
        }
        ParseResult<D> down = second(left.remainder());
        if (down.is_empty()) {
            return ParseResult<Chain<L, D>>::empty();
        }
        return ParseResult<Chain<L, D>>::success(
            Chain<L, D>{std::move(left.value()), std::move(down.value())}, down.remainder());
    };
}

// Ordered alternation: the second parser runs from the original cursor, and
// only when the first one failed.
template <typename T>
Parser<T> either(Parser<T> first, Parser<T> second) {
    return [first, second](const Cursor& cursor) -> ParseResult<T> {
        ParseResult<T> result = first(cursor);
        if (result.is_success()) {
            return result;
        }
        return second(cursor);
    };
}

// Negative lookahead: runs parser only if guard fails at the same cursor.
// Whatever guard would have consumed is discarded.
template <typename T, typename U>
Parser<T> unless(Parser<T> parser, Parser<U> guard) {
    return [parser, guard](const Cursor& cursor) -> ParseResult<T> {
        if (guard(cursor).is_success()) {
            return ParseResult<T>::empty();
        }
        return parser(cursor);
    };
}

template <typename T, typename Fn>
Parser<std::decay_t<std::invoke_result_t<Fn, const T&>>> build(Parser<T> parser, Fn fn) {
    using U = std::decay_t<std::invoke_result_t<Fn, const T&>>;
    return [parser, fn](const Cursor& cursor) -> ParseResult<U> {
        ParseResult<T> result = parser(cursor);
        if (result.is_empty()) {
            return ParseResult<U>::empty();
        }
        return ParseResult<U>::success(fn(result.value()), result.remainder());
    };
}

template <typename L, typename D>
Parser<L> left(Parser<Chain<L, D>> parser) {
    return build(std::move(parser), [](const Chain<L, D>& chain) { return chain.left; });
}

template <typename L, typename D>
Parser<D> down(Parser<Chain<L, D>> parser) {
    return build(std::move(parser), [](const Chain<L, D>& chain) { return chain.down; });
}

inline Parser<std::string> collect_to_string(Parser<std::vector<char>> parser) {
    return build(std::move(parser), [](const std::vector<char>& chars) {
        return std::string(chars.begin(), chars.end());
    });
}

inline Parser<std::string> collect_to_string(Parser<std::vector<std::string>> parser) {
    return build(std::move(parser), [](const std::vector<std::string>& pieces) {
        std::string joined;
        for (const auto& piece : pieces) {
            joined += piece;
        }
        return joined;
    });
}

}  // namespace grammar
