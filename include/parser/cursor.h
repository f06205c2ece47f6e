/*
  cursor.h

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

#include <cstddef>
#include <string_view>

template <typename T>
class ParseResult;

// Immutable half-open window [start, end) over a text the cursor does not own.
class Cursor {
   public:
    Cursor() : start_(0), end_(0) {
    }
    explicit Cursor(std::string_view text);
    Cursor(std::string_view text, size_t start, size_t end);

    bool is_end() const {
        return start_ == end_;
    }

    // Returns '\0' when offset runs past the window.
    char peek(size_t offset) const;

    // Defined in parse_result.h.
    template <typename T>
    ParseResult<T> advance(T value, size_t length) const;

    size_t start() const {
        return start_;
    }
    size_t end() const {
        return end_;
    }
    size_t remaining_length() const {
        return end_ - start_;
    }

    std::string_view remaining() const;

   private:
    std::string_view text_;
    size_t start_;
    size_t end_;
};
