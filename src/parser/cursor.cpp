/*
  cursor.cpp

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

#include "parser/cursor.h"

#include <stdexcept>
#include <string>

Cursor::Cursor(std::string_view text) : Cursor(text, 0, text.size()) {
}

Cursor::Cursor(std::string_view text, size_t start, size_t end)
    : text_(text), start_(start), end_(end) {
    if (start_ > end_ || end_ > text_.size()) {
        throw std::out_of_range("Cursor range [" + std::to_string(start) + ", " +
                                std::to_string(end) + ") is outside a text of length " +
                                std::to_string(text.size()));
    }
}

char Cursor::peek(size_t offset) const {
    if (offset >= end_ - start_) {
        return '\0';
    }
    return text_[start_ + offset];
}

std::string_view Cursor::remaining() const {
    return text_.substr(start_, end_ - start_);
}
