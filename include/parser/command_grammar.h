/*
  command_grammar.h

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

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "error_out.h"
#include "parser/grammar.h"
#include "parser/variable_lookup.h"

class MalformedInputError : public std::runtime_error {
   public:
    MalformedInputError(std::string text, size_t offset);

    const std::string& text() const noexcept {
        return text_;
    }
    // Position of the first character no term could consume.
    size_t offset() const noexcept {
        return offset_;
    }

    ErrorInfo to_error_info() const;

   private:
    static std::string build_message(const std::string& text);

    std::string text_;
    size_t offset_;
};

/*
 * Splits a raw command line into arguments.
 *
 * A term is a run of unquoted text or a double-quoted string, separated by
 * spaces. Inside both, %NAME% is replaced through lookup (an unresolved
 * reference is kept literally) and the escapes %%, ^^, \\ and \" collapse
 * to their second character. Variable references take precedence over
 * escapes, so a bare %% is first looked up as the empty name.
 */
struct CommandGrammar {
    VariableLookup lookup;
    bool preserve_surrounding_quotes = false;

    Parser<std::vector<std::string>> build_parser() const;

    // Throws MalformedInputError unless the whole text is consumed.
    std::vector<std::string> parse(const std::string& text) const;
};

std::vector<std::string> tokenize(const std::string& text, const VariableLookup& lookup,
                                  bool preserve_surrounding_quotes);

// Uses config::preserve_surrounding_quotes.
std::vector<std::string> tokenize(const std::string& text, const VariableLookup& lookup);

bool try_tokenize(const std::string& text, const VariableLookup& lookup,
                  bool preserve_surrounding_quotes, std::vector<std::string>& tokens,
                  ErrorInfo* error = nullptr);
