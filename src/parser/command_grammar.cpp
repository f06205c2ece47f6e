/*
  command_grammar.cpp

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

#include "parser/command_grammar.h"

#include <iostream>
#include <utility>

#include "cmdtok.h"
#include "parser/parser_ops.h"

using grammar::any_char;
using grammar::build;
using grammar::ch;
using grammar::collect_to_string;
using grammar::down;
using grammar::either;
using grammar::left;
using grammar::repeat;
using grammar::repeat1;
using grammar::then;
using grammar::unless;

MalformedInputError::MalformedInputError(std::string text, size_t offset)
    : std::runtime_error(build_message(text)), text_(std::move(text)), offset_(offset) {
}

std::string MalformedInputError::build_message(const std::string& text) {
    return "Malformed command text '" + text + "'";
}

ErrorInfo MalformedInputError::to_error_info() const {
    size_t stop = text_.find_first_not_of(' ', offset_);
    std::vector<std::string> suggestions;
    if (stop != std::string::npos && text_[stop] == '"') {
        if (text_.find('"', stop + 1) == std::string::npos) {
            suggestions.push_back("Check for an unterminated double quote at offset " +
                                  std::to_string(stop));
        } else {
            // The closing quote exists but a %...% reference swallowed it.
            suggestions.push_back("The double quote at offset " + std::to_string(stop) +
                                  " is not closed; check for a %...% reference that spans "
                                  "its closing quote");
        }
    } else {
        suggestions.push_back("Text starting at offset " + std::to_string(offset_) +
                              " could not be split into arguments");
    }

    std::string context = text_ + "\n" + std::string(offset_, ' ') + "^";
    return ErrorInfo(ErrorType::SYNTAX_ERROR, "tokenize", what(), suggestions, context);
}

Parser<std::vector<std::string>> CommandGrammar::build_parser() const {
    VariableLookup resolve = lookup ? lookup : no_lookup();
    const bool keep_quotes = preserve_surrounding_quotes;

    // %NAME%
    Parser<std::string> variable_name = collect_to_string(repeat(unless(any_char(), ch('%'))));
    Parser<std::string> environment_variable_piece =
        build(then(then(ch('%'), variable_name), ch('%')),
              [resolve](const Chain<Chain<char, std::string>, char>& reference) {
                  const std::string& name = reference.left.down;
                  std::optional<std::string> value = resolve(name);
                  if (value) {
                      return *value;
                  }
                  return "%" + name + "%";
              });

    auto escape = [](char first, char second, const char* replacement) {
        return build(then(ch(first), ch(second)),
                     [replacement](const Chain<char, char>&) { return std::string(replacement); });
    };
    Parser<std::string> escape_sequence_piece =
        either(either(either(escape('%', '%', "%"), escape('^', '^', "^")),
                      escape('\\', '\\', "\\")),
               escape('\\', '"', "\""));

    Parser<std::string> special_piece = either(environment_variable_piece, escape_sequence_piece);

    // A double quote never starts or continues an unquoted piece, so a stray
    // quote has to open a complete quoted term.
    Parser<std::string> unquoted_piece = collect_to_string(
        repeat1(unless(unless(unless(any_char(), special_piece), ch(' ')), ch('"'))));
    Parser<std::string> quoted_piece =
        collect_to_string(repeat1(unless(unless(any_char(), special_piece), ch('"'))));

    Parser<std::string> unquoted_term =
        collect_to_string(repeat1(either(unquoted_piece, special_piece)));
    Parser<std::string> quoted_term = build(
        then(then(ch('"'), collect_to_string(repeat(either(quoted_piece, special_piece)))),
             ch('"')),
        [keep_quotes](const Chain<Chain<char, std::string>, char>& quoted) {
            if (keep_quotes) {
                return "\"" + quoted.left.down + "\"";
            }
            return quoted.left.down;
        });

    Parser<std::vector<char>> whitespace = repeat(ch(' '));
    Parser<std::string> term =
        down(left(then(then(whitespace, either(quoted_term, unquoted_term)), whitespace)));

    return repeat(term);
}

std::vector<std::string> CommandGrammar::parse(const std::string& text) const {
    Parser<std::vector<std::string>> parser = build_parser();
    ParseResult<std::vector<std::string>> result = parser(Cursor(text));

    if (!result.remainder().is_end()) {
        if (g_debug_mode) {
            std::cerr << "DEBUG: tokenize stopped at offset " << result.remainder().start()
                      << " of " << text.size() << std::endl;
        }
        throw MalformedInputError(text, result.remainder().start());
    }

    return std::move(result.value());
}

std::vector<std::string> tokenize(const std::string& text, const VariableLookup& lookup,
                                  bool preserve_surrounding_quotes) {
    if (g_debug_mode) {
        std::cerr << "DEBUG: tokenize input='" << text << "'"
                  << " preserve_surrounding_quotes=" << preserve_surrounding_quotes << std::endl;
    }

    CommandGrammar command_grammar{lookup, preserve_surrounding_quotes};
    std::vector<std::string> tokens = command_grammar.parse(text);

    if (g_debug_mode) {
        std::cerr << "DEBUG: tokenize produced " << tokens.size() << " token(s)" << std::endl;
    }
    return tokens;
}

std::vector<std::string> tokenize(const std::string& text, const VariableLookup& lookup) {
    return tokenize(text, lookup, config::preserve_surrounding_quotes);
}

bool try_tokenize(const std::string& text, const VariableLookup& lookup,
                  bool preserve_surrounding_quotes, std::vector<std::string>& tokens,
                  ErrorInfo* error) {
    tokens.clear();
    try {
        tokens = tokenize(text, lookup, preserve_surrounding_quotes);
    } catch (const MalformedInputError& e) {
        if (error != nullptr) {
            *error = e.to_error_info();
        }
        return false;
    }
    return true;
}
