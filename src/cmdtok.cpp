/*
  cmdtok.cpp

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

#include "cmdtok.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>

bool g_debug_mode = false;

namespace {

bool is_truthy(const char* value) {
    if (value == nullptr) {
        return false;
    }
    std::string lowered(value);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

}  // namespace

namespace config {

bool preserve_surrounding_quotes = false;

void load_from_environment() {
    if (is_truthy(std::getenv("CMDTOK_DEBUG"))) {
        g_debug_mode = true;
    }
    if (is_truthy(std::getenv("CMDTOK_PRESERVE_QUOTES"))) {
        preserve_surrounding_quotes = true;
    }
    if (g_debug_mode) {
        std::cerr << "DEBUG: cmdtok " << c_version
                  << " preserve_surrounding_quotes=" << preserve_surrounding_quotes << std::endl;
    }
}

void reset() {
    g_debug_mode = false;
    preserve_surrounding_quotes = false;
}

}  // namespace config
