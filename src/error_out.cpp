#include "error_out.h"
#include <iostream>
#include <string>
#include <vector>

void print_error(const ErrorInfo& error) {
    std::cerr << "cmdtok: ";

    if (!error.command_used.empty()) {
        std::cerr << error.command_used << ": ";
    }

    switch (error.type) {
        case ErrorType::SYNTAX_ERROR:
            std::cerr << "syntax error";
            break;
        case ErrorType::UNKNOWN_ERROR:
        default:
            std::cerr << "unknown error";
            break;
    }

    if (!error.message.empty()) {
        std::cerr << ": " << error.message;
    }

    std::cerr << '\n';

    if (!error.context.empty()) {
        std::cerr << error.context << '\n';
    }

    for (const auto& suggestion : error.suggestions) {
        std::cerr << suggestion << '\n';
    }
}

ErrorInfo::ErrorInfo()
    : type(ErrorType::UNKNOWN_ERROR),
      severity(ErrorSeverity::ERROR),
      command_used(""),
      message(""),
      suggestions() {
}

ErrorInfo::ErrorInfo(ErrorType t, ErrorSeverity s, const std::string& cmd, const std::string& msg,
                     const std::vector<std::string>& sugg, const std::string& ctx)
    : type(t), severity(s), command_used(cmd), message(msg), suggestions(sugg), context(ctx) {
}

ErrorInfo::ErrorInfo(ErrorType t, const std::string& cmd, const std::string& msg,
                     const std::vector<std::string>& sugg, const std::string& ctx)
    : type(t),
      severity(get_default_severity(t)),
      command_used(cmd),
      message(msg),
      suggestions(sugg),
      context(ctx) {
}

ErrorSeverity ErrorInfo::get_default_severity(ErrorType type) {
    switch (type) {
        case ErrorType::SYNTAX_ERROR:
            return ErrorSeverity::CRITICAL;
        case ErrorType::UNKNOWN_ERROR:
        default:
            return ErrorSeverity::ERROR;
    }
}
