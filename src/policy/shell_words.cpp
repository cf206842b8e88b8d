#include "policy/shell_words.hpp"

#include <cctype>

namespace skillbox::policy {

using core::errors::ErrorCategory;
using core::errors::SandboxError;
namespace codes = core::errors::codes;

namespace {

enum class QuoteState {
    None,
    Single,
    Double
};

bool is_blank(const char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

// Inside double quotes a backslash only escapes these characters.
bool escapable_in_double_quotes(const char c) {
    return c == '$' || c == '`' || c == '"' || c == '\\' || c == '\n';
}

}  // namespace

core::errors::Result<std::vector<std::string>> split_shell_words(
    const std::string& command) {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    QuoteState state = QuoteState::None;

    for (std::size_t i = 0; i < command.size(); ++i) {
        const char c = command[i];

        if (state == QuoteState::Single) {
            if (c == '\'') {
                state = QuoteState::None;
            } else {
                current.push_back(c);
            }
            continue;
        }

        if (state == QuoteState::Double) {
            if (c == '"') {
                state = QuoteState::None;
            } else if (c == '\\' && i + 1 < command.size() &&
                       escapable_in_double_quotes(command[i + 1])) {
                ++i;
                if (command[i] != '\n') {
                    current.push_back(command[i]);
                }
            } else {
                current.push_back(c);
            }
            continue;
        }

        // Escaped newline is a line continuation.
        if (c == '\\' && i + 1 < command.size() && command[i + 1] == '\n') {
            ++i;
            continue;
        }

        if (is_blank(c)) {
            if (in_word) {
                words.push_back(current);
                current.clear();
                in_word = false;
            }
            continue;
        }

        in_word = true;
        if (c == '\'') {
            state = QuoteState::Single;
        } else if (c == '"') {
            state = QuoteState::Double;
        } else if (c == '\\') {
            if (i + 1 >= command.size()) {
                return SandboxError{ErrorCategory::Input,
                                    "Command ends with a dangling escape: " + command,
                                    codes::kDanglingEscape};
            }
            ++i;
            current.push_back(command[i]);
        } else {
            current.push_back(c);
        }
    }

    if (state != QuoteState::None) {
        return SandboxError{ErrorCategory::Input,
                            "Command has an unterminated quote: " + command,
                            codes::kUnbalancedQuotes};
    }

    if (in_word) {
        words.push_back(current);
    }
    return words;
}

}  // namespace skillbox::policy
