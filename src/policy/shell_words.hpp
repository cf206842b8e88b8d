#pragma once

#include <string>
#include <vector>
#include "core/errors/sandbox_errors.hpp"

namespace skillbox::policy {

// Splits a command line into words the way a POSIX shell would, honoring
// single quotes, double quotes and backslash escapes. Operators such as
// `|` or `;` are not special and stay inside the words they touch.
core::errors::Result<std::vector<std::string>> split_shell_words(
    const std::string& command);

}  // namespace skillbox::policy
