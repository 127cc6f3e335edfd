//
// Created by igor on 02/12/2025.
//

#pragma once

#include <string>
#include <vector>

#include "token.hh"
#include "parser_error.hh"

namespace quasar {
    /// Scan `text` into tokens. The last token is always token_kind::end_of_file.
    /// Throws lex_error at the first invalid character or unterminated string.
    std::vector<token> tokenize(const std::string& text, const std::string& filename = "<string>");
}
