//
// Created by igor on 27/11/2025.
//
// Parser constants - named constants to replace magic numbers
//

#ifndef QUASAR_PARSER_CONSTANTS_H
#define QUASAR_PARSER_CONSTANTS_H

#include <cstddef>

namespace quasar::parser {

/* Buffer configuration */
constexpr std::size_t INPUT_BUFFER_PADDING = 32;  // Bytes of padding for re2c lookahead

/* Parser limits (prevent DoS attacks) */
constexpr std::size_t MAX_IDENTIFIER_LENGTH = 256;
constexpr std::size_t MAX_STRING_LITERAL_LENGTH = 65536;  // 64KB
constexpr std::size_t MAX_EXPRESSION_DEPTH = 256;

} // namespace quasar::parser

#endif // QUASAR_PARSER_CONSTANTS_H
