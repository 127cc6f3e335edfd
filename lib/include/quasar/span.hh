//
// Created by igor on 02/12/2025.
//

#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace quasar::ast {
    // 1-indexed, inclusive on both ends
    struct span {
        span()
            : start_line(1),
              start_column(1),
              end_line(1),
              end_column(1) {
        }

        span(std::size_t start_line_, std::size_t start_column_,
             std::size_t end_line_, std::size_t end_column_,
             std::string file_ = "<string>")
            : start_line(start_line_),
              start_column(start_column_),
              end_line(end_line_),
              end_column(end_column_),
              file(std::move(file_)) {
        }

        std::size_t start_line;
        std::size_t start_column;
        std::size_t end_line;
        std::size_t end_column;
        std::string file{"<string>"};

        /// "file:line:col" of the start position
        [[nodiscard]] std::string str() const;

        /// True if this span starts at or before `other` and ends at or after it.
        [[nodiscard]] bool contains(const span& other) const;
    };

    /// Smallest span covering both arguments. File is taken from `first`.
    [[nodiscard]] span merge(const span& first, const span& last);
}
