// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace toolhost
{

/// @brief Accumulates partial reads and splits them into newline-delimited lines.
///
/// Carriage returns before the newline are stripped and blank lines are skipped.
/// A line longer than the maximum length is discarded up to its terminating newline.
/// Not thread-safe; each stream owns its own framer.
class LineFramer
{
  public:
    static constexpr auto DefaultMaxLineLength = std::size_t { 16 * 1024 * 1024 };

    explicit LineFramer(std::size_t maxLineLength = DefaultMaxLineLength): _maxLineLength(maxLineLength) {}

    /// @brief Appends a chunk of bytes and returns every line completed by it.
    [[nodiscard]] auto feed(std::string_view chunk) -> std::vector<std::string>;

    /// @brief Returns and clears whatever partial line is still buffered.
    [[nodiscard]] auto flush() -> std::string;

    /// @brief Returns the number of buffered bytes not yet terminated by a newline.
    [[nodiscard]] auto pendingBytes() const noexcept -> std::size_t { return _buffer.size(); }

    /// @brief Returns the number of lines dropped for exceeding the maximum length.
    [[nodiscard]] auto discardedLines() const noexcept -> std::size_t { return _discardedLines; }

  private:
    std::size_t _maxLineLength;
    std::string _buffer;
    bool _discarding = false; ///< Skipping the rest of an oversized line.
    std::size_t _discardedLines = 0;
};

} // namespace toolhost
