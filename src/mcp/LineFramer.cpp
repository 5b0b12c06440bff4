// SPDX-License-Identifier: Apache-2.0
#include "LineFramer.hpp"

#include <core/Log.hpp>

namespace toolhost
{

namespace
{
    auto isBlank(std::string_view line) -> bool
    {
        return line.find_first_not_of(" \t\r") == std::string_view::npos;
    }
} // namespace

auto LineFramer::feed(std::string_view chunk) -> std::vector<std::string>
{
    auto lines = std::vector<std::string> {};
    auto pos = std::size_t { 0 };

    while (pos < chunk.size())
    {
        auto const newlinePos = chunk.find('\n', pos);
        auto const piece = chunk.substr(pos, newlinePos == std::string_view::npos ? std::string_view::npos
                                                                                  : newlinePos - pos);

        if (_discarding)
        {
            if (newlinePos == std::string_view::npos)
                break;
            _discarding = false;
            pos = newlinePos + 1;
            continue;
        }

        if (_buffer.size() + piece.size() > _maxLineLength)
        {
            log::warning("Discarding line longer than {} bytes", _maxLineLength);
            ++_discardedLines;
            _buffer.clear();
            if (newlinePos == std::string_view::npos)
            {
                _discarding = true;
                break;
            }
            pos = newlinePos + 1;
            continue;
        }

        _buffer.append(piece);
        if (newlinePos == std::string_view::npos)
            break;

        auto line = std::string_view(_buffer);
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        if (!isBlank(line))
            lines.emplace_back(line);

        _buffer.clear();
        pos = newlinePos + 1;
    }

    return lines;
}

auto LineFramer::flush() -> std::string
{
    auto rest = std::move(_buffer);
    _buffer.clear();
    _discarding = false;
    return rest;
}

} // namespace toolhost
