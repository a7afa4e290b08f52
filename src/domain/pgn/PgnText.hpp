#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace pgnreplay::domain::pgn {

// Small text helpers shared by the splitter, parser and writer.

bool isBlank(std::string_view s);
std::string trim(std::string_view v);

// Drops a leading UTF-8 BOM and converts "\r\n" and lone "\r" to "\n".
std::string normalizePgnText(std::string_view text);

// Splits on '\n'. A trailing newline does not produce an empty last line.
std::vector<std::string> splitLines(std::string_view text);

// Removes {...} comments, ; line comments, (...) variations (nested) and % escape lines.
std::string removeCommentsAndVariations(std::string_view in);

std::vector<std::string> splitWhitespace(std::string_view text);

// PGN string escaping for tag values (\" and \\).
std::string escapePgnString(std::string_view v);
std::string unescapePgnString(std::string_view v);

} // namespace pgnreplay::domain::pgn
