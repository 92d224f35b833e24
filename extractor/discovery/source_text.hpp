#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mex::discovery
{
    struct TextRange
    {
        std::size_t begin{0};
        std::size_t end{0};
    };

    [[nodiscard]] std::optional<std::string> loadFile(const std::filesystem::path& path);

    [[nodiscard]] std::string_view trim(std::string_view text);

    [[nodiscard]] bool isQuote(char ch);

    // Index one past the string literal opening at `quoteIndex`, or npos when
    // the literal is unterminated. Triple quotes and backslash escapes are honoured.
    [[nodiscard]] std::size_t skipStringLiteral(std::string_view text, std::size_t quoteIndex);

    // Index of the delimiter closing the one at `openIndex`. String literals
    // and comments are skipped; other bracket kinds only affect nesting.
    [[nodiscard]] std::optional<std::size_t> findMatchingDelimiter(std::string_view text, std::size_t openIndex);

    // Pieces of `text` separated by `separator` at nesting depth zero.
    [[nodiscard]] std::vector<std::string_view> splitTopLevel(std::string_view text, char separator);

    [[nodiscard]] std::optional<std::size_t> findTopLevel(std::string_view text, char target);

    // First top-level `=` that is not part of a comparison operator.
    [[nodiscard]] std::optional<std::size_t> findTopLevelAssignment(std::string_view text);

    // `text` with `#` comments removed; string literals are kept intact.
    [[nodiscard]] std::string stripComments(std::string_view text);

    [[nodiscard]] bool isQuotedString(std::string_view text);
    // Contents of a quoted literal with `\\`, `\"`, `\'`, `\n`, `\t` and `\r`
    // decoded; other escapes are kept verbatim. Non-literals are returned as is.
    [[nodiscard]] std::string unquote(std::string_view text);

    [[nodiscard]] bool isIdentifier(std::string_view text);
    [[nodiscard]] bool isDottedName(std::string_view text);
    [[nodiscard]] bool isIdentifierChar(char ch);

    [[nodiscard]] std::size_t indentationOf(std::string_view line);

    // Body of a block whose header ends with the `:` at `colonIndex`. An
    // inline body covers the rest of that line; otherwise the first non-blank
    // line sets the base indent and a later line with less indent ends it.
    [[nodiscard]] TextRange findIndentedBody(std::string_view source, std::size_t colonIndex);

    [[nodiscard]] std::string escapeJson(std::string_view value);
} // namespace mex::discovery
