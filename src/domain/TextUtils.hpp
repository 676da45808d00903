/**
 * @file TextUtils.hpp
 * @brief UTF-8 aware string helpers shared by the parser and the query engine.
 */

#pragma once
#include <string>

namespace patternkeeper::domain {

class TextUtils {
public:
    /** @brief True if the text is well-formed UTF-8. */
    static bool IsValidUtf8(const std::string& text);

    /** @brief Strips leading and trailing Unicode whitespace (White_Space property). */
    static std::string Trim(const std::string& text);

    /** @brief Unicode lowercase mapping, locale-independent. */
    static std::string ToLower(const std::string& text);

    /** @brief Number of UTF-8 code points in the text. */
    static std::size_t Utf8Length(const std::string& text);

    /**
     * @brief Returns the first maxChars code points of the text.
     * Never splits a multi-byte sequence; returns the whole text if it is shorter.
     */
    static std::string Utf8Prefix(const std::string& text, std::size_t maxChars);
};

} // namespace patternkeeper::domain
