// =================================================================
// include/Addonkit/TemplateRenderer.hpp
// =================================================================
// Turns readably indented in-source templates into generated file
// content.

#pragma once

#include <map>
#include <string>
#include <vector>

namespace Addonkit {

/// Native line ending of the host platform.
#if defined(_WIN32)
constexpr const char* kNativeEol = "\r\n";
#else
constexpr const char* kNativeEol = "\n";
#endif

class TemplateRenderer {
public:
    using Values = std::map<std::string, std::string>;

    /**
     * @brief Renders a template.
     *
     * `@key` placeholders (identifier characters after '@') are replaced by
     * the matching value; unknown keys stay as written. Leading blank lines
     * and one trailing blank line are dropped, the indentation of the first
     * remaining line is removed from every line, and lines are joined with
     * the native line ending. A template with no content renders to "".
     */
    static std::string render(const std::string& text, const Values& values = {});

    /**
     * @brief Replaces `@key` placeholders only.
     */
    static std::string substitute(const std::string& text, const Values& values);

    /**
     * @brief Converts "\n" and "\r\n" separators to the native line ending.
     */
    static std::string toNativeLineEndings(const std::string& text);

private:
    static std::vector<std::string> splitLines(const std::string& text);
    static bool isBlank(const std::string& line);
};

} // namespace Addonkit
