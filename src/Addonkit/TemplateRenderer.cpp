// =================================================================
// src/Addonkit/TemplateRenderer.cpp
// =================================================================
// Implementation for template rendering.

#include "Addonkit/TemplateRenderer.hpp"
#include <cctype>

namespace Addonkit {

static bool isIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

std::string TemplateRenderer::render(const std::string& text, const Values& values) {
    std::vector<std::string> lines = splitLines(substitute(text, values));

    size_t first = 0;
    while (first < lines.size() && isBlank(lines[first])) {
        first++;
    }
    if (first == lines.size()) {
        return "";
    }

    size_t last = lines.size();
    if (isBlank(lines[last - 1])) {
        last--;
    }

    size_t depth = 0;
    while (depth < lines[first].size() && lines[first][depth] == ' ') {
        depth++;
    }

    std::string result;
    for (size_t i = first; i < last; i++) {
        const std::string& line = lines[i];
        size_t strip = 0;
        while (strip < depth && strip < line.size() && line[strip] == ' ') {
            strip++;
        }
        if (i != first) {
            result += kNativeEol;
        }
        result.append(line, strip, std::string::npos);
    }
    return result;
}

std::string TemplateRenderer::substitute(const std::string& text, const Values& values) {
    std::string result;
    result.reserve(text.size());

    size_t pos = 0;
    while (pos < text.size()) {
        if (text[pos] != '@') {
            result += text[pos++];
            continue;
        }

        size_t end = pos + 1;
        while (end < text.size() && isIdentifierChar(text[end])) {
            end++;
        }

        auto it = values.find(text.substr(pos + 1, end - pos - 1));
        if (end > pos + 1 && it != values.end()) {
            result += it->second;
        } else {
            result.append(text, pos, end - pos);
        }
        pos = end;
    }
    return result;
}

std::string TemplateRenderer::toNativeLineEndings(const std::string& text) {
    std::vector<std::string> lines = splitLines(text);
    std::string result;
    for (size_t i = 0; i < lines.size(); i++) {
        if (i != 0) {
            result += kNativeEol;
        }
        result += lines[i];
    }
    return result;
}

std::vector<std::string> TemplateRenderer::splitLines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t newline = text.find('\n', start);
        std::string line = text.substr(start, newline == std::string::npos ? std::string::npos : newline - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
        if (newline == std::string::npos) {
            break;
        }
        start = newline + 1;
    }
    return lines;
}

bool TemplateRenderer::isBlank(const std::string& line) {
    for (char c : line) {
        if (c != ' ' && c != '\t') {
            return false;
        }
    }
    return true;
}

} // namespace Addonkit
