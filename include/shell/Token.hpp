#pragma once

#include <string>
#include <vector>

namespace lv::shell {

inline void skip_ws(const char*& p, const char* e) {
    while (p < e && (*p == ' ' || *p == '\t')) ++p;
}

inline std::string read_quoted(const char*& p, const char* e, const char quote) {
    // p is at the opening quote; consume it
    ++p;
    std::string buf;
    buf.reserve(32);
    while (p < e) {
        if (*p == quote) { ++p; break; }
        if (quote == '"' && *p == '\\' && p + 1 < e) {
            // In double quotes, honor \" and \\ escapes
            ++p;
            buf.push_back(*p++);
            continue;
        }
        buf.push_back(*p++);
    }
    return buf;
}

// Splits on whitespace; single or double quotes group, and adjacent pieces join ("a"b -> ab)
inline std::vector<std::string> tokenize(const std::string& line) {
    std::vector<std::string> out;
    const char* p = line.c_str();
    const char* e = p + line.size();

    skip_ws(p, e);
    while (p < e) {
        std::string word;
        while (p < e && *p != ' ' && *p != '\t') {
            if (*p == '"' || *p == '\'') word += read_quoted(p, e, *p);
            else word.push_back(*p++);
        }
        out.push_back(std::move(word));
        skip_ws(p, e);
    }
    return out;
}

// Everything after the first `skip` words, verbatim apart from one layer of surrounding quotes
inline std::string restOfLine(const std::string& line, const size_t skip) {
    const char* p = line.c_str();
    const char* e = p + line.size();
    skip_ws(p, e);
    for (size_t i = 0; i < skip && p < e; ++i) {
        while (p < e && *p != ' ' && *p != '\t') {
            if (*p == '"' || *p == '\'') read_quoted(p, e, *p);
            else ++p;
        }
        skip_ws(p, e);
    }

    std::string rest(p, e);
    while (!rest.empty() && (rest.back() == ' ' || rest.back() == '\t' || rest.back() == '\r')) rest.pop_back();
    if (rest.size() >= 2 && (rest.front() == '"' || rest.front() == '\'') && rest.back() == rest.front())
        return rest.substr(1, rest.size() - 2);
    return rest;
}

}
