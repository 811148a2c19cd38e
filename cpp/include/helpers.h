#pragma once

#include <string>
#include <string_view>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#endif

namespace agentshell {
namespace helpers {

#ifdef _WIN32
namespace win {

/**
 * Convert UTF-16 (Windows wide string) to UTF-8.
 * Note: allocates once using the exact required byte count.
 * Failure returns empty string.
 */
inline std::string wstring_to_utf8(const std::wstring& w) {
    if (w.empty()) return {};
    int n = ::WideCharToMultiByte(CP_UTF8, 0, w.data(), (int)w.size(), nullptr, 0, nullptr, nullptr);
    if (n <= 0) return {};
    std::string out(n, '\0');
    ::WideCharToMultiByte(CP_UTF8, 0, w.data(), (int)w.size(), out.data(), n, nullptr, nullptr);
    return out;
}

inline std::wstring utf8_to_wstring(const std::string& s) {
    if (s.empty()) return {};
    int n = ::MultiByteToWideChar(CP_UTF8, 0, s.data(), (int)s.size(), nullptr, 0);
    if (n <= 0) return {};
    std::wstring out(n, L'\0');
    ::MultiByteToWideChar(CP_UTF8, 0, s.data(), (int)s.size(), out.data(), n);
    return out;
}

} // namespace win
#endif

namespace parsers {

inline void trim_inplace(std::string& s) {
    // Remove leading/trailing whitespace (space, tab, CR, LF) in-place.
    auto is_space = [](unsigned char ch){ return ch==' '||ch=='\t'||ch=='\r'||ch=='\n'; };
    size_t a = 0, b = s.size();
    while (a < b && is_space(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && is_space(static_cast<unsigned char>(s[b-1]))) --b;

    if (a==0 && b==s.size()) return;
    s.assign(s.begin()+a, s.begin()+b);
}

inline void rtrim_inplace(std::string& s) {
    while (!s.empty()) {
        const char c = s.back();
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n') break;
        s.pop_back();
    }
}

// "\r\n" -> "\n"; lone '\r' is kept (progress bars rely on it).
inline std::string normalize_newlines(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '\r' && i + 1 < in.size() && in[i + 1] == '\n') continue;
        out.push_back(in[i]);
    }
    return out;
}

} // namespace parsers

namespace quoting {

inline std::string ps_quote(std::string_view s) {
    // Quote a string for PowerShell literal context.
    // - Encloses with single quotes.
    // - Internal single quotes are doubled (' -> '').
    std::string t;
    t.reserve(s.size() + 2);
    t.push_back('\'');
    for (char c : s) {
        if (c == '\'') t += "''";
        else t.push_back(c);
    }
    t.push_back('\'');
    return t;
}

inline std::string sh_quote(std::string_view s) {
    // POSIX single-quote literal: ' -> '\''
    std::string t;
    t.reserve(s.size() + 2);
    t.push_back('\'');
    for (char c : s) {
        if (c == '\'') t += "'\\''";
        else t.push_back(c);
    }
    t.push_back('\'');
    return t;
}

} // namespace quoting

} // namespace helpers
} // namespace agentshell
