#pragma once

#include <algorithm>
#include <cctype>
#include <string>

namespace youwee::util {

inline bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

inline std::string trimCopy(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && isSpace(s[begin])) begin++;
    while (end > begin && isSpace(s[end - 1])) end--;
    return s.substr(begin, end - begin);
}

// Drop at most one `quote` from the front and one from the back (not necessarily paired).
inline std::string trimOneQuote(const std::string& s, char quote) {
    size_t begin = 0;
    size_t end = s.size();
    if (begin < end && s[begin] == quote) begin++;
    if (end > begin && s[end - 1] == quote) end--;
    return s.substr(begin, end - begin);
}

inline bool startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

inline std::string toLowerCopy(const std::string& s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

inline std::string ellipsize(const std::string& s, size_t maxlen) {
    if (s.size() <= maxlen) return s;
    return s.substr(0, maxlen) + "...";
}

} // namespace youwee::util
