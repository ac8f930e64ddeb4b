#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace otadump {

// Normalize an archive member path to a clean relative form:
// - strip leading "./"
// - strip leading "/" (avoid absolute)
// - collapse duplicate slashes
inline std::string NormalizeArchivePath(std::string s) {
    while (s.rfind("./", 0) == 0) s.erase(0, 2);
    while (!s.empty() && s.front() == '/') s.erase(0, 1);

    std::string out;
    out.reserve(s.size());
    bool prev_slash = false;
    for (char c : s) {
        const bool slash = (c == '/');
        if (slash && prev_slash) continue;
        out.push_back(c);
        prev_slash = slash;
    }
    return out;
}

// "a,b,,c" -> {"a", "b", "c"}. Surrounding blanks are trimmed.
inline std::vector<std::string> SplitList(std::string_view s, char sep = ',') {
    std::vector<std::string> out;
    std::size_t pos = 0;
    while (pos <= s.size()) {
        std::size_t end = s.find(sep, pos);
        if (end == std::string_view::npos) end = s.size();
        std::string_view item = s.substr(pos, end - pos);
        while (!item.empty() && (item.front() == ' ' || item.front() == '\t')) item.remove_prefix(1);
        while (!item.empty() && (item.back() == ' ' || item.back() == '\t')) item.remove_suffix(1);
        if (!item.empty()) out.emplace_back(item);
        pos = end + 1;
    }
    return out;
}

// True for a single path component that stays inside the directory it is
// joined to: not empty, not "." or "..", no '/', '\\' or NUL.
inline bool IsPlainFileName(std::string_view name) {
    if (name.empty() || name == "." || name == "..") return false;
    return name.find_first_of(std::string_view("/\\\0", 3)) == std::string_view::npos;
}

// 1536 -> "1.5 KiB"
std::string HumanSize(unsigned long long bytes);

} // namespace otadump
