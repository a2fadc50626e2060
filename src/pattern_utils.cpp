#include "pattern_utils.hpp"
#include <fnmatch.h>
#include <glob.h>
#include <stdexcept>

namespace patterns {

bool matches(const std::filesystem::path& path, const std::vector<std::string>& patterns) {
    const std::string full = path.generic_string();
    const std::string name = path.filename().generic_string();

    for (const auto& pat : patterns) {
        const bool has_dirsep = pat.find('/') != std::string::npos;
        const bool has_glob = pat.find_first_of("*?[") != std::string::npos;
        const std::string& subject = has_dirsep ? full : name;
        if (!has_glob) {
            if (subject == pat)
                return true;
            continue;
        }
        if (fnmatch(pat.c_str(), subject.c_str(), 0) == 0)
            return true;
    }
    return false;
}

std::vector<std::string> expand_globs(const std::vector<std::string>& args, bool strict) {
    std::vector<std::string> out;
    for (const auto& arg : args) {
        glob_t g{};
        int rc = ::glob(arg.c_str(), 0, nullptr, &g);
        if (rc == 0) {
            for (size_t i = 0; i < g.gl_pathc; ++i)
                out.emplace_back(g.gl_pathv[i]);
        }
        globfree(&g);
        if (rc == 0)
            continue;
        if (rc != GLOB_NOMATCH)
            throw std::runtime_error("Error expanding pattern " + arg);
        if (strict)
            throw std::runtime_error("No files matched " + arg);
        out.push_back(arg);
    }
    return out;
}

std::string clean_path(const std::string& p) {
    if (p.empty())
        return ".";
    std::string s = std::filesystem::path(p).lexically_normal().generic_string();
    while (s.size() > 1 && s.back() == '/')
        s.pop_back();
    return s.empty() ? "." : s;
}

} // namespace patterns
