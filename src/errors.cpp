#include "errors.hpp"
#include <sstream>
#include <utility>

namespace errors {

const char* category_name(Category c) {
    switch (c) {
    case Category::Environment:
        return "environment";
    case Category::Authorization:
        return "authorization";
    case Category::HostKey:
        return "host-key";
    case Category::Connection:
        return "connection";
    case Category::PushRejected:
        return "push-rejected";
    case Category::WouldOverwrite:
        return "would-overwrite";
    case Category::MergeConflict:
        return "merge-conflict";
    case Category::AutoResolvedConflict:
        return "auto-resolved-conflict";
    case Category::ItemFailure:
        return "item-failure";
    case Category::Command:
        return "command";
    }
    return "command";
}

std::string Failure::describe() const {
    std::string out = message;
    for (const auto& f : files)
        out += "\n  " + f;
    return out;
}

OperationError::OperationError(Failure f)
    : std::runtime_error(f.describe()), failure_(std::move(f)) {}

OperationError::OperationError(Category c, const std::string& message, const std::string& detail)
    : OperationError(Failure{c, message, {}, detail}) {}

const std::vector<Rule>& upload_rules() {
    static const std::vector<Rule> rules = {
        {"Permission denied", Category::Authorization, "upload failed: permission denied"},
        {"Host key verification failed", Category::HostKey,
         "upload failed: server key does not match known host key"},
        {"rejected", Category::PushRejected,
         "upload failed: changes were made on the server that have not been downloaded; "
         "run 'annexsync download' to update local copies"},
        {"Could not resolve hostname", Category::Connection,
         "upload failed: could not connect to server"},
        {"Connection refused", Category::Connection,
         "upload failed: could not connect to server"},
    };
    return rules;
}

const std::vector<Rule>& download_rules() {
    static const std::vector<Rule> rules = {
        {"Permission denied", Category::Authorization, "download failed: permission denied"},
        {"Host key verification failed", Category::HostKey,
         "download failed: server key does not match known host key"},
        {"would be overwritten by merge", Category::WouldOverwrite,
         "download failed: local modified or untracked file would be overwritten by download"},
        {"Merge conflict in ", Category::MergeConflict,
         "download failed: files changed locally and remotely and cannot be automatically "
         "merged"},
        {"Could not resolve hostname", Category::Connection,
         "download failed: could not connect to server"},
        {"Connection refused", Category::Connection,
         "download failed: could not connect to server"},
    };
    return rules;
}

Failure classify(const std::string& text, const std::vector<Rule>& rules,
                 const std::string& fallback) {
    for (const auto& r : rules) {
        if (text.find(r.needle) != std::string::npos)
            return Failure{r.category, r.message, {}, text};
    }
    std::string msg = fallback;
    std::string t = trim(text);
    if (!t.empty())
        msg += ": " + t;
    return Failure{Category::Command, msg, {}, text};
}

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos)
        return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

static bool contains_any(const std::string& line, const std::vector<std::string>& needles) {
    for (const auto& n : needles)
        if (line.find(n) != std::string::npos)
            return true;
    return false;
}

std::vector<std::string> files_between_markers(const std::string& text,
                                               const std::vector<std::string>& starts,
                                               const std::vector<std::string>& ends) {
    std::vector<std::string> files;
    std::istringstream in(text);
    std::string line;
    bool inside = false;
    while (std::getline(in, line)) {
        if (!inside) {
            inside = contains_any(line, starts);
            continue;
        }
        if (contains_any(line, ends)) {
            inside = false;
            continue;
        }
        std::string f = trim(line);
        if (!f.empty())
            files.push_back(f);
    }
    return files;
}

std::vector<std::string> files_with_marker(const std::string& text, const std::string& marker) {
    std::vector<std::string> files;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        size_t pos = line.find(marker);
        if (pos == std::string::npos)
            continue;
        std::string f = trim(line.substr(pos + marker.size()));
        if (!f.empty())
            files.push_back(f);
    }
    return files;
}

std::vector<std::string> lines_containing(const std::string& text, const std::string& needle) {
    std::vector<std::string> out;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        if (line.find(needle) != std::string::npos)
            out.push_back(trim(line));
    }
    return out;
}

} // namespace errors
