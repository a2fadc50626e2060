#include "tool_versions.hpp"
#include <cctype>
#include <stdexcept>
#include <system_error>

#include "errors.hpp"
#include "logger.hpp"
#include "process.hpp"
#include "version.hpp"

namespace versions {

using errors::Category;
using errors::OperationError;

std::vector<int> parse_version(const std::string& v) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : v) {
        if (c == '.' || c == '-' || c == '~') {
            if (!cur.empty())
                parts.push_back(cur);
            cur.clear();
        } else {
            cur += c;
        }
    }
    if (!cur.empty())
        parts.push_back(cur);

    std::vector<int> out;
    for (size_t i = 0; i < parts.size(); ++i) {
        const std::string& p = parts[i];
        bool numeric = !p.empty();
        for (char c : p)
            numeric = numeric && std::isdigit(static_cast<unsigned char>(c));
        if (!numeric) {
            if (i == 0)
                throw std::runtime_error(v + ": version string not understood");
            break;
        }
        out.push_back(std::stoi(p));
    }
    if (out.empty())
        throw std::runtime_error(v + ": version string not understood");
    return out;
}

bool at_least(const std::string& have, const std::string& need) {
    std::vector<int> h = parse_version(have);
    std::vector<int> n = parse_version(need);
    for (size_t i = 0; i < n.size(); ++i) {
        if (i >= h.size() || h[i] < n[i])
            return false;
        if (h[i] > n[i])
            return true;
    }
    return true;
}

static std::string tool_output(const procutil::CommandSpec& spec, const std::string& name) {
    procutil::CaptureResult res;
    try {
        res = procutil::run_capture(spec);
    } catch (const std::system_error& e) {
        throw OperationError(Category::Environment,
                             name + " executable not found: " + std::string(e.what()));
    }
    if (!res.ok()) {
        log_command_output(spec.display(), res.out, res.err);
        throw OperationError(Category::Environment, errors::trim(res.err), res.err);
    }
    return errors::trim(res.out);
}

std::string git_version(const cmd::ToolConfig& tools) {
    std::string out = tool_output(cmd::git_command(tools, {}, {"version"}), "git");
    const std::string prefix = "git version ";
    if (out.rfind(prefix, 0) == 0)
        out.erase(0, prefix.size());
    return out;
}

std::string annex_version(const cmd::ToolConfig& tools) {
    return tool_output(cmd::annex_command(tools, {}, {"version", "--raw"}), "git-annex");
}

void check_tools(const cmd::ToolConfig& tools) {
    std::string gv = git_version(tools);
    try {
        parse_version(gv);
    } catch (const std::runtime_error&) {
        throw OperationError(Category::Environment, gv);
    }
    std::string av = annex_version(tools);
    bool ok = false;
    try {
        ok = at_least(av, ANNEXSYNC_MIN_ANNEX_VERSION);
    } catch (const std::runtime_error& e) {
        throw OperationError(Category::Environment, e.what());
    }
    if (!ok)
        throw OperationError(Category::Environment,
                             "git-annex version " + av + " found, but " +
                                 ANNEXSYNC_MIN_ANNEX_VERSION + " or newer is required");
}

std::string describe(const cmd::ToolConfig& tools) {
    std::string gv;
    try {
        gv = git_version(tools);
    } catch (const OperationError& e) {
        gv = std::string(e.what()).find("not found") != std::string::npos ? "not found" : e.what();
    }
    std::string av;
    try {
        av = annex_version(tools);
        if (!at_least(av, ANNEXSYNC_MIN_ANNEX_VERSION))
            av = "git-annex version " + av + " found, but " + ANNEXSYNC_MIN_ANNEX_VERSION +
                 " or newer is required";
    } catch (const OperationError& e) {
        av = std::string(e.what()).find("not found") != std::string::npos ? "not found" : e.what();
    } catch (const std::runtime_error& e) {
        av = e.what();
    }
    return std::string("annexsync ") + ANNEXSYNC_VERSION + "\n  git: " + gv +
           "\n  git-annex: " + av;
}

} // namespace versions
