#include "command_builder.hpp"
#include "pattern_utils.hpp"

namespace cmd {

std::map<std::string, std::string> ssh_env(const ToolConfig& cfg, bool annex) {
    std::map<std::string, std::string> env;
    if (cfg.ssh_keys.empty() && cfg.known_hosts.empty())
        return env;
    std::string sshcmd = cfg.ssh_bin;
    for (const auto& key : cfg.ssh_keys)
        sshcmd += " -i " + procutil::quote_argument(key);
    sshcmd += " -o IdentitiesOnly=yes -o StrictHostKeyChecking=yes";
    if (!cfg.known_hosts.empty())
        sshcmd += " -o 'UserKnownHostsFile=\"" + cfg.known_hosts + "\"'";
    env["GIT_SSH_COMMAND"] = sshcmd;
    if (annex)
        env["GIT_ANNEX_USE_GIT_SSH"] = "1";
    return env;
}

procutil::CommandSpec git_command(const ToolConfig& cfg, const std::filesystem::path& dir,
                                  std::vector<std::string> args) {
    procutil::CommandSpec spec;
    spec.program = cfg.git_bin;
    spec.args = std::move(args);
    spec.cwd = dir;
    spec.env = ssh_env(cfg, false);
    return spec;
}

procutil::CommandSpec annex_command(const ToolConfig& cfg, const std::filesystem::path& dir,
                                    std::vector<std::string> args) {
    procutil::CommandSpec spec;
    spec.program = cfg.annex_bin;
    spec.args = std::move(args);
    spec.cwd = dir;
    spec.env = ssh_env(cfg, true);
    return spec;
}

procutil::CommandSpec clone_command(const ToolConfig& cfg, const std::filesystem::path& dir,
                                    const std::string& url, const std::string& dest) {
    std::vector<std::string> args;
#ifdef _WIN32
    args = {"-c", "core.symlinks=false"};
#endif
    args.insert(args.end(), {"clone", "--progress", url, dest});
    procutil::CommandSpec spec = git_command(cfg, dir, std::move(args));
    spec.err_delims = procutil::kProgressDelims;
    return spec;
}

procutil::CommandSpec annex_init_command(const ToolConfig& cfg, const std::filesystem::path& dir,
                                         const std::string& description) {
    return annex_command(cfg, dir, {"init", "--version=" + cfg.annex_repo_version, description});
}

std::vector<std::string> annex_filter_args(const ToolConfig& cfg, const std::string& repo_config) {
    std::vector<std::string> args{"--not",
                                  "--smallerthan=" + std::to_string(cfg.annex_min_size)};
    for (const auto& pat : cfg.annex_exclude)
        args.push_back("--exclude=" + pat);
    args.push_back("--exclude=" + repo_config);
    return args;
}

bool is_content_file(const ToolConfig& cfg, const std::filesystem::path& path,
                     std::uintmax_t size) {
    if (size < cfg.annex_min_size)
        return false;
    if (path.lexically_normal().generic_string() == kRepoConfigFile)
        return false;
    return !patterns::matches(path, cfg.annex_exclude);
}

} // namespace cmd
