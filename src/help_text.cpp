#include "help_text.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <map>
#include <string>
#include <vector>

struct OptionInfo {
    const char* long_flag;
    const char* short_flag;
    const char* arg;
    const char* desc;
    const char* category;
};

struct CommandInfo {
    const char* usage;
    const char* desc;
};

void print_help(const char* prog) {
    static const std::vector<CommandInfo> commands = {
        {"init", "Initialise the current directory as an annexed repository"},
        {"clone <url|alias:owner/repo> [dir]", "Download a repository and initialise it"},
        {"add [paths]", "Record new and changed files; large files go to the annex"},
        {"commit [paths]", "Add and record changes in the local repository"},
        {"upload [--to remote] [paths]", "Upload history and file content to remotes"},
        {"download [--content]", "Download changes from remotes"},
        {"sync [--content]", "Upload and download changes, resolving merges"},
        {"get-content <paths>", "Download the content of placeholder files"},
        {"remove-content <paths>", "Remove local content that is stored remotely"},
        {"lock <paths>", "Lock files, making them read-only"},
        {"unlock <paths>", "Unlock files for editing"},
        {"ls [--short] [paths]", "List the synchronisation status of files"},
        {"log [-n count] [paths]", "Show the version history"},
        {"version [--id rev] [--copy-to dir] [paths]", "Restore or copy out older versions"},
        {"checkout-copies <rev> <dir> [paths]", "Copy files of a revision into a directory"},
        {"remotes", "List configured remotes"},
        {"add-remote <name> <url|alias:owner/repo>", "Add a remote"},
        {"remove-remote <name>", "Remove a remote"},
        {"use-remote <name>", "Set the default remote"},
        {"tool-versions", "Show the versions of git and git-annex in use"},
    };
    static const std::vector<OptionInfo> opts = {
        {"--json", "", "", "Print one JSON object per event", "Output"},
        {"--verbose", "-v", "", "Print the raw output of the tools", "Output"},
        {"--short", "-s", "", "Two-letter status codes for ls", "Output"},
        {"--content", "", "", "Also transfer file content (download, sync)", "Transfer"},
        {"--to", "", "<remote>", "Upload target (repeatable)", "Transfer"},
        {"--message", "-m", "<text>", "Commit message", "History"},
        {"--max-count", "-n", "<n>", "Number of versions to list (0 for all)", "History"},
        {"--id", "", "<rev>", "Version to restore", "History"},
        {"--copy-to", "", "<dir>", "Copy old versions here instead of restoring", "History"},
        {"--config", "", "<file>", "Client configuration file (YAML or JSON)", "Config"},
        {"--log-level", "", "<level>", "DEBUG, INFO, WARNING or ERROR", "Logging"},
        {"--log-file", "", "<path>", "Log file location", "Logging"},
        {"--max-log-size", "", "<bytes>", "Rotate the log at this size", "Logging"},
        {"--json-log", "", "", "Write log entries as JSON", "Logging"},
        {"--compress-logs", "", "", "Gzip rotated log files", "Logging"},
        {"--version", "-V", "", "Print program version and exit", "Basics"},
        {"--help", "-h", "", "Show this message", "Basics"}};

    std::map<std::string, std::vector<const OptionInfo*>> groups;
    size_t width = 0;
    for (const auto& o : opts) {
        groups[o.category].push_back(&o);
        std::string flag = "  ";
        if (std::strlen(o.short_flag))
            flag += std::string(o.short_flag) + ", ";
        else
            flag += "    ";
        flag += o.long_flag;
        if (std::strlen(o.arg))
            flag += " " + std::string(o.arg);
        width = std::max(width, flag.size());
    }
    size_t cmd_width = 0;
    for (const auto& c : commands)
        cmd_width = std::max(cmd_width, std::strlen(c.usage) + 2);

    std::cout << "annexsync - git and git-annex repository client\n";
    std::cout << "Tracks large files with git-annex and everything else with git.\n\n";
    std::cout << "Usage: " << prog << " <command> [options] [paths...]\n\n";
    std::cout << "Commands:\n";
    for (const auto& c : commands)
        std::cout << "  " << std::left << std::setw(static_cast<int>(cmd_width)) << c.usage
                  << c.desc << "\n";
    std::cout << "\n";
    const std::vector<std::string> order{"Basics", "Output", "Transfer", "History", "Config",
                                         "Logging"};
    for (const auto& cat : order) {
        if (!groups.count(cat))
            continue;
        std::cout << cat << ":\n";
        for (const auto* o : groups[cat]) {
            std::string flag = "  ";
            if (std::strlen(o->short_flag))
                flag += std::string(o->short_flag) + ", ";
            else
                flag += "    ";
            flag += o->long_flag;
            if (std::strlen(o->arg))
                flag += " " + std::string(o->arg);
            std::cout << std::left << std::setw(static_cast<int>(width) + 2) << flag << o->desc
                      << "\n";
        }
        std::cout << "\n";
    }
}
