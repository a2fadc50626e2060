#ifndef ARG_PARSER_HPP
#define ARG_PARSER_HPP
#include <map>
#include <set>
#include <string>
#include <vector>

/**
 * @brief Command line parser for `annexsync <command> [options] [paths]`.
 *
 * Long options are written `--flag`, `--opt value` or `--opt=value`. Only
 * flags listed in @a value_flags consume the following argument, so boolean
 * flags may sit directly in front of a subcommand or a path. Short options
 * (`-m msg`, `-n5`) are mapped onto their long names. A bare `--` ends
 * option parsing and everything after it is positional.
 *
 * Flags that are not part of @a known_flags are collected so the caller can
 * report them.
 */
class ArgParser {
    std::set<std::string> flags_;                ///< Flags present on the command line
    std::map<std::string, std::string> options_; ///< Option values keyed by flag
    std::map<std::string, std::vector<std::string>>
        multi_options_;                      ///< Store all values for repeatable options
    std::vector<std::string> positional_;    ///< Positional arguments in order
    std::vector<std::string> unknown_flags_; ///< Flags not present in known_flags
    std::set<std::string> known_flags_;      ///< List of accepted flags
    std::map<char, std::string> short_map_;  ///< Mapping of short to long flags
    std::set<std::string> value_flags_;      ///< Flags that take a value

    bool known(const std::string& key) const {
        return known_flags_.empty() || known_flags_.count(key) > 0;
    }

    bool takes_value(const std::string& key) const { return value_flags_.count(key) > 0; }

    void store(const std::string& key, const std::string& val) {
        if (!known(key)) {
            unknown_flags_.push_back(key);
            return;
        }
        flags_.insert(key);
        options_[key] = val;
        multi_options_[key].push_back(val);
    }

    void store_flag(const std::string& key) {
        if (known(key))
            flags_.insert(key);
        else
            unknown_flags_.push_back(key);
    }

    void parse(const std::vector<std::string>& args) {
        bool only_positional = false;
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (only_positional) {
                positional_.push_back(arg);
            } else if (arg == "--") {
                only_positional = true;
            } else if (arg.rfind("--", 0) == 0) {
                size_t eq = arg.find('=');
                if (eq != std::string::npos) {
                    store(arg.substr(0, eq), arg.substr(eq + 1));
                } else if (takes_value(arg) && i + 1 < args.size()) {
                    store(arg, args[++i]);
                } else {
                    store_flag(arg);
                }
            } else if (arg.size() >= 2 && arg[0] == '-') {
                // Stacked short flags; a value-taking flag swallows the rest
                // of the word or, failing that, the next argument.
                for (size_t j = 1; j < arg.size(); ++j) {
                    auto it = short_map_.find(arg[j]);
                    if (it == short_map_.end()) {
                        unknown_flags_.push_back("-" + std::string(1, arg[j]));
                        break;
                    }
                    const std::string& key = it->second;
                    if (!takes_value(key)) {
                        store_flag(key);
                        continue;
                    }
                    std::string val = arg.substr(j + 1);
                    if (!val.empty() && val[0] == '=')
                        val.erase(0, 1);
                    if (val.empty() && i + 1 < args.size())
                        val = args[++i];
                    store(key, val);
                    break;
                }
            } else {
                positional_.push_back(arg);
            }
        }
    }

  public:
    /**
     * @brief Parse the given command line arguments.
     *
     * @param argc Argument count from `main`.
     * @param argv Argument vector from `main`; `argv[0]` is skipped.
     * @param known_flags Flags considered valid. If empty, every flag is
     *        accepted.
     * @param short_map Mapping from single character options (e.g. '-m') to
     *        their long form (e.g. '--message').
     * @param value_flags Long flags that take a value.
     */
    ArgParser(int argc, char* argv[], const std::set<std::string>& known_flags = {},
              const std::map<char, std::string>& short_map = {},
              const std::set<std::string>& value_flags = {})
        : known_flags_(known_flags), short_map_(short_map), value_flags_(value_flags) {
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i)
            args.emplace_back(argv[i]);
        parse(args);
    }

    /** @brief Parse an argument list that does not include the program name. */
    ArgParser(const std::vector<std::string>& args, const std::set<std::string>& known_flags,
              const std::map<char, std::string>& short_map,
              const std::set<std::string>& value_flags)
        : known_flags_(known_flags), short_map_(short_map), value_flags_(value_flags) {
        parse(args);
    }

    /**
     * @brief Check whether a flag was provided on the command line.
     *
     * @param flag Flag name including the leading `--`.
     */
    bool has_flag(const std::string& flag) const { return flags_.count(flag) > 0; }

    /**
     * @brief Retrieve the value associated with an option.
     *
     * @return Stored option value or empty string if missing.
     */
    std::string get_option(const std::string& opt) const {
        auto it = options_.find(opt);
        if (it != options_.end())
            return it->second;
        return "";
    }

    /** @brief Every value given for a repeatable option, in order. */
    std::vector<std::string> get_all_options(const std::string& opt) const {
        auto it = multi_options_.find(opt);
        if (it != multi_options_.end())
            return it->second;
        return {};
    }

    const std::set<std::string>& flags() const { return flags_; }
    const std::map<std::string, std::string>& options() const { return options_; }
    const std::vector<std::string>& positional() const { return positional_; }
    const std::vector<std::string>& unknown_flags() const { return unknown_flags_; }
};

#endif // ARG_PARSER_HPP
