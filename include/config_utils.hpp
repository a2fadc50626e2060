#ifndef CONFIG_UTILS_HPP
#define CONFIG_UTILS_HPP
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "command_builder.hpp"

/**
 * @brief Flattened configuration values keyed by dotted path.
 *
 * Scalars become a single element, sequences keep their items in order, e.g.
 * `annex.exclude` → {"*.md", "*.txt"}.
 */
using ConfigValues = std::map<std::string, std::vector<std::string>>;

/** Git endpoint of a server alias, `servers.<alias>.git`. */
struct ServerConfig {
    std::string user = "git";
    std::string host;
    unsigned int port = 22;

    /** @brief `ssh://user@host:port` */
    std::string address() const;

    /** @brief Remote URL for `owner/repo` on this server. */
    std::string repo_url(const std::string& repo_path) const;
};

/**
 * @brief Client configuration assembled from defaults and the config file.
 */
struct ClientConfig {
    cmd::ToolConfig tools;
    std::map<std::string, ServerConfig> servers;
};

/**
 * @brief Load configuration values from a YAML file.
 *
 * Nested maps are flattened into dotted keys.
 *
 * @param path   Filesystem path to the YAML configuration file.
 * @param values Map receiving the values found.
 * @param error  Output string capturing a human-readable error message on
 *               failure.
 * @return `true` if the configuration was loaded successfully.
 */
bool load_yaml_config(const std::string& path, ConfigValues& values, std::string& error);

/**
 * @brief Load configuration values from a JSON file.
 *
 * Same layout and flattening rules as load_yaml_config().
 */
bool load_json_config(const std::string& path, ConfigValues& values, std::string& error);

/**
 * @brief Load a YAML or JSON file depending on its extension.
 */
bool load_config_file(const std::string& path, ConfigValues& values, std::string& error);

/**
 * @brief Apply loaded values on top of @p cfg.
 *
 * Recognised keys are `bin.git`, `bin.gitannex`, `bin.ssh`, `annex.minsize`,
 * `annex.exclude`, `annex.repoversion`, `ssh.keys`, `ssh.knownhosts` and
 * `servers.<alias>.git.{user,host,port}`. Unknown keys are ignored.
 *
 * @return `false` with @p error set if a value cannot be parsed.
 */
bool apply_config(const ConfigValues& values, ClientConfig& cfg, std::string& error);

/**
 * @brief Apply the `annex` section of a repository's `config.yml`.
 *
 * Every other section of that file is ignored.
 */
bool apply_repo_config(const ConfigValues& values, cmd::ToolConfig& tools, std::string& error);

/**
 * @brief Default client configuration file.
 *
 * `ANNEXSYNC_CONFIG_DIR` wins, then `$XDG_CONFIG_HOME/annexsync`, then
 * `~/.config/annexsync`; the file is `config.yml` inside that directory.
 */
std::string default_config_path();

/**
 * @brief Defaults merged with the file at @p path, or with the default file
 * when @p path is empty. A missing default file is not an error.
 *
 * @throws std::runtime_error if the file cannot be read or holds bad values.
 */
ClientConfig load_client_config(const std::string& path);

#endif // CONFIG_UTILS_HPP
