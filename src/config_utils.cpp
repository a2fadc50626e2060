#include "config_utils.hpp"
#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <nlohmann/json.hpp>

#include "logger.hpp"
#include "parse_utils.hpp"
#include "system_utils.hpp"

namespace fs = std::filesystem;

static bool to_string_value(const YAML::Node& node, std::string& out) {
    if (!node.IsDefined() || node.IsSequence() || node.IsMap())
        return false;
    if (node.IsNull()) {
        out.clear();
        return true;
    }
    try {
        out = node.as<std::string>();
        return true;
    } catch (const YAML::BadConversion&) {
        return false;
    }
}

static bool to_string_value(const nlohmann::json& v, std::string& out) {
    if (v.is_string()) {
        out = v.get<std::string>();
        return true;
    }
    if (v.is_boolean()) {
        out = v.get<bool>() ? "true" : "false";
        return true;
    }
    if (v.is_number_integer()) {
        out = std::to_string(v.get<long long>());
        return true;
    }
    if (v.is_number_unsigned()) {
        out = std::to_string(v.get<unsigned long long>());
        return true;
    }
    if (v.is_number_float()) {
        std::ostringstream oss;
        oss << v.get<double>();
        out = oss.str();
        return true;
    }
    if (v.is_null()) {
        out.clear();
        return true;
    }
    return false;
}

static void flatten_yaml(const YAML::Node& node, const std::string& prefix, ConfigValues& values) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (!it->first.IsScalar())
                continue;
            std::string key = it->first.as<std::string>();
            flatten_yaml(it->second, prefix.empty() ? key : prefix + "." + key, values);
        }
        return;
    }
    auto& slot = values[prefix];
    slot.clear();
    if (node.IsSequence()) {
        for (const auto& item : node) {
            std::string s;
            if (to_string_value(item, s))
                slot.push_back(s);
        }
        return;
    }
    std::string s;
    if (to_string_value(node, s))
        slot.push_back(s);
}

static void flatten_json(const nlohmann::json& node, const std::string& prefix,
                         ConfigValues& values) {
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it)
            flatten_json(it.value(), prefix.empty() ? it.key() : prefix + "." + it.key(), values);
        return;
    }
    auto& slot = values[prefix];
    slot.clear();
    if (node.is_array()) {
        for (const auto& item : node) {
            std::string s;
            if (to_string_value(item, s))
                slot.push_back(s);
        }
        return;
    }
    std::string s;
    if (to_string_value(node, s))
        slot.push_back(s);
}

bool load_yaml_config(const std::string& path, ConfigValues& values, std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        YAML::Node root = YAML::Load(ifs);
        if (root.IsNull())
            return true;
        if (!root.IsMap()) {
            error = "Root YAML node is not a map";
            return false;
        }
        flatten_yaml(root, "", values);
        return true;
    } catch (const YAML::Exception& e) {
        error = e.what();
        return false;
    }
}

bool load_json_config(const std::string& path, ConfigValues& values, std::string& error) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            error = "Failed to open file";
            return false;
        }
        nlohmann::json root;
        ifs >> root;
        if (!root.is_object()) {
            error = "Root JSON value is not an object";
            return false;
        }
        flatten_json(root, "", values);
        return true;
    } catch (const nlohmann::json::exception& e) {
        error = e.what();
        return false;
    }
}

bool load_config_file(const std::string& path, ConfigValues& values, std::string& error) {
    std::string ext = fs::path(path).extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (ext == ".json")
        return load_json_config(path, values, error);
    return load_yaml_config(path, values, error);
}

std::string ServerConfig::address() const {
    return "ssh://" + user + "@" + host + ":" + std::to_string(port);
}

std::string ServerConfig::repo_url(const std::string& repo_path) const {
    return address() + "/" + repo_path;
}

static const std::string* scalar(const ConfigValues& values, const std::string& key) {
    auto it = values.find(key);
    if (it == values.end() || it->second.empty())
        return nullptr;
    return &it->second.front();
}

static bool apply_annex(const ConfigValues& values, cmd::ToolConfig& tools, std::string& error) {
    if (const std::string* v = scalar(values, "annex.minsize")) {
        bool ok = false;
        size_t bytes = parse_bytes(*v, ok);
        if (!ok) {
            error = "invalid annex.minsize value '" + *v + "'";
            return false;
        }
        tools.annex_min_size = bytes;
    }
    auto it = values.find("annex.exclude");
    if (it != values.end())
        tools.annex_exclude = it->second;
    if (const std::string* v = scalar(values, "annex.repoversion")) {
        if (v->empty() || v->find_first_not_of("0123456789") != std::string::npos) {
            error = "invalid annex.repoversion value '" + *v + "'";
            return false;
        }
        tools.annex_repo_version = *v;
    }
    return true;
}

bool apply_config(const ConfigValues& values, ClientConfig& cfg, std::string& error) {
    if (const std::string* v = scalar(values, "bin.git"))
        cfg.tools.git_bin = *v;
    if (const std::string* v = scalar(values, "bin.gitannex"))
        cfg.tools.annex_bin = *v;
    if (const std::string* v = scalar(values, "bin.ssh"))
        cfg.tools.ssh_bin = *v;
    auto keys = values.find("ssh.keys");
    if (keys != values.end())
        cfg.tools.ssh_keys = keys->second;
    if (const std::string* v = scalar(values, "ssh.knownhosts"))
        cfg.tools.known_hosts = *v;
    if (!apply_annex(values, cfg.tools, error))
        return false;

    const std::string prefix = "servers.";
    for (const auto& [key, vals] : values) {
        if (key.rfind(prefix, 0) != 0 || vals.empty())
            continue;
        std::string rest = key.substr(prefix.size());
        size_t dot = rest.find(".git.");
        if (dot == std::string::npos)
            continue;
        std::string alias = rest.substr(0, dot);
        std::string field = rest.substr(dot + 5);
        ServerConfig& srv = cfg.servers[alias];
        if (field == "user") {
            srv.user = vals.front();
        } else if (field == "host") {
            srv.host = vals.front();
        } else if (field == "port") {
            bool ok = false;
            srv.port = parse_uint(vals.front(), 1, 65535, ok);
            if (!ok) {
                error = "invalid port for server '" + alias + "'";
                return false;
            }
        }
    }
    return true;
}

bool apply_repo_config(const ConfigValues& values, cmd::ToolConfig& tools, std::string& error) {
    return apply_annex(values, tools, error);
}

std::string default_config_path() {
    fs::path dir;
    if (auto d = procutil::safe_getenv("ANNEXSYNC_CONFIG_DIR"); d && !d->empty()) {
        dir = *d;
    } else if (auto x = procutil::safe_getenv("XDG_CONFIG_HOME"); x && !x->empty()) {
        dir = fs::path(*x) / "annexsync";
    } else if (auto h = procutil::safe_getenv("HOME"); h && !h->empty()) {
        dir = fs::path(*h) / ".config" / "annexsync";
    } else {
        dir = fs::current_path();
    }
    return (dir / "config.yml").string();
}

ClientConfig load_client_config(const std::string& path) {
    ClientConfig cfg;
    std::string file = path.empty() ? default_config_path() : path;
    std::error_code ec;
    if (path.empty() && !fs::exists(file, ec))
        return cfg;
    ConfigValues values;
    std::string error;
    if (!load_config_file(file, values, error) || !apply_config(values, cfg, error))
        throw std::runtime_error("Failed to load config " + file + ": " + error);
    log_debug("Loaded configuration", file);
    return cfg;
}
