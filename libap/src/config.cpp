//
// Created by the autopatch developers on 10/12/26.
//

#include "libap/config.h"
#include "libap/logging.h"

#include <yaml-cpp/yaml.h>
#include <unistd.h>
#include <climits>
#include <system_error>

namespace ap {

    static std::string get_optional_scalar(const YAML::Node& node, const std::string& key, const std::string& fallback) {
        if (node[key] && node[key].IsScalar()) {
            return node[key].as<std::string>();
        }
        return fallback;
    }

    template<typename T>
    static std::expected<T, ConfigError> get_required_scalar(const YAML::Node& node, const std::string& key) {
        if (!node[key] || !node[key].IsScalar()) {
            log::error("Missing required config field: '" + key + "'");
            return std::unexpected(ConfigError::MissingRequiredField);
        }
        return node[key].as<T>();
    }

    static std::expected<Config, ConfigError> parse_config_node(const YAML::Node& root) {
        if (!root.IsMap()) {
            log::error("Configuration root is not a YAML mapping.");
            return std::unexpected(ConfigError::InvalidFormat);
        }

        Config config;

        auto admin_res = get_required_scalar<std::string>(root, "admin_email");
        if (!admin_res) return std::unexpected(admin_res.error());
        config.admin_email = *admin_res;

        const YAML::Node smtp = root["smtp"];
        if (!smtp || !smtp.IsMap()) {
            log::error("Missing required config section: 'smtp'");
            return std::unexpected(ConfigError::MissingRequiredField);
        }

        auto server_res = get_required_scalar<std::string>(smtp, "server");
        if (!server_res) return std::unexpected(server_res.error());
        config.smtp.server = *server_res;

        auto user_res = get_required_scalar<std::string>(smtp, "user");
        if (!user_res) return std::unexpected(user_res.error());
        config.smtp.user = *user_res;

        config.smtp.password = get_optional_scalar(smtp, "password", "");

        if (smtp["port"]) {
            config.smtp.port = smtp["port"].as<int>();
        }
        if (config.smtp.port < 1 || config.smtp.port > 65535) {
            log::error("SMTP port out of range: " + std::to_string(config.smtp.port));
            return std::unexpected(ConfigError::InvalidValue);
        }

        config.log_file = get_optional_scalar(root, "log_file", config.log_file.string());
        if (config.log_file.empty()) {
            log::error("'log_file' must not be empty.");
            return std::unexpected(ConfigError::InvalidValue);
        }

        config.hostname = get_optional_scalar(root, "hostname", "");
        if (config.hostname.empty()) {
            config.hostname = local_hostname();
        }

        if (root["strict_parsing"]) {
            config.strict_parsing = root["strict_parsing"].as<bool>();
        }
        if (root["notify_on_detection_failure"]) {
            config.notify_on_detection_failure = root["notify_on_detection_failure"].as<bool>();
        }

        return config;
    }

    std::expected<Config, ConfigError> ConfigLoader::load(const std::filesystem::path& file_path) {
        std::error_code ec;
        if (!std::filesystem::is_regular_file(file_path, ec)) {
            if (ec && ec != std::errc::no_such_file_or_directory) {
                log::error("Cannot access config file " + file_path.string() + ": " + ec.message());
            }
            return std::unexpected(ConfigError::FileNotFound);
        }
        try {
            YAML::Node root = YAML::LoadFile(file_path.string());
            return parse_config_node(root);
        } catch (const YAML::BadFile&) {
            log::error("Config file " + file_path.string() + " exists but could not be opened for reading.");
            return std::unexpected(ConfigError::FileNotFound);
        } catch (const YAML::Exception& e) {
            log::error("Failed to parse config file " + file_path.string() + ": " + e.what());
            return std::unexpected(ConfigError::InvalidFormat);
        }
    }

    std::expected<Config, ConfigError> ConfigLoader::load_from_string(const std::string& content) {
        try {
            YAML::Node root = YAML::Load(content);
            return parse_config_node(root);
        } catch (const YAML::Exception& e) {
            log::error(std::string("Failed to parse config from string: ") + e.what());
            return std::unexpected(ConfigError::InvalidFormat);
        }
    }

    std::string to_string(ConfigError error) {
        switch (error) {
            case ConfigError::FileNotFound: return "Configuration file not found or not readable.";
            case ConfigError::InvalidFormat: return "Configuration file is not valid YAML.";
            case ConfigError::MissingRequiredField: return "Configuration is missing a required field.";
            case ConfigError::InvalidValue: return "Configuration contains an invalid value.";
        }
        return "Unknown configuration error.";
    }

    std::string local_hostname() {
        char buf[HOST_NAME_MAX + 1] = {};
        if (gethostname(buf, sizeof(buf) - 1) != 0 || buf[0] == '\0') {
            return "localhost";
        }
        return buf;
    }

} // namespace ap
