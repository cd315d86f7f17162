//
// Created by the autopatch developers on 10/12/26.
//

#pragma once

#include <expected>
#include <filesystem>
#include <string>

namespace ap {

    enum class ConfigError {
        FileNotFound,
        InvalidFormat,
        MissingRequiredField,
        InvalidValue
    };

    struct SmtpSettings {
        std::string server;
        int port = 587;
        std::string user;
        std::string password;
    };

    // Deployment settings. Loaded once at process start and passed around by
    // const reference; never modified during a run.
    struct Config {
        std::string admin_email;
        SmtpSettings smtp;
        std::filesystem::path log_file = "/var/log/auto-update.log";
        std::string hostname;

        // Only proceed when the dry-run output carried a recognised transaction summary.
        bool strict_parsing = false;
        bool notify_on_detection_failure = true;
    };

    inline constexpr const char* DEFAULT_CONFIG_PATH = "/etc/autopatch/autopatch.yaml";

    class ConfigLoader {
    public:
        static std::expected<Config, ConfigError> load(const std::filesystem::path& file_path);
        static std::expected<Config, ConfigError> load_from_string(const std::string& content);
    };

    std::string to_string(ConfigError error);

    // Falls back to "localhost" if the kernel will not tell us.
    std::string local_hostname();

} // namespace ap
