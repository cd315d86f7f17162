#include <iostream>
#include <string>
#include <vector>
#include <unistd.h> // For geteuid()

#include <libap/backend.h>
#include <libap/command.h>
#include <libap/config.h>
#include <libap/controller.h>
#include <libap/event_log.h>
#include <libap/logging.h>
#include <libap/notifier.h>

void print_usage() {
    std::cerr << "Usage: autopatch [options]\n\n"
              << "Checks for pending package updates, applies them when the dry run shows\n"
              << "nothing will be removed, and mails the administrator otherwise.\n\n"
              << "Options:\n"
              << "  --config <file>   Configuration file (default: " << ap::DEFAULT_CONFIG_PATH << ")\n"
              << "  --help            Show this help\n";
}

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);
    std::string config_path = ap::DEFAULT_CONFIG_PATH;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "--config") {
            if (i + 1 >= args.size()) {
                ap::log::error("--config requires a file argument.");
                return ap::EXIT_OPERATIONAL_FAILURE;
            }
            config_path = args[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return ap::EXIT_RUN_COMPLETED;
        } else {
            ap::log::error("Unknown argument: " + arg);
            print_usage();
            return ap::EXIT_OPERATIONAL_FAILURE;
        }
    }

    if (geteuid() != 0) {
        ap::log::error("autopatch must be run as root to manage system packages.");
        return ap::EXIT_OPERATIONAL_FAILURE;
    }

    auto config_result = ap::ConfigLoader::load(config_path);
    if (!config_result) {
        ap::log::error(ap::to_string(config_result.error()) + " (" + config_path + ")");
        return ap::EXIT_OPERATIONAL_FAILURE;
    }
    const ap::Config config = std::move(*config_result);

    ap::FileLogSink event_log(config.log_file);
    ap::ShellCommandRunner runner;
    ap::SmtpNotifier notifier(config);
    ap::UpdateController controller(config, notifier, event_log);

    ap::RunOutcome outcome = controller.run([&]() { return ap::detect_backend(runner, event_log); });
    return outcome.exit_code;
}
