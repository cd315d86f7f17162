//
// Created by the autopatch developers on 10/14/26.
//

#include "libap/controller.h"
#include "libap/logging.h"
#include "libap/ui.h"
#include "test_fakes.h"
#include <cassert>
#include <fcntl.h>
#include <iostream>
#include <sstream>
#include <string>
#include <unistd.h>

using ap::test::BackendScript;
using ap::test::FakeBackend;
using ap::test::FakeNotifier;

// Wires a controller to fakes and runs it once.
struct ControllerTestFixture {
    ap::Config config = ap::test::make_test_config();
    FakeNotifier notifier;
    ap::test::MemoryLogSink log;
    BackendScript script;

    ap::RunOutcome run() {
        ap::UpdateController controller(config, notifier, log);
        return controller.run([this]() -> std::expected<std::unique_ptr<ap::Backend>, ap::BackendError> {
            return std::make_unique<FakeBackend>(script);
        });
    }

    ap::RunOutcome run_without_backend() {
        ap::UpdateController controller(config, notifier, log);
        return controller.run([]() -> std::expected<std::unique_ptr<ap::Backend>, ap::BackendError> {
            return std::unexpected(ap::BackendError{ap::BackendErrorKind::BackendNotFound, 0});
        });
    }

    void use_dnf() {
        script.family = ap::BackendFamily::YumDnf;
        script.tool = "dnf";
    }
};

// Runs fn with fd 1 pointed at /dev/null, as under cron, and std::cout
// redirected into a buffer. Returns whatever was written to std::cout.
template<typename Fn>
static std::string run_detached_from_terminal(Fn fn) {
    std::cout.flush();
    const int saved_stdout = dup(STDOUT_FILENO);
    const int devnull = open("/dev/null", O_WRONLY);
    assert(saved_stdout >= 0);
    assert(devnull >= 0);
    dup2(devnull, STDOUT_FILENO);
    close(devnull);

    std::ostringstream captured;
    std::streambuf* previous = std::cout.rdbuf(captured.rdbuf());
    fn();
    std::cout.rdbuf(previous);

    dup2(saved_stdout, STDOUT_FILENO);
    close(saved_stdout);
    return captured.str();
}

void test_clean_apt_run_upgrades() {
    ap::log::info("Running test: clean apt run upgrades...");
    ControllerTestFixture fx;
    fx.script.simple_output = "The following packages will be upgraded:\n  curl\n"
                              "1 upgraded, 0 newly installed, 0 to remove and 0 not upgraded.\n";

    auto outcome = fx.run();
    assert(outcome.exit_code == ap::EXIT_RUN_COMPLETED);
    assert(outcome.backend == ap::BackendFamily::Apt);
    assert(outcome.verdict->kind == ap::VerdictKind::ProceedSimpleUpgrade);
    assert(fx.script.refresh_calls == 1);
    assert(fx.script.apply_calls == 1);
    assert(fx.script.applied_modes[0] == ap::UpgradeMode::Simple);
    assert(fx.script.dist_simulate_calls == 0);
    assert(outcome.action_exit_code == 0);
    assert(fx.notifier.sent.empty());
    assert(!outcome.notification_attempted);
    assert(fx.log.contains("Upgrade completed successfully"));
    ap::log::ok("Test Passed: clean apt run upgrades");
}

void test_scenario_a_removal_escalates() {
    ap::log::info("Running test: scenario A, apt removal escalates...");
    ControllerTestFixture fx;
    fx.script.simple_output = "The following packages will be REMOVED:\n  foo bar\n";

    auto outcome = fx.run();
    assert(outcome.exit_code == ap::EXIT_RUN_COMPLETED);
    assert(outcome.verdict->kind == ap::VerdictKind::Escalate);
    assert(fx.script.apply_calls == 0);
    assert(fx.notifier.sent.size() == 1);
    assert(fx.notifier.sent[0].subject == "[testhost] Manual intervention required for system update");
    assert(fx.notifier.sent[0].body.find("foo bar") != std::string::npos);
    assert(outcome.notification_sent);
    assert(fx.log.contains("Email sent to admin@example.com"));
    ap::log::ok("Test Passed: scenario A, apt removal escalates");
}

void test_scenario_b_kept_back_dist_upgrade() {
    ap::log::info("Running test: scenario B, kept back goes to dist-upgrade...");
    ControllerTestFixture fx;
    fx.script.simple_output = "The following packages have been kept back: libssl1.1\n";
    fx.script.dist_output = "The following packages will be upgraded:\n  libssl1.1\n";

    auto outcome = fx.run();
    assert(outcome.exit_code == ap::EXIT_RUN_COMPLETED);
    assert(outcome.verdict->kind == ap::VerdictKind::ProceedDistUpgrade);
    assert(fx.script.dist_simulate_calls == 1);
    assert(fx.script.apply_calls == 1);
    assert(fx.script.applied_modes[0] == ap::UpgradeMode::DistUpgrade);
    assert(fx.notifier.sent.empty());
    assert(fx.log.contains("dist-upgrade completed successfully"));
    ap::log::ok("Test Passed: scenario B, kept back goes to dist-upgrade");
}

void test_kept_back_dist_upgrade_would_remove() {
    ap::log::info("Running test: kept back, dist-upgrade would remove...");
    ControllerTestFixture fx;
    fx.script.simple_output = "The following packages have been kept back:\n  libssl1.1\n";
    fx.script.dist_output = "The following packages will be REMOVED:\n  legacy-tool\n";

    auto outcome = fx.run();
    assert(outcome.verdict->kind == ap::VerdictKind::Escalate);
    assert(fx.script.apply_calls == 0);
    assert(fx.notifier.sent.size() == 1);
    const auto& body = fx.notifier.sent[0].body;
    assert(body.find("libssl1.1") != std::string::npos);
    assert(body.find("legacy-tool") != std::string::npos);
    assert(body.find("dist-upgrade would remove packages") != std::string::npos);
    ap::log::ok("Test Passed: kept back, dist-upgrade would remove");
}

void test_scenario_c_dnf_no_updates() {
    ap::log::info("Running test: scenario C, dnf reports no updates...");
    ControllerTestFixture fx;
    fx.use_dnf();
    fx.script.check = {ap::UpdateAvailability::None, 0};

    auto outcome = fx.run();
    assert(outcome.exit_code == ap::EXIT_RUN_COMPLETED);
    assert(outcome.verdict->kind == ap::VerdictKind::NoUpdatesAvailable);
    assert(fx.script.check_calls == 1);
    assert(fx.script.simulate_calls == 0);
    assert(fx.script.apply_calls == 0);
    assert(fx.notifier.sent.empty());
    assert(fx.log.contains("No updates available"));
    ap::log::ok("Test Passed: scenario C, dnf reports no updates");
}

void test_scenario_d_yum_conflict() {
    ap::log::info("Running test: scenario D, yum conflict escalates...");
    ControllerTestFixture fx;
    fx.script.family = ap::BackendFamily::YumDnf;
    fx.script.tool = "yum";
    fx.script.simple_output = "Resolving Dependencies\nError: conflicting requests\n";

    auto outcome = fx.run();
    assert(outcome.exit_code == ap::EXIT_RUN_COMPLETED);
    assert(outcome.verdict->kind == ap::VerdictKind::Escalate);
    assert(fx.script.apply_calls == 0);
    assert(fx.notifier.sent.size() == 1);
    assert(fx.notifier.sent[0].body.find("Error: conflicting requests") != std::string::npos);
    ap::log::ok("Test Passed: scenario D, yum conflict escalates");
}

void test_dnf_check_error_is_fatal() {
    ap::log::info("Running test: dnf check-update error is fatal...");
    ControllerTestFixture fx;
    fx.use_dnf();
    fx.script.check = {ap::UpdateAvailability::Error, 1};

    auto outcome = fx.run();
    assert(outcome.exit_code == ap::EXIT_OPERATIONAL_FAILURE);
    assert(outcome.verdict->kind == ap::VerdictKind::DetectionFailed);
    assert(fx.script.simulate_calls == 0);
    assert(fx.notifier.sent.size() == 1);
    assert(fx.notifier.sent[0].subject == "[testhost] Error during system update");
    assert(fx.log.contains("ERROR: Failed to check for updates (exit code: 1)"));
    ap::log::ok("Test Passed: dnf check-update error is fatal");
}

void test_refresh_failure_is_fatal() {
    ap::log::info("Running test: refresh failure is fatal...");
    ControllerTestFixture fx;
    fx.script.refresh_exit = 100;

    auto outcome = fx.run();
    assert(outcome.exit_code == ap::EXIT_OPERATIONAL_FAILURE);
    assert(!outcome.verdict.has_value());
    assert(fx.script.simulate_calls == 0);
    assert(fx.script.apply_calls == 0);
    assert(fx.notifier.sent.size() == 1);
    assert(fx.notifier.sent[0].body.find("exit code: 100") != std::string::npos);
    assert(fx.notifier.sent[0].body.find("/tmp/autopatch_test.log") != std::string::npos);
    ap::log::ok("Test Passed: refresh failure is fatal");
}

void test_missing_backend_is_fatal() {
    ap::log::info("Running test: missing backend is fatal...");
    ControllerTestFixture fx;

    auto outcome = fx.run_without_backend();
    assert(outcome.exit_code == ap::EXIT_OPERATIONAL_FAILURE);
    assert(!outcome.backend.has_value());
    assert(outcome.verdict->kind == ap::VerdictKind::DetectionFailed);
    assert(fx.notifier.sent.size() == 1);
    assert(fx.log.contains("ERROR: No supported package manager found"));

    ControllerTestFixture quiet;
    quiet.config.notify_on_detection_failure = false;
    auto quiet_outcome = quiet.run_without_backend();
    assert(quiet_outcome.exit_code == ap::EXIT_OPERATIONAL_FAILURE);
    assert(quiet.notifier.sent.empty());
    ap::log::ok("Test Passed: missing backend is fatal");
}

void test_apply_failure_notifies_once() {
    ap::log::info("Running test: apply failure notifies once...");
    ControllerTestFixture fx;
    fx.script.simple_output = "1 upgraded, 0 newly installed, 0 to remove and 0 not upgraded.\n";
    fx.script.apply_exit = 100;

    auto outcome = fx.run();
    // Reported, but the run still completed.
    assert(outcome.exit_code == ap::EXIT_RUN_COMPLETED);
    assert(outcome.action_exit_code == 100);
    assert(fx.script.apply_calls == 1);
    assert(fx.notifier.sent.size() == 1);
    assert(fx.notifier.sent[0].body.find("Upgrade failed with exit code 100") != std::string::npos);
    ap::log::ok("Test Passed: apply failure notifies once");
}

void test_dist_upgrade_failure_notifies_once() {
    ap::log::info("Running test: dist-upgrade failure notifies once...");
    ControllerTestFixture fx;
    fx.script.simple_output = "The following packages have been kept back:\n  linux-image-amd64\n";
    fx.script.dist_output = "The following packages will be upgraded:\n  linux-image-amd64\n"
                            "1 upgraded, 0 newly installed, 0 to remove and 0 not upgraded.\n";
    fx.script.apply_exit = 100;

    auto outcome = fx.run();
    assert(outcome.exit_code == ap::EXIT_RUN_COMPLETED);
    assert(outcome.verdict->kind == ap::VerdictKind::ProceedDistUpgrade);
    assert(outcome.action_exit_code == 100);
    assert(fx.script.apply_calls == 1);
    assert(fx.script.applied_modes[0] == ap::UpgradeMode::DistUpgrade);
    assert(outcome.notification_attempted);
    assert(fx.notifier.sent.size() == 1);
    assert(fx.notifier.sent[0].subject == "[testhost] Error during system update");
    assert(fx.notifier.sent[0].body.find("dist-upgrade failed with exit code 100") != std::string::npos);
    assert(fx.log.contains("ERROR: dist-upgrade failed with exit code 100"));
    ap::log::ok("Test Passed: dist-upgrade failure notifies once");
}

void test_unattended_success_prints_nothing() {
    ap::log::info("Running test: unattended success prints nothing...");
    ControllerTestFixture upgraded;
    upgraded.script.simple_output = "The following packages will be upgraded:\n  curl\n"
                                    "1 upgraded, 0 newly installed, 0 to remove and 0 not upgraded.\n";
    ap::RunOutcome upgrade_outcome;
    bool interactive = true;
    const std::string upgrade_stdout = run_detached_from_terminal([&]() {
        interactive = ap::ui::is_interactive();
        upgrade_outcome = upgraded.run();
    });
    assert(!interactive);
    assert(upgrade_outcome.exit_code == ap::EXIT_RUN_COMPLETED);
    assert(upgrade_outcome.action_exit_code == 0);
    assert(upgrade_stdout.empty());
    // The event log still has the full record.
    assert(upgraded.log.contains("Detected apt package manager"));
    assert(upgraded.log.contains("Upgrade completed successfully"));

    ControllerTestFixture idle;
    idle.use_dnf();
    idle.script.check = {ap::UpdateAvailability::None, 0};
    ap::RunOutcome idle_outcome;
    const std::string idle_stdout = run_detached_from_terminal([&]() { idle_outcome = idle.run(); });
    assert(idle_outcome.verdict->kind == ap::VerdictKind::NoUpdatesAvailable);
    assert(idle_stdout.empty());
    assert(idle.notifier.sent.empty());
    ap::log::ok("Test Passed: unattended success prints nothing");
}

void test_notification_failure_is_only_logged() {
    ap::log::info("Running test: notification failure is only logged...");
    ControllerTestFixture fx;
    fx.notifier.fail = true;
    fx.script.simple_output = "The following packages will be REMOVED:\n  foo\n";

    auto outcome = fx.run();
    assert(outcome.exit_code == ap::EXIT_RUN_COMPLETED);
    assert(outcome.notification_attempted);
    assert(!outcome.notification_sent);
    assert(fx.notifier.sent.size() == 1);
    assert(fx.log.contains("Failed to send email to admin@example.com"));
    ap::log::ok("Test Passed: notification failure is only logged");
}

void test_run_is_bannered() {
    ap::log::info("Running test: run is bannered...");
    ControllerTestFixture fx;
    fx.script.refresh_exit = 1;
    fx.run();

    const auto& lines = fx.log.lines();
    assert(lines.size() >= 2);
    assert(lines.front().rfind("=== autopatch started at ", 0) == 0);
    assert(lines.back().rfind("=== autopatch completed at ", 0) == 0);
    ap::log::ok("Test Passed: run is bannered");
}

int main() {
    try {
        test_clean_apt_run_upgrades();
        test_scenario_a_removal_escalates();
        test_scenario_b_kept_back_dist_upgrade();
        test_kept_back_dist_upgrade_would_remove();
        test_scenario_c_dnf_no_updates();
        test_scenario_d_yum_conflict();
        test_dnf_check_error_is_fatal();
        test_refresh_failure_is_fatal();
        test_missing_backend_is_fatal();
        test_apply_failure_notifies_once();
        test_dist_upgrade_failure_notifies_once();
        test_unattended_success_prints_nothing();
        test_notification_failure_is_only_logged();
        test_run_is_bannered();
    } catch (const std::exception& e) {
        ap::log::error(std::string("An assertion failed or an unexpected exception occurred: ") + e.what());
        return 1;
    }

    ap::log::ok("All controller tests completed successfully!");
    return 0;
}
