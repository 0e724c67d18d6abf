#include <atomic>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "vpncheck_engine/account_list_loader.hpp"
#include "vpncheck_engine/batch_worker.hpp"
#include "vpncheck_engine/client_commands.hpp"
#include "vpncheck_engine/command_executor.hpp"
#include "vpncheck_engine/errors.hpp"
#include "vpncheck_engine/logger.hpp"
#include "vpncheck_engine/report_writer.hpp"
#include "vpncheck_engine/result_sink.hpp"
#include "vpncheck_engine/settings.hpp"
#include "vpncheck_engine/signal_watcher.hpp"

using vpncheck::engine::AccountListLoader;
using vpncheck::engine::BatchListener;
using vpncheck::engine::BatchRequest;
using vpncheck::engine::BatchState;
using vpncheck::engine::BatchTally;
using vpncheck::engine::BatchWorker;
using vpncheck::engine::CheckerSettings;
using vpncheck::engine::ClassificationOutcome;
using vpncheck::engine::ClientCommands;
using vpncheck::engine::CommandExecutor;
using vpncheck::engine::ConfigError;
using vpncheck::engine::Logger;
using vpncheck::engine::LogLevel;
using vpncheck::engine::ReportWriter;
using vpncheck::engine::ResultSink;
using vpncheck::engine::SettingsLoader;
using vpncheck::engine::SignalWatcher;

namespace {

struct Args {
    std::filesystem::path config_path{};
    std::vector<std::pair<std::string, std::string>> overrides;
    std::filesystem::path results_path{};
    std::filesystem::path summary_path{};
    bool verbose{false};
    bool help{false};
};

void print_usage(const char* argv0) {
    std::cerr
        << "VPN account checker\n"
        << "Usage:\n"
        << "  " << argv0 << " [--config <file>] [--input <file>] [--data-dir <dir>] [--client <exe>]\n"
        << "                 [--delay <ms>] [--cooldown <ms>] [--proxy <host:port>] [--proxy-type <kind>]\n"
        << "                 [--no-proxy] [--results <path>] [--summary <path>] [--log-file <path>]\n"
        << "                 [--verbose]\n"
        << "\n"
        << "Options:\n"
        << "  --config      key=value settings file (client, data_dir, input_file, valid_file,\n"
        << "                device_limit_file, log_file, pre_check_delay_ms, post_check_cooldown_ms,\n"
        << "                proxy, proxy_type, use_proxy, log_level).\n"
        << "  --input       Newline-delimited account list (default: <data-dir>/nullvad_in.txt).\n"
        << "  --data-dir    Directory holding the list, result files and log (default: .).\n"
        << "  --client      Client executable (default: mullvad).\n"
        << "  --delay       Pause before each account check in ms (default: 2000).\n"
        << "  --cooldown    Pause after each account check in ms (default: 1000).\n"
        << "  --proxy       Domain:Port[:Username[:Password]]; enables proxying.\n"
        << "  --proxy-type  http, https, socks4 or socks5 (default: socks5).\n"
        << "  --no-proxy    Disable proxying even if the settings file enables it.\n"
        << "  --results     Write '<account> - <status> - <message>' lines to this path.\n"
        << "  --summary     Write a JSON summary to this path.\n"
        << "  --log-file    Log file (empty string disables; default: <data-dir>/nullvad_checker.log).\n"
        << "  --verbose     Debug logging.\n"
        << "  -h, --help    Show this help message.\n"
        << "\n"
        << "Exit codes: 0 completed, 1 completed with errors, 2 configuration error,\n"
        << "            3 internal error, 130 cancelled.\n"
        << std::endl;
}

bool arg_eq(std::string_view a, std::string_view b) {
    return a == b;
}

std::string take_value(int argc, char** argv, int& i, std::string_view flag) {
    if (i + 1 >= argc) {
        throw ConfigError(std::string{flag} + " expects a value");
    }
    return argv[++i];
}

Args parse_args(int argc, char** argv) {
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string_view tok = argv[i];
        if (arg_eq(tok, "-h") || arg_eq(tok, "--help")) {
            args.help = true;
            break;
        } else if (arg_eq(tok, "--config")) {
            args.config_path = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--input")) {
            args.overrides.emplace_back("input_file", take_value(argc, argv, i, tok));
        } else if (arg_eq(tok, "--data-dir")) {
            args.overrides.emplace_back("data_dir", take_value(argc, argv, i, tok));
        } else if (arg_eq(tok, "--client")) {
            args.overrides.emplace_back("client", take_value(argc, argv, i, tok));
        } else if (arg_eq(tok, "--delay")) {
            args.overrides.emplace_back("pre_check_delay_ms", take_value(argc, argv, i, tok));
        } else if (arg_eq(tok, "--cooldown")) {
            args.overrides.emplace_back("post_check_cooldown_ms", take_value(argc, argv, i, tok));
        } else if (arg_eq(tok, "--proxy")) {
            args.overrides.emplace_back("proxy", take_value(argc, argv, i, tok));
            args.overrides.emplace_back("use_proxy", "true");
        } else if (arg_eq(tok, "--proxy-type")) {
            args.overrides.emplace_back("proxy_type", take_value(argc, argv, i, tok));
        } else if (arg_eq(tok, "--no-proxy")) {
            args.overrides.emplace_back("use_proxy", "false");
        } else if (arg_eq(tok, "--log-file")) {
            args.overrides.emplace_back("log_file", take_value(argc, argv, i, tok));
        } else if (arg_eq(tok, "--results")) {
            args.results_path = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--summary")) {
            args.summary_path = take_value(argc, argv, i, tok);
        } else if (arg_eq(tok, "--verbose") || arg_eq(tok, "-v")) {
            args.verbose = true;
        } else {
            throw ConfigError("Unknown argument: " + std::string{tok});
        }
    }
    return args;
}

CheckerSettings resolve_settings(const Args& args) {
    CheckerSettings settings = args.config_path.empty() ? CheckerSettings{} : SettingsLoader{}.load(args.config_path);
    for (const auto& [key, value] : args.overrides) {
        SettingsLoader::apply(settings, key, value, "command line");
    }
    if (args.verbose) {
        settings.log_level = LogLevel::Debug;
    }
    return settings;
}

int exit_code_for(BatchState state, const BatchTally& tally) {
    if (state == BatchState::Cancelled) return 130;
    if (tally.error > 0) return 1;
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        const auto args = parse_args(argc, argv);
        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }

        const CheckerSettings settings = resolve_settings(args);
        std::filesystem::create_directories(settings.data_dir);

        Logger logger(Logger::Config{
            .min_level = settings.log_level,
            .console = &std::cerr,
            .file = settings.log_path(),
        });

        // Fail fast on a bad proxy before anything runs.
        auto proxy = settings.proxy_config();
        if (!proxy && settings.use_proxy) {
            logger.warning("Proxy enabled but no proxy string or type given; running without proxy");
        }

        AccountListLoader list_loader;
        list_loader.ensure_exists(settings.input_path());
        auto accounts = list_loader.load(settings.input_path());
        logger.info("Loaded " + std::to_string(accounts.size()) + " accounts from " + settings.input_path().string());

        ResultSink sink(ResultSink::Config{
            .valid_accounts = settings.valid_path(),
            .device_limit_accounts = settings.device_limit_path(),
            .logger = &logger,
        });
        CommandExecutor executor;

        BatchWorker::Config worker_cfg;
        worker_cfg.commands = ClientCommands::for_executable(settings.client_executable);
        worker_cfg.logger = &logger;
        BatchWorker worker(executor, sink, std::move(worker_cfg));

        std::mutex out_mutex;
        std::vector<ClassificationOutcome> outcomes;
        BatchTally tally;
        bool empty_input = false;

        BatchListener listener;
        listener.on_outcome = [&](const ClassificationOutcome& outcome) {
            std::lock_guard<std::mutex> lock(out_mutex);
            outcomes.push_back(outcome);
            tally.add(outcome);
            std::cout << "[" << vpncheck::engine::to_string(outcome.category) << "] " << outcome.account << " - "
                      << outcome.message << std::endl;
        };
        listener.on_empty_input = [&] { empty_input = true; };

        BatchRequest request;
        request.accounts = std::move(accounts);
        request.pacing = settings.pacing;
        request.proxy = std::move(proxy);

        // Must exist before the worker thread starts so that thread inherits the blocked mask.
        std::atomic<bool> interrupted{false};
        SignalWatcher signals({SIGINT, SIGTERM}, [&](int sig) {
            logger.info(std::string(sig == SIGINT ? "SIGINT" : "SIGTERM") +
                        " received; stopping after the current account");
            interrupted.store(true);
            worker.stop();
        });

        if (!worker.start(std::move(request), std::move(listener))) {
            if (empty_input) {
                logger.warning("No accounts found in " + settings.input_path().string());
            }
            return 0;
        }

        if (interrupted.load()) {
            // Signal arrived before the run was Running.
            worker.stop();
        }
        const BatchState final_state = worker.wait();

        std::lock_guard<std::mutex> lock(out_mutex);
        ReportWriter writer;
        if (!args.results_path.empty()) {
            writer.write_text(args.results_path, outcomes);
        }
        if (!args.summary_path.empty()) {
            writer.write_summary(args.summary_path, outcomes, final_state);
        }

        std::cout << "VPN account check " << vpncheck::engine::to_string(final_state) << "\n"
                  << "  Accounts: " << outcomes.size() << "\n"
                  << "  Valid: " << tally.valid << "  Invalid: " << tally.invalid << "  Errors: " << tally.error
                  << "\n"
                  << "Results:\n"
                  << "  Valid accounts: " << sink.valid_accounts_path() << "\n"
                  << "  Device limit:   " << sink.device_limit_path() << "\n";
        if (!args.results_path.empty()) {
            std::cout << "  Text:           " << args.results_path << "\n";
        }
        if (!args.summary_path.empty()) {
            std::cout << "  JSON:           " << args.summary_path << "\n";
        }

        return exit_code_for(final_state, tally);
    } catch (const ConfigError& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        print_usage(argv[0]);
        return 2;  // configuration issue
    } catch (const std::exception& ex) {
        std::cerr << "ERROR: " << ex.what() << "\n";
        return 3;  // internal error
    } catch (...) {
        std::cerr << "ERROR: Unknown exception\n";
        return 3;
    }
}
