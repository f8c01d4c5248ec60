/**
 * blueadv
 * Registers a BLE advertisement with BlueZ over the system D-Bus
 */

#include <iostream>
#include <csignal>
#include <memory>
#include <string>
#include <vector>

#include <glib-unix.h>

#include "core/advertiser.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "bluez/adapter_inventory.hpp"
#include "bluez/advertising_backend.hpp"

// Command line argument parsing
#include <getopt.h>

namespace blueadv {

/**
 * Global advertiser instance for signal handling
 */
std::unique_ptr<core::Advertiser> g_advertiser;

/**
 * Runs on the main loop, including the nested iterations inside start()
 */
gboolean signal_handler(gpointer user_data) {
    int signum = GPOINTER_TO_INT(user_data);
    auto logger = core::get_logger("main");
    logger->info("Received signal, shutting down gracefully...",
                core::LogContext().add("signal", signum));

    if (g_advertiser) {
        g_advertiser->request_stop();
    }

    return G_SOURCE_CONTINUE;
}

void setup_signal_handlers() {
    g_unix_signal_add(SIGINT, signal_handler, GINT_TO_POINTER(SIGINT));
    g_unix_signal_add(SIGTERM, signal_handler, GINT_TO_POINTER(SIGTERM));
}

/**
 * Print usage information
 */
void print_usage(const char* program_name) {
    std::cout << "blueadv - BLE advertisement over BlueZ\n\n";
    std::cout << "Usage: " << program_name << " [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config FILE        Configuration file path (default: built-in settings)\n";
    std::cout << "  -v, --verbose            Increase verbosity (-v for INFO, -vv for DEBUG)\n";
    std::cout << "  -l, --log-file FILE      Also write logs to FILE\n";
    std::cout << "  -a, --adapter NAME       Advertise on adapter NAME (e.g. hci1)\n";
    std::cout << "  -n, --name NAME          Local name to advertise\n";
    std::cout << "  -u, --uuid UUID          Add a service UUID (repeatable)\n";
    std::cout << "  -t, --type TYPE          Advertisement type: broadcast or peripheral\n";
    std::cout << "  -P, --power-on           Power the adapter on before registering\n";
    std::cout << "  --list-adapters          List local Bluetooth adapters and exit\n";
    std::cout << "  --dump-config            Print the effective configuration and exit\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "  --version                Show version information\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << "                          # Advertise with built-in defaults\n";
    std::cout << "  " << program_name << " -c blueadv.json          # Use a configuration file\n";
    std::cout << "  " << program_name << " -a hci1 -n Beacon -vv    # Named adapter, debug logging\n";
    std::cout << std::endl;
}

/**
 * Print version information
 */
void print_version() {
    std::cout << "blueadv v0.1.0" << std::endl;
    std::cout << "Requires BlueZ 5.50+ on Linux" << std::endl;
}

enum LongOnlyOption {
    OPT_LIST_ADAPTERS = 1000,
    OPT_DUMP_CONFIG,
    OPT_VERSION
};

/**
 * Parse command line arguments
 */
struct Arguments {
    std::string config_file;
    int verbosity = 0;
    std::string log_file;
    std::string adapter;
    std::string local_name;
    std::vector<std::string> uuids;
    std::string type;
    bool power_on = false;
    bool list_adapters = false;
    bool dump_config = false;
    bool help = false;
    bool version = false;
};

Arguments parse_arguments(int argc, char* argv[]) {
    Arguments args;

    static struct option long_options[] = {
        {"config",        required_argument, 0, 'c'},
        {"verbose",       no_argument,       0, 'v'},
        {"log-file",      required_argument, 0, 'l'},
        {"adapter",       required_argument, 0, 'a'},
        {"name",          required_argument, 0, 'n'},
        {"uuid",          required_argument, 0, 'u'},
        {"type",          required_argument, 0, 't'},
        {"power-on",      no_argument,       0, 'P'},
        {"list-adapters", no_argument,       0, OPT_LIST_ADAPTERS},
        {"dump-config",   no_argument,       0, OPT_DUMP_CONFIG},
        {"help",          no_argument,       0, 'h'},
        {"version",       no_argument,       0, OPT_VERSION},
        {0, 0, 0, 0}
    };

    int c;
    int option_index = 0;

    while ((c = getopt_long(argc, argv, "c:vl:a:n:u:t:Ph", long_options, &option_index)) != -1) {
        switch (c) {
            case 'c':
                args.config_file = optarg;
                break;
            case 'v':
                args.verbosity++;
                break;
            case 'l':
                args.log_file = optarg;
                break;
            case 'a':
                args.adapter = optarg;
                break;
            case 'n':
                args.local_name = optarg;
                break;
            case 'u':
                args.uuids.push_back(optarg);
                break;
            case 't':
                args.type = optarg;
                break;
            case 'P':
                args.power_on = true;
                break;
            case OPT_LIST_ADAPTERS:
                args.list_adapters = true;
                break;
            case OPT_DUMP_CONFIG:
                args.dump_config = true;
                break;
            case 'h':
                args.help = true;
                break;
            case OPT_VERSION:
                args.version = true;
                break;
            case '?':
                // getopt_long already printed an error message
                exit(1);
                break;
            default:
                std::cerr << "Unknown option: " << c << std::endl;
                exit(1);
        }
    }

    return args;
}

void apply_overrides(const Arguments& args, core::AdvertiserConfig& config) {
    auto logger = core::get_logger("main");

    if (!args.adapter.empty()) {
        config.adapter.name = args.adapter;
    }

    if (!args.local_name.empty()) {
        config.advertisement.local_name = args.local_name;
    }

    for (const auto& uuid : args.uuids) {
        config.advertisement.service_uuids.push_back(uuid);
    }

    if (!args.type.empty()) {
        config.advertisement.type = args.type;
    }

    if (args.power_on) {
        config.adapter.power_on = true;
    }

    logger->debug("Command-line overrides applied",
                  core::LogContext().add("adapter", config.adapter.name)
                                    .add("extra_uuids", args.uuids.size()));
}

int list_adapters() {
    bool enabled = bluez::bluetooth_enabled();
    std::cout << "Bluetooth enabled: " << (enabled ? "yes" : "no") << std::endl;

    auto adapters = bluez::list_adapters();
    if (adapters.empty()) {
        std::cout << "No adapters found" << std::endl;
        return 0;
    }

    for (const auto& adapter : adapters) {
        std::cout << adapter.identifier << "  " << adapter.address << std::endl;
    }
    return 0;
}

} // namespace blueadv

/**
 * Main entry point
 */
int main(int argc, char* argv[]) {
    using namespace blueadv;

    try {
        auto args = parse_arguments(argc, argv);

        if (args.help) {
            print_usage(argv[0]);
            return 0;
        }

        if (args.version) {
            print_version();
            return 0;
        }

        // Setup logging
        core::LogLevel log_level = core::LogLevel::WARNING;
        if (args.verbosity == 1) {
            log_level = core::LogLevel::INFO;
        } else if (args.verbosity >= 2) {
            log_level = core::LogLevel::DEBUG;
        }

        core::setup_logging(log_level, args.log_file, true);
        auto logger = core::get_logger("main");

        // Load configuration
        std::unique_ptr<core::AdvertiserConfig> config;
        try {
            if (args.config_file.empty()) {
                config = core::AdvertiserConfig::create_default();
            } else {
                config = core::AdvertiserConfig::from_file(args.config_file);
            }
        } catch (const std::exception& e) {
            logger->error("Failed to load configuration",
                         core::LogContext().add("config_file", args.config_file)
                                          .add("error", e.what()));
            return 1;
        }

        // The command line takes precedence over the file's logging section
        if (args.verbosity == 0 || args.log_file.empty()) {
            core::LogLevel level = args.verbosity == 0
                                       ? core::LoggerManager::string_to_level(config->logging.log_level)
                                       : log_level;
            std::string log_file = args.log_file.empty() ? config->logging.log_file : args.log_file;
            core::setup_logging(level, log_file, true);
        }

        apply_overrides(args, *config);

        if (!config->validate()) {
            logger->error("Configuration validation failed");
            return 1;
        }

        if (args.dump_config) {
            std::cout << config->to_json().dump(2) << std::endl;
            return 0;
        }

        if (args.list_adapters) {
            return list_adapters();
        }

        logger->info("Starting blueadv...",
                     core::LogContext().add("config_file", args.config_file.empty() ? "<defaults>" : args.config_file)
                                      .add("local_name", config->advertisement.local_name));

        auto backend = bluez::create_gio_backend(*config);
        g_advertiser = std::make_unique<core::Advertiser>(std::move(config), std::move(backend));

        setup_signal_handlers();

        if (!g_advertiser->start()) {
            if (g_advertiser->stop_requested()) {
                g_advertiser->stop();
                g_advertiser.reset();
                logger->info("blueadv stopped before registration completed");
                return 0;
            }

            logger->error("Failed to start advertising",
                          core::LogContext().add("error", g_advertiser->last_error().error_name)
                                           .add("message", g_advertiser->last_error().error_message));
            g_advertiser.reset();
            return 1;
        }

        // Serves BlueZ until a signal, Release with exit_on_release, or bus loss
        g_advertiser->run();
        g_advertiser->stop();
        g_advertiser.reset();

        logger->info("blueadv stopped");
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
