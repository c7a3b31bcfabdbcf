#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "daemon/daemon.hpp"

#include <spdlog/spdlog.h>

#include <signal.h>

static Daemon* g_daemon = nullptr;

static void signal_handler(int /*sig*/) {
    if (g_daemon) {
        g_daemon->request_stop();
    }
}

static int run_daemon() {
    Config config;
    bool loaded = config.load();

    LogSettings log;
    log.level = config.data().log_level;
    log.file = config.data().log_file;
    init_logging(log);
    if (!loaded) {
        spdlog::info("No usable config at {}, using defaults", Config::config_path());
    }

    Daemon daemon(config);
    g_daemon = &daemon;

    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGTERM, &sa, nullptr);
    sigaction(SIGINT, &sa, nullptr);

    int ret = daemon.run();
    g_daemon = nullptr;
    return ret;
}

int main(int argc, char* argv[]) {
    // A dead control client must not kill the supervisor
    signal(SIGPIPE, SIG_IGN);

    int cli_result = CLI::run(argc, argv);

    if (cli_result == -2) {
        // run subcommand
        return run_daemon();
    }
    return cli_result;
}
