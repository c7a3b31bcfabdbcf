#pragma once

#include <string>

class CLI {
public:
    /// Parse argv and dispatch to subcommand.
    /// Returns exit code, or -2 for "run" (caller should start the daemon).
    static int run(int argc, char* argv[]);

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_status();
    static int cmd_service(const std::string& action);
    static int cmd_health(int argc, char* argv[]);
    static int cmd_config(int argc, char* argv[]);
};
