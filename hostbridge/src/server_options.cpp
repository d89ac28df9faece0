#include "server_options.hpp"

#include <cstring>

namespace hostbridge {

namespace {

// Matches "--name value" and "--name=value"; advances i past a separate value.
bool take_value(int argc, const char* const* argv, int& i, const char* name, std::string& value, std::string& error) {
    const size_t len = std::strlen(name);
    if (std::strncmp(argv[i], name, len) != 0) {
        return false;
    }
    if (argv[i][len] == '=') {
        value = argv[i] + len + 1;
        return true;
    }
    if (argv[i][len] != '\0') {
        return false;
    }
    if (i + 1 >= argc) {
        error = std::string(name) + " requires a value";
        return true;
    }
    value = argv[++i];
    return true;
}

} // namespace

bool parse_options(int argc, const char* const* argv, ServerOptions& options, std::string& error) {
    error.clear();

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "-v") == 0 || strcmp(argv[i], "--version") == 0) {
            options.show_version = true;
            continue;
        }

        if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            options.show_help = true;
            continue;
        }

        if (strcmp(argv[i], "--pdeathsig") == 0) {
            options.pdeathsig = true;
            continue;
        }

        if (strcmp(argv[i], "--create") == 0) {
            options.create_channel = true;
            continue;
        }

        if (strcmp(argv[i], "--strict") == 0) {
            options.strict = true;
            continue;
        }

        if (take_value(argc, argv, i, "--channel", options.channel_path, error) ||
            take_value(argc, argv, i, "--config", options.config_path, error) ||
            take_value(argc, argv, i, "--notify-program", options.notify_program, error) ||
            take_value(argc, argv, i, "--app-name", options.app_name, error)) {
            if (!error.empty()) {
                return false;
            }
            continue;
        }

        if (argv[i][0] == '-' && argv[i][1] != '\0') {
            error = std::string("unknown option ") + argv[i];
            return false;
        }

        if (!options.channel_path.empty()) {
            error = std::string("unexpected argument ") + argv[i];
            return false;
        }
        options.channel_path = argv[i];
    }

    if (options.show_help || options.show_version) {
        return true;
    }

    if (options.channel_path.empty()) {
        error = "missing channel path";
        return false;
    }
    if (options.notify_program.empty()) {
        error = "--notify-program must not be empty";
        return false;
    }
    return true;
}

void print_usage(std::ostream& out, const char* program) {
    out << "Usage: " << program << " [options] <channel>\n"
        << "\n"
        << "Reads one JSON request per write to the FIFO <channel> and prints the result on stdout.\n"
        << "\n"
        << "Options:\n"
        << "  --channel <path>         FIFO to read requests from (same as <channel>)\n"
        << "  --create                 create the FIFO if it does not exist\n"
        << "  --config <file>          log4cplus configuration (default: log4cplus.ini)\n"
        << "  --notify-program <prog>  notification tool (default: notify-send)\n"
        << "  --app-name <name>        application name shown on notifications (default: hostbridge)\n"
        << "  --strict                 print an ERROR line for malformed requests\n"
        << "  --pdeathsig              exit when the parent process exits\n"
        << "  -v, --version            print version information\n"
        << "  -h, --help               print this help\n";
}

} // namespace hostbridge
