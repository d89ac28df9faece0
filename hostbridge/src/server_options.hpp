#pragma once

#include <ostream>
#include <string>

namespace hostbridge {

struct ServerOptions {
    std::string channel_path;
    std::string config_path = "log4cplus.ini";
    std::string notify_program = "notify-send";
    std::string app_name = "hostbridge";
    bool create_channel = false;
    bool strict = false;
    bool pdeathsig = false;
    bool show_version = false;
    bool show_help = false;
};

/**
 * Parse the command line. Accepts "--opt value" and "--opt=value"; the first
 * non-option argument is the channel path.
 *
 * @return false with @p error set when the arguments are unusable
 */
bool parse_options(int argc, const char* const* argv, ServerOptions& options, std::string& error);

void print_usage(std::ostream& out, const char* program);

} // namespace hostbridge
