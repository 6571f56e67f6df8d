#ifndef UUIDGEN_OPTIONS_HPP
#define UUIDGEN_OPTIONS_HPP
#include <optional>
#include <string>

namespace uuidgen{
    // Command line flags. One value per invocation, no process wide state.
    struct Options
    {
        bool v4 = false;
        bool v6 = false;
        bool v7 = false;
        std::optional<std::string> timestamp;
        bool inspect = false;
        bool help = false;
        bool version = false;
    };

    // getopt_long over -4 -6 -7 -t/--timestamp -i/--inspect -h/--help -v/--version.
    // Throws std::invalid_argument on unknown options, missing option arguments
    // and positional arguments.
    Options parse_options(int argc, char* argv[]);

    // Throws std::invalid_argument if more than one of -4, -6, -7 is set,
    // or if -t is combined with -4 or -6.
    void validate(const Options& options);

    // Returns the line to print (without the trailing newline).
    // Propagates std::invalid_argument from the timestamp parser and
    // std::system_error from the random source.
    std::string dispatch(const Options& options);

    std::string usage();
    std::string version_string();
}
#endif
