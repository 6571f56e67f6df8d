#include "options.hpp"
#include <uuid/uuid.hpp>
#include <timestamp/timestamp.hpp>
#include <getopt.h>
#include <sstream>
#include <stdexcept>

#ifndef UUIDGEN_VERSION
#define UUIDGEN_VERSION "dev"
#endif
#ifndef UUIDGEN_BUILD
#define UUIDGEN_BUILD "unknown"
#endif

namespace uuidgen{
    static const char* short_options = ":467t:ihv";
    static const struct option long_options[] = {
        {"timestamp", required_argument, nullptr, 't'},
        {"inspect", no_argument, nullptr, 'i'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {nullptr, 0, nullptr, 0}
    };

    Options parse_options(int argc, char* argv[]){
        Options options;
        // optind = 0 makes glibc reinitialize its scanner, parse_options may run more than once.
        optind = 0;
        opterr = 0;
        int opt;
        while((opt = getopt_long(argc, argv, short_options, long_options, nullptr)) != -1){
            switch(opt)
            {
                case '4':
                    options.v4 = true;
                    break;
                case '6':
                    options.v6 = true;
                    break;
                case '7':
                    options.v7 = true;
                    break;
                case 't':
                    options.timestamp = std::string(optarg);
                    break;
                case 'i':
                    options.inspect = true;
                    break;
                case 'h':
                    options.help = true;
                    break;
                case 'v':
                    options.version = true;
                    break;
                case ':':
                    throw std::invalid_argument("option '" + std::string(argv[optind-1]) + "' requires an argument");
                default:
                    if(optopt != 0){
                        throw std::invalid_argument("unknown option '-" + std::string(1, static_cast<char>(optopt)) + "'");
                    }
                    throw std::invalid_argument("unknown option '" + std::string(argv[optind-1]) + "'");
            }
        }
        if(optind < argc){
            throw std::invalid_argument("unexpected argument '" + std::string(argv[optind]) + "'");
        }
        return options;
    }

    void validate(const Options& options){
        int versions = static_cast<int>(options.v4) + static_cast<int>(options.v6) + static_cast<int>(options.v7);
        if(versions > 1){
            throw std::invalid_argument("flags -4, -6 and -7 are mutually exclusive");
        }
        if(options.timestamp && (options.v4 || options.v6)){
            const std::string& ts = *options.timestamp;
            throw std::invalid_argument(
                "timestamp flag (-t) is only supported with UUIDv7. Use 'uuidgen -t " + ts
                + "' or 'uuidgen -7 -t " + ts + "'"
            );
        }
    }

    // Tab separated version and embedded time, appended after the uuid.
    static std::string describe(const UUID::Uuid& uuid){
        std::stringstream ss;
        ss << "\tversion=" << uuid.version();
        if(uuid.version() == 7){
            ss << "\tunix_ms=" << uuid.unix_ts_ms();
        } else if(uuid.version() == 6){
            std::chrono::milliseconds since_epoch = std::chrono::floor<std::chrono::milliseconds>(uuid.gregorian_time().time_since_epoch());
            ss << "\tunix_ms=" << since_epoch.count();
        }
        return ss.str();
    }

    std::string dispatch(const Options& options){
        UUID::Uuid uuid;
        if(options.timestamp){
            timestamp::TimePoint tp = timestamp::parse(*options.timestamp);
            uuid = UUID::Uuid(UUID::Uuid::v7, tp);
        } else if(options.v7){
            uuid = UUID::Uuid(UUID::Uuid::v7);
        } else if(options.v6){
            uuid = UUID::Uuid(UUID::Uuid::v6);
        } else {
            uuid = UUID::Uuid(UUID::Uuid::v4);
        }
        std::string line = uuid.str();
        if(options.inspect){
            line += describe(uuid);
        }
        return line;
    }

    std::string usage(){
        return
            "Generate UUIDs from the command line.\n"
            "\n"
            "By default, generates UUIDv4. Use version flags to generate other UUID versions.\n"
            "Use the timestamp flag (-t) to generate UUIDv7 from a specific timestamp.\n"
            "\n"
            "SECURITY NOTE: UUIDv6 and UUIDv7 contain embedded timestamps that reveal timing information.\n"
            "Use UUIDv4 when privacy is important.\n"
            "\n"
            "Usage: uuidgen [-4 | -6 | -7] [-t timestamp] [-i]\n"
            "\n"
            "  -4                   Generate UUIDv4 (default)\n"
            "  -6                   Generate UUIDv6\n"
            "  -7                   Generate UUIDv7 (contains timestamp)\n"
            "  -t, --timestamp VAL  Generate UUIDv7 from timestamp (Unix seconds/milliseconds, RFC3339, or ISO date)\n"
            "  -i, --inspect        Append the version and embedded Unix milliseconds\n"
            "  -h, --help           Show this help\n"
            "  -v, --version        Show the version\n"
            "\n"
            "Examples:\n"
            "  uuidgen                        # Generate UUIDv4 (default)\n"
            "  uuidgen -6                     # Generate UUIDv6\n"
            "  uuidgen -7                     # Generate UUIDv7\n"
            "  uuidgen -t 1686742245          # Generate UUIDv7 from Unix timestamp\n"
            "  uuidgen -t 2023-06-14          # Generate UUIDv7 from date\n"
            "  uuidgen -t \"2023-06-14 10:30:45\" # Generate UUIDv7 from date-time\n";
    }

    std::string version_string(){
        std::string version(UUIDGEN_VERSION);
        std::string build(UUIDGEN_BUILD);
        if(!build.empty() && build != "unknown"){
            return version + "+" + build;
        }
        return version;
    }
}
