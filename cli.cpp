#include "cli.hpp"
#include <ostream>

SCliOptions parseArgs(const std::vector<std::string>& args) {
    SCliOptions opts;

    auto valueOf = [&](size_t& i) -> std::string {
        if (i + 1 >= args.size())
            throw CUsageError(args[i] + " needs an argument");
        return args[++i];
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const auto& arg = args[i];

        if (arg == "-l" || arg == "--list")
            opts.listOnly = true;
        else if (arg == "-d" || arg == "--device")
            opts.device = valueOf(i);
        else if (arg == "-c" || arg == "--config")
            opts.configPath = valueOf(i);
        else if (arg == "--create-config")
            opts.createConfig = true;
        else if (arg == "--log-level")
            opts.logLevel = valueOf(i);
        else if (arg == "-h" || arg == "--help") {
            opts.help = true;
            return opts;
        } else
            throw CUsageError("unknown option '" + arg + "'");
    }

    return opts;
}

void printUsage(std::ostream& out) {
    out << "wheel-smoother: scroll wheel debouncer\n"
        << "usage:\n"
        << "  sudo wheel-smoother [options]\n"
        << "\n"
        << "options:\n"
        << "  -l, --list                list available mouse devices\n"
        << "  -d, --device <n|path>     device index from --list or /dev/input/eventN\n"
        << "  -c, --config <path>       config file (default " << DEFAULT_CONFIG_PATH << ")\n"
        << "  --create-config           write a default config file\n"
        << "  --log-level <level>       error, warn, info, debug or trace\n"
        << "  -h, --help                show this help\n";
}
