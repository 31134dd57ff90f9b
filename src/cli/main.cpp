#include <acb/build_cache.hpp>
#include <acb/builder.hpp>
#include <acb/log.hpp>
#include <acb/options.hpp>

#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace acb;

namespace fs = std::filesystem;

static CancelToken g_cancel;

static void on_interrupt(int) {
    g_cancel.cancel();
}

static void usage(std::ostream& os) {
    os << "Usage: acb [options] <command>\n"
          "\n"
          "Commands:\n"
          "  build          build the console, reusing a cached build when possible\n"
          "  cache key      print the cache key for the current options\n"
          "  cache path     print the cache entry path\n"
          "  cache status   print hit or miss (exit code 0 on hit, 1 on miss)\n"
          "\n"
          "Options:\n"
          "  -c, --config FILE     options file (default: acb.toml)\n"
          "  --no-cache            do not read or write the build cache\n"
          "  -v, --verbose         debug logging\n"
          "  -q, --quiet           errors only\n"
          "  --log-level LEVEL     trace, debug, info, warn or error\n"
          "  -h, --help            show this help\n";
}

struct CliArgs {
    std::string config_path = "acb.toml";
    bool config_explicit = false;
    bool no_cache = false;
    bool verbose = false;
    std::optional<log::Level> level;
    std::vector<std::string> command;
};

static bool parse_args(int argc, char* argv[], CliArgs& out) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                std::cerr << "error: " << arg << " needs a file argument\n";
                return false;
            }
            out.config_path = argv[++i];
            out.config_explicit = true;
        } else if (arg == "--no-cache") {
            out.no_cache = true;
        } else if (arg == "-v" || arg == "--verbose") {
            out.verbose = true;
            out.level = log::Debug;
        } else if (arg == "-q" || arg == "--quiet") {
            out.level = log::Error;
        } else if (arg == "--log-level") {
            log::Level lvl;
            if (i + 1 >= argc || !log::parse_level(argv[i + 1], lvl)) {
                std::cerr << "error: --log-level needs one of trace, debug, info, warn, error\n";
                return false;
            }
            out.level = lvl;
            ++i;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "error: unknown option " << arg << "\n";
            return false;
        } else {
            out.command.push_back(arg);
        }
    }
    return !out.command.empty();
}

static Result<BuilderOptions> load_options(const CliArgs& args) {
    std::optional<BuilderOptions> global;
    std::string global_path = global_options_path();
    if (!global_path.empty() && fs::exists(global_path)) {
        auto g = BuilderOptions::load(global_path);
        ACB_TRY(g);
        global = std::move(g).value();
    }

    std::optional<BuilderOptions> project;
    if (args.config_explicit || fs::exists(args.config_path)) {
        auto p = BuilderOptions::load(args.config_path);
        ACB_TRY(p);
        project = std::move(p).value();
    } else {
        log::debug("no %s found, using default options", args.config_path.c_str());
    }

    BuilderOptions opts = BuilderOptions::effective(global, project);
    if (args.no_cache) opts.no_cache = true;
    if (args.verbose) opts.verbose = true;
    return Result<BuilderOptions>::ok(std::move(opts));
}

static int run_build(const BuilderOptions& opts) {
    std::signal(SIGINT, on_interrupt);
    std::signal(SIGTERM, on_interrupt);

    ConsoleBuilder builder(opts);
    auto r = builder.build(&g_cancel);
    if (r.is_err()) {
        std::cerr << r.error().format() << "\n";
        return 1;
    }
    std::cout << (r.value().from_cache ? "restored " : "built ")
              << r.value().file_count << " files into " << r.value().destination << "\n";
    return 0;
}

static int run_cache(const BuilderOptions& opts, const std::string& sub) {
    BuildCacheStore store(opts);

    if (sub == "key") {
        if (!store.caching_enabled() && store.key().empty()) {
            std::cerr << "error: caching is disabled (no-cache)\n";
            return 1;
        }
        std::cout << store.key() << "\n";
        return 0;
    }

    if (!store.caching_enabled()) {
        if (store.root_error()) {
            std::cerr << store.root_error()->format() << "\n";
        } else {
            std::cerr << "error: caching is disabled (no-cache)\n";
        }
        return 1;
    }

    if (sub == "path") {
        std::cout << store.entry_path() << "\n";
        return 0;
    }
    if (sub == "status") {
        bool hit = store.exists();
        std::cout << (hit ? "hit" : "miss") << "\n";
        return hit ? 0 : 1;
    }

    std::cerr << "error: unknown cache command `" << sub << "`\n";
    return 2;
}

int main(int argc, char* argv[]) {
    CliArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a == "-h" || a == "--help") {
            usage(std::cout);
            return 0;
        }
    }
    if (!parse_args(argc, argv, args)) {
        usage(std::cerr);
        return 2;
    }
    if (args.level) log::set_level(*args.level);

    auto opts = load_options(args);
    if (opts.is_err()) {
        std::cerr << opts.error().format() << "\n";
        return 1;
    }
    if (!args.level && opts.value().verbose) log::set_level(log::Debug);

    const std::string& cmd = args.command.front();
    if (cmd == "build" && args.command.size() == 1) {
        return run_build(opts.value());
    }
    if (cmd == "cache" && args.command.size() == 2) {
        return run_cache(opts.value(), args.command[1]);
    }

    usage(std::cerr);
    return 2;
}
