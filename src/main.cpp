// main.cpp - Main entry point
#include <getopt.h>
#include <cerrno>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>
#include "conf/config.hpp"
#include "core/engine.hpp"
#include "core/paths.hpp"
#include "core/seance.hpp"
#include "defs.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;
using namespace rip;

struct CliOptions {
    std::string config_file;
    fs::path graveyard;
    std::size_t max_depth = 0;
    bool unbury = false;
    bool decompose = false;
    bool seance = false;
    bool full_path = false;
    bool show_all = false;
    bool local = false;
    bool plain = false;
    bool inspect = false;
    bool verbose = false;
    std::vector<std::string> targets;
};

static void print_help() {
    std::cout << "Usage: rip [OPTIONS] [TARGET...]\n\n";
    std::cout << "Send files to the graveyard ($XDG_DATA_HOME/graveyard if set, else\n";
    std::cout << "/tmp/graveyard-$USER) instead of unlinking them.\n\n";
    std::cout << "Options:\n";
    std::cout << "  -G, --graveyard DIR     Directory where deleted files go to rest\n";
    std::cout << "  -u, --unbury            Undo the last removal, or restore TARGET(s)\n";
    std::cout << "                          from the graveyard. Can be combined with -s and -l\n";
    std::cout << "  -m, --max-depth N       Max depth for glob to search (default: 10)\n";
    std::cout << "  -d, --decompose         Permanently delete the entire graveyard\n";
    std::cout << "  -s, --seance            Print files sent from the current directory\n";
    std::cout << "  -f, --full-path         Print full graveyard paths (with -s or -u)\n";
    std::cout << "  -a, --all               Print every file in the graveyard (with -s)\n";
    std::cout << "  -l, --local             Unbury relative to the current directory (with -u)\n";
    std::cout << "  -p, --plain             Print only paths, no index or time\n";
    std::cout << "  -i, --inspect           Print info about TARGET before prompting\n";
    std::cout << "  -v, --verbose           Print what is going on\n";
    std::cout << "  -c, --config FILE       Config file path\n";
    std::cout << "  -h, --help              Show this help\n";
    std::cout << "\nGlobs: '*glob', '**/glob', '*.{png,jpg}', and '!glob' to exclude.\n";
    std::cout << "\nExamples:\n";
    std::cout << "  rip notes.txt build/           # Bury a file and a directory\n";
    std::cout << "  rip -u                         # Restore the last buried file\n";
    std::cout << "  rip -u '*.txt' '!keep.txt'     # Restore matching graves\n";
    std::cout << "  rip -s                         # List graves from this directory\n";
}

static bool parse_size(const char* text, std::size_t& out) {
    char* end = nullptr;
    errno = 0;
    unsigned long value = std::strtoul(text, &end, 10);
    if (errno != 0 || end == text || *end != '\0' || value == 0) {
        return false;
    }
    out = static_cast<std::size_t>(value);
    return true;
}

static CliOptions parse_args(int argc, char* argv[]) {
    CliOptions opts;

    static struct option long_options[] = {{"graveyard", required_argument, 0, 'G'},
                                           {"unbury", no_argument, 0, 'u'},
                                           {"max-depth", required_argument, 0, 'm'},
                                           {"decompose", no_argument, 0, 'd'},
                                           {"seance", no_argument, 0, 's'},
                                           {"full-path", no_argument, 0, 'f'},
                                           {"all", no_argument, 0, 'a'},
                                           {"local", no_argument, 0, 'l'},
                                           {"plain", no_argument, 0, 'p'},
                                           {"inspect", no_argument, 0, 'i'},
                                           {"verbose", no_argument, 0, 'v'},
                                           {"config", required_argument, 0, 'c'},
                                           {"help", no_argument, 0, 'h'},
                                           {0, 0, 0, 0}};

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "G:um:dsfalpivc:h", long_options, &option_index)) !=
           -1) {
        switch (opt) {
        case 'G':
            opts.graveyard = optarg;
            break;
        case 'u':
            opts.unbury = true;
            break;
        case 'm':
            if (!parse_size(optarg, opts.max_depth)) {
                std::cerr << "Invalid max depth: " << optarg << "\n";
                exit(1);
            }
            break;
        case 'd':
            opts.decompose = true;
            break;
        case 's':
            opts.seance = true;
            break;
        case 'f':
            opts.full_path = true;
            break;
        case 'a':
            opts.show_all = true;
            break;
        case 'l':
            opts.local = true;
            break;
        case 'p':
            opts.plain = true;
            break;
        case 'i':
            opts.inspect = true;
            break;
        case 'v':
            opts.verbose = true;
            break;
        case 'c':
            opts.config_file = optarg;
            break;
        case 'h':
            print_help();
            exit(0);
        default:
            print_help();
            exit(1);
        }
    }

    while (optind < argc) {
        opts.targets.push_back(argv[optind]);
        optind++;
    }

    return opts;
}

static Config load_config(const CliOptions& opts) {
    if (!opts.config_file.empty()) {
        return Config::from_file(opts.config_file);
    }
    return Config::load_default();
}

static bool prompt_yes(const std::string& message) {
    std::cout << message << " [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer)) {
        std::cout << "\n";
        return false;
    }
    return !answer.empty() && (answer[0] == 'y' || answer[0] == 'Y');
}

static Operation build_operation(const CliOptions& cli, const Config& config) {
    if (cli.unbury) {
        UnburyOptions options;
        options.targets = cli.targets;
        options.local = cli.local;
        options.seance = cli.seance;
        options.max_depth = config.max_depth;
        options.full_path = cli.full_path;
        return options;
    }
    if (cli.seance) {
        SeanceOptions options;
        options.show_all = cli.show_all;
        options.full_path = cli.full_path;
        options.plain = cli.plain;
        return options;
    }
    if (cli.decompose) {
        return DecomposeOptions{};
    }
    BuryOptions options;
    options.targets = cli.targets;
    options.inspect = config.inspect;
    return options;
}

static std::string shorten_grave(const fs::path& grave, const fs::path& graveyard) {
    std::string shown = grave.string();
    const std::string prefix = graveyard.string();
    if (shown.compare(0, prefix.size(), prefix) == 0) {
        shown.replace(0, prefix.size(), "$GRAVEYARD");
    }
    return shown;
}

static void print_report(const OperationReport& report, const Operation& operation,
                         const Context& ctx) {
    if (const auto* seance_opts = std::get_if<SeanceOptions>(&operation)) {
        for (const auto& listing : report.graves) {
            std::cout << format_grave_listing(listing, ctx.graveyard, seance_opts->full_path,
                                              seance_opts->plain)
                      << "\n";
        }
    } else if (!report.graves.empty()) {
        // Decompose in verbose mode
        std::cout << "File\tType\n----\t----\n";
        for (const auto& listing : report.graves) {
            std::cout << listing.entry.original.string() << "\t" << listing.file_type << "\n";
        }
    }

    const auto* unbury_opts = std::get_if<UnburyOptions>(&operation);
    for (const auto& outcome : report.outcomes) {
        switch (outcome.kind) {
        case OutcomeKind::Buried:
            std::cout << "Buried " << outcome.source.string() << "\n";
            break;
        case OutcomeKind::Exhumed:
            if (unbury_opts && unbury_opts->full_path) {
                std::cout << "Returned " << shorten_grave(outcome.source, ctx.graveyard)
                          << " to " << outcome.destination.string() << "\n";
            } else {
                std::cout << "Returned " << outcome.destination.string() << "\n";
            }
            break;
        case OutcomeKind::Deleted:
            std::cout << "Deleted " << outcome.source.string() << "\n";
            break;
        case OutcomeKind::Skipped:
            std::cout << "Skipped " << outcome.source.string() << ": " << outcome.message
                      << "\n";
            break;
        case OutcomeKind::Failed:
            std::cerr << "Error: " << outcome.message << "\n";
            break;
        }
    }
}

int main(int argc, char* argv[]) {
    try {
        CliOptions cli = parse_args(argc, argv);

        if (cli.show_all && !cli.seance) {
            std::cerr << "--all requires --seance\n";
            return 1;
        }
        if (cli.local && !cli.unbury) {
            std::cerr << "--local requires --unbury\n";
            return 1;
        }
        if (!cli.unbury && !cli.seance && !cli.decompose && cli.targets.empty()) {
            print_help();
            return 1;
        }

        Config config = load_config(cli);
        config.merge_with_cli(cli.max_depth, cli.verbose, cli.inspect);

        Logger::getInstance().init(config.verbose, config.log_file);

        Context ctx;
        ctx.graveyard = config.resolve_graveyard(cli.graveyard);
        ctx.cwd = fs::current_path();
        ctx.verbose = config.verbose;
        ctx.confirm = prompt_yes;
        ctx.graveyard = normalize_path(fs::absolute(ctx.graveyard));

        Operation operation = build_operation(cli, config);
        OperationReport report = run_operation(operation, ctx);
        print_report(report, operation, ctx);

        return report.ok() ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal Error: " << e.what() << "\n";
        LOG_ERROR("Fatal Error: " + std::string(e.what()));
        return 1;
    }
}
