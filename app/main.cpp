#include "commands/parse.hpp"
#include "commands/render.hpp"
#include "commands/stats.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  swimset parse <file|-> [args]\n"
        << "  swimset render --template <path> [args]\n"
        << "  swimset stats --template <path>\n"
        << "  swimset help\n";
    return 1;
}

static int print_parse_help() {
    std::cerr
        << "usage:\n"
        << "  swimset parse <file|-> [options]\n"
        << "\n"
        << "Reads coach notation (\"4x100 free @ 1:30\") and writes a practice template.\n"
        << "\n"
        << "headers:\n"
        << "  WU / Warmup, PS / Pre-Set, MS / Main Set, Reset / Technique / Post-Set, CD / Cooldown\n"
        << "repeated blocks:\n"
        << "  \"2x thru:\" followed by indented lines\n"
        << "\n"
        << "options:\n"
        << "  --out <path>                 default: out/template.json\n"
        << "  --title <str>                override the parsed title\n"
        << "  --notes <str>                optional\n"
        << "  --pool <str>                 optional, e.g. \"25 Yards\"\n"
        << "  --tag <str>                  Sprint|Distance|IM|Recovery|Threshold|Skills\n"
        << "  --fallback <label>           default: Main Set\n";
    return 0;
}

static int print_render_help() {
    std::cerr
        << "usage:\n"
        << "  swimset render --template <path> [options]\n"
        << "\n"
        << "options:\n"
        << "  --date <YYYY-MM-DD>          default: today\n"
        << "  --time <HH:MM>               default: now\n"
        << "  --out <path>                 default: stdout\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        print_usage();
        return 0;
    }

    // subcommand help
    if (cmd == "parse"  && (argc >= 3 && std::string(argv[2]) == "--help")) return print_parse_help();
    if (cmd == "render" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_render_help();

    if (cmd == "parse")  return cmd_parse(argc - 1, argv + 1);
    if (cmd == "render") return cmd_render(argc - 1, argv + 1);
    if (cmd == "stats")  return cmd_stats(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
