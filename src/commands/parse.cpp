#include "commands/parse.hpp"

#include "io/JsonIO.hpp"
#include "workout/PracticeTemplate.hpp"
#include "workout/WorkoutParser.hpp"
#include "workout/Yardage.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static std::optional<std::string> get_opt(int argc, char** argv, const std::string& key) {
    const std::string v = get_arg(argc, argv, key, "");
    if (v.empty()) return std::nullopt;
    return v;
}

// first argument after the subcommand that is not a flag or a flag's value
static std::string positional(int argc, char** argv) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a.rfind("--", 0) == 0) {
            ++i;
            continue;
        }
        return a;
    }
    return "";
}

static std::string read_stdin() {
    std::ostringstream ss;
    ss << std::cin.rdbuf();
    return ss.str();
}

static int parse_usage() {
    std::cerr
        << "usage:\n"
        << "  swimset parse <file|-> [options]\n"
        << "\n"
        << "options:\n"
        << "  --out <path>                 default: out/template.json\n"
        << "  --title <str>                override the parsed title\n"
        << "  --notes <str>                e.g. \"Team Practice\"\n"
        << "  --pool <str>                 e.g. \"25 Yards\"\n"
        << "  --tag <str>                  Sprint|Distance|IM|Recovery|Threshold|Skills\n"
        << "  --fallback <label>           section label for content before any header (default: Main Set)\n";
    return 2;
}

int cmd_parse(int argc, char** argv) {
    const std::string in_path = positional(argc, argv);
    if (in_path.empty()) {
        std::cerr << "error: missing input file\n";
        return parse_usage();
    }

    try {
        const fs::path out_path = get_arg(argc, argv, "--out", "out/template.json");

        workout::ParserConfig cfg;
        cfg.fallback_section_label = get_arg(argc, argv, "--fallback", cfg.fallback_section_label);

        workout::TemplateOptions opts;
        opts.title = get_arg(argc, argv, "--title", "");
        opts.notes = get_opt(argc, argv, "--notes");
        opts.pool_info = get_opt(argc, argv, "--pool");
        if (const auto tag = get_opt(argc, argv, "--tag")) {
            opts.tag = workout::practice_tag_from_string(*tag);
            if (!opts.tag) std::cerr << "warning: unknown tag ignored: " << *tag << "\n";
        }

        const std::string text = (in_path == "-") ? read_stdin() : read_text_file(in_path);
        const workout::ParseResult result = workout::parse(text, cfg);

        for (const auto& w : result.warnings) std::cerr << "warning: " << w << "\n";

        const workout::PracticeTemplate tmpl = workout::make_template(result, text, opts);
        tmpl.write_to(out_path);

        int set_count = 0;
        for (const auto& sec : result.sections) set_count += static_cast<int>(sec.sets.size());

        std::cout << "TITLE: " << tmpl.title << "\n";
        std::cout << "SECTIONS: " << result.sections.size() << "\n";
        std::cout << "SETS: " << set_count << "\n";
        for (const auto& sec : result.sections) {
            std::cout << "  " << sec.label << ": " << workout::section_yards(sec) << "\n";
        }
        std::cout << "TOTAL_YARDS: " << workout::total_yards(result) << "\n";
        std::cout << "WARNINGS: " << result.warnings.size() << "\n";
        std::cout << "OUT_JSON: " << out_path.string() << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "parse failed: " << e.what() << "\n";
        return 1;
    }
}
