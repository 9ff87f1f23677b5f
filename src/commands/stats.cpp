#include "commands/stats.hpp"

#include "io/JsonIO.hpp"
#include "workout/Yardage.hpp"

#include <iostream>
#include <stdexcept>
#include <string>

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

int cmd_stats(int argc, char** argv) {
    const std::string template_path = get_arg(argc, argv, "--template", "");
    if (template_path.empty()) {
        std::cerr << "error: missing --template\n"
                  << "usage:\n"
                  << "  swimset stats --template <path>\n";
        return 2;
    }

    try {
        const workout::PracticeTemplate tmpl = load_practice_template(template_path);

        std::cout << "TITLE: " << tmpl.title << "\n";
        std::cout << "TOTAL_YARDS: " << tmpl.total_yards() << "\n";

        for (const auto& sec : tmpl.sections) {
            std::cout << "SECTION[" << sec.label << "]: " << workout::section_yards(sec) << "\n";
        }

        for (const auto& [cat, yards] : workout::stroke_yards(tmpl.sections)) {
            std::cout << "YARDS[" << cat.display() << "]: " << yards << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "stats failed: " << e.what() << "\n";
        return 1;
    }
}
