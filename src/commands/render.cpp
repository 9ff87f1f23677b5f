#include "commands/render.hpp"

#include "io/JsonIO.hpp"
#include "workout/CommitRenderer.hpp"

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int render_usage() {
    std::cerr
        << "usage:\n"
        << "  swimset render --template <path> [--date YYYY-MM-DD] [--time HH:MM] [--out <path>]\n";
    return 2;
}

// --date/--time override the current local time
static std::tm resolve_when(const std::string& date, const std::string& time) {
    const std::time_t now = std::time(nullptr);
    std::tm when = *std::localtime(&now);

    if (!date.empty()) {
        int y = 0, m = 0, d = 0;
        if (std::sscanf(date.c_str(), "%d-%d-%d", &y, &m, &d) != 3 || m < 1 || m > 12 || d < 1 || d > 31) {
            throw std::runtime_error("bad --date (want YYYY-MM-DD): " + date);
        }
        when.tm_year = y - 1900;
        when.tm_mon = m - 1;
        when.tm_mday = d;
    }

    if (!time.empty()) {
        int h = 0, mi = 0;
        if (std::sscanf(time.c_str(), "%d:%d", &h, &mi) != 2 || h < 0 || h > 23 || mi < 0 || mi > 59) {
            throw std::runtime_error("bad --time (want HH:MM): " + time);
        }
        when.tm_hour = h;
        when.tm_min = mi;
        when.tm_sec = 0;
    }

    when.tm_isdst = -1;
    std::mktime(&when);  // fills tm_wday
    return when;
}

int cmd_render(int argc, char** argv) {
    const std::string template_path = get_arg(argc, argv, "--template", "");
    if (template_path.empty()) {
        std::cerr << "error: missing --template\n";
        return render_usage();
    }

    try {
        const std::string out_path = get_arg(argc, argv, "--out", "");
        const std::tm when = resolve_when(get_arg(argc, argv, "--date", ""), get_arg(argc, argv, "--time", ""));

        const workout::PracticeTemplate tmpl = load_practice_template(template_path);
        const std::string text = workout::render_commit_text(tmpl, when);

        if (out_path.empty()) {
            std::cout << text;
            return 0;
        }

        workout::write_commit_text(fs::path(out_path), text);
        std::cout << "OUT_TEXT: " << out_path << "\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "render failed: " << e.what() << "\n";
        return 1;
    }
}
