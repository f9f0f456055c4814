#include "runner_utils.h"
#include "bbhunt/json_mini.h"

#include <unistd.h>

#include <cstdio>
#include <iomanip>
#include <iostream>

namespace bbhunt {

bool is_json_object(const std::string& s) {
    return static_cast<bool>(json_mini::parse_object(s));
}

bool parse_run_args(int argc, char** argv, int first, RunArgs* out) {
    if (first >= argc) {
        std::cerr << "missing plugin name\n";
        return false;
    }
    out->plugin = argv[first];
    for (int i = first + 1; i < argc; i++) {
        std::string a = argv[i];
        if ((a == "-t" || a == "--target") && i + 1 < argc) {
            out->target = argv[++i];
        } else if ((a == "-o" || a == "--options") && i + 1 < argc) {
            out->options_json = argv[++i];
            out->options_given = true;
            if (!is_json_object(out->options_json)) {
                std::cerr << "Error parsing options: expected a JSON object\n";
                return false;
            }
        } else if (a == "-c" || a == "--container") {
            out->container = true;
        } else {
            std::cerr << "unknown argument: " << a << "\n";
            return false;
        }
    }
    return true;
}

bool stdin_is_tty() {
    return ::isatty(STDIN_FILENO) == 1;
}

bool prompt_yes_no(const std::string& question, bool defv) {
    std::cout << question << (defv ? " [Y/n] " : " [y/N] ") << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) return defv;
    if (line.empty()) return defv;
    const char c = line[0];
    return c == 'y' || c == 'Y';
}

void print_result(const RunResult& r) {
    if (r.ok()) {
        std::cout << "Plugin completed successfully in " << std::fixed << std::setprecision(2)
                  << (double)r.elapsed_ms / 1000.0 << " seconds ("
                  << dispatch_to_str(r.dispatch) << ")\n";
        std::cout << "  " << r.message << "\n";
        json_mini::Doc d = json_mini::parse(r.payload_json);
        if (d) {
            std::cout << json_object_to_json_string_ext(d.root, JSON_C_TO_STRING_PRETTY) << "\n";
        } else {
            std::cout << r.payload_json << "\n";
        }
        return;
    }
    std::cerr << "Plugin failed [" << failure_to_str(r.failure) << "]: " << r.message << "\n";
}

} // namespace bbhunt
