#include "utils.hpp"

#include "common.hpp"

#include <iostream>

namespace jstub::cli {

std::vector<std::string> split_list(const std::string& value, char separator) {
    std::vector<std::string> items;
    size_t start = 0;
    while (start <= value.size()) {
        auto end = value.find(separator, start);
        if (end == std::string::npos) {
            end = value.size();
        }
        if (end > start) {
            items.push_back(value.substr(start, end - start));
        }
        start = end + 1;
    }
    return items;
}

void print_usage() {
    std::cout << "jstub " << VERSION << "\n\n";
    std::cout << "Generate Python type stubs for Java packages.\n\n";
    std::cout << "Usage: jstub [options] <package-prefix>...\n\n";
    std::cout << "Options:\n";
    std::cout << "  --classpath=<list>     Reflection dumps, separated by ':'\n";
    std::cout << "                         (glob patterns such as dumps/*.json are expanded)\n";
    std::cout << "  --output-dir=<dir>     Directory to write stubs to (default: .)\n";
    std::cout << "  --no-javadoc           Do not emit docstrings from Javadoc\n";
    std::cout << "  --no-stubs-suffix      Do not suffix top-level packages with -stubs\n";
    std::cout << "  --help, -h             Show this help\n";
    std::cout << "  --version, -V          Show version\n";
    std::cout << "\nLogging:\n";
    std::cout << "  --log-level=<level>    trace, debug, info, warn, error, off\n";
    std::cout << "  --log-filter=<spec>    Per-module levels (emitter=debug,*=warn)\n";
    std::cout << "  --log-file=<path>      Also write log records to a file\n";
    std::cout << "  --log-format=<fmt>     text or json\n";
    std::cout << "  -v, -vv                Debug or trace output\n";
    std::cout << "  -q, --quiet            Only show errors\n";
    std::cout << "\nThe JSTUB_LOG environment variable sets the level or filter when no\n";
    std::cout << "logging option is given.\n";
}

void print_version() {
    std::cout << "jstub " << VERSION << "\n";
}

} // namespace jstub::cli
