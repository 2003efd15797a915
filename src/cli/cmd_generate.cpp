#include "cmd_generate.hpp"

#include "log/log.hpp"
#include "reflect/class_universe.hpp"
#include "reflect/universe_loader.hpp"
#include "utils.hpp"

#include <glob.h>

namespace jstub::cli {

GenerateOptions parse_generate_args(int argc, char* argv[]) {
    GenerateOptions opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            opts.show_help = true;
        } else if (arg == "--version" || arg == "-V") {
            opts.show_version = true;
        } else if (arg.starts_with("--classpath=")) {
            auto entries = split_list(arg.substr(12), ':');
            opts.classpath.insert(opts.classpath.end(), entries.begin(), entries.end());
        } else if (arg == "--classpath" && i + 1 < argc) {
            auto entries = split_list(argv[++i], ':');
            opts.classpath.insert(opts.classpath.end(), entries.begin(), entries.end());
        } else if (arg.starts_with("--output-dir=")) {
            opts.generator.output_dir = arg.substr(13);
        } else if (arg == "--output-dir" && i + 1 < argc) {
            opts.generator.output_dir = argv[++i];
        } else if (arg == "--no-javadoc") {
            opts.generator.include_javadoc = false;
        } else if (arg == "--no-stubs-suffix") {
            opts.generator.use_stubs_suffix = false;
        } else if (log::is_log_option(arg)) {
            continue;
        } else if (!arg.empty() && arg[0] != '-') {
            opts.prefixes.push_back(arg);
        } else {
            JSTUB_LOG_WARN("cli", "Unknown option: " << arg);
        }
    }

    return opts;
}

std::vector<std::string> expand_classpath(const std::vector<std::string>& entries) {
    std::vector<std::string> files;
    for (const auto& entry : entries) {
        glob_t matches{};
        int rc = ::glob(entry.c_str(), 0, nullptr, &matches);
        if (rc == 0) {
            for (size_t i = 0; i < matches.gl_pathc; ++i) {
                files.emplace_back(matches.gl_pathv[i]);
            }
        } else {
            JSTUB_LOG_WARN("cli", "classpath entry " << entry << " matches no file");
        }
        globfree(&matches);
    }
    return files;
}

int run_generate(const GenerateOptions& options) {
    auto dumps = expand_classpath(options.classpath);
    if (dumps.empty()) {
        JSTUB_LOG_ERROR("cli", "no reflection dumps on the classpath");
        return 1;
    }

    reflect::ClassUniverse universe;
    reflect::UniverseLoader loader(universe);
    for (const auto& dump : dumps) {
        auto read = loader.add_dump_file(dump);
        if (is_err(read)) {
            JSTUB_LOG_ERROR("cli", unwrap_err(read).to_string());
            return 1;
        }
        JSTUB_LOG_DEBUG("cli", "read " << unwrap(read) << " class entries from " << dump);
    }
    auto loaded = loader.finish();
    JSTUB_LOG_INFO("cli", "Loaded " << loaded.classes << " classes from " << dumps.size()
                                    << " dumps (" << loaded.failures << " unloadable)");

    auto result = stubgen::generate_java_stubs(universe, options.prefixes, options.generator);
    if (is_err(result)) {
        JSTUB_LOG_ERROR("cli", unwrap_err(result).to_string());
        return 1;
    }
    return 0;
}

} // namespace jstub::cli
