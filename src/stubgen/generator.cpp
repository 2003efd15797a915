#include "stubgen/generator.hpp"

#include "log/log.hpp"
#include "stubgen/class_emitter.hpp"
#include "stubgen/identifiers.hpp"
#include "stubgen/interop_bindings.hpp"
#include "stubgen/package_walker.hpp"
#include "stubgen/scheduler.hpp"

#include <map>

namespace jstub::stubgen {

auto generate_package_stub(const reflect::ReflectionProvider& provider,
                           const TypeTranslator& translator, const std::string& package,
                           const std::vector<std::string>& class_names,
                           const std::set<std::string>& subpackages, bool include_javadoc,
                           EmissionState& state) -> PackageStub {
    PackageStub stub;
    stub.package = package;

    ClassEmitter emitter(provider, translator, package, include_javadoc, state);
    PackageScheduler scheduler(provider, translator, emitter, state);
    bool is_java = package == "java";
    if (is_java) {
        const auto& names = interop_names();
        scheduler.set_excluded_names(std::set<std::string>(names.begin(), names.end()));
    }

    auto stats = scheduler.run(class_names, stub.lines);
    JSTUB_LOG_DEBUG("generate", package << ": " << stats.passes << " passes, "
                                        << stats.fallback_classes << " classes in fallback order, "
                                        << stats.resolved_missing << " resolved references");

    for (const auto& sub : subpackages) {
        state.add_import("import " + pysafe_package_path(package + "." + sub));
    }
    stub.imports = state.imports;
    if (is_java) {
        add_interop_bindings(stub);
    }
    return stub;
}

auto generate_java_stubs(const reflect::ReflectionProvider& provider,
                         const std::vector<std::string>& roots, const GeneratorOptions& options)
    -> Result<GenerationSummary, GenerateError> {
    std::map<std::string, reflect::PackageListing> packages;
    for (const auto& root : roots) {
        auto walked = walk_packages(provider, root);
        if (is_err(walked)) {
            return GenerateError{"cannot enumerate root package: " + unwrap_err(walked).to_string(),
                                 root};
        }
        for (auto& [name, listing] : unwrap(walked)) {
            packages[name] = std::move(listing);
        }
    }
    JSTUB_LOG_INFO("generate", "Collected " << packages.size() << " packages ...");

    std::vector<std::string> names;
    for (const auto& [name, listing] : packages) {
        names.push_back(name);
    }
    auto plan = plan_stub_paths(names, options.output_dir, options.use_stubs_suffix);

    TypeTranslator translator(&provider);
    GenerationSummary summary;
    for (const auto& [package, path] : plan.paths) {
        const auto& subpackages = plan.subpackages[package];
        std::vector<std::string> class_names;
        if (auto it = packages.find(package); it != packages.end()) {
            class_names = it->second.classes;
            JSTUB_LOG_INFO("generate", "Generating stubs for " << package << " ("
                                                               << class_names.size()
                                                               << " classes, " << subpackages.size()
                                                               << " subpackages)");
        } else {
            JSTUB_LOG_DEBUG("generate", "writing intermediate package " << package);
        }

        EmissionState state;
        auto stub = generate_package_stub(provider, translator, package, class_names, subpackages,
                                          options.include_javadoc, state);
        auto written = write_package_stub(path, stub);
        if (is_err(written)) {
            return unwrap_err(written);
        }
        if (package == "java") {
            auto interop = write_interop_modules(path.parent_path());
            if (is_err(interop)) {
                return unwrap_err(interop);
            }
        }

        ++summary.packages_written;
        summary.classes_emitted += state.classes_emitted;
        summary.placeholders += state.placeholders;
        summary.failures += state.failed.size();
    }

    JSTUB_LOG_INFO("generate", "Generation done: " << summary.packages_written << " packages, "
                                                   << summary.classes_emitted << " classes, "
                                                   << summary.placeholders << " placeholders, "
                                                   << summary.failures << " failures");
    return summary;
}

} // namespace jstub::stubgen
