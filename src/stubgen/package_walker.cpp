#include "stubgen/package_walker.hpp"

#include "log/log.hpp"

namespace jstub::stubgen {

using reflect::PackageListing;

auto is_pseudo_package(const std::string& name, const PackageListing& listing) -> bool {
    return (listing.classes.empty() && listing.subpackages.empty()) ||
           name.find('$') != std::string::npos;
}

static void walk_children(const reflect::ReflectionProvider& provider, const std::string& package,
                          const PackageListing& listing,
                          std::map<std::string, PackageListing>& out) {
    for (const auto& child : listing.subpackages) {
        std::string name = package + "." + child;
        auto result = provider.list_package(name);
        if (is_err(result)) {
            JSTUB_LOG_WARN("walker", "skipping " << name << ": " << unwrap_err(result).to_string());
            continue;
        }
        const auto& child_listing = unwrap(result);
        if (is_pseudo_package(name, child_listing)) {
            JSTUB_LOG_DEBUG("walker", "ignoring pseudo-package " << name);
            continue;
        }
        out[name] = child_listing;
        walk_children(provider, name, child_listing, out);
    }
}

auto walk_packages(const reflect::ReflectionProvider& provider, const std::string& root)
    -> Result<std::map<std::string, PackageListing>, reflect::ReflectionError> {
    auto result = provider.list_package(root);
    if (is_err(result)) {
        return unwrap_err(result);
    }
    std::map<std::string, PackageListing> packages;
    packages[root] = unwrap(result);
    walk_children(provider, root, packages[root], packages);
    JSTUB_LOG_DEBUG("walker", "collected " << packages.size() << " packages under " << root);
    return packages;
}

auto plan_stub_paths(const std::vector<std::string>& packages,
                     const std::filesystem::path& output_dir, bool use_stubs_suffix) -> StubPlan {
    StubPlan plan;
    for (const auto& package : packages) {
        std::filesystem::path path = output_dir;
        std::string prefix;
        size_t start = 0;
        while (start <= package.size()) {
            auto dot = package.find('.', start);
            std::string part =
                package.substr(start, dot == std::string::npos ? std::string::npos : dot - start);

            if (prefix.empty()) {
                path /= use_stubs_suffix ? part + "-stubs" : part;
                prefix = part;
            } else {
                path /= part;
                plan.subpackages[prefix].insert(part);
                prefix += "." + part;
            }
            plan.paths[prefix] = path / "__init__.pyi";
            plan.subpackages[prefix];

            if (dot == std::string::npos) {
                break;
            }
            start = dot + 1;
        }
    }
    return plan;
}

} // namespace jstub::stubgen
