//! # Package Walker
//!
//! Collects the packages to generate and assigns each package name,
//! including every parent prefix, the stub file that declares it.
//!
//! ## Output Layout
//!
//! | Package | Stub file (`use_stubs_suffix`) |
//! |---------|--------------------------------|
//! | `com` | `com-stubs/__init__.pyi` |
//! | `com.example` | `com-stubs/example/__init__.pyi` |
//! | `com.example.util` | `com-stubs/example/util/__init__.pyi` |
//!
//! Pseudo-packages (no members, or a `$` in the name) are neither listed
//! nor descended into. The root itself is always listed.

#ifndef JSTUB_STUBGEN_PACKAGE_WALKER_HPP
#define JSTUB_STUBGEN_PACKAGE_WALKER_HPP

#include "common.hpp"
#include "reflect/provider.hpp"

#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace jstub::stubgen {

/// Listings of `root` and all of its real descendant packages, keyed by
/// qualified package name. Fails only when `root` itself cannot be listed;
/// unlistable descendants are logged and skipped.
[[nodiscard]] auto walk_packages(const reflect::ReflectionProvider& provider,
                                 const std::string& root)
    -> Result<std::map<std::string, reflect::PackageListing>, reflect::ReflectionError>;

/// True for packages that are not importable from Java.
[[nodiscard]] auto is_pseudo_package(const std::string& name,
                                     const reflect::PackageListing& listing) -> bool;

/// Where every package and package prefix is written.
struct StubPlan {
    std::map<std::string, std::filesystem::path> paths;
    /// Direct child package names of every planned package.
    std::map<std::string, std::set<std::string>> subpackages;
};

[[nodiscard]] auto plan_stub_paths(const std::vector<std::string>& packages,
                                   const std::filesystem::path& output_dir, bool use_stubs_suffix)
    -> StubPlan;

} // namespace jstub::stubgen

#endif // JSTUB_STUBGEN_PACKAGE_WALKER_HPP
