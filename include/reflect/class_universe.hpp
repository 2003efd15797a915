//! # Class Universe
//!
//! An in-memory `ReflectionProvider`. Classes, packages, documentation and
//! load failures are registered up front, either programmatically (tests)
//! or by `universe_loader` from reflection dumps.
//!
//! ## Package Registration
//!
//! Registering a class registers its package and every enclosing package,
//! so `list_package("java")` reports `util` once `java.util.List` is known.
//! Nested classes (`Outer$Inner`) are never listed; they are reached
//! through `ClassInfo::member_classes` and `load_class`.

#ifndef JSTUB_REFLECT_CLASS_UNIVERSE_HPP
#define JSTUB_REFLECT_CLASS_UNIVERSE_HPP

#include "reflect/provider.hpp"

#include <map>
#include <set>
#include <string>

namespace jstub::reflect {

class ClassUniverse : public ReflectionProvider {
public:
    ClassUniverse() = default;

    /// Registers a class, replacing any earlier class or failure of the
    /// same binary name.
    void add_class(ClassRef cls);

    /// Registers a package (and its parents) even if it holds no classes.
    void add_package(const std::string& package_name);

    /// Registers a class that is listed in its package but fails to load.
    void add_failure(const std::string& binary_name, std::string message);

    /// Attaches documentation to a class; overrides `ClassInfo::javadoc`.
    void add_documentation(const std::string& binary_name, JavadocInfo doc);

    [[nodiscard]] auto class_count() const -> size_t {
        return classes_.size();
    }

    [[nodiscard]] auto has_package(const std::string& package_name) const -> bool {
        return packages_.count(package_name) > 0;
    }

    // ReflectionProvider
    [[nodiscard]] auto list_package(const std::string& package_name) const
        -> Result<PackageListing, ReflectionError> override;
    [[nodiscard]] auto load_class(const std::string& binary_name) const
        -> Result<ClassRef, ReflectionError> override;
    [[nodiscard]] auto documentation(const ClassInfo& cls) const
        -> std::optional<JavadocInfo> override;

private:
    struct PackageEntry {
        std::set<std::string> classes;
        std::set<std::string> subpackages;
    };

    void register_class_name(const std::string& binary_name);

    std::map<std::string, ClassRef> classes_;
    std::map<std::string, std::string> failures_;
    std::map<std::string, JavadocInfo> docs_;
    std::map<std::string, PackageEntry> packages_;
};

} // namespace jstub::reflect

#endif // JSTUB_REFLECT_CLASS_UNIVERSE_HPP
