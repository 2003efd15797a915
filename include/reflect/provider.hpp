//! # Reflection Provider
//!
//! The capability interface through which the stub generator reads Java
//! reflection facts. Every lookup is fallible: a class may fail to load
//! because one of its dependencies is missing, and callers are expected to
//! record the failure and carry on.
//!
//! ## Implementations
//!
//! | Provider | Source of facts |
//! |----------|-----------------|
//! | `ClassUniverse` | In-memory registry, filled by `universe_loader` from JSON reflection dumps |
//!
//! All calls happen on one thread; providers are not required to be
//! thread-safe.

#ifndef JSTUB_REFLECT_PROVIDER_HPP
#define JSTUB_REFLECT_PROVIDER_HPP

#include "common.hpp"
#include "reflect/java_type.hpp"

#include <string>
#include <vector>

namespace jstub::reflect {

/// A failed reflection lookup.
struct ReflectionError {
    enum class Kind {
        TypeLoad,  ///< The class exists but could not be loaded
        NotFound,  ///< No such class or package
        Malformed, ///< The reflection data itself is invalid
    };

    Kind kind = Kind::NotFound;
    std::string subject; ///< Class or package name the lookup was about
    std::string message;

    static auto type_load(std::string subject, std::string message) -> ReflectionError {
        return ReflectionError{Kind::TypeLoad, std::move(subject), std::move(message)};
    }

    static auto not_found(std::string subject) -> ReflectionError {
        return ReflectionError{Kind::NotFound, subject, "no such class or package: " + subject};
    }

    static auto malformed(std::string subject, std::string message) -> ReflectionError {
        return ReflectionError{Kind::Malformed, std::move(subject), std::move(message)};
    }

    [[nodiscard]] auto to_string() const -> std::string {
        switch (kind) {
        case Kind::TypeLoad:
            return "failed to load " + subject + ": " + message;
        case Kind::NotFound:
            return message;
        case Kind::Malformed:
            return "malformed reflection data for " + subject + ": " + message;
        }
        return message;
    }
};

/// The direct members of a package.
struct PackageListing {
    std::vector<std::string> classes;     ///< Binary names of top-level classes
    std::vector<std::string> subpackages; ///< Simple names of child packages
};

/// Read-only access to reflected Java classes and packages.
class ReflectionProvider {
public:
    virtual ~ReflectionProvider() = default;

    /// Lists the top-level classes and child packages of `package_name`.
    /// Fails with `NotFound` if the package does not exist.
    [[nodiscard]] virtual auto list_package(const std::string& package_name) const
        -> Result<PackageListing, ReflectionError> = 0;

    /// Loads a class by binary name, whatever its visibility.
    /// Nested classes are addressed as `pkg.Outer$Inner`.
    [[nodiscard]] virtual auto load_class(const std::string& binary_name) const
        -> Result<ClassRef, ReflectionError> = 0;

    /// Best-effort documentation lookup; never fails.
    [[nodiscard]] virtual auto documentation(const ClassInfo& cls) const
        -> std::optional<JavadocInfo> = 0;
};

} // namespace jstub::reflect

#endif // JSTUB_REFLECT_PROVIDER_HPP
