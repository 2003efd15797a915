#include "reflect/class_universe.hpp"

#include "log/log.hpp"

namespace jstub::reflect {

void ClassUniverse::add_package(const std::string& package_name) {
    if (package_name.empty()) {
        return;
    }
    std::string current = package_name;
    while (true) {
        packages_[current];
        auto dot = current.rfind('.');
        if (dot == std::string::npos) {
            break;
        }
        std::string parent = current.substr(0, dot);
        packages_[parent].subpackages.insert(current.substr(dot + 1));
        current = parent;
    }
}

void ClassUniverse::register_class_name(const std::string& binary_name) {
    auto [package_name, local] = split_package(binary_name);
    add_package(package_name);
    // Nested classes are reached through their outer class only
    if (local.find('$') == std::string::npos) {
        packages_[package_name].classes.insert(binary_name);
    }
}

void ClassUniverse::add_class(ClassRef cls) {
    std::string name = cls->name;
    register_class_name(name);
    failures_.erase(name);
    classes_[name] = std::move(cls);
}

void ClassUniverse::add_failure(const std::string& binary_name, std::string message) {
    register_class_name(binary_name);
    classes_.erase(binary_name);
    failures_[binary_name] = std::move(message);
}

void ClassUniverse::add_documentation(const std::string& binary_name, JavadocInfo doc) {
    docs_[binary_name] = std::move(doc);
}

auto ClassUniverse::list_package(const std::string& package_name) const
    -> Result<PackageListing, ReflectionError> {
    auto it = packages_.find(package_name);
    if (it == packages_.end()) {
        return ReflectionError::not_found(package_name);
    }

    PackageListing listing;
    for (const auto& name : it->second.classes) {
        auto cls = classes_.find(name);
        // Non-public classes stay loadable by name but are not listed
        if (cls != classes_.end() && !cls->second->is_public()) {
            continue;
        }
        listing.classes.push_back(name);
    }
    listing.subpackages.assign(it->second.subpackages.begin(), it->second.subpackages.end());
    return listing;
}

auto ClassUniverse::load_class(const std::string& binary_name) const
    -> Result<ClassRef, ReflectionError> {
    if (auto it = classes_.find(binary_name); it != classes_.end()) {
        return it->second;
    }
    if (auto it = failures_.find(binary_name); it != failures_.end()) {
        JSTUB_LOG_TRACE("reflect", "load of " << binary_name << " fails: " << it->second);
        return ReflectionError::type_load(binary_name, it->second);
    }
    return ReflectionError::not_found(binary_name);
}

auto ClassUniverse::documentation(const ClassInfo& cls) const -> std::optional<JavadocInfo> {
    if (auto it = docs_.find(cls.name); it != docs_.end()) {
        return it->second;
    }
    return cls.javadoc;
}

} // namespace jstub::reflect
