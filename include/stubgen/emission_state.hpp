//! # Emission State
//!
//! Mutable bookkeeping for generating one package file. A single instance
//! is passed by reference through the scheduler, the class emitter and
//! every nested-class recursion, so that a class emitted by one branch is
//! immediately visible to its siblings.
//!
//! ## Name Forms
//!
//! | Set | Holds | Example |
//! |-----|-------|---------|
//! | `emitted` | local binary names | `Map$Entry` |
//! | `referenced` | mangled qualified names | `java.util.Map$Entry` |
//! | `failed` | local binary names | `Broken` |
//!
//! `emitted` only grows, and a class enters it only once its declaration,
//! nested classes included, is complete.

#ifndef JSTUB_STUBGEN_EMISSION_STATE_HPP
#define JSTUB_STUBGEN_EMISSION_STATE_HPP

#include <set>
#include <string>

namespace jstub::stubgen {

struct EmissionState {
    std::set<std::string> emitted;
    std::set<std::string> referenced;
    std::set<std::string> failed;
    /// Import lines for the package file, kept sorted and unique.
    std::set<std::string> imports;

    size_t classes_emitted = 0;
    size_t placeholders = 0;

    void add_import(std::string line) {
        imports.insert(std::move(line));
    }

    [[nodiscard]] auto is_emitted(const std::string& local_name) const -> bool {
        return emitted.count(local_name) > 0;
    }

    /// A failed class is never loaded again while generating this package.
    [[nodiscard]] auto is_failed(const std::string& local_name) const -> bool {
        return failed.count(local_name) > 0;
    }
};

} // namespace jstub::stubgen

#endif // JSTUB_STUBGEN_EMISSION_STATE_HPP
