//! # Package Scheduler
//!
//! Orders the top-level classes of one package so that every class is
//! declared after the in-package supertypes it names in its class
//! statement.
//!
//! ## Algorithm
//!
//! ```text
//! while queue not empty:
//!     ready = classes whose in-package supertypes (and those of their
//!             public nested classes) are emitted
//!     if ready is empty: ready = queue        # cycle fallback
//!     emit ready sorted by name
//!     for each referenced-but-missing class of this package:
//!         loadable      -> queue it
//!         otherwise     -> empty placeholder
//! ```
//!
//! The fallback pass guarantees termination for `A extends B`,
//! `B extends A`; the later class then refers to the earlier one through
//! its qualified name.

#ifndef JSTUB_STUBGEN_SCHEDULER_HPP
#define JSTUB_STUBGEN_SCHEDULER_HPP

#include "reflect/provider.hpp"
#include "stubgen/class_emitter.hpp"
#include "stubgen/emission_state.hpp"
#include "stubgen/type_translator.hpp"

#include <set>
#include <string>
#include <vector>

namespace jstub::stubgen {

/// Counters of one scheduler run.
struct ScheduleStats {
    size_t passes = 0;
    size_t fallback_passes = 0;
    size_t fallback_classes = 0;
    size_t resolved_missing = 0;
};

class PackageScheduler {
public:
    PackageScheduler(const reflect::ReflectionProvider& provider, const TypeTranslator& translator,
                     ClassEmitter& emitter, EmissionState& state);

    /// Names of the package that are defined by other means and must never
    /// be replaced by a placeholder.
    void set_excluded_names(std::set<std::string> names) {
        excluded_ = std::move(names);
    }

    /// Loads and emits the classes named in `class_names` (binary names),
    /// appending the stub lines to `out`. Classes that fail to load are
    /// logged and recorded in the failed set.
    auto run(const std::vector<std::string>& class_names, std::vector<std::string>& out)
        -> ScheduleStats;

    /// True when every supertype of `cls` that lives in this package has
    /// been emitted, checked recursively for its public nested classes.
    [[nodiscard]] auto dependencies_satisfied(const reflect::ClassInfo& cls) const -> bool;

private:
    /// Local names referenced in this package but neither emitted nor
    /// excluded.
    [[nodiscard]] auto missing_classes() const -> std::vector<std::string>;

    const reflect::ReflectionProvider& provider_;
    const TypeTranslator& translator_;
    ClassEmitter& emitter_;
    EmissionState& state_;
    std::set<std::string> excluded_;
};

} // namespace jstub::stubgen

#endif // JSTUB_STUBGEN_SCHEDULER_HPP
