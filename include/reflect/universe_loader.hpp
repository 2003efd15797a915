//! # Reflection Dump Loader
//!
//! Fills a `ClassUniverse` from JSON reflection dumps written by the
//! Java-side agent. One dump holds any number of classes; several dumps
//! may be loaded into the same universe (later registrations win).
//!
//! ## Dump Layout
//!
//! ```json
//! { "format": "jstub-reflection/1",
//!   "packages": ["com.example.empty"],
//!   "classes": [ { "name": "com.example.Box", "modifiers": 1,
//!                  "signature": "<T:Ljava/lang/Object;>Ljava/lang/Object;",
//!                  "methods": [ { "name": "get", "modifiers": 1, "signature": "()TT;" } ] } ],
//!   "javadoc": { "com.example.Box": { "description": "A box." } } }
//! ```
//!
//! Generic types use the JVM signature grammar (see `signature_parser.hpp`).
//! A class carrying an `"error"` member is registered as a load failure.
//! The top-level `"javadoc"` map attaches documentation to classes by
//! binary name, including classes defined in another dump.
//!
//! ## Binding
//!
//! Type variables are bound once every dump has been read, so an inherited
//! method resolves its variables against the declaring class wherever
//! that class was dumped. A class whose signatures do not parse becomes a
//! load failure; only a dump that is not a dump at all is an error.
//!
//! ```cpp
//! UniverseLoader loader(universe);
//! for (const auto& path : dumps) {
//!     auto read = loader.add_dump_file(path);
//!     if (is_err(read)) { ... }
//! }
//! loader.finish();
//! ```

#ifndef JSTUB_REFLECT_UNIVERSE_LOADER_HPP
#define JSTUB_REFLECT_UNIVERSE_LOADER_HPP

#include "json/json_value.hpp"
#include "reflect/class_universe.hpp"
#include "reflect/signature_parser.hpp"

#include <deque>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace jstub::reflect {

/// Format tag every dump must carry.
constexpr const char* DUMP_FORMAT = "jstub-reflection/1";

/// Counts reported by `UniverseLoader::finish`.
struct LoadSummary {
    size_t classes = 0;  ///< Classes registered
    size_t failures = 0; ///< Entries registered as load failures
};

/// Reads any number of dumps, then binds and registers their classes.
///
/// The loader must not outlive the universe it fills.
class UniverseLoader {
public:
    explicit UniverseLoader(ClassUniverse& universe) : universe_(universe) {}

    /// Parses one dump held in memory and queues its classes. `source`
    /// names the dump in errors. Returns the number of class entries read.
    [[nodiscard]] auto add_dump(std::string_view json, const std::string& source = "<memory>")
        -> Result<size_t, ReflectionError>;

    /// Reads one dump file and queues its classes.
    [[nodiscard]] auto add_dump_file(const std::string& path) -> Result<size_t, ReflectionError>;

    /// Binds every queued class and registers it with the universe.
    /// Classes registered by earlier calls stay visible to later ones.
    auto finish() -> LoadSummary;

private:
    struct Pending {
        const json::JsonValue* entry;
        std::string name;
        std::string source;
    };

    struct Header {
        Rc<ClassInfo> cls;
        const json::JsonValue* entry;
        const TypeScope* scope;
    };

    auto read_header(const Pending& pending) -> Result<Header, std::string>;
    auto read_members(const Header& header) -> Result<bool, std::string>;
    auto read_method(const json::JsonValue& entry, const ClassInfo& cls, const TypeScope& scope,
                     bool is_constructor) -> Result<MethodInfo, std::string>;

    ClassUniverse& universe_;
    std::vector<Box<json::JsonValue>> documents_;
    std::vector<Pending> pending_;
    std::deque<TypeScope> scope_arena_;
    std::map<std::string, const TypeScope*> scopes_;
};

/// Loads one dump held in memory and binds it on its own.
/// Returns the number of class entries read.
[[nodiscard]] auto load_universe(std::string_view json, ClassUniverse& universe,
                                 const std::string& source = "<memory>")
    -> Result<size_t, ReflectionError>;

/// Reads and loads one dump file on its own.
[[nodiscard]] auto load_universe_file(const std::string& path, ClassUniverse& universe)
    -> Result<size_t, ReflectionError>;

} // namespace jstub::reflect

#endif // JSTUB_REFLECT_UNIVERSE_LOADER_HPP
