#include "stubgen/scheduler.hpp"

#include "log/log.hpp"
#include "stubgen/identifiers.hpp"

#include <algorithm>

namespace jstub::stubgen {

using reflect::ClassInfo;
using reflect::ClassRef;

PackageScheduler::PackageScheduler(const reflect::ReflectionProvider& provider,
                                   const TypeTranslator& translator, ClassEmitter& emitter,
                                   EmissionState& state)
    : provider_(provider), translator_(translator), emitter_(emitter), state_(state) {}

auto PackageScheduler::dependencies_satisfied(const ClassInfo& cls) const -> bool {
    std::vector<reflect::JavaTypeRef> supers;
    if (cls.generic_superclass) {
        supers.push_back(*cls.generic_superclass);
    }
    supers.insert(supers.end(), cls.generic_interfaces.begin(), cls.generic_interfaces.end());

    for (const auto& super : supers) {
        auto name = translator_.translate(super, {}).name;
        auto dot = name.rfind('.');
        if (dot == std::string::npos) {
            continue;
        }
        if (name.substr(0, dot) == emitter_.package() && !state_.is_emitted(name.substr(dot + 1))) {
            return false;
        }
    }

    for (const auto& member_name : cls.member_classes) {
        auto local = reflect::split_package(member_name).second;
        if (state_.is_failed(local)) {
            continue;
        }
        auto loaded = provider_.load_class(member_name);
        if (is_err(loaded)) {
            JSTUB_LOG_WARN("scheduler", "skipping nested class " << member_name << ": "
                                                                 << unwrap_err(loaded).to_string());
            state_.failed.insert(local);
            continue;
        }
        const auto& member = unwrap(loaded);
        if (member->is_public() && is_declarable_class(*member) &&
            !dependencies_satisfied(*member)) {
            return false;
        }
    }
    return true;
}

auto PackageScheduler::missing_classes() const -> std::vector<std::string> {
    const std::string package = pysafe_package_path(emitter_.package());
    std::vector<std::string> missing;
    for (const auto& ref : state_.referenced) {
        auto dot = ref.rfind('.');
        if (dot == std::string::npos || ref.substr(0, dot) != package) {
            continue;
        }
        auto local = ref.substr(dot + 1);
        if (local.find('$') != std::string::npos || state_.is_emitted(local) ||
            excluded_.count(local) > 0) {
            continue;
        }
        missing.push_back(local);
    }
    return missing;
}

auto PackageScheduler::run(const std::vector<std::string>& class_names,
                           std::vector<std::string>& out) -> ScheduleStats {
    ScheduleStats stats;
    const std::string& package = emitter_.package();

    std::vector<ClassRef> queue;
    for (const auto& name : class_names) {
        auto loaded = provider_.load_class(name);
        if (is_err(loaded)) {
            JSTUB_LOG_WARN("scheduler", "Skipping " << name << ": "
                                                    << unwrap_err(loaded).to_string());
            state_.failed.insert(reflect::split_package(name).second);
            continue;
        }
        queue.push_back(unwrap(loaded));
    }

    auto by_name = [](const ClassRef& a, const ClassRef& b) { return a->name < b->name; };

    while (!queue.empty()) {
        ++stats.passes;
        std::vector<ClassRef> ready;
        for (const auto& cls : queue) {
            if (dependencies_satisfied(*cls)) {
                ready.push_back(cls);
            }
        }
        if (ready.empty()) {
            ++stats.fallback_passes;
            stats.fallback_classes += queue.size();
            JSTUB_LOG_DEBUG("scheduler", "no class of " << package << " is ready, emitting "
                                                        << queue.size() << " in fallback order");
            ready = queue;
        }
        std::sort(ready.begin(), ready.end(), by_name);

        for (const auto& cls : ready) {
            emitter_.emit_top_level(*cls, out);
            queue.erase(std::remove(queue.begin(), queue.end(), cls), queue.end());
        }

        for (const auto& local : missing_classes()) {
            if (!state_.is_failed(local)) {
                auto loaded = provider_.load_class(package + "." + local);
                if (is_ok(loaded)) {
                    const auto& cls = unwrap(loaded);
                    bool queued = std::any_of(queue.begin(), queue.end(), [&](const ClassRef& c) {
                        return c->name == cls->name;
                    });
                    if (!queued) {
                        JSTUB_LOG_DEBUG("scheduler", "resolved referenced class " << cls->name);
                        queue.push_back(cls);
                        ++stats.resolved_missing;
                    }
                    continue;
                }
                JSTUB_LOG_WARN("scheduler", "Skipping missing class "
                                                << local << " due to "
                                                << unwrap_err(loaded).to_string());
            }
            JSTUB_LOG_WARN("scheduler", "reference to missing class "
                                            << package << "." << local
                                            << " - generating empty stub");
            out.emplace_back("");
            emitter_.emit_placeholder(local, out);
        }
    }
    return stats;
}

} // namespace jstub::stubgen
