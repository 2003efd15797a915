//! # Package Scheduler Tests
//!
//! Declaration order within one package, cycles and missing classes.

#include "stubgen/scheduler.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <map>
#include <optional>
#include <set>

using namespace jstub;
using namespace jstub::stubgen;
using namespace jstub::test;

using Lines = std::vector<std::string>;

/// Counts class loads while delegating to a universe.
class CountingProvider : public reflect::ReflectionProvider {
public:
    explicit CountingProvider(const reflect::ClassUniverse& universe) : universe_(universe) {}

    auto list_package(const std::string& package_name) const
        -> Result<reflect::PackageListing, reflect::ReflectionError> override {
        return universe_.list_package(package_name);
    }

    auto load_class(const std::string& binary_name) const
        -> Result<reflect::ClassRef, reflect::ReflectionError> override {
        ++loads[binary_name];
        return universe_.load_class(binary_name);
    }

    auto documentation(const reflect::ClassInfo& cls) const
        -> std::optional<reflect::JavadocInfo> override {
        return universe_.documentation(cls);
    }

    mutable std::map<std::string, int> loads;

private:
    const reflect::ClassUniverse& universe_;
};

class SchedulerTest : public ::testing::Test {
protected:
    void load(std::string_view extra) {
        load_classes(universe, with_java_lang(extra));
    }

    auto run(const std::vector<std::string>& names, std::set<std::string> excluded = {})
        -> ScheduleStats {
        ClassEmitter emitter(universe, translator, "p", false, state);
        PackageScheduler scheduler(universe, translator, emitter, state);
        scheduler.set_excluded_names(std::move(excluded));
        return scheduler.run(names, out);
    }

    /// Position of the first line equal to `line`, or -1.
    auto position(const std::string& line) const -> long {
        auto it = std::find(out.begin(), out.end(), line);
        return it == out.end() ? -1 : static_cast<long>(it - out.begin());
    }

    reflect::ClassUniverse universe;
    TypeTranslator translator{&universe};
    EmissionState state;
    Lines out;
};

TEST_F(SchedulerTest, SupertypeIsDeclaredFirst) {
    load(R"(
        {"name": "p.A", "modifiers": 1, "signature": "Lp/Z;"},
        {"name": "p.Z", "modifiers": 1}
    )");

    auto stats = run({"p.A", "p.Z"});
    EXPECT_EQ(out, (Lines{"", "class Z(java.lang.Object): ...", "", "class A(Z): ..."}));
    EXPECT_EQ(stats.passes, 2u);
    EXPECT_EQ(stats.fallback_passes, 0u);
}

TEST_F(SchedulerTest, CycleFallsBackToNameOrder) {
    load(R"(
        {"name": "p.A", "modifiers": 1, "signature": "Lp/B;"},
        {"name": "p.B", "modifiers": 1, "signature": "Lp/A;"}
    )");

    auto stats = run({"p.B", "p.A"});
    EXPECT_EQ(out, (Lines{"", "class A(p.B): ...", "", "class B(A): ..."}));
    EXPECT_EQ(stats.fallback_passes, 1u);
    EXPECT_EQ(stats.fallback_classes, 2u);
    EXPECT_EQ(state.classes_emitted, 2u);
}

TEST_F(SchedulerTest, NestedClassSupertypesCount) {
    load(R"(
        {"name": "p.Aaa", "modifiers": 1, "member_classes": ["p.Aaa$In"]},
        {"name": "p.Aaa$In", "modifiers": 9, "signature": "Lp/Zed;"},
        {"name": "p.Zed", "modifiers": 1}
    )");

    run({"p.Aaa", "p.Zed"});
    auto zed = position("class Zed(java.lang.Object): ...");
    auto aaa = position("class Aaa(java.lang.Object):");
    ASSERT_GE(zed, 0);
    ASSERT_GE(aaa, 0);
    EXPECT_LT(zed, aaa);
    EXPECT_GE(position("    class In(Zed): ..."), 0);
}

TEST_F(SchedulerTest, MissingClassGetsPlaceholder) {
    load(R"(
        {"name": "p.User", "modifiers": 1,
         "methods": [{"name": "helper", "modifiers": 1, "signature": "()Lp/Helper;"}]}
    )");

    run({"p.User"});
    EXPECT_EQ(out, (Lines{
                       "",
                       "class User(java.lang.Object):",
                       "    def helper(self) -> Helper: ...",
                       "",
                       "class Helper: ...",
                   }));
    EXPECT_EQ(state.placeholders, 1u);
}

TEST_F(SchedulerTest, UnlistedClassIsResolvedByName) {
    load(R"(
        {"name": "p.User", "modifiers": 1,
         "methods": [{"name": "internal", "modifiers": 1, "signature": "()Lp/Internal;"}]},
        {"name": "p.Internal", "modifiers": 0}
    )");

    auto stats = run({"p.User"});
    EXPECT_EQ(stats.resolved_missing, 1u);
    EXPECT_GE(position("class Internal(java.lang.Object): ..."), 0);
    EXPECT_EQ(state.placeholders, 0u);
}

TEST_F(SchedulerTest, FailedClassIsSkippedAndPlaceholdered) {
    load(R"(
        {"name": "p.Broken", "error": "ExceptionInInitializerError"},
        {"name": "p.User", "modifiers": 1,
         "methods": [{"name": "broken", "modifiers": 1, "signature": "()Lp/Broken;"}]}
    )");

    run({"p.Broken", "p.User"});
    EXPECT_EQ(state.failed.count("Broken"), 1u);
    EXPECT_GE(position("class Broken: ..."), 0);
    EXPECT_EQ(state.classes_emitted, 1u);
}

TEST_F(SchedulerTest, FailedClassesAreLoadedOnce) {
    load(R"(
        {"name": "p.Broken", "error": "ExceptionInInitializerError"},
        {"name": "p.Outer", "modifiers": 1, "member_classes": ["p.Outer$Gone"],
         "methods": [
            {"name": "broken", "modifiers": 1, "signature": "()Lp/Broken;"},
            {"name": "gone", "modifiers": 1, "signature": "()Lp/Outer$Gone;"}
         ]},
        {"name": "p.Outer$Gone", "error": "NoClassDefFoundError: q/Missing"}
    )");

    CountingProvider counting(universe);
    ClassEmitter emitter(counting, translator, "p", false, state);
    PackageScheduler scheduler(counting, translator, emitter, state);
    scheduler.run({"p.Broken", "p.Outer"}, out);

    EXPECT_EQ(counting.loads["p.Broken"], 1);
    EXPECT_EQ(counting.loads["p.Outer$Gone"], 1);
    EXPECT_EQ(state.failed, (std::set<std::string>{"Broken", "Outer$Gone"}));
    EXPECT_EQ(out, (Lines{
                       "",
                       "class Outer(java.lang.Object):",
                       "    def broken(self) -> Broken: ...",
                       "    def gone(self) -> Outer.Gone: ...",
                       "    class Gone: ...",
                       "",
                       "class Broken: ...",
                   }));
}

TEST_F(SchedulerTest, ExcludedNamesAreNeverPlaceholdered) {
    load(R"(
        {"name": "p.User", "modifiers": 1,
         "methods": [{"name": "helper", "modifiers": 1, "signature": "()Lp/Helper;"}]}
    )");

    run({"p.User"}, {"Helper"});
    EXPECT_EQ(position("class Helper: ..."), -1);
    EXPECT_EQ(state.placeholders, 0u);
}

TEST_F(SchedulerTest, EmptyPackage) {
    auto stats = run({});
    EXPECT_TRUE(out.empty());
    EXPECT_EQ(stats.passes, 0u);
}
