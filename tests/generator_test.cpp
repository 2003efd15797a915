//! # Generator Tests
//!
//! Package discovery, output layout and whole-tree generation into a
//! temporary directory.

#include "stubgen/generator.hpp"
#include "stubgen/interop_bindings.hpp"
#include "stubgen/output_writer.hpp"
#include "stubgen/package_walker.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>

using namespace jstub;
using namespace jstub::stubgen;
using namespace jstub::test;

namespace fs = std::filesystem;

namespace {

auto read_file(const fs::path& path) -> std::string {
    std::ifstream file(path, std::ios::binary);
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

auto contains(const std::string& text, const std::string& needle) -> bool {
    return text.find(needle) != std::string::npos;
}

} // namespace

// ============================================================================
// Package Walking
// ============================================================================

TEST(PackageWalkerTest, PseudoPackages) {
    reflect::PackageListing empty;
    reflect::PackageListing with_class;
    with_class.classes.push_back("a.Outer$1.X");

    EXPECT_TRUE(is_pseudo_package("a.b", empty));
    EXPECT_TRUE(is_pseudo_package("a.Outer$1", with_class));
    EXPECT_FALSE(is_pseudo_package("a.b", with_class));
}

TEST(PackageWalkerTest, WalkSkipsEmptyPackages) {
    reflect::ClassUniverse universe;
    load_classes(universe, R"([
        {"name": "org.demo.Widget", "modifiers": 1},
        {"name": "org.demo.sub.Part", "modifiers": 1}
    ])", R"(["org.demo.empty"])");

    auto walked = walk_packages(universe, "org.demo");
    ASSERT_TRUE(is_ok(walked));
    const auto& packages = unwrap(walked);
    EXPECT_EQ(packages.size(), 2u);
    EXPECT_EQ(packages.count("org.demo"), 1u);
    EXPECT_EQ(packages.count("org.demo.sub"), 1u);
    EXPECT_EQ(packages.count("org.demo.empty"), 0u);
}

TEST(PackageWalkerTest, UnknownRootFails) {
    reflect::ClassUniverse universe;
    EXPECT_TRUE(is_err(walk_packages(universe, "missing")));
}

TEST(PackageWalkerTest, PlanCoversEveryPrefix) {
    auto plan = plan_stub_paths({"a.b.c"}, "out", false);
    ASSERT_EQ(plan.paths.size(), 3u);
    EXPECT_EQ(plan.paths["a"].string(), (fs::path("out") / "a" / "__init__.pyi").string());
    EXPECT_EQ(plan.paths["a.b.c"].string(),
              (fs::path("out") / "a" / "b" / "c" / "__init__.pyi").string());
    EXPECT_EQ(plan.subpackages["a"], std::set<std::string>{"b"});
    EXPECT_TRUE(plan.subpackages["a.b.c"].empty());
}

TEST(PackageWalkerTest, PlanSuffixesTopLevelDirectory) {
    auto plan = plan_stub_paths({"java.util", "java.lang"}, "out", true);
    EXPECT_EQ(plan.paths["java"].string(), (fs::path("out") / "java-stubs" / "__init__.pyi").string());
    EXPECT_EQ(plan.paths["java.util"].string(),
              (fs::path("out") / "java-stubs" / "util" / "__init__.pyi").string());
    EXPECT_EQ(plan.subpackages["java"], (std::set<std::string>{"lang", "util"}));
}

// ============================================================================
// Package Stubs
// ============================================================================

TEST(PackageStubTest, RenderLayout) {
    PackageStub stub;
    stub.imports = {"import typing", "import java.lang"};
    stub.lines = {"", "class A: ..."};
    EXPECT_EQ(render_package_stub(stub), "import java.lang\nimport typing\n\n\n\nclass A: ...\n");
}

TEST(PackageStubTest, JavaPackageKeepsInteropNames) {
    reflect::ClassUniverse universe;
    load_classes(universe, with_java_lang(R"(
        {"name": "java.Foo", "modifiers": 1,
         "methods": [{"name": "set", "modifiers": 1, "signature": "(I)V", "parameters": ["x"]}]}
    )"));
    TypeTranslator translator(&universe);
    EmissionState state;

    auto stub = generate_package_stub(universe, translator, "java", {"java.Foo"}, {"lang"}, false,
                                      state);
    EXPECT_NE(std::find(stub.lines.begin(), stub.lines.end(),
                        "    def set(self, x: typing.Union[int, jint, java.lang.Integer]) -> None: ..."),
              stub.lines.end());
    EXPECT_EQ(std::find(stub.lines.begin(), stub.lines.end(), "class jint: ..."), stub.lines.end());
    EXPECT_EQ(state.placeholders, 0u);

    EXPECT_EQ(stub.imports.count("import java.lang"), 1u);
    EXPECT_TRUE(contains(stub.lines.back(), "__all__ = [\n    \"cast\","));
    EXPECT_TRUE(contains(stub.lines.back(), "    \"jchar\",\n]"));
    EXPECT_EQ(interop_names().size(), 19u);
}

// ============================================================================
// Whole Tree
// ============================================================================

class GeneratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        output_dir = fs::temp_directory_path() / "jstub_generator_test";
        fs::remove_all(output_dir);
        options.output_dir = output_dir;
        options.include_javadoc = false;

        load_classes(universe, with_java_lang(R"(
            {"name": "org.demo.Widget", "modifiers": 1,
             "methods": [{"name": "part", "modifiers": 1, "signature": "()Lorg/demo/sub/Part;"}]},
            {"name": "org.demo.sub.Part", "modifiers": 1},
            {"name": "org.demo.Broken", "error": "NoClassDefFoundError: gone/Dep"}
        )"), R"(["org.demo.empty"])");
    }

    void TearDown() override {
        fs::remove_all(output_dir);
    }

    reflect::ClassUniverse universe;
    GeneratorOptions options;
    fs::path output_dir;
};

TEST_F(GeneratorTest, WritesPackageTree) {
    auto result = generate_java_stubs(universe, {"org.demo"}, options);
    ASSERT_TRUE(is_ok(result)) << unwrap_err(result).to_string();
    const auto& summary = unwrap(result);
    EXPECT_EQ(summary.packages_written, 3u);
    EXPECT_EQ(summary.classes_emitted, 2u);
    EXPECT_EQ(summary.failures, 1u);

    auto root = output_dir / "org-stubs";
    EXPECT_EQ(read_file(root / "__init__.pyi"), "import org.demo\n\n\n");
    EXPECT_FALSE(fs::exists(root / "demo" / "empty"));

    auto demo = read_file(root / "demo" / "__init__.pyi");
    EXPECT_TRUE(contains(demo, "import org.demo.sub\n"));
    EXPECT_TRUE(contains(demo, "class Widget(java.lang.Object):\n"
                               "    def part(self) -> org.demo.sub.Part: ...\n"));
    EXPECT_FALSE(contains(demo, "class Broken"));

    auto sub = read_file(root / "demo" / "sub" / "__init__.pyi");
    EXPECT_TRUE(contains(sub, "\nclass Part(java.lang.Object): ...\n"));
}

TEST_F(GeneratorTest, OutputIsIdempotent) {
    ASSERT_TRUE(is_ok(generate_java_stubs(universe, {"org.demo"}, options)));
    auto first = read_file(output_dir / "org-stubs" / "demo" / "__init__.pyi");
    ASSERT_TRUE(is_ok(generate_java_stubs(universe, {"org.demo"}, options)));
    auto second = read_file(output_dir / "org-stubs" / "demo" / "__init__.pyi");
    EXPECT_FALSE(first.empty());
    EXPECT_EQ(first, second);
}

TEST_F(GeneratorTest, WithoutStubsSuffix) {
    options.use_stubs_suffix = false;
    ASSERT_TRUE(is_ok(generate_java_stubs(universe, {"org.demo.sub"}, options)));
    EXPECT_TRUE(fs::exists(output_dir / "org" / "demo" / "sub" / "__init__.pyi"));
    EXPECT_TRUE(fs::exists(output_dir / "org" / "__init__.pyi"));
}

TEST_F(GeneratorTest, JavaPackageGetsInteropModules) {
    auto result = generate_java_stubs(universe, {"java"}, options);
    ASSERT_TRUE(is_ok(result));

    auto java_dir = output_dir / "java-stubs";
    EXPECT_EQ(read_file(java_dir / "chaquopy.pyi"), chaquopy_module_text());
    EXPECT_EQ(read_file(java_dir / "primitive.pyi"), primitive_module_text());

    auto init = read_file(java_dir / "__init__.pyi");
    EXPECT_TRUE(init.starts_with("from java.chaquopy import (\n    cast,\n"));
    EXPECT_TRUE(contains(init, "import java.lang\n"));

    auto lang = read_file(java_dir / "lang" / "__init__.pyi");
    EXPECT_TRUE(contains(lang, "class Object:\n"));
    EXPECT_TRUE(contains(lang, "class Runnable:\n"));
}

TEST_F(GeneratorTest, UnknownRootIsFatal) {
    auto result = generate_java_stubs(universe, {"org.demo", "nope"}, options);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).path, "nope");
    EXPECT_TRUE(contains(unwrap_err(result).message, "cannot enumerate root package"));
}

TEST_F(GeneratorTest, UnwritableOutputIsReported) {
    // A regular file where the output directory should be
    fs::create_directories(output_dir);
    std::ofstream(output_dir / "org-stubs") << "not a directory";

    auto result = generate_java_stubs(universe, {"org.demo"}, options);
    EXPECT_TRUE(is_err(result));
}
