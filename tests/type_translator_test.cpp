//! # Type Translator Tests
//!
//! Java types to target type expressions, checked through the debug
//! rendering of `TypeExpr`.

#include "reflect/class_universe.hpp"
#include "reflect/signature_parser.hpp"
#include "stubgen/type_translator.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace jstub;
using namespace jstub::stubgen;
using namespace jstub::test;
using reflect::JavaType;
using reflect::JavaTypeRef;

namespace {

auto field_type(const std::string& signature) -> JavaTypeRef {
    auto result = reflect::parse_field_signature(signature, nullptr);
    EXPECT_TRUE(is_ok(result)) << signature;
    return is_ok(result) ? unwrap(result) : JavaType::make_class("java.lang.Object");
}

} // namespace

class TypeTranslatorTest : public ::testing::Test {
protected:
    auto arg(const std::string& signature) -> std::string {
        return translator.translate(field_type(signature), {}, true).to_string();
    }

    auto ret(const std::string& signature) -> std::string {
        return translator.translate(field_type(signature), {}).to_string();
    }

    TypeTranslator translator;
};

// ============================================================================
// Fixed Mappings
// ============================================================================

TEST_F(TypeTranslatorTest, PrimitivesWidenOnlyAsArguments) {
    EXPECT_EQ(arg("I"), "typing.Union[int, java.jint, java.lang.Integer]");
    EXPECT_EQ(ret("I"), "int");
    EXPECT_EQ(arg("Z"), "typing.Union[bool, java.jboolean, java.lang.Boolean]");
    EXPECT_EQ(ret("D"), "float");
    EXPECT_EQ(ret("C"), "str");
}

TEST_F(TypeTranslatorTest, BoxedTypesMapLikePrimitives) {
    EXPECT_EQ(ret("Ljava/lang/Long;"), "int");
    EXPECT_EQ(arg("Ljava/lang/Long;"), "typing.Union[int, java.jlong, java.lang.Long]");
}

TEST_F(TypeTranslatorTest, StringObjectAndClass) {
    EXPECT_EQ(ret("Ljava/lang/String;"), "str");
    EXPECT_EQ(arg("Ljava/lang/String;"), "typing.Union[str, java.lang.String]");
    EXPECT_EQ(ret("Ljava/lang/Object;"), "java.lang.Object");
    EXPECT_EQ(arg("Ljava/lang/Object;"), "typing.Union[java.lang.Object, int, bool, float, str]");
    EXPECT_EQ(ret("Ljava/lang/Class<Ljava/lang/Number;>;"), "typing.Type[java.lang.Number]");
}

TEST_F(TypeTranslatorTest, VoidAndConstructorReturn) {
    EXPECT_EQ(translator.translate(JavaType::make_class("void"), {}).to_string(), "None");
    EXPECT_EQ(translator.translate(nullptr, {}).to_string(), "None");
}

TEST_F(TypeTranslatorTest, Arrays) {
    EXPECT_EQ(ret("[I"), "java.chaquopy.JavaArrayJInt");
    EXPECT_EQ(arg("[I"), "java.chaquopy.JavaArrayJInt");
    EXPECT_EQ(ret("[Ljava/lang/String;"), "java.chaquopy.JavaArray[java.lang.String]");
    EXPECT_EQ(ret("[[J"), "java.chaquopy.JavaArray[java.chaquopy.JavaArrayJLong]");
    EXPECT_EQ(arg("[Ljava/lang/Object;"), "java.chaquopy.JavaArray[java.lang.Object]");
}

TEST_F(TypeTranslatorTest, ParameterizedTypes) {
    EXPECT_EQ(ret("Ljava/util/Map<Ljava/lang/String;[I>;"),
              "java.util.Map[str, java.chaquopy.JavaArrayJInt]");
    EXPECT_EQ(ret("Ljava/util/List<+Ljava/lang/Number;>;"), "java.util.List[java.lang.Number]");
    EXPECT_EQ(ret("Ljava/util/List<-Ljava/lang/Integer;>;"), "java.util.List[int]");
    EXPECT_EQ(ret("Ljava/util/List<*>;"), "java.util.List[java.lang.Object]");
}

TEST_F(TypeTranslatorTest, NestedClassKeepsBinaryName) {
    EXPECT_EQ(ret("Ljava/util/Map$Entry;"), "java.util.Map$Entry");
}

// ============================================================================
// Type Variables
// ============================================================================

TEST_F(TypeTranslatorTest, ScopedVariableUsesGeneratedName) {
    std::vector<TypeVariable> scope = {TypeVariable{"T", "_get__T", std::nullopt},
                                       TypeVariable{"T", "_Box__T", std::nullopt}};
    auto type = JavaType::make_type_variable("T", {});
    EXPECT_EQ(translator.translate(type, scope).to_string(), "_get__T");
}

TEST_F(TypeTranslatorTest, OutOfScopeVariableFallsBackToErasedBound) {
    reflect::TypeScope scope;
    auto cls = reflect::parse_class_signature(
        "<T:Ljava/lang/Comparable<TT;>;U:Ljava/lang/Object;>Ljava/lang/Object;", scope);
    ASSERT_TRUE(is_ok(cls));

    auto t = reflect::parse_field_signature("TT;", &scope);
    auto u = reflect::parse_field_signature("TU;", &scope);
    ASSERT_TRUE(is_ok(t));
    ASSERT_TRUE(is_ok(u));
    EXPECT_EQ(translator.translate(unwrap(t), {}).to_string(), "java.lang.Comparable");
    EXPECT_EQ(translator.translate(unwrap(u), {}).to_string(), "java.lang.Object");
}

TEST_F(TypeTranslatorTest, TypeVariableDeclaration) {
    reflect::TypeScope scope;
    auto cls = reflect::parse_class_signature(
        "<T:Ljava/lang/Comparable<TT;>;U:Ljava/lang/Object;>Ljava/lang/Object;", scope);
    ASSERT_TRUE(is_ok(cls));
    const auto& params = unwrap(cls).type_parameters;

    auto t = translator.make_type_variable(*params[0], "Outer__Inner");
    EXPECT_EQ(t.generated_name, "_Outer__Inner__T");
    ASSERT_TRUE(t.bound.has_value());
    EXPECT_EQ(t.bound->to_string(), "java.lang.Comparable");

    auto u = translator.make_type_variable(*params[1], "Outer__Inner");
    EXPECT_FALSE(u.bound.has_value());
}

// ============================================================================
// Functional Interfaces
// ============================================================================

class FunctionalInterfaceTest : public ::testing::Test {
protected:
    void SetUp() override {
        load_classes(universe, with_java_lang(R"(
            {"name": "f.BiFunc", "kind": "interface", "modifiers": 1537,
             "signature": "<T1:Ljava/lang/Object;T2:Ljava/lang/Object;R:Ljava/lang/Object;>Ljava/lang/Object;",
             "methods": [{"name": "apply", "modifiers": 1025, "signature": "(TT1;TT2;)TR;"}]},
            {"name": "f.Comparing", "kind": "interface", "modifiers": 1537,
             "methods": [
                {"name": "compare", "modifiers": 1025, "signature": "(II)I"},
                {"name": "equals", "modifiers": 1025, "signature": "(Ljava/lang/Object;)Z"},
                {"name": "reversed", "modifiers": 1, "signature": "()Lf/Comparing;"}
             ]},
            {"name": "f.TwoMethods", "kind": "interface", "modifiers": 1537,
             "methods": [
                {"name": "a", "modifiers": 1025, "signature": "()V"},
                {"name": "b", "modifiers": 1025, "signature": "()V"}
             ]},
            {"name": "f.Plain", "modifiers": 1}
        )"));
    }

    auto arg(const std::string& signature) -> std::string {
        return translator.translate(field_type(signature), {}, true).to_string();
    }

    reflect::ClassUniverse universe;
    TypeTranslator translator{&universe};
};

TEST_F(FunctionalInterfaceTest, ArgumentAcceptsCallable) {
    EXPECT_EQ(arg("Ljava/lang/Runnable;"),
              "typing.Union[java.lang.Runnable, typing.Callable[[], None]]");
}

TEST_F(FunctionalInterfaceTest, TypeArgumentsSubstitutePositionally) {
    EXPECT_EQ(arg("Lf/BiFunc<Lf/Plain;Ljava/lang/Long;Ljava/lang/String;>;"),
              "typing.Union[f.BiFunc[f.Plain, typing.Union[int, java.jlong, java.lang.Long], "
              "typing.Union[str, java.lang.String]], "
              "typing.Callable[[f.Plain, int], str]]");
}

TEST_F(FunctionalInterfaceTest, RawInterfaceUsesBounds) {
    EXPECT_EQ(arg("Lf/BiFunc;"),
              "typing.Union[f.BiFunc, typing.Callable[[java.lang.Object, java.lang.Object], "
              "java.lang.Object]]");
}

TEST_F(FunctionalInterfaceTest, ObjectMethodsAndDefaultsDoNotCount) {
    EXPECT_EQ(arg("Lf/Comparing;"), "typing.Union[f.Comparing, typing.Callable[[int, int], int]]");
}

TEST_F(FunctionalInterfaceTest, NonFunctionalTypesStayPlain) {
    EXPECT_EQ(arg("Lf/TwoMethods;"), "f.TwoMethods");
    EXPECT_EQ(arg("Lf/Plain;"), "f.Plain");
    EXPECT_EQ(arg("Lf/Unknown;"), "f.Unknown");
}

TEST_F(FunctionalInterfaceTest, ReturnPositionNeverWidens) {
    EXPECT_EQ(translator.translate(field_type("Ljava/lang/Runnable;"), {}).to_string(),
              "java.lang.Runnable");
}

TEST_F(FunctionalInterfaceTest, ArrayElementsNeverWiden) {
    EXPECT_EQ(arg("[Ljava/lang/Runnable;"), "java.chaquopy.JavaArray[java.lang.Runnable]");
}
