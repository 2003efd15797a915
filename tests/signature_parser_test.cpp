//! # Signature Parser Tests
//!
//! JVM generic signatures into `JavaType` trees, including type variable
//! binding across class and method scopes.

#include "reflect/signature_parser.hpp"

#include <gtest/gtest.h>

using namespace jstub;
using namespace jstub::reflect;

// ============================================================================
// Field Signatures
// ============================================================================

TEST(SignatureParserTest, PrimitivesAndArrays) {
    auto result = parse_field_signature("[[I", nullptr);
    ASSERT_TRUE(is_ok(result));
    const auto& type = unwrap(result);
    EXPECT_EQ(type->kind, JavaTypeKind::Array);
    EXPECT_EQ(type->type_name(), "int[][]");
    EXPECT_EQ(type->component()->component()->name, "int");
}

TEST(SignatureParserTest, ParameterizedWithWildcards) {
    auto result = parse_field_signature(
        "Ljava/util/Map<+Ljava/lang/Number;-Ljava/lang/Integer;>;", nullptr);
    ASSERT_TRUE(is_ok(result));
    const auto& type = unwrap(result);
    EXPECT_EQ(type->kind, JavaTypeKind::Parameterized);
    EXPECT_EQ(type->name, "java.util.Map");
    EXPECT_EQ(type->type_name(),
              "java.util.Map<? extends java.lang.Number, ? super java.lang.Integer>");
    EXPECT_EQ(type->erasure(), "java.util.Map");
}

TEST(SignatureParserTest, UnboundedWildcard) {
    auto result = parse_field_signature("Ljava/util/List<*>;", nullptr);
    ASSERT_TRUE(is_ok(result));
    const auto& arg = unwrap(result)->args.front();
    EXPECT_EQ(arg->kind, JavaTypeKind::Wildcard);
    EXPECT_EQ(arg->type_name(), "?");
}

TEST(SignatureParserTest, InnerClassOfParameterizedOuter) {
    auto result = parse_field_signature(
        "Ljava/util/Map<Ljava/lang/String;Ljava/lang/Long;>.Entry<Ljava/lang/String;Ljava/lang/Long;>;",
        nullptr);
    ASSERT_TRUE(is_ok(result));
    const auto& type = unwrap(result);
    EXPECT_EQ(type->name, "java.util.Map$Entry");
    ASSERT_EQ(type->args.size(), 2u);
    EXPECT_EQ(type->args[1]->name, "java.lang.Long");
}

TEST(SignatureParserTest, PlainDescriptor) {
    auto result = parse_method_signature("(ILjava/lang/String;[J)V", nullptr);
    ASSERT_TRUE(is_ok(result));
    const auto& sig = unwrap(result);
    ASSERT_EQ(sig.parameters.size(), 3u);
    EXPECT_EQ(sig.parameters[0]->name, "int");
    EXPECT_EQ(sig.parameters[1]->name, "java.lang.String");
    EXPECT_EQ(sig.parameters[2]->type_name(), "long[]");
    EXPECT_EQ(sig.return_type->name, "void");
}

// ============================================================================
// Type Variables
// ============================================================================

TEST(SignatureParserTest, ClassTypeParametersAndBounds) {
    TypeScope scope;
    auto result = parse_class_signature(
        "<E:Ljava/lang/Enum<TE;>;>Ljava/lang/Object;Ljava/lang/Comparable<TE;>;", scope);
    ASSERT_TRUE(is_ok(result));
    const auto& sig = unwrap(result);

    ASSERT_EQ(sig.type_parameters.size(), 1u);
    const auto& param = sig.type_parameters.front();
    EXPECT_EQ(param->name, "E");
    ASSERT_EQ(param->bounds.size(), 1u);
    EXPECT_EQ(param->bounds.front()->type_name(), "java.lang.Enum<E>");

    // Self-referential bound points back at the declaration
    auto bound_arg = param->bounds.front()->args.front();
    EXPECT_EQ(bound_arg->declaration.lock(), param);

    EXPECT_EQ(sig.superclass->name, "java.lang.Object");
    ASSERT_EQ(sig.interfaces.size(), 1u);
    EXPECT_EQ(sig.interfaces.front()->type_name(), "java.lang.Comparable<E>");
}

TEST(SignatureParserTest, InterfaceBoundWithEmptyClassBound) {
    TypeScope scope;
    auto result = parse_class_signature(
        "<T::Ljava/lang/Comparable<TT;>;>Ljava/lang/Object;", scope);
    ASSERT_TRUE(is_ok(result));
    const auto& param = unwrap(result).type_parameters.front();
    ASSERT_EQ(param->bounds.size(), 1u);
    EXPECT_EQ(param->bounds.front()->name, "java.lang.Comparable");
}

TEST(SignatureParserTest, ForwardReferenceInParameterList) {
    TypeScope scope;
    auto result = parse_class_signature("<A:TB;B:Ljava/lang/Number;>Ljava/lang/Object;", scope);
    ASSERT_TRUE(is_ok(result));
    const auto& params = unwrap(result).type_parameters;
    ASSERT_EQ(params.size(), 2u);
    auto a_bound = params[0]->bounds.front();
    EXPECT_EQ(a_bound->kind, JavaTypeKind::TypeVariable);
    EXPECT_EQ(a_bound->declaration.lock(), params[1]);
    EXPECT_EQ(a_bound->erasure(), "java.lang.Number");
}

TEST(SignatureParserTest, MethodVariableShadowsClassVariable) {
    TypeScope class_scope;
    auto cls = parse_class_signature("<T:Ljava/lang/Object;>Ljava/lang/Object;", class_scope);
    ASSERT_TRUE(is_ok(cls));

    auto method = parse_method_signature("<T:Ljava/lang/Number;>(TT;)TT;", &class_scope);
    ASSERT_TRUE(is_ok(method));
    const auto& sig = unwrap(method);
    auto decl = sig.parameters.front()->declaration.lock();
    ASSERT_NE(decl, nullptr);
    EXPECT_EQ(decl, sig.type_parameters.front());
    EXPECT_NE(decl, unwrap(cls).type_parameters.front());
}

TEST(SignatureParserTest, MethodSeesEnclosingClassVariable) {
    TypeScope outer;
    ASSERT_TRUE(is_ok(parse_class_signature("<K:Ljava/lang/Object;>Ljava/lang/Object;", outer)));
    TypeScope inner(&outer);
    ASSERT_TRUE(is_ok(parse_class_signature("Ljava/lang/Object;", inner)));

    auto method = parse_method_signature("()TK;", &inner);
    ASSERT_TRUE(is_ok(method));
    EXPECT_EQ(unwrap(method).return_type->declaration.lock(), outer.lookup("K"));
}

TEST(SignatureParserTest, UnknownVariableIsUnbound) {
    auto result = parse_field_signature("TX;", nullptr);
    ASSERT_TRUE(is_ok(result));
    const auto& type = unwrap(result);
    EXPECT_EQ(type->kind, JavaTypeKind::TypeVariable);
    EXPECT_EQ(type->declaration.lock(), nullptr);
    EXPECT_EQ(type->erasure(), "java.lang.Object");
}

TEST(SignatureParserTest, ThrowsClause) {
    auto result = parse_method_signature("()V^Ljava/io/IOException;", nullptr);
    ASSERT_TRUE(is_ok(result));
    ASSERT_EQ(unwrap(result).exceptions.size(), 1u);
    EXPECT_EQ(unwrap(result).exceptions.front()->name, "java.io.IOException");
}

// ============================================================================
// Errors
// ============================================================================

TEST(SignatureParserTest, RejectsMalformedSignatures) {
    EXPECT_TRUE(is_err(parse_field_signature("Ljava/lang/String", nullptr)));
    EXPECT_TRUE(is_err(parse_field_signature("V", nullptr)));
    EXPECT_TRUE(is_err(parse_field_signature("Ljava/util/List<>;", nullptr)));
    EXPECT_TRUE(is_err(parse_method_signature("(I", nullptr)));
    EXPECT_TRUE(is_err(parse_method_signature("()VX", nullptr)));
}

TEST(SignatureParserTest, ErrorReportsOffset) {
    auto result = parse_field_signature("Ljava/util/List<Q>;", nullptr);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).offset, 16u);
}
