//****************************************************************************************************************************************************
//* Zero-Clause BSD (0BSD)
//*
//* Copyright (c) 2025, Mana Battery
//*
//* Permission to use, copy, modify, and/or distribute this software for any purpose with or without fee is hereby granted.
//*
//* THE SOFTWARE IS PROVIDED "AS IS" AND THE AUTHOR DISCLAIMS ALL WARRANTIES WITH REGARD TO THIS SOFTWARE INCLUDING ALL IMPLIED WARRANTIES OF
//* MERCHANTABILITY AND FITNESS. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR ANY SPECIAL, DIRECT, INDIRECT, OR CONSEQUENTIAL DAMAGES OR ANY DAMAGES
//* WHATSOEVER RESULTING FROM LOSS OF USE, DATA OR PROFITS, WHETHER IN AN ACTION OF CONTRACT, NEGLIGENCE OR OTHER TORTIOUS ACTION, ARISING OUT OF
//* OR IN CONNECTION WITH THE USE OR PERFORMANCE OF THIS SOFTWARE.
//****************************************************************************************************************************************************

#include <GroundLevel/Exception/AttributeTypeException.hpp>
#include <GroundLevel/Metadata/AnnotationSet.hpp>
#include <GroundLevel/Metadata/AttributeMap.hpp>
#include <gtest/gtest.h>

using namespace GroundLevel;

TEST(AttributeMapTest, MergeAttributes_OverlayReplacesMatchingKeys)
{
  AttributeMap base{{"value", 10}, {"name", std::string("base")}};
  const AttributeMap overlay{{"value", 5}};

  MergeAttributes(base, overlay);

  ASSERT_EQ(base.size(), 2u);
  EXPECT_EQ(std::get<int32_t>(base.at("value")), 5);
  EXPECT_EQ(std::get<std::string>(base.at("name")), "base");
}

TEST(AttributeMapTest, MergeAttributes_OverlayAddsMissingKeys)
{
  AttributeMap base{{"value", 10}};
  const AttributeMap overlay{{"enabled", true}};

  MergeAttributes(base, overlay);

  ASSERT_EQ(base.size(), 2u);
  EXPECT_EQ(std::get<int32_t>(base.at("value")), 10);
  EXPECT_TRUE(std::get<bool>(base.at("enabled")));
}

TEST(AttributeMapTest, MergeAttributes_EmptyOverlayKeepsBase)
{
  AttributeMap base{{"value", 10}};
  MergeAttributes(base, AttributeMap());
  EXPECT_EQ(std::get<int32_t>(base.at("value")), 10);
}

TEST(AttributeMapTest, TryGetAttribute_MissingReturnsNullopt)
{
  const AttributeMap attributes{{"name", std::string("x")}};
  EXPECT_FALSE(TryGetAttribute<int32_t>(attributes, "value").has_value());
}

TEST(AttributeMapTest, TryGetAttribute_MatchingTypeReturnsValue)
{
  const AttributeMap attributes{{"value", -42}};
  const auto value = TryGetAttribute<int32_t>(attributes, "value");
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(*value, -42);
}

TEST(AttributeMapTest, TryGetAttribute_WrongTypeThrows)
{
  const AttributeMap attributes{{"value", std::string("10")}};
  EXPECT_THROW(TryGetAttribute<int32_t>(attributes, "value"), AttributeTypeException);
}

TEST(AttributeMapTest, TryGetAttribute_WiderIntegerIsNotConverted)
{
  const AttributeMap attributes{{"value", int64_t(10)}};
  EXPECT_THROW(TryGetAttribute<int32_t>(attributes, "value"), AttributeTypeException);
}

TEST(AttributeMapTest, GetAttributeTypeName)
{
  EXPECT_EQ(GetAttributeTypeName(AttributeValue(true)), "bool");
  EXPECT_EQ(GetAttributeTypeName(AttributeValue(int32_t(1))), "int32");
  EXPECT_EQ(GetAttributeTypeName(AttributeValue(int64_t(1))), "int64");
  EXPECT_EQ(GetAttributeTypeName(AttributeValue(1.5)), "double");
  EXPECT_EQ(GetAttributeTypeName(AttributeValue(std::string("x"))), "string");
}

TEST(AnnotationSetTest, AddAndQuery)
{
  AnnotationSet annotations;
  EXPECT_TRUE(annotations.Empty());

  annotations.Add(AnnotationKinds::Order(), {{"value", 3}});

  EXPECT_FALSE(annotations.Empty());
  EXPECT_TRUE(annotations.IsAnnotated(AnnotationKinds::Order()));
  EXPECT_FALSE(annotations.IsAnnotated(AnnotationKind("Primary")));

  const auto attributes = annotations.TryGetAttributes(AnnotationKinds::Order());
  ASSERT_TRUE(attributes.has_value());
  EXPECT_EQ(std::get<int32_t>(attributes->at("value")), 3);
  EXPECT_FALSE(annotations.TryGetAttributes(AnnotationKind("Primary")).has_value());
}

TEST(AnnotationSetTest, MarkerAnnotationHasNoAttributes)
{
  AnnotationSet annotations;
  annotations.Add(AnnotationKind("Primary"));

  EXPECT_TRUE(annotations.IsAnnotated(AnnotationKind("Primary")));
  const auto attributes = annotations.TryGetAttributes(AnnotationKind("Primary"));
  ASSERT_TRUE(attributes.has_value());
  EXPECT_TRUE(attributes->empty());
}

TEST(AnnotationSetTest, AddReplacesPreviousDeclaration)
{
  AnnotationSet annotations;
  annotations.Add(AnnotationKinds::Order(), {{"value", 3}}).Add(AnnotationKinds::Order(), {{"value", 4}});

  EXPECT_EQ(std::get<int32_t>(annotations.TryGetAttributes(AnnotationKinds::Order())->at("value")), 4);
}
