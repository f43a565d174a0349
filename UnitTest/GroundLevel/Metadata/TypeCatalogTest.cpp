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

#include <GroundLevel/Exception/TypeCatalogException.hpp>
#include <GroundLevel/Metadata/TypeCatalog.hpp>
#include <gtest/gtest.h>
#include <type_traits>
#include "../TestComponents.hpp"

using namespace GroundLevel;
using namespace GroundLevel::Test;

namespace
{
  AnnotationSet OrderAnnotation(const int32_t value)
  {
    AnnotationSet annotations;
    annotations.Add(AnnotationKinds::Order(), {{"value", value}});
    return annotations;
  }
}

// Descriptors are only created through TypeDescriptor::For<T>(), which binds the type to its own OrderProbe
static_assert(!std::is_default_constructible_v<TypeDescriptor>);

TEST(TypeCatalogTest, DescriptorBindsTypeAndProbe)
{
  const auto ordered = TypeDescriptor::For<OrderedComponent>("OrderedComponent");
  EXPECT_EQ(ordered.GetType(), std::type_index(typeid(OrderedComponent)));
  EXPECT_EQ(ordered.GetProbe().GetCapability(), OrderCapability::DeclaresInterface);

  const auto accessor = TypeDescriptor::For<NamedAccessorComponent>("NamedAccessorComponent", AnnotationSet(), {typeid(NamedComponent)});
  EXPECT_EQ(accessor.GetType(), std::type_index(typeid(NamedAccessorComponent)));
  EXPECT_EQ(accessor.GetProbe().GetCapability(), OrderCapability::ExposesAccessor);
  ASSERT_EQ(accessor.GetBaseTypes().size(), 1u);
  EXPECT_EQ(accessor.GetBaseTypes()[0], std::type_index(typeid(NamedComponent)));
}

TEST(TypeCatalogTest, UnknownTypeHasNoDescriptor)
{
  TypeCatalog catalog;
  EXPECT_EQ(catalog.FindDescriptor(typeid(PlainComponent)), nullptr);
  EXPECT_FALSE(catalog.FindAnnotation(typeid(PlainComponent), AnnotationKinds::Order()).has_value());
}

TEST(TypeCatalogTest, RegisterTypeCapturesProbe)
{
  TypeCatalog catalog;
  catalog.RegisterType<OrderedComponent>();
  catalog.RegisterType<AccessorComponent>();
  catalog.RegisterType<PlainComponent>();

  ASSERT_NE(catalog.FindDescriptor(typeid(OrderedComponent)), nullptr);
  EXPECT_EQ(catalog.FindDescriptor(typeid(OrderedComponent))->GetProbe().GetCapability(), OrderCapability::DeclaresInterface);
  EXPECT_EQ(catalog.FindDescriptor(typeid(AccessorComponent))->GetProbe().GetCapability(), OrderCapability::ExposesAccessor);
  EXPECT_EQ(catalog.FindDescriptor(typeid(PlainComponent))->GetProbe().GetCapability(), OrderCapability::None);
}

TEST(TypeCatalogTest, FindAnnotationOnType)
{
  TypeCatalog catalog;
  catalog.RegisterType<AnnotatedComponent>(OrderAnnotation(10));

  const auto attributes = catalog.FindAnnotation(typeid(AnnotatedComponent), AnnotationKinds::Order());
  ASSERT_TRUE(attributes.has_value());
  EXPECT_EQ(std::get<int32_t>(attributes->at("value")), 10);
}

TEST(TypeCatalogTest, FindAnnotationOfOtherKindReturnsNullopt)
{
  TypeCatalog catalog;
  catalog.RegisterType<AnnotatedComponent>(OrderAnnotation(10));

  EXPECT_FALSE(catalog.FindAnnotation(typeid(AnnotatedComponent), AnnotationKind("Primary")).has_value());
}

TEST(TypeCatalogTest, FindAnnotationSearchesBaseTypes)
{
  TypeCatalog catalog;
  catalog.RegisterType<NamedComponent>(OrderAnnotation(20));
  catalog.RegisterType<NamedAccessorComponent>(AnnotationSet(), {typeid(NamedComponent)});

  const auto attributes = catalog.FindAnnotation(typeid(NamedAccessorComponent), AnnotationKinds::Order());
  ASSERT_TRUE(attributes.has_value());
  EXPECT_EQ(std::get<int32_t>(attributes->at("value")), 20);
}

TEST(TypeCatalogTest, AnnotationOnTypeHidesAnnotationOnBaseType)
{
  TypeCatalog catalog;
  catalog.RegisterType<NamedComponent>(OrderAnnotation(20));
  catalog.RegisterType<NamedAccessorComponent>(OrderAnnotation(30), {typeid(NamedComponent)});

  const auto attributes = catalog.FindAnnotation(typeid(NamedAccessorComponent), AnnotationKinds::Order());
  ASSERT_TRUE(attributes.has_value());
  EXPECT_EQ(std::get<int32_t>(attributes->at("value")), 30);
}

TEST(TypeCatalogTest, FindAnnotationToleratesCyclicBaseTypes)
{
  TypeCatalog catalog;
  catalog.RegisterType<AnnotatedComponent>(AnnotationSet(), {typeid(OtherAnnotatedComponent)});
  catalog.RegisterType<OtherAnnotatedComponent>(AnnotationSet(), {typeid(AnnotatedComponent)});

  EXPECT_FALSE(catalog.FindAnnotation(typeid(AnnotatedComponent), AnnotationKinds::Order()).has_value());
}

TEST(TypeCatalogTest, DuplicateTypeThrows)
{
  TypeCatalog catalog;
  catalog.RegisterType<PlainComponent>();
  EXPECT_THROW(catalog.RegisterType<PlainComponent>(), DuplicateTypeRegistrationException);
}

TEST(TypeCatalogTest, RegisterDescriptorWithCustomName)
{
  TypeCatalog catalog;
  auto descriptor = TypeDescriptor::For<PlainComponent>("PlainComponent");
  catalog.RegisterType(std::move(descriptor));

  ASSERT_NE(catalog.FindDescriptor(typeid(PlainComponent)), nullptr);
  EXPECT_EQ(catalog.FindDescriptor(typeid(PlainComponent))->GetName(), "PlainComponent");
}
