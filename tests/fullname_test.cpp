#include <gtest/gtest.h>

#include "identity/fullname.hpp"
#include "test_support.hpp"

using sid::identity::qualified_name;

TEST(Fullname, KeepsTrailingSegmentsWithoutExtension) {
  EXPECT_EQ(qualified_name("/srv/app/models/records.hpp", "Reading", 1), "records.Reading");
  EXPECT_EQ(qualified_name("/srv/app/models/records.hpp", "Reading", 2), "models.records.Reading");
  EXPECT_EQ(qualified_name("/srv/app/models/records.hpp", "Reading", 3),
            "app.models.records.Reading");
}

TEST(Fullname, ZeroPartsGivesBareName) {
  EXPECT_EQ(qualified_name("/srv/app/models/records.hpp", "Reading", 0), "Reading");
  EXPECT_EQ(qualified_name("/srv/app/models/records.hpp", "Reading", -3), "Reading");
}

TEST(Fullname, MissingFileGivesBareName) {
  EXPECT_EQ(qualified_name("", "Reading", 2), "Reading");
}

TEST(Fullname, DepthBeyondPathUsesWholePath) {
  EXPECT_EQ(qualified_name("/srv/records.hpp", "Reading", 10), "srv.records.Reading");
}

TEST(Fullname, DotSegmentsResolveBeforeSplitting) {
  EXPECT_EQ(qualified_name("./models/../records.cpp", "Reading", 2), "records.Reading");
  EXPECT_EQ(qualified_name("/srv/app/models/../geo/records.cpp", "Reading", 2),
            "geo.records.Reading");
  EXPECT_EQ(qualified_name("../lib/records.cpp", "Reading", 3), "lib.records.Reading");
  EXPECT_EQ(qualified_name("records.cpp", "Reading", 2), "records.Reading");
}

TEST(Fullname, ResolverUsesDeclaringFile) {
  sid::identity::TypeCatalog catalog;
  auto id = define(catalog, make_model("Reading", {int_field("value")}));
  sid::identity::PathFullnameResolver resolver;
  EXPECT_EQ(resolver.resolve(*catalog.lookup(id), 2), "models.records.Reading");
}
