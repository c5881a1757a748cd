#include <gtest/gtest.h>

#include "identity/schema_provider.hpp"
#include "test_support.hpp"

using sid::identity::Aliasing;
using sid::identity::ErrorCode;
using sid::identity::FieldSchemaProvider;
using sid::identity::Json;
using sid::identity::SchemaMode;
using sid::identity::TypeCatalog;

namespace {

auto generate(const TypeCatalog& catalog, sid::identity::TypeId id, SchemaMode mode,
              Aliasing aliasing) -> Json {
  FieldSchemaProvider provider(&catalog);
  return provider.generate(*catalog.lookup(id), mode, aliasing).value();
}

}  // namespace

TEST(SchemaProvider, ObjectDocumentLayout) {
  TypeCatalog catalog;
  auto def = make_model("Reading", {int_field("sensor_id"), int_field("count", 0)});
  def.doc = "A single reading.";
  auto id = define(catalog, std::move(def));

  auto expected = Json::parse(R"({
    "description": "A single reading.",
    "properties": {
      "sensor_id": {"type": "integer", "title": "Sensor Id"},
      "count": {"type": "integer", "default": 0, "title": "Count"}
    },
    "required": ["sensor_id"],
    "title": "Reading",
    "type": "object"
  })");
  EXPECT_EQ(generate(catalog, id, SchemaMode::Serialization, Aliasing::ByAlias), expected);
  EXPECT_EQ(generate(catalog, id, SchemaMode::Serialization, Aliasing::ByAlias).dump(),
            expected.dump());
}

TEST(SchemaProvider, OmitsEmptyRequired) {
  TypeCatalog catalog;
  auto id = define(catalog, make_model("Defaults", {int_field("count", 1)}));
  auto doc = generate(catalog, id, SchemaMode::Serialization, Aliasing::ByAlias);
  EXPECT_FALSE(doc.contains("required"));
  EXPECT_FALSE(doc.contains("description"));
}

TEST(SchemaProvider, PropertyKeysFollowAliasing) {
  TypeCatalog catalog;
  auto field = int_field("sensor_id");
  field.alias = "sensorId";
  field.validation_alias = "sensor";
  auto plain = int_field("value");
  plain.alias = "val";
  auto id = define(catalog, make_model("Reading", {field, plain}));

  auto by_alias = generate(catalog, id, SchemaMode::Serialization, Aliasing::ByAlias);
  EXPECT_TRUE(by_alias["properties"].contains("sensorId"));
  EXPECT_EQ(by_alias["required"], Json::array({"sensorId", "val"}));

  auto by_name = generate(catalog, id, SchemaMode::Serialization, Aliasing::ByName);
  EXPECT_TRUE(by_name["properties"].contains("sensor_id"));
  EXPECT_EQ(by_name["required"], Json::array({"sensor_id", "value"}));

  auto validation = generate(catalog, id, SchemaMode::Validation, Aliasing::ByAlias);
  EXPECT_TRUE(validation["properties"].contains("sensor"));
  EXPECT_EQ(validation["required"], Json::array({"sensor", "val"}));
}

TEST(SchemaProvider, ValidationSchemaOnlyInValidationMode) {
  TypeCatalog catalog;
  auto field = make_field("taken_at", {{"type", "string"}, {"format", "date-time"}});
  field.validation_schema = Json{{"anyOf", Json::array({Json{{"type", "string"}},
                                                        Json{{"type", "number"}}})}};
  auto id = define(catalog, make_model("Reading", {field}));

  auto serialization = generate(catalog, id, SchemaMode::Serialization, Aliasing::ByAlias);
  EXPECT_EQ(serialization["properties"]["taken_at"]["format"], "date-time");

  auto validation = generate(catalog, id, SchemaMode::Validation, Aliasing::ByAlias);
  EXPECT_TRUE(validation["properties"]["taken_at"].contains("anyOf"));
  EXPECT_FALSE(validation["properties"]["taken_at"].contains("format"));
}

TEST(SchemaProvider, FieldKeysAfterFragment) {
  TypeCatalog catalog;
  auto field = int_field("count", 3);
  field.description = "How many.";
  auto id = define(catalog, make_model("Reading", {field}));

  auto property = generate(catalog, id, SchemaMode::Serialization, Aliasing::ByAlias)
                    ["properties"]["count"];
  EXPECT_EQ(property.dump(),
            R"({"type":"integer","default":3,"description":"How many.","title":"Count"})");
}

TEST(SchemaProvider, NestedModelsLandInDefsOnce) {
  TypeCatalog catalog;
  auto location = define(catalog, make_model("Location", {int_field("lat"), int_field("lon")}));
  auto home = make_field("home", Json::object());
  home.model = location;
  auto work = make_field("work", Json::object());
  work.model = location;
  auto id = define(catalog, make_model("Trip", {home, work}));

  auto doc = generate(catalog, id, SchemaMode::Serialization, Aliasing::ByAlias);
  EXPECT_EQ(doc["properties"]["home"]["$ref"], "#/$defs/Location");
  EXPECT_EQ(doc["properties"]["work"]["$ref"], "#/$defs/Location");
  ASSERT_TRUE(doc.contains("$defs"));
  EXPECT_EQ(doc["$defs"].size(), 1u);
  EXPECT_EQ(doc["$defs"]["Location"]["title"], "Location");
  EXPECT_EQ(doc["$defs"]["Location"]["required"], Json::array({"lat", "lon"}));
}

TEST(SchemaProvider, RejectsNonObjectFragment) {
  TypeCatalog catalog;
  auto id = define(catalog, make_model("Broken", {make_field("value", Json::array({1}))}));
  FieldSchemaProvider provider(&catalog);
  auto doc = provider.generate(*catalog.lookup(id), SchemaMode::Serialization, Aliasing::ByAlias);
  ASSERT_FALSE(doc.has_value());
  EXPECT_EQ(doc.error().code, ErrorCode::Provider);
  EXPECT_EQ(doc.error().type_name, "Broken");
}

TEST(SchemaProvider, FieldTitle) {
  EXPECT_EQ(sid::identity::field_title("sensor_id"), "Sensor Id");
  EXPECT_EQ(sid::identity::field_title("value"), "Value");
  EXPECT_EQ(sid::identity::field_title("rawADC"), "Rawadc");
}

TEST(SchemaProvider, SameNamedNestedModelsGetDistinctDefs) {
  TypeCatalog catalog;
  auto geo_def = make_model("Point", {int_field("a")});
  geo_def.declaring_file = "/srv/app/geo.hpp";
  auto geo = define(catalog, std::move(geo_def));
  auto plot_def = make_model("Point", {make_field("b", {{"type", "string"}})});
  plot_def.declaring_file = "/srv/app/plot.hpp";
  auto plot = define(catalog, std::move(plot_def));
  auto local = define(catalog, make_model("Point", {int_field("c")}));

  auto x = make_field("x", Json::object());
  x.model = geo;
  auto y = make_field("y", Json::object());
  y.model = plot;
  auto z = make_field("z", Json::object());
  z.model = local;
  auto again = make_field("again", Json::object());
  again.model = geo;
  auto id = define(catalog, make_model("Route", {x, y, z, again}));

  auto doc = generate(catalog, id, SchemaMode::Serialization, Aliasing::ByAlias);
  EXPECT_EQ(doc["properties"]["x"]["$ref"], "#/$defs/Point");
  EXPECT_EQ(doc["properties"]["y"]["$ref"], "#/$defs/plot.Point");
  EXPECT_EQ(doc["properties"]["z"]["$ref"], "#/$defs/records.Point");
  EXPECT_EQ(doc["properties"]["again"]["$ref"], "#/$defs/Point");
  ASSERT_EQ(doc["$defs"].size(), 3u);
  EXPECT_EQ(doc["$defs"]["Point"]["required"], Json::array({"a"}));
  EXPECT_EQ(doc["$defs"]["plot.Point"]["required"], Json::array({"b"}));
  EXPECT_EQ(doc["$defs"]["records.Point"]["required"], Json::array({"c"}));
}

TEST(SchemaProvider, UnqualifiableNameFallsBackToId) {
  TypeCatalog catalog;
  auto first_def = make_model("Point", {int_field("a")});
  first_def.declaring_file = "point.hpp";
  auto first = define(catalog, std::move(first_def));
  auto second_def = make_model("Point", {int_field("b")});
  second_def.declaring_file = "point.hpp";
  auto second = define(catalog, std::move(second_def));
  auto third_def = make_model("Point", {int_field("c")});
  third_def.declaring_file = "point.hpp";
  auto third = define(catalog, std::move(third_def));

  auto x = make_field("x", Json::object());
  x.model = first;
  auto y = make_field("y", Json::object());
  y.model = second;
  auto z = make_field("z", Json::object());
  z.model = third;
  auto id = define(catalog, make_model("Route", {x, y, z}));

  auto doc = generate(catalog, id, SchemaMode::Serialization, Aliasing::ByAlias);
  EXPECT_EQ(doc["properties"]["y"]["$ref"], "#/$defs/point.Point");
  EXPECT_EQ(doc["properties"]["z"]["$ref"], "#/$defs/point.Point_" + std::to_string(third));
  EXPECT_EQ(doc["$defs"].size(), 3u);
}
