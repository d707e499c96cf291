/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE JsonReaderTests
#include "utils/JsonReader.hpp"
#include <boost/test/unit_test.hpp>
#include <filesystem>
#include <fstream>

using namespace Formicary;

BOOST_AUTO_TEST_SUITE(JsonValueTests)

BOOST_AUTO_TEST_CASE(TestBasicTypes) {
  JsonValue nullVal;
  BOOST_CHECK(nullVal.isNull());
  BOOST_CHECK_EQUAL(nullVal.getType(), JsonType::Null);

  JsonValue trueVal(true);
  BOOST_CHECK(trueVal.isBool());
  BOOST_CHECK_EQUAL(trueVal.asBool(), true);

  JsonValue numberVal(3.5);
  BOOST_CHECK(numberVal.isNumber());
  BOOST_CHECK_CLOSE(numberVal.asNumber(), 3.5, 0.001);

  JsonValue stringVal(std::string("hello"));
  BOOST_CHECK(stringVal.isString());
  BOOST_CHECK_EQUAL(stringVal.getType(), JsonType::String);
  BOOST_CHECK_EQUAL(stringVal.asString(), "hello");
}

BOOST_AUTO_TEST_CASE(TestContainerAccess) {
  JsonObject obj;
  obj["name"] = JsonValue(std::string("colony"));
  obj["size"] = JsonValue(30.0);
  JsonValue objectVal(obj);

  BOOST_CHECK(objectVal.isObject());
  BOOST_CHECK_EQUAL(objectVal.size(), 2u);
  BOOST_CHECK(objectVal.hasKey("name"));
  BOOST_CHECK(!objectVal.hasKey("missing"));
  BOOST_CHECK(objectVal["missing"].isNull());
  BOOST_CHECK_EQUAL(objectVal["size"].asInt(), 30);

  JsonArray arr;
  arr.push_back(JsonValue(1.0));
  arr.push_back(JsonValue(false));
  JsonValue arrayVal(arr);
  BOOST_CHECK_EQUAL(arrayVal.size(), 2u);
  BOOST_CHECK_EQUAL(arrayVal[1].asBool(), false);
  BOOST_CHECK(arrayVal[5].isNull());
  BOOST_CHECK(arrayVal["key"].isNull());
}

BOOST_AUTO_TEST_CASE(TestSafeAccessors) {
  JsonValue stringVal(std::string("test"));
  JsonValue integral(42.0);
  JsonValue fractional(4.25);

  BOOST_CHECK_EQUAL(stringVal.tryAsString().value(), "test");
  BOOST_CHECK(!stringVal.tryAsInt().has_value());
  BOOST_CHECK(!stringVal.tryAsBool().has_value());

  BOOST_CHECK_EQUAL(integral.tryAsInt().value(), 42);
  BOOST_CHECK(!fractional.tryAsInt().has_value());
  BOOST_CHECK_CLOSE(fractional.tryAsNumber().value(), 4.25, 0.001);
  BOOST_CHECK(!JsonValue(1e12).tryAsInt().has_value());
}

BOOST_AUTO_TEST_CASE(TestMismatchedAccessThrows) {
  JsonValue numberVal(1.0);
  BOOST_CHECK_THROW(numberVal.asString(), std::bad_variant_access);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderParseTests)

BOOST_AUTO_TEST_CASE(TestParseDocument) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse(R"({
    "world": {"width": 128, "scale": -1.5e2, "name": "nest"},
    "layers": ["ants", "food", null],
    "enabled": true
  })"));

  const JsonValue &root = reader.getRoot();
  BOOST_CHECK(root.isObject());
  BOOST_CHECK_EQUAL(root["world"]["width"].asInt(), 128);
  BOOST_CHECK_CLOSE(root["world"]["scale"].asNumber(), -150.0, 0.001);
  BOOST_CHECK_EQUAL(root["world"]["name"].asString(), "nest");
  BOOST_CHECK_EQUAL(root["layers"].size(), 3u);
  BOOST_CHECK_EQUAL(root["layers"][1].asString(), "food");
  BOOST_CHECK(root["layers"][2].isNull());
  BOOST_CHECK(root["enabled"].asBool());
  BOOST_CHECK(reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestParseEscapes) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse(R"(["a\"b\\c\n", "\u0041\u00e9"])"));
  BOOST_CHECK_EQUAL(reader.getRoot()[0].asString(), "a\"b\\c\n");
  BOOST_CHECK_EQUAL(reader.getRoot()[1].asString(), "A\xC3\xA9");
}

BOOST_AUTO_TEST_CASE(TestParseEmptyContainers) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse("{ }"));
  BOOST_CHECK_EQUAL(reader.getRoot().size(), 0u);
  BOOST_REQUIRE(reader.parse("[]"));
  BOOST_CHECK(reader.getRoot().isArray());
}

BOOST_AUTO_TEST_CASE(TestErrorsReportPosition) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse("{\n  \"width\" 12\n}"));
  const std::string &error = reader.getLastError();
  BOOST_CHECK(error.find("Expected ':'") != std::string::npos);
  BOOST_CHECK(error.find("line 2") != std::string::npos);

  reader.clearError();
  BOOST_CHECK(reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestMalformedInputsFail) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse(""));
  BOOST_CHECK(!reader.parse("[1, 2"));
  BOOST_CHECK(!reader.parse("{\"a\": tru}"));
  BOOST_CHECK(!reader.parse("\"unterminated"));
  BOOST_CHECK(!reader.parse("1."));
  BOOST_CHECK(!reader.parse("{} extra"));
  BOOST_CHECK(!reader.parse("{'single': 1}"));
  BOOST_CHECK(!reader.parse(std::string(200, '[') + std::string(200, ']')));
}

BOOST_AUTO_TEST_CASE(TestFailedParseKeepsPreviousRoot) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse("{\"kept\": 1}"));
  BOOST_CHECK(!reader.parse("{broken"));
  BOOST_CHECK(reader.getRoot().hasKey("kept"));
}

BOOST_AUTO_TEST_CASE(TestLoadFromFile) {
  const auto path =
      std::filesystem::temp_directory_path() / "formicary_json_reader.json";
  {
    std::ofstream out(path);
    out << "{\"capacity\": 4}";
  }

  JsonReader reader;
  BOOST_REQUIRE(reader.loadFromFile(path.string()));
  BOOST_CHECK_EQUAL(reader.getRoot()["capacity"].asInt(), 4);

  std::filesystem::remove(path);
  BOOST_CHECK(!reader.loadFromFile(path.string()));
  BOOST_CHECK(reader.getLastError().find("Failed to open file") !=
              std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
