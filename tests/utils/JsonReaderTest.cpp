/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE JsonReaderTest
#include "utils/JsonReader.hpp"
#include <boost/test/unit_test.hpp>
#include <cstdio>
#include <fstream>
#include <limits>
#include <string>

using namespace PongEngine;

BOOST_AUTO_TEST_SUITE(JsonValueTests)

BOOST_AUTO_TEST_CASE(TestBasicTypes) {
  // Null
  JsonValue nullVal;
  BOOST_CHECK(nullVal.isNull());
  BOOST_CHECK_EQUAL(nullVal.getType(), JsonType::Null);
  BOOST_CHECK_EQUAL(nullVal.toString(), "null");

  // Boolean
  JsonValue trueVal(true);
  JsonValue falseVal(false);
  BOOST_CHECK(trueVal.isBool());
  BOOST_CHECK_EQUAL(trueVal.asBool(), true);
  BOOST_CHECK_EQUAL(falseVal.asBool(), false);
  BOOST_CHECK_EQUAL(trueVal.toString(), "true");

  // Number
  JsonValue intVal(42);
  JsonValue floatVal(0.75f);
  JsonValue doubleVal(3.14);
  BOOST_CHECK(intVal.isNumber());
  BOOST_CHECK(floatVal.isNumber());
  BOOST_CHECK_EQUAL(intVal.asInt(), 42);
  BOOST_CHECK_CLOSE(floatVal.asFloat(), 0.75f, 0.001f);
  BOOST_CHECK_CLOSE(doubleVal.asNumber(), 3.14, 0.001);
  BOOST_CHECK_EQUAL(intVal.toString(), "42");

  // String
  JsonValue stringVal("serve");
  BOOST_CHECK(stringVal.isString());
  BOOST_CHECK_EQUAL(stringVal.asString(), "serve");
  BOOST_CHECK_EQUAL(stringVal.toString(), "\"serve\"");
}

BOOST_AUTO_TEST_CASE(TestArrayOperations) {
  JsonArray arr;
  arr.push_back(JsonValue(1));
  arr.push_back(JsonValue("left"));
  arr.push_back(JsonValue(true));

  JsonValue arrayVal(arr);
  BOOST_CHECK(arrayVal.isArray());
  BOOST_CHECK_EQUAL(arrayVal.size(), 3u);
  BOOST_CHECK_EQUAL(arrayVal[0].asInt(), 1);
  BOOST_CHECK_EQUAL(arrayVal[1].asString(), "left");
  BOOST_CHECK_EQUAL(arrayVal[2].asBool(), true);

  // Out of range reads as null
  BOOST_CHECK(arrayVal[7].isNull());
}

BOOST_AUTO_TEST_CASE(TestObjectOperations) {
  JsonObject obj;
  obj["x"] = JsonValue(0.25f);
  obj["y"] = JsonValue(0.5f);

  JsonValue objectVal(obj);
  BOOST_CHECK(objectVal.isObject());
  BOOST_CHECK_EQUAL(objectVal.size(), 2u);
  BOOST_CHECK(objectVal.hasKey("x"));
  BOOST_CHECK(!objectVal.hasKey("z"));
  BOOST_CHECK_CLOSE(objectVal["x"].asFloat(), 0.25f, 0.001f);

  // Missing keys and chained lookups through non-objects read as null
  BOOST_CHECK(objectVal["z"].isNull());
  BOOST_CHECK(objectVal["x"]["nested"].isNull());
}

BOOST_AUTO_TEST_CASE(TestMutableObjectAccess) {
  JsonValue value;
  value["speedMultiplier"] = JsonValue(1.5f);
  BOOST_CHECK(value.isObject());
  BOOST_CHECK_CLOSE(value["speedMultiplier"].asFloat(), 1.5f, 0.001f);
  BOOST_CHECK_EQUAL(value.toString(), "{\"speedMultiplier\":1.5}");
}

BOOST_AUTO_TEST_CASE(TestSafeAccessors) {
  JsonValue stringVal("test");
  JsonValue numberVal(42);
  JsonValue boolVal(false);

  BOOST_CHECK(stringVal.tryAsString().has_value());
  BOOST_CHECK_EQUAL(stringVal.tryAsString().value(), "test");
  BOOST_CHECK(numberVal.tryAsFloat().has_value());
  BOOST_CHECK_CLOSE(numberVal.tryAsFloat().value(), 42.0f, 0.001f);
  BOOST_CHECK(boolVal.tryAsBool().has_value());
  BOOST_CHECK_EQUAL(boolVal.tryAsBool().value(), false);

  BOOST_CHECK(!stringVal.tryAsNumber().has_value());
  BOOST_CHECK(!numberVal.tryAsString().has_value());
  BOOST_CHECK(!numberVal.tryAsBool().has_value());
  BOOST_CHECK(stringVal.tryAsObject() == nullptr);
}

BOOST_AUTO_TEST_CASE(TestNonFiniteNumbersWriteAsNull) {
  JsonValue nanVal(std::numeric_limits<double>::quiet_NaN());
  BOOST_CHECK_EQUAL(nanVal.toString(), "null");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderParsingTests)

BOOST_AUTO_TEST_CASE(TestBasicParsing) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("null"));
  BOOST_CHECK(reader.getRoot().isNull());

  BOOST_CHECK(reader.parse("true"));
  BOOST_CHECK_EQUAL(reader.getRoot().asBool(), true);

  BOOST_CHECK(reader.parse("false"));
  BOOST_CHECK_EQUAL(reader.getRoot().asBool(), false);

  BOOST_CHECK(reader.parse("42"));
  BOOST_CHECK_EQUAL(reader.getRoot().asInt(), 42);

  BOOST_CHECK(reader.parse("-123"));
  BOOST_CHECK_EQUAL(reader.getRoot().asInt(), -123);

  BOOST_CHECK(reader.parse("0.008"));
  BOOST_CHECK_CLOSE(reader.getRoot().asNumber(), 0.008, 0.001);

  BOOST_CHECK(reader.parse("1.5e2"));
  BOOST_CHECK_CLOSE(reader.getRoot().asNumber(), 150.0, 0.001);

  BOOST_CHECK(reader.parse("\"hello\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "hello");
}

BOOST_AUTO_TEST_CASE(TestStringEscapes) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("\"hello\\nworld\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "hello\nworld");

  BOOST_CHECK(reader.parse("\"quote\\\"here\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "quote\"here");

  BOOST_CHECK(reader.parse("\"backslash\\\\here\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "backslash\\here");

  BOOST_CHECK(reader.parse("\"\\u0041\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "A");

  // Two-byte UTF-8
  BOOST_CHECK(reader.parse("\"\\u00e9\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "\xC3\xA9");
}

BOOST_AUTO_TEST_CASE(TestArrayParsing) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("[]"));
  BOOST_CHECK(reader.getRoot().isArray());
  BOOST_CHECK_EQUAL(reader.getRoot().size(), 0u);

  BOOST_CHECK(reader.parse("[1, \"hello\", true, null]"));
  const auto &arr = reader.getRoot();
  BOOST_CHECK_EQUAL(arr.size(), 4u);
  BOOST_CHECK_EQUAL(arr[0].asInt(), 1);
  BOOST_CHECK_EQUAL(arr[1].asString(), "hello");
  BOOST_CHECK_EQUAL(arr[2].asBool(), true);
  BOOST_CHECK(arr[3].isNull());
}

BOOST_AUTO_TEST_CASE(TestSettingsDocument) {
  JsonReader reader;

  std::string settingsJson = R"({
        "ball": {
            "time_to_cross": 2.75,
            "acceleration_rate": 0.05,
            "max_multiplier": 4
        },
        "edges": {
            "zone_size": 0.05,
            "top_bottom_deflection": "none"
        },
        "loop": {
            "max_steps_per_frame": 8
        }
    })";

  BOOST_CHECK(reader.parse(settingsJson));
  const auto &root = reader.getRoot();
  BOOST_CHECK(root.isObject());
  BOOST_CHECK_EQUAL(root.size(), 3u);

  BOOST_CHECK_CLOSE(root["ball"]["time_to_cross"].asFloat(), 2.75f, 0.001f);
  BOOST_CHECK_EQUAL(root["ball"]["max_multiplier"].asInt(), 4);
  BOOST_CHECK_EQUAL(root["edges"]["top_bottom_deflection"].asString(), "none");
  BOOST_CHECK_EQUAL(root["loop"]["max_steps_per_frame"].asInt(), 8);
}

BOOST_AUTO_TEST_CASE(TestWhitespace) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("  \t\n  42  \r\n  "));
  BOOST_CHECK_EQUAL(reader.getRoot().asInt(), 42);

  BOOST_CHECK(reader.parse("{\n  \"x\" :\t0.5 ,\n  \"y\": 0.25\n}"));
  BOOST_CHECK_CLOSE(reader.getRoot()["y"].asFloat(), 0.25f, 0.001f);
}

BOOST_AUTO_TEST_CASE(TestWriteThenParse) {
  JsonObject position;
  position["x"] = JsonValue(0.125);
  position["y"] = JsonValue(0.875);
  JsonObject root;
  root["position"] = JsonValue(std::move(position));
  root["label"] = JsonValue("tab\there");

  const std::string text = JsonValue(std::move(root)).toString();

  JsonReader reader;
  BOOST_REQUIRE(reader.parse(text));
  BOOST_CHECK_CLOSE(reader.getRoot()["position"]["x"].asNumber(), 0.125, 0.0001);
  BOOST_CHECK_CLOSE(reader.getRoot()["position"]["y"].asNumber(), 0.875, 0.0001);
  BOOST_CHECK_EQUAL(reader.getRoot()["label"].asString(), "tab\there");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderErrorTests)

BOOST_AUTO_TEST_CASE(TestInvalidJSON) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse("hello"));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(!reader.parse("{\"key\": \"value\",}"));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(!reader.parse("[1, 2, 3,]"));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(!reader.parse("{\"key\": \"value\""));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(!reader.parse("123."));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(!reader.parse("1e"));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(!reader.parse("\"hello"));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(!reader.parse("\"hello\\x\""));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(!reader.parse("42 43"));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(!reader.parse(""));
  BOOST_CHECK(!reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestMalformedStructures) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse("{\"key\" \"value\"}"));
  BOOST_CHECK(!reader.parse("{42: \"value\"}"));
  BOOST_CHECK(!reader.parse("{\"a\": 1 \"b\": 2}"));
  BOOST_CHECK(!reader.parse("[1 2 3]"));
  BOOST_CHECK(!reader.parse("truee"));
  BOOST_CHECK(!reader.parse("nul"));
  BOOST_CHECK(!reader.parse("@"));
}

BOOST_AUTO_TEST_CASE(TestErrorReportsLocation) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse("{\n  \"x\": @\n}"));
  BOOST_CHECK(reader.getLastError().find("Line 2") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestFailedParseClearsRoot) {
  JsonReader reader;
  BOOST_REQUIRE(reader.parse("{\"x\": 1}"));
  BOOST_CHECK(!reader.parse("{\"x\": }"));
  BOOST_CHECK(reader.getRoot().isNull());

  // A later successful parse clears the error
  BOOST_CHECK(reader.parse("1"));
  BOOST_CHECK(reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestNestingDepthLimit) {
  JsonReader reader;
  const std::string deep = std::string(100, '[') + std::string(100, ']');
  BOOST_CHECK(!reader.parse(deep));
  BOOST_CHECK(reader.getLastError().find("depth") != std::string::npos);

  const std::string shallow = std::string(10, '[') + std::string(10, ']');
  BOOST_CHECK(reader.parse(shallow));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderFileTests)

BOOST_AUTO_TEST_CASE(TestFileLoading) {
  std::string filename = "json_reader_test_temp.json";
  {
    std::ofstream file(filename);
    file << R"({"paddle": {"height_ratio": 0.15, "freeze_seconds": 0.2}})";
  }

  JsonReader reader;
  BOOST_CHECK(reader.loadFromFile(filename));
  BOOST_CHECK_CLOSE(reader.getRoot()["paddle"]["height_ratio"].asFloat(), 0.15f, 0.001f);
  BOOST_CHECK_CLOSE(reader.getRoot()["paddle"]["freeze_seconds"].asFloat(), 0.2f, 0.001f);

  std::remove(filename.c_str());
}

BOOST_AUTO_TEST_CASE(TestNonExistentFile) {
  JsonReader reader;
  BOOST_CHECK(!reader.loadFromFile("non_existent_file.json"));
  BOOST_CHECK(!reader.getLastError().empty());
}

BOOST_AUTO_TEST_SUITE_END()
