#include <stdio.h>

#include <string>
#include <vector>

#include "agent/value_parsing.h"
#include "test_support.h"

using namespace scenelink;
using namespace scenelink::agent;

static void test_scalars_are_strict() {
  int64_t i = 7;
  TEST_ASSERT(parseInteger(" 42 ", i));
  TEST_ASSERT(i == 42);
  TEST_ASSERT(parseInteger("-3", i));
  TEST_ASSERT(i == -3);
  TEST_ASSERT(!parseInteger("4.5", i));
  TEST_ASSERT(!parseInteger("", i));
  TEST_ASSERT(!parseInteger("12abc", i));
  TEST_ASSERT(i == -3);

  double f = 0;
  TEST_ASSERT(parseFloat("2.5", f));
  TEST_ASSERT_NEAR(f, 2.5, 1e-9);
  TEST_ASSERT(parseFloat("1e3", f));
  TEST_ASSERT_NEAR(f, 1000.0, 1e-9);
  TEST_ASSERT(!parseFloat("fast", f));
  TEST_ASSERT(!parseFloat("1e999", f));
  TEST_CASE_OK("scalars_are_strict");
}

static void test_booleans() {
  bool b = false;
  TEST_ASSERT(parseBoolean("TRUE", b) && b);
  TEST_ASSERT(parseBoolean("1", b) && b);
  TEST_ASSERT(parseBoolean("False", b) && !b);
  TEST_ASSERT(parseBoolean("0", b) && !b);
  b = true;
  TEST_ASSERT(!parseBoolean("yes", b));
  TEST_ASSERT(b);
  TEST_CASE_OK("booleans");
}

static void test_vector_forms() {
  editor::Vector3 v;
  TEST_ASSERT(parseVector3("[0, 1, 0]", v));
  TEST_ASSERT_NEAR(v.y, 1.0, 1e-6);
  TEST_ASSERT(parseVector3("(1,2,3)", v));
  TEST_ASSERT_NEAR(v.z, 3.0, 1e-6);
  TEST_ASSERT(parseVector3("4,5,6", v));
  TEST_ASSERT_NEAR(v.x, 4.0, 1e-6);
  TEST_ASSERT(!parseVector3("[1,2]", v));
  TEST_ASSERT(!parseVector3("[1,2,3,4]", v));
  TEST_ASSERT(!parseVector3("[1,x,3]", v));
  TEST_ASSERT_NEAR(v.x, 4.0, 1e-6);

  editor::Vector2 v2;
  TEST_ASSERT(parseVector2("(0.5, -1)", v2));
  TEST_ASSERT_NEAR(v2.y, -1.0, 1e-6);
  editor::Vector4 v4;
  TEST_ASSERT(parseVector4("[1,2,3,4]", v4));
  TEST_ASSERT_NEAR(v4.w, 4.0, 1e-6);
  TEST_CASE_OK("vector_forms");
}

static void test_colors() {
  editor::Color c;
  TEST_ASSERT(parseColor("#FF0000", c));
  TEST_ASSERT_NEAR(c.r, 1.0, 1e-6);
  TEST_ASSERT_NEAR(c.g, 0.0, 1e-6);
  TEST_ASSERT_NEAR(c.a, 1.0, 1e-6);
  TEST_ASSERT(parseColor("#00FF0080", c));
  TEST_ASSERT_NEAR(c.a, 128.0 / 255.0, 1e-4);
  TEST_ASSERT(parseColor("0.1,0.2,0.3", c));
  TEST_ASSERT_NEAR(c.b, 0.3, 1e-6);
  TEST_ASSERT_NEAR(c.a, 1.0, 1e-6);
  TEST_ASSERT(parseColor("[0,0,0,0.5]", c));
  TEST_ASSERT_NEAR(c.a, 0.5, 1e-6);
  TEST_ASSERT(!parseColor("#GG0000", c));
  TEST_ASSERT(!parseColor("red", c));
  TEST_CASE_OK("colors");
}

static void test_coerce_by_kind() {
  std::vector<std::string> no_names;
  editor::PropertyValue value;
  TEST_ASSERT(coerceValue("5", editor::PropertyKind::FLOAT, no_names, value));
  TEST_ASSERT(value.kind == editor::PropertyKind::FLOAT);
  TEST_ASSERT_NEAR(value.f, 5.0, 1e-9);

  TEST_ASSERT(coerceValue("hello world", editor::PropertyKind::STRING, no_names, value));
  TEST_ASSERT_EQ_STR(value.s, "hello world");

  TEST_ASSERT(!coerceValue("maybe", editor::PropertyKind::BOOLEAN, no_names, value));
  TEST_ASSERT(value.kind == editor::PropertyKind::STRING);

  std::vector<std::string> lights;
  lights.push_back("Spot");
  lights.push_back("Directional");
  lights.push_back("Point");
  TEST_ASSERT(coerceValue("point", editor::PropertyKind::ENUM, lights, value));
  TEST_ASSERT(value.kind == editor::PropertyKind::ENUM);
  TEST_ASSERT(value.i == 2);
  TEST_ASSERT(coerceValue("1", editor::PropertyKind::ENUM, lights, value));
  TEST_ASSERT(value.i == 1);
  TEST_ASSERT(!coerceValue("3", editor::PropertyKind::ENUM, lights, value));
  TEST_ASSERT(!coerceValue("Area", editor::PropertyKind::ENUM, lights, value));

  TEST_ASSERT(coerceValue("#000000", editor::PropertyKind::COLOR, no_names, value));
  TEST_ASSERT(value.kind == editor::PropertyKind::COLOR);
  TEST_CASE_OK("coerce_by_kind");
}

static void test_json_array() {
  const Json::Value json = toJsonArray(editor::Vector3(1, 2, 3));
  TEST_ASSERT(json.isArray());
  TEST_ASSERT_EQ_UINT(json.size(), 3);
  TEST_ASSERT_NEAR(json[2].asDouble(), 3.0, 1e-6);
  TEST_CASE_OK("json_array");
}

int main() {
  test_scalars_are_strict();
  test_booleans();
  test_vector_forms();
  test_colors();
  test_coerce_by_kind();
  test_json_array();
  return 0;
}
