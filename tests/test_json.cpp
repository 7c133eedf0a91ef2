#include <iostream>
#include <stdexcept>
#include <string>

#include "superint/util/json.h"

#define SI_ASSERT(expr) \
  do { \
    if (!(expr)) { \
      std::cerr << "ASSERT failed: " #expr " (" << __FILE__ << ":" << __LINE__ << ")\n"; \
      return 1; \
    } \
  } while (0)

namespace json = superint::json;

static std::string parse_error_message(const std::string& text) {
  try {
    (void)json::parse(text);
  } catch (const std::runtime_error& e) {
    return std::string(e.what());
  }
  return {};
}

int test_json() {
  // Objects are written with sorted keys and integral numbers without a fraction.
  {
    json::Object o;
    o["zeta"] = 3;
    o["alpha"] = true;
    o["mid"] = json::Array{json::Value(), "x", 2.5};
    const std::string compact = json::stringify(json::Value(o), 0);
    SI_ASSERT(compact == "{\"alpha\":true,\"mid\":[null,\"x\",2.5],\"zeta\":3}");

    const std::string pretty = json::stringify(json::Value(o), 2);
    SI_ASSERT(pretty.find("\n  \"alpha\": true") != std::string::npos);
  }

  // Doubles survive a text round trip exactly.
  {
    const double values[] = {0.1, 1.0 / 3.0, 1e-12, 123456.789, -0.7};
    for (double d : values) {
      const json::Value back = json::parse(json::stringify(json::Value(d), 0));
      SI_ASSERT(back.is_number());
      SI_ASSERT(back.number_value() == d);
    }
  }

  // Accessors with defaults.
  {
    const json::Value v = json::parse("{\"n\": 7, \"s\": \"hi\", \"b\": false, \"list\": [1, 2]}");
    SI_ASSERT(v.at("n").int_value() == 7);
    SI_ASSERT(v.at("s").string_value() == "hi");
    SI_ASSERT(v.at("b").bool_value(true) == false);
    SI_ASSERT(v.at("list").array().size() == 2);
    SI_ASSERT(v.at("list").at(1).number_value() == 2.0);
    SI_ASSERT(v.find("missing") == nullptr);
    SI_ASSERT(v.at("s").number_value(4.0) == 4.0);

    bool threw = false;
    try {
      (void)v.at("missing");
    } catch (const std::runtime_error&) {
      threw = true;
    }
    SI_ASSERT(threw);
  }

  // Escapes and unicode.
  {
    const json::Value v = json::parse("\"a\\n\\u00e9\\ud83d\\ude00\"");
    SI_ASSERT(v.string_value() == "a\n\xC3\xA9\xF0\x9F\x98\x80");
    SI_ASSERT(json::stringify(json::Value("q\"t"), 0) == "\"q\\\"t\"");
  }

  // UTF-8 byte order mark at the start of a document is ignored.
  {
    const json::Value v = json::parse("\xEF\xBB\xBF{\"ok\": true}");
    SI_ASSERT(v.at("ok").bool_value());
  }

  // Errors carry line and column.
  {
    const std::string msg = parse_error_message("[\n  1,\n  ,\n  2\n]\n");
    SI_ASSERT(!msg.empty());
    SI_ASSERT(msg.find("line 3, col 3") != std::string::npos);
  }
  {
    const std::string msg = parse_error_message("{\"a\": 1} trailing");
    SI_ASSERT(!msg.empty());
  }
  {
    const std::string msg = parse_error_message("{\"a\": tru}");
    SI_ASSERT(!msg.empty());
  }

  return 0;
}
