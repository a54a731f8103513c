#include <catch2/catch_test_macros.hpp>
#include "recovery/json_recovery.hpp"

using namespace toolcage;

TEST_CASE("extract_json_object: bare object", "[recovery]") {
    auto obj = extract_json_object(R"({"success": true, "n": 1})");
    REQUIRE(obj.has_value());
    REQUIRE((*obj)["success"] == true);
    REQUIRE((*obj)["n"] == 1);
}

TEST_CASE("extract_json_object: prose around the object", "[recovery]") {
    auto obj = extract_json_object(
        "Sure! Here is my verdict:\n{\"success\": false, \"analysis\": \"empty\"}\nHope it helps.");
    REQUIRE(obj.has_value());
    REQUIRE((*obj)["analysis"] == "empty");
}

TEST_CASE("extract_json_object: fenced block", "[recovery]") {
    auto obj = extract_json_object("```json\n{\"a\": [1, 2, 3]}\n```");
    REQUIRE(obj.has_value());
    REQUIRE((*obj)["a"].size() == 3);

    auto plain = extract_json_object("```\n{\"b\": null}\n```");
    REQUIRE(plain.has_value());
    REQUIRE((*plain)["b"].is_null());
}

TEST_CASE("extract_json_object: nested objects", "[recovery]") {
    auto obj = extract_json_object(R"(result: {"outer": {"inner": {"x": 1}}, "y": 2} end)");
    REQUIRE(obj.has_value());
    REQUIRE((*obj)["outer"]["inner"]["x"] == 1);
    REQUIRE((*obj)["y"] == 2);
}

TEST_CASE("extract_json_object: braces inside strings", "[recovery]") {
    auto obj = extract_json_object(R"({"code": "if (x) { return \"}\"; }", "ok": true})");
    REQUIRE(obj.has_value());
    REQUIRE((*obj)["code"] == "if (x) { return \"}\"; }");
    REQUIRE((*obj)["ok"] == true);
}

TEST_CASE("extract_json_object: unbalanced brace inside a string", "[recovery]") {
    auto obj = extract_json_object(R"(Answer: {"a": "text with a { brace inside"} done)");
    REQUIRE(obj.has_value());
    REQUIRE((*obj)["a"] == "text with a { brace inside");
}

TEST_CASE("extract_json_object: typographic quotes", "[recovery]") {
    std::string text = "{\xE2\x80\x9C" "success\xE2\x80\x9D: true, "
                       "\xE2\x80\x9C" "analysis\xE2\x80\x9D: \xE2\x80\x9C" "fine\xE2\x80\x9D}";
    auto obj = extract_json_object(text);
    REQUIRE(obj.has_value());
    REQUIRE((*obj)["success"] == true);
    REQUIRE((*obj)["analysis"] == "fine");
}

TEST_CASE("extract_json_object: skips a broken candidate", "[recovery]") {
    auto obj = extract_json_object(R"({not json} then {"valid": 1})");
    REQUIRE(obj.has_value());
    REQUIRE((*obj)["valid"] == 1);
}

TEST_CASE("extract_json_object: nothing to recover", "[recovery]") {
    REQUIRE_FALSE(extract_json_object("").has_value());
    REQUIRE_FALSE(extract_json_object("no json here").has_value());
    REQUIRE_FALSE(extract_json_object("[1, 2, 3]").has_value());
    REQUIRE_FALSE(extract_json_object(R"({"unclosed": true)").has_value());
}

TEST_CASE("normalize_smart_quotes: replaces curly quotes", "[recovery]") {
    REQUIRE(normalize_smart_quotes("\xE2\x80\x9Chi\xE2\x80\x9D") == "\"hi\"");
    REQUIRE(normalize_smart_quotes("it\xE2\x80\x99s") == "it's");
    REQUIRE(normalize_smart_quotes("plain") == "plain");
}
