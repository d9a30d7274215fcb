// Repository: Seedling
// Component: JSON Unit Tests
// Purpose: Parser and writer behaviour for recognizer payloads and API replies.
// Copyright (c) 2025 RetroVue

#include "seedling/util/Json.hpp"

#include <gtest/gtest.h>

#include <string>

using seedling::util::JsonEscape;
using seedling::util::JsonObjectWriter;
using seedling::util::JsonValue;
using seedling::util::ParseJson;

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

TEST(JsonTest, ParsesNestedRecognizerResult)
{
  auto v = ParseJson(R"({"result":{"text":"hello","utterances":[{"definite":true}]},"audio_info":{"duration":3200}})");
  ASSERT_TRUE(v.has_value());
  ASSERT_TRUE(v->IsObject());
  const JsonValue* result = v->Find("result");
  ASSERT_NE(result, nullptr);
  EXPECT_EQ(result->GetString("text").value_or(""), "hello");
  const JsonValue* utterances = result->Find("utterances");
  ASSERT_NE(utterances, nullptr);
  ASSERT_TRUE(utterances->IsArray());
  ASSERT_EQ(utterances->size(), 1u);
  EXPECT_TRUE(utterances->At(0).Find("definite")->AsBool());
  EXPECT_EQ(v->Find("audio_info")->Find("duration")->AsInt(), 3200);
}

TEST(JsonTest, DecodesUnicodeEscapesAndSurrogatePairs)
{
  auto v = ParseJson(R"({"t":"\u4f60\u597d \ud83d\ude00"})");
  ASSERT_TRUE(v.has_value());
  EXPECT_EQ(v->GetString("t").value_or(""), "\xE4\xBD\xA0\xE5\xA5\xBD \xF0\x9F\x98\x80");
}

TEST(JsonTest, RejectsMalformedInput)
{
  EXPECT_FALSE(ParseJson("").has_value());
  EXPECT_FALSE(ParseJson("{").has_value());
  EXPECT_FALSE(ParseJson(R"({"a":1,})").has_value());
  EXPECT_FALSE(ParseJson(R"({"a":1} x)").has_value());
  EXPECT_FALSE(ParseJson("\x1f\x8b\x08").has_value());
}

TEST(JsonTest, RejectsExcessiveNesting)
{
  std::string deep(seedling::util::kMaxJsonDepth + 1, '[');
  deep.append(seedling::util::kMaxJsonDepth + 1, ']');
  EXPECT_FALSE(ParseJson(deep).has_value());

  std::string ok(8, '[');
  ok.append(8, ']');
  EXPECT_TRUE(ParseJson(ok).has_value());
}

TEST(JsonTest, GetStringIgnoresNonStringMembers)
{
  auto v = ParseJson(R"({"text":42,"empty":""})");
  ASSERT_TRUE(v.has_value());
  EXPECT_FALSE(v->GetString("text").has_value());
  EXPECT_FALSE(v->GetString("missing").has_value());
  EXPECT_EQ(v->GetString("empty").value_or("x"), "");
}

// ---------------------------------------------------------------------------
// Writing
// ---------------------------------------------------------------------------

TEST(JsonTest, WriterProducesParseableObject)
{
  JsonObjectWriter w;
  w.AddString("status", "stopped")
      .AddString("text", "say \"hi\"\n")
      .AddFixed("duration", 1.234, 2)
      .AddInt("chars", 9)
      .AddBool("timeout", false);
  EXPECT_EQ(w.str(),
            R"({"status":"stopped","text":"say \"hi\"\n","duration":1.23,"chars":9,"timeout":false})");

  auto back = ParseJson(w.str());
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(back->GetString("text").value_or(""), "say \"hi\"\n");
}

TEST(JsonTest, EmptyWriterIsEmptyObject)
{
  JsonObjectWriter w;
  EXPECT_EQ(w.str(), "{}");
}

TEST(JsonTest, EscapeHandlesControlCharacters)
{
  EXPECT_EQ(JsonEscape("a\tb\\c"), "a\\tb\\\\c");
  EXPECT_EQ(JsonEscape(std::string("\x01", 1)), "\\u0001");
  EXPECT_EQ(JsonEscape("\xE4\xBD\xA0"), "\xE4\xBD\xA0");
}

TEST(JsonTest, SerializeRoundTripsBuiltTree)
{
  JsonValue root = JsonValue::Object();
  JsonValue list = JsonValue::Array();
  list.Append(JsonValue::Number(1));
  list.Append(JsonValue::Bool(true));
  list.Append(JsonValue());
  root.Set("list", list);
  root.Set("name", JsonValue::String("x"));
  EXPECT_EQ(root.Serialize(), R"({"list":[1,true,null],"name":"x"})");
}
