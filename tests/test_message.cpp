#include <gtest/gtest.h>

#include "core/message.hpp"

using namespace chatstore;

TEST(MessageTest, CreateUserMessage) {
  auto msg = Message::user("Hello, world!");

  EXPECT_EQ(msg.role(), Role::User);
  EXPECT_EQ(msg.text(), "Hello, world!");
  EXPECT_FALSE(msg.is_streaming());
  EXPECT_FALSE(msg.is_blocks());
  EXPECT_FALSE(msg.id().empty());
}

TEST(MessageTest, CreateAssistantMessage) {
  auto msg = Message::assistant("Hi there!");

  EXPECT_EQ(msg.role(), Role::Assistant);
  EXPECT_EQ(msg.text(), "Hi there!");
}

TEST(MessageTest, IdsAreUnique) {
  EXPECT_NE(Message::user("a").id(), Message::user("a").id());
}

TEST(MessageTest, JsonSerialization) {
  auto msg = Message::user("Test message");

  auto j = msg.to_json();

  EXPECT_EQ(j["role"], "user");
  EXPECT_EQ(j["content"], "Test message");
  EXPECT_TRUE(j["thinking"].is_null());
  EXPECT_FALSE(j.contains("tool_results"));
  EXPECT_FALSE(j.contains("streaming"));
  EXPECT_TRUE(j["created_at"].is_string());
}

TEST(MessageTest, JsonRoundTrip) {
  Message msg(Role::Assistant, std::vector<ContentBlock>{TextBlock{"Running"}, ToolUseBlock{"tu_1", "bash", {{"command", "ls"}}}});
  msg.set_thinking(std::string("need a listing"));
  ToolResult result;
  result.tool_use_id = "tu_1";
  result.content = "a.txt";
  msg.set_tool_results({result});
  msg.set_streaming(true);

  auto j = msg.to_json();
  EXPECT_EQ(j["streaming"], true);
  EXPECT_EQ(j["tool_results"].size(), 1u);

  auto loaded = Message::from_json(j);
  EXPECT_EQ(loaded.id(), msg.id());
  EXPECT_EQ(loaded.role(), Role::Assistant);
  EXPECT_TRUE(loaded.is_blocks());
  EXPECT_TRUE(loaded.is_streaming());
  EXPECT_EQ(loaded.thinking(), std::optional<std::string>("need a listing"));
  ASSERT_EQ(loaded.tool_results().size(), 1u);
  EXPECT_EQ(loaded.tool_results()[0].tool_use_id, "tu_1");
  EXPECT_EQ(format_timestamp(loaded.created_at()), format_timestamp(msg.created_at()));

  auto& blocks = std::get<std::vector<ContentBlock>>(loaded.content());
  ASSERT_EQ(blocks.size(), 2u);
  EXPECT_EQ(std::get<ToolUseBlock>(blocks[1]).input["command"], "ls");
}

TEST(MessageTest, ContentTextJoinsTextBlocks) {
  Content content = std::vector<ContentBlock>{TextBlock{"one"}, ToolUseBlock{"t", "x", json::object()}, TextBlock{"two"}};
  EXPECT_EQ(content_text(content), "one\ntwo");
  EXPECT_TRUE(has_special_blocks(content));
  EXPECT_FALSE(has_special_blocks(Content(std::string("plain"))));
}

TEST(MessageTest, FileAndCompactionBlocks) {
  json j = json::array({
      {{"type", "image"}, {"file_id", "f1"}, {"media_type", "image/png"}, {"source", {{"type", "base64"}}}},
      {{"type", "compaction"}, {"summary", "earlier talk"}},
  });

  auto content = content_from_json(j);
  auto& blocks = std::get<std::vector<ContentBlock>>(content);
  ASSERT_EQ(blocks.size(), 2u);
  EXPECT_EQ(std::get<FileRefBlock>(blocks[0]).kind, "image");
  EXPECT_EQ(std::get<CompactionMarker>(blocks[1]).summary, "earlier talk");

  EXPECT_EQ(content_to_json(content), j);
}

TEST(MessageTest, SurfacePrefersFileReference) {
  SurfaceBlock surface;
  surface.content_id = "s1";
  surface.filename = std::string("surface_s1.html");
  surface.content = std::string("<p>inline</p>");

  auto j = block_to_json(surface);
  EXPECT_EQ(j["type"], "surface_content");
  EXPECT_EQ(j["filename"], "surface_s1.html");
  EXPECT_FALSE(j.contains("content"));
  EXPECT_FALSE(j.contains("title"));
}

TEST(MessageTest, UnknownBlocksArePreserved) {
  json j = {{"type", "server_tool_use"}, {"id", "x"}, {"extra", {1, 2}}};
  auto block = block_from_json(j);
  ASSERT_TRUE(std::holds_alternative<OpaqueBlock>(block));
  EXPECT_EQ(block_to_json(block), j);
}

TEST(MessageTest, LegacyContentShapes) {
  // {text, web_searches}
  auto legacy = content_from_json({{"text", "answer"}, {"web_searches", json::array({"q"})}});
  auto& blocks = std::get<std::vector<ContentBlock>>(legacy);
  ASSERT_EQ(blocks.size(), 2u);
  EXPECT_EQ(std::get<TextBlock>(blocks[0]).text, "answer");
  EXPECT_EQ(std::get<OpaqueBlock>(blocks[1]).raw["type"], "web_searches");

  // A single text object becomes a bare string
  auto single = content_from_json({{"type", "text"}, {"text", "hi"}});
  EXPECT_EQ(std::get<std::string>(single), "hi");

  EXPECT_EQ(std::get<std::string>(content_from_json(nullptr)), "");
}

TEST(MessageTest, FromJsonTolerance) {
  auto msg = Message::from_json({{"role", "assistant"}, {"content", "x"}, {"created_at", 1700000000}});
  EXPECT_FALSE(msg.id().empty());
  EXPECT_EQ(msg.role(), Role::Assistant);
  EXPECT_EQ(std::chrono::duration_cast<std::chrono::seconds>(msg.created_at().time_since_epoch()).count(), 1700000000);
}

TEST(MessageTest, TimestampFormat) {
  auto ts = parse_timestamp("2025-01-01T12:00:00.123456");
  EXPECT_EQ(format_timestamp(ts), "2025-01-01T12:00:00.123456");
  EXPECT_EQ(format_timestamp(parse_timestamp("2025-01-01T12:00:00")), "2025-01-01T12:00:00.000000");
  EXPECT_EQ(parse_timestamp("garbage"), Timestamp{});
}

TEST(MessageTest, RoleStrings) {
  EXPECT_EQ(to_string(Role::System), "system");
  EXPECT_EQ(role_from_string("assistant"), Role::Assistant);
  EXPECT_EQ(role_from_string("bogus"), Role::User);
}
