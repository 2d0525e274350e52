#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "typeset_lsp/lsp/client.hpp"
#include "typeset_lsp/lsp/protocol.hpp"

using nlohmann::json;
using typeset_lsp::Diagnostic;
using typeset_lsp::LspPosition;
using typeset_lsp::LspRange;
using typeset_lsp::Severity;
using typeset_lsp::Uri;
using typeset_lsp::lsp::decode_content_changes;
using typeset_lsp::lsp::JsonClient;
using typeset_lsp::lsp::MessageType;

TEST(LspProtocol, DiagnosticEncoding)
{
  Diagnostic diag;
  diag.range = LspRange{LspPosition{1, 2}, LspPosition{1, 6}};
  diag.severity = Severity::Warning;
  diag.message = "unknown font family: Comic";
  diag.hints = {"try Inter"};

  const json j = diag;
  EXPECT_EQ(j["range"]["start"]["line"], 1);
  EXPECT_EQ(j["range"]["end"]["character"], 6);
  EXPECT_EQ(j["severity"], 2);
  EXPECT_EQ(j["source"], "typeset");
  EXPECT_EQ(j["message"], "unknown font family: Comic\nhint: try Inter");
}

TEST(LspProtocol, DecodesContentChanges)
{
  const auto changes = json::parse(R"([
    {"range": {"start": {"line": 0, "character": 1}, "end": {"line": 0, "character": 3}}, "text": "ab"},
    {"text": "whole"},
    {"range": null, "text": "also whole"},
    {"range": {"start": {"line": 0}}, "text": "bad range"},
    {"range": {"start": {"line": 0, "character": 0}, "end": {"line": 0, "character": 0}}},
    42
  ])");

  const auto decoded = decode_content_changes(changes);
  ASSERT_EQ(decoded.size(), 3U);
  ASSERT_TRUE(decoded[0].range.has_value());
  EXPECT_EQ(decoded[0].range->start, (LspPosition{0, 1}));
  EXPECT_EQ(decoded[0].range->end, (LspPosition{0, 3}));
  EXPECT_EQ(decoded[0].text, "ab");
  EXPECT_FALSE(decoded[1].range.has_value());
  EXPECT_EQ(decoded[1].text, "whole");
  EXPECT_FALSE(decoded[2].range.has_value());

  EXPECT_TRUE(decode_content_changes(json::object()).empty());
}

TEST(LspProtocol, JsonClientWritesNotifications)
{
  std::vector<json> written;
  JsonClient client([&written](const json & msg) { written.push_back(msg); });

  client.log_message(MessageType::Error, "boom");
  Diagnostic diag;
  diag.message = "bad";
  client.publish_diagnostics(Uri("file:///doc/a.typ"), {diag});
  client.publish_diagnostics(Uri("file:///doc/b.typ"), {});

  ASSERT_EQ(written.size(), 3U);
  EXPECT_EQ(written[0]["method"], "window/logMessage");
  EXPECT_EQ(written[0]["params"]["type"], 1);
  EXPECT_EQ(written[0]["params"]["message"], "boom");

  EXPECT_EQ(written[1]["method"], "textDocument/publishDiagnostics");
  EXPECT_EQ(written[1]["params"]["uri"], "file:///doc/a.typ");
  ASSERT_EQ(written[1]["params"]["diagnostics"].size(), 1U);
  EXPECT_EQ(written[1]["params"]["diagnostics"][0]["severity"], 1);

  EXPECT_TRUE(written[2]["params"]["diagnostics"].is_array());
  EXPECT_TRUE(written[2]["params"]["diagnostics"].empty());
}
