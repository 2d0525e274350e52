#include <fmt/format.h>
#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "typeset_lsp/engine/directive_engine.hpp"
#include "typeset_lsp/server/server.hpp"
#include "typeset_lsp/test_support/memory_file_system.hpp"
#include "typeset_lsp/test_support/recording_client.hpp"

using namespace typeset_lsp;
using lsp::ContentChange;
using server::Server;
using test_support::MemoryFileSystem;
using test_support::RecordingClient;

namespace
{

struct Fixture
{
  explicit Fixture(ServerConfig config = {})
  : fs(std::make_shared<MemoryFileSystem>()),
    client(std::make_shared<RecordingClient>()),
    ws(fs, workspace::FontManager{}, client),
    server(ws, engine, std::move(config))
  {
  }

  std::shared_ptr<MemoryFileSystem> fs;
  std::shared_ptr<RecordingClient> client;
  workspace::Workspace ws;
  engine::DirectiveEngine engine;
  Server server;
};

ContentChange ranged(uint32_t line, uint32_t from, uint32_t to, std::string text)
{
  return ContentChange{LspRange{LspPosition{line, from}, LspPosition{line, to}}, std::move(text)};
}

class CrashingEngine : public engine::Engine
{
public:
  engine::PassResult<engine::Document> compile(const engine::World &) override
  {
    throw std::runtime_error("engine crashed");
  }

  engine::PassResult<engine::Module> evaluate(
    const engine::World &, const engine::SourceFile &) override
  {
    throw std::runtime_error("engine crashed");
  }
};

}  // namespace

TEST(Server, DidOpenPublishesDiagnostics)
{
  Fixture f;
  const Uri uri("file:///doc/main.typ");

  f.server.did_open(uri, "Hello\n#tabel(\"x\")\n").get();

  const auto published = f.client->published(uri);
  ASSERT_TRUE(published.has_value());
  ASSERT_EQ(published->size(), 1U);
  EXPECT_EQ((*published)[0].message, "unknown function: tabel");
  EXPECT_EQ((*published)[0].range.start, (LspPosition{1, 0}));
}

TEST(Server, DidChangeEditsAndClearsDiagnostics)
{
  Fixture f;
  const Uri uri("file:///doc/main.typ");
  f.server.did_open(uri, "#tabel(\"x\")\n").get();

  // Fix the typo in place: "tabel" -> "emph" (columns 1..6)
  f.server.did_change(uri, {ranged(0, 1, 6, "emph")}).get();

  auto guard = f.ws.sources().get_source(uri);
  ASSERT_TRUE(guard);
  EXPECT_EQ(guard.value()->text(), "#emph(\"x\")\n");

  const auto published = f.client->published(uri);
  ASSERT_TRUE(published.has_value());
  EXPECT_TRUE(published->empty());
}

TEST(Server, DidChangeAppliesChangesInOrder)
{
  Fixture f;
  const Uri uri("file:///doc/main.typ");
  f.server.did_open(uri, "abc\n").get();

  f.server
    .did_change(uri, {ContentChange{std::nullopt, "h\xC3\xA9llo\n"}, ranged(0, 2, 4, "LL")})
    .get();

  auto guard = f.ws.sources().get_source(uri);
  ASSERT_TRUE(guard);
  EXPECT_EQ(guard.value()->text(), "h\xC3\xA9LLo\n");
}

TEST(Server, DidChangeOnUnreadableFileLogsWarning)
{
  Fixture f;
  f.server.did_change(Uri("file:///doc/ghost.typ"), {ContentChange{std::nullopt, "x"}}).get();

  const auto logs = f.client->logs();
  ASSERT_EQ(logs.size(), 1U);
  EXPECT_EQ(logs[0].type, lsp::MessageType::Warning);
  EXPECT_EQ(f.client->publish_count(), 0);
}

TEST(Server, DidChangeOnClosedDocumentWarns)
{
  Fixture f;
  f.fs->write("/doc/side.typ", "disk\n");
  const Uri uri("file:///doc/side.typ");

  f.server.did_change(uri, {ContentChange{std::nullopt, "edited\n"}}).get();

  const auto logs = f.client->logs();
  ASSERT_EQ(logs.size(), 1U);
  EXPECT_EQ(logs[0].type, lsp::MessageType::Warning);

  const auto id = f.ws.sources().find(uri);
  ASSERT_TRUE(id.has_value());
  EXPECT_EQ(f.ws.sources().status(*id), workspace::CacheStatus::ClosedUnmodified);
  auto guard = f.ws.sources().get_source(uri);
  ASSERT_TRUE(guard);
  EXPECT_EQ(guard.value()->text(), "edited\n");
}

TEST(Server, DidCloseClearsDiagnosticsAndReloadsFromDisk)
{
  Fixture f;
  f.fs->write("/doc/main.typ", "on disk\n");
  const Uri uri("file:///doc/main.typ");
  f.server.did_open(uri, "#tabel()\n").get();
  ASSERT_EQ(f.client->published(uri)->size(), 1U);

  f.server.did_close(uri);
  EXPECT_TRUE(f.client->published(uri)->empty());
  EXPECT_TRUE(f.ws.sources().list_open_uris().empty());

  auto guard = f.ws.sources().get_source(uri);
  ASSERT_TRUE(guard);
  EXPECT_EQ(guard.value()->text(), "on disk\n");
}

TEST(Server, ErrorsInImportedFilesArePublishedForThoseFiles)
{
  ServerConfig config;
  config.diagnostic_pass = DiagnosticPass::Compile;
  Fixture f(config);
  f.fs->write("/doc/part.typ", "#bad()\n");
  const Uri main("file:///doc/main.typ");
  const Uri part("file:///doc/part.typ");

  f.server.did_open(main, "#include(\"part.typ\")\n").get();

  const auto on_part = f.client->published(part);
  ASSERT_TRUE(on_part.has_value());
  EXPECT_EQ(on_part->size(), 1U);

  // The open document without errors gets an empty list
  const auto on_main = f.client->published(main);
  ASSERT_TRUE(on_main.has_value());
  EXPECT_TRUE(on_main->empty());
}

TEST(Server, WatchedFileChangesAreSeenByTheNextPass)
{
  Fixture f;
  f.fs->write("/doc/lib.typ", "#bad()\n");
  const Uri main("file:///doc/main.typ");
  const Uri lib("file:///doc/lib.typ");

  f.server.did_open(main, "#import(\"lib.typ\")\n").get();
  ASSERT_EQ(f.client->published(lib)->size(), 1U);

  f.fs->write("/doc/lib.typ", "fixed\n");
  f.server.did_change_watched_files({lib});
  const auto id = f.ws.sources().find(lib);
  ASSERT_TRUE(id.has_value());
  EXPECT_EQ(f.ws.sources().status(*id), workspace::CacheStatus::ClosedModified);

  f.server.run_diagnostics(*f.ws.sources().find(main)).get();
  const auto published = f.client->published(main);
  ASSERT_TRUE(published.has_value());
  EXPECT_TRUE(published->empty());
  EXPECT_EQ(f.ws.sources().status(*id), workspace::CacheStatus::ClosedUnmodified);
}

TEST(Server, UpdateAllDiagnosticsCoversOpenDocuments)
{
  Fixture f;
  const Uri a("file:///doc/a.typ");
  const Uri b("file:///doc/b.typ");
  f.ws.sources().open(a, "a");
  f.ws.sources().open(b, "b");

  DiagnosticsByUri diags;
  Diagnostic d;
  d.message = "only on a";
  diags[a].push_back(d);
  f.server.update_all_diagnostics(std::move(diags));

  EXPECT_EQ(f.client->published(a)->size(), 1U);
  ASSERT_TRUE(f.client->published(b).has_value());
  EXPECT_TRUE(f.client->published(b)->empty());
  EXPECT_EQ(f.client->publish_count(), 2);
}

TEST(Server, PassFailuresSurfaceThroughTheFuture)
{
  auto fs = std::make_shared<MemoryFileSystem>();
  auto client = std::make_shared<RecordingClient>();
  workspace::Workspace ws(fs, workspace::FontManager{}, client);
  CrashingEngine engine;
  Server server(ws, engine, ServerConfig{});

  auto pass = server.did_open(Uri("file:///doc/main.typ"), "text\n");
  EXPECT_THROW(pass.get(), std::runtime_error);
  EXPECT_EQ(client->publish_count(), 0);

  // The pool keeps serving after a failed pass
  EXPECT_THROW(server.run_diagnostics(SourceId(0)).get(), std::runtime_error);
}

TEST(Server, DestructionWaitsForQueuedPasses)
{
  std::shared_ptr<RecordingClient> client;
  {
    ServerConfig config;
    config.compile_threads = 0;
    Fixture f(config);
    client = f.client;
    for (int i = 0; i < 10; ++i) {
      (void)f.server.did_open(Uri(fmt::format("file:///doc/{}.typ", i)), "plain\n");
    }
  }
  // Every pass published at least its own document
  EXPECT_GE(client->publish_count(), 10);
}
