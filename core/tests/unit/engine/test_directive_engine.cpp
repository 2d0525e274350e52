#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "typeset_lsp/engine/directive_engine.hpp"
#include "typeset_lsp/engine/memo.hpp"

using namespace typeset_lsp;
using engine::BlockKind;
using engine::DirectiveEngine;
using engine::SourceFile;

namespace
{

/// Self-contained World over an in-memory set of files
class FakeWorld final : public engine::World
{
public:
  FakeWorld() : library_(engine::Library::standard()), detached_(SourceFile::detached("")) {}

  SourceId add(const std::string & path, std::string text)
  {
    const SourceId id(static_cast<uint16_t>(files_.size()));
    files_.push_back(std::make_unique<SourceFile>(id, path, std::move(text)));
    return id;
  }

  void add_resource(const std::string & path, std::string data)
  {
    resources_[path] = Bytes::from_string(data);
  }

  void add_font(const std::string & family, const std::string & path, bool loadable)
  {
    book_.push(engine::FontInfo{family, path});
    loadable_.push_back(loadable);
  }

  void set_main(SourceId id) { main_ = id; }

  const engine::Library & library() const override { return library_; }
  const engine::FontBook & font_book() const override { return book_; }

  const SourceFile & main_source() const override
  {
    if (main_.is_detached()) {
      throw std::logic_error("no main source");
    }
    return fetch_text(main_);
  }

  FileResult<SourceId> resolve(const std::filesystem::path & path) const override
  {
    ++resolve_calls;
    for (const auto & file : files_) {
      if (file->path() == path) {
        return FileResult<SourceId>::ok(file->id());
      }
    }
    return FileResult<SourceId>::fail(FileError::not_found(path));
  }

  const SourceFile & fetch_text(SourceId id) const override
  {
    return id.index() < files_.size() ? *files_[id.index()] : detached_;
  }

  FileResult<Bytes> fetch_binary_resource(const std::filesystem::path & path) const override
  {
    const auto it = resources_.find(path.generic_string());
    if (it == resources_.end()) {
      return FileResult<Bytes>::fail(FileError::not_found(path));
    }
    return FileResult<Bytes>::ok(it->second);
  }

  std::optional<engine::Font> fetch_font(size_t index) const override
  {
    if (index >= loadable_.size() || !loadable_[index]) {
      return std::nullopt;
    }
    return engine::Font{index, *book_.info(index), Bytes::from_string("font")};
  }

  mutable int resolve_calls = 0;

private:
  engine::Library library_;
  engine::FontBook book_;
  std::vector<bool> loadable_;
  std::vector<std::unique_ptr<SourceFile>> files_;
  std::map<std::string, Bytes> resources_;
  SourceFile detached_;
  SourceId main_;
};

const engine::SourceError * find_error(const engine::SourceErrors & errors, const std::string & msg)
{
  for (const auto & e : errors) {
    if (e.message.find(msg) != std::string::npos) {
      return &e;
    }
  }
  return nullptr;
}

}  // namespace

TEST(DirectiveEngine, ParsesDirectivesAndText)
{
  const SourceFile file(SourceId(0), "/doc/main.typ", "Hello\n  #heading(\"Intro\")\n#pagebreak()\n");
  const auto parsed = engine::parse_markup(file);

  ASSERT_TRUE(parsed.errors.empty());
  ASSERT_EQ(parsed.items.size(), 3U);
  EXPECT_EQ(parsed.items[0].kind, engine::MarkupItem::Kind::Text);
  EXPECT_EQ(parsed.items[0].text, "Hello");

  const auto & heading = parsed.items[1];
  EXPECT_EQ(heading.kind, engine::MarkupItem::Kind::Directive);
  EXPECT_EQ(heading.name, "heading");
  ASSERT_TRUE(heading.arg.has_value());
  EXPECT_EQ(heading.arg->value, "Intro");
  EXPECT_EQ(file.get_slice(heading.name_span), "#heading");
  EXPECT_EQ(file.get_slice(heading.arg->span), "\"Intro\"");

  EXPECT_EQ(parsed.items[2].name, "pagebreak");
  EXPECT_FALSE(parsed.items[2].arg.has_value());
}

TEST(DirectiveEngine, ReportsSyntaxErrors)
{
  const SourceFile file(SourceId(0), "/doc/main.typ", "#image(\"a.png\n#link(\"x\" junk\n");
  const auto parsed = engine::parse_markup(file);

  const auto * unterminated = find_error(parsed.errors, "unterminated string");
  ASSERT_NE(unterminated, nullptr);
  EXPECT_EQ(unterminated->span.start, 6U);

  EXPECT_NE(find_error(parsed.errors, "expected closing parenthesis"), nullptr);
}

TEST(DirectiveEngine, UnknownFunctionIsAnError)
{
  FakeWorld world;
  const SourceId main = world.add("/doc/main.typ", "#tabel(\"x\")\n");
  DirectiveEngine eng;

  const auto result = eng.evaluate(world, world.fetch_text(main));
  EXPECT_FALSE(result.output.has_value());
  const auto * err = find_error(result.errors, "unknown function: tabel");
  ASSERT_NE(err, nullptr);
  EXPECT_EQ(err->source, main);
  EXPECT_EQ(err->span.start, 0U);
  EXPECT_EQ(err->span.end, 6U);
  EXPECT_FALSE(err->hints.empty());
}

TEST(DirectiveEngine, IncludeResolvesRelativeToCurrentFile)
{
  FakeWorld world;
  const SourceId main = world.add("/doc/main.typ", "Top\n#include(\"parts/a.typ\")\n");
  world.add("/doc/parts/a.typ", "From A\n");
  DirectiveEngine eng;

  const auto result = eng.evaluate(world, world.fetch_text(main));
  ASSERT_TRUE(result.output.has_value()) << (result.errors.empty() ? "" : result.errors[0].message);
  std::vector<std::string> texts;
  for (const auto & block : result.output->content) {
    if (block.kind == BlockKind::Text) {
      texts.push_back(block.text);
    }
  }
  EXPECT_EQ(texts, (std::vector<std::string>{"Top", "From A"}));
}

TEST(DirectiveEngine, ErrorsInImportedFilesCarryTheirSourceId)
{
  FakeWorld world;
  const SourceId main = world.add("/doc/main.typ", "#import \"lib.typ\"\n");
  const SourceId lib = world.add("/doc/lib.typ", "ok\n#nope()\n");
  DirectiveEngine eng;

  const auto result = eng.evaluate(world, world.fetch_text(main));
  const auto * err = find_error(result.errors, "unknown function: nope");
  ASSERT_NE(err, nullptr);
  EXPECT_EQ(err->source, lib);
}

TEST(DirectiveEngine, MissingImportIsAnErrorAtTheString)
{
  FakeWorld world;
  const SourceId main = world.add("/doc/main.typ", "#import(\"gone.typ\")\n");
  DirectiveEngine eng;

  const auto result = eng.evaluate(world, world.fetch_text(main));
  const auto * err = find_error(result.errors, "file not found");
  ASSERT_NE(err, nullptr);
  EXPECT_EQ(err->source, main);
  EXPECT_EQ(world.fetch_text(main).get_slice(err->span), "\"gone.typ\"");
}

TEST(DirectiveEngine, CyclicImportIsAnError)
{
  FakeWorld world;
  const SourceId a = world.add("/doc/a.typ", "#import(\"b.typ\")\n");
  world.add("/doc/b.typ", "#import(\"a.typ\")\n");
  DirectiveEngine eng;

  const auto result = eng.evaluate(world, world.fetch_text(a));
  EXPECT_NE(find_error(result.errors, "cyclic import"), nullptr);
}

TEST(DirectiveEngine, ImagesAndFontsUseWorldQueries)
{
  FakeWorld world;
  const SourceId main = world.add(
    "/doc/main.typ",
    "#image(\"logo.png\")\n#font(\"inter\")\n#font(\"Comic\")\n#font(\"Broken\")\n#image(\"none.png\")\n");
  world.add_resource("/doc/logo.png", "PNGDATA");
  world.add_font("Inter", "/fonts/Inter.ttf", true);
  world.add_font("Broken", "/fonts/Broken.ttf", false);
  DirectiveEngine eng;

  const auto result = eng.evaluate(world, world.fetch_text(main));

  const auto * unknown_family = find_error(result.errors, "unknown font family: Comic");
  ASSERT_NE(unknown_family, nullptr);
  EXPECT_EQ(unknown_family->severity, Severity::Warning);

  const auto * broken = find_error(result.errors, "failed to load font: Broken");
  ASSERT_NE(broken, nullptr);
  EXPECT_EQ(broken->severity, Severity::Error);

  EXPECT_NE(find_error(result.errors, "none.png"), nullptr);
  EXPECT_FALSE(result.output.has_value());
}

TEST(DirectiveEngine, CompileLaysOutPages)
{
  FakeWorld world;
  const SourceId main =
    world.add("/doc/main.typ", "Page one\n#image(\"logo.png\")\n#pagebreak()\nPage two");
  world.add_resource("/doc/logo.png", "1234");
  world.set_main(main);
  DirectiveEngine eng;

  const auto result = eng.compile(world);
  ASSERT_TRUE(result.output.has_value());
  ASSERT_EQ(result.output->pages.size(), 2U);
  EXPECT_EQ(
    result.output->pages[0].lines,
    (std::vector<std::string>{"Page one", "[image /doc/logo.png (4 bytes)]"}));
  EXPECT_EQ(result.output->pages[1].lines, (std::vector<std::string>{"Page two"}));
}

TEST(DirectiveEngine, WarningsDoNotSuppressOutput)
{
  FakeWorld world;
  const SourceId main = world.add("/doc/main.typ", "#font(\"Nope\")\ntext\n");
  DirectiveEngine eng;

  const auto result = eng.evaluate(world, world.fetch_text(main));
  EXPECT_EQ(result.errors.size(), 1U);
  EXPECT_TRUE(result.output.has_value());
}

TEST(DirectiveEngine, ParseIsMemoizedByFingerprint)
{
  FakeWorld world;
  const SourceId main = world.add("/doc/main.typ", "memo test line\n");
  DirectiveEngine eng;
  const auto & file = world.fetch_text(main);

  (void)eng.evaluate(world, file);
  EXPECT_TRUE(engine::memo::global().contains(DirectiveEngine::k_parse_memo, file.fingerprint()));

  const auto hits_before = engine::memo::global().stats().hits;
  (void)eng.evaluate(world, file);
  EXPECT_GT(engine::memo::global().stats().hits, hits_before);
}
