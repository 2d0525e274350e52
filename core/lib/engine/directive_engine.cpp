// typeset_lsp/engine/directive_engine.cpp - Reference engine
#include "typeset_lsp/engine/directive_engine.hpp"

#include <algorithm>
#include <fmt/format.h>

#include "typeset_lsp/engine/memo.hpp"

namespace typeset_lsp::engine
{

namespace
{

bool is_name_char(char c) noexcept
{
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_' ||
         c == '-';
}

uint32_t skip_spaces(std::string_view line, uint32_t pos) noexcept
{
  while (pos < line.size() && (line[pos] == ' ' || line[pos] == '\t')) {
    ++pos;
  }
  return pos;
}

SourceError make_error(SourceId source, ByteRange span, std::string message)
{
  SourceError err;
  err.source = source;
  err.span = span;
  err.message = std::move(message);
  return err;
}

// ============================================================================
// Line Parser
// ============================================================================

/// Parse a single line starting at byte offset `base` of its file
MarkupItem parse_line(const SourceFile & file, std::string_view line, uint32_t base, SourceErrors & errors)
{
  MarkupItem item;
  item.span = ByteRange{base, base + static_cast<uint32_t>(line.size())};

  uint32_t pos = skip_spaces(line, 0);
  const uint32_t hash_pos = pos;
  if (pos >= line.size() || line[pos] != '#') {
    item.text = std::string(line);
    return item;
  }
  ++pos;

  const uint32_t name_start = pos;
  while (pos < line.size() && is_name_char(line[pos])) {
    ++pos;
  }
  if (pos == name_start) {
    // A lone '#' is ordinary text
    item.text = std::string(line);
    return item;
  }

  item.kind = MarkupItem::Kind::Directive;
  item.name = std::string(line.substr(name_start, pos - name_start));
  item.name_span = ByteRange{base + hash_pos, base + pos};

  pos = skip_spaces(line, pos);
  bool open_paren = false;
  if (pos < line.size() && line[pos] == '(') {
    open_paren = true;
    pos = skip_spaces(line, pos + 1);
  }

  if (pos < line.size() && line[pos] == '"') {
    const uint32_t quote_start = pos;
    std::string value;
    ++pos;
    bool closed = false;
    while (pos < line.size()) {
      const char c = line[pos];
      if (c == '\\' && pos + 1 < line.size()) {
        value.push_back(line[pos + 1]);
        pos += 2;
        continue;
      }
      if (c == '"') {
        closed = true;
        ++pos;
        break;
      }
      value.push_back(c);
      ++pos;
    }
    if (!closed) {
      errors.push_back(make_error(
        file.id(), ByteRange{base + quote_start, base + static_cast<uint32_t>(line.size())},
        "unterminated string"));
      return item;
    }
    item.arg = MarkupItem::StringArg{std::move(value), ByteRange{base + quote_start, base + pos}};
    pos = skip_spaces(line, pos);
  }

  if (open_paren) {
    if (pos < line.size() && line[pos] == ')') {
      pos = skip_spaces(line, pos + 1);
    } else {
      auto err = make_error(
        file.id(), ByteRange{base + pos, base + pos}, "expected closing parenthesis");
      err.hints.push_back("directive arguments are written as #name(\"value\")");
      errors.push_back(std::move(err));
      return item;
    }
  }

  if (pos < line.size()) {
    errors.push_back(make_error(
      file.id(), ByteRange{base + pos, base + static_cast<uint32_t>(line.size())},
      "unexpected text after directive"));
  }
  return item;
}

// ============================================================================
// Evaluator
// ============================================================================

class Evaluator
{
public:
  Evaluator(const World & world, SourceErrors & errors) : world_(world), errors_(errors) {}

  Module eval_file(const SourceFile & file)
  {
    Module module;
    module.source = file.id();

    const auto parsed = memo::global().memoize<ParsedMarkup>(
      DirectiveEngine::k_parse_memo, file.fingerprint(), [&file] { return parse_markup(file); });
    errors_.insert(errors_.end(), parsed->errors.begin(), parsed->errors.end());

    route_.push_back(file.id());
    for (const auto & item : parsed->items) {
      if (item.kind == MarkupItem::Kind::Text) {
        module.content.push_back(Block{BlockKind::Text, item.text, 0});
        continue;
      }
      eval_directive(file, item, module);
    }
    route_.pop_back();
    return module;
  }

private:
  void eval_directive(const SourceFile & file, const MarkupItem & item, Module & module)
  {
    if (!world_.library().has_function(item.name)) {
      auto err = make_error(file.id(), item.name_span, fmt::format("unknown function: {}", item.name));
      err.hints.push_back("only functions of the standard library can be called");
      errors_.push_back(std::move(err));
      return;
    }

    if (item.name == "pagebreak") {
      module.content.push_back(Block{BlockKind::PageBreak, {}, 0});
      return;
    }

    if (item.name == "import" || item.name == "include") {
      const auto * arg = require_arg(file, item);
      if (arg == nullptr) {
        return;
      }
      auto child = eval_reference(file, *arg);
      if (child && item.name == "include") {
        module.content.insert(module.content.end(), child->content.begin(), child->content.end());
      }
      return;
    }

    if (item.name == "image") {
      const auto * arg = require_arg(file, item);
      if (arg == nullptr) {
        return;
      }
      const auto path = relative_to(file, arg->value);
      auto data = world_.fetch_binary_resource(path);
      if (!data) {
        errors_.push_back(make_error(file.id(), arg->span, data.error().message()));
        return;
      }
      module.content.push_back(Block{BlockKind::Image, path.generic_string(), data->size()});
      return;
    }

    if (item.name == "font") {
      const auto * arg = require_arg(file, item);
      if (arg == nullptr) {
        return;
      }
      const auto index = world_.font_book().select_family(arg->value);
      if (!index) {
        auto warn = make_error(file.id(), arg->span, fmt::format("unknown font family: {}", arg->value));
        warn.severity = Severity::Warning;
        errors_.push_back(std::move(warn));
        return;
      }
      const auto font = world_.fetch_font(*index);
      if (!font) {
        errors_.push_back(make_error(
          file.id(), arg->span, fmt::format("failed to load font: {}", arg->value)));
        return;
      }
      module.content.push_back(Block{BlockKind::FontChange, font->info.family, font->data.size()});
      return;
    }

    // heading, emph, strong, link, set: content is the argument, if any
    module.content.push_back(Block{BlockKind::Text, item.arg ? item.arg->value : std::string{}, 0});
  }

  const MarkupItem::StringArg * require_arg(const SourceFile & file, const MarkupItem & item)
  {
    if (!item.arg) {
      errors_.push_back(make_error(
        file.id(), item.name_span, fmt::format("{} expects a path string", item.name)));
      return nullptr;
    }
    return &*item.arg;
  }

  std::optional<Module> eval_reference(const SourceFile & file, const MarkupItem::StringArg & arg)
  {
    auto id = world_.resolve(relative_to(file, arg.value));
    if (!id) {
      errors_.push_back(make_error(file.id(), arg.span, id.error().message()));
      return std::nullopt;
    }
    if (std::find(route_.begin(), route_.end(), id.value()) != route_.end()) {
      errors_.push_back(make_error(file.id(), arg.span, "cyclic import"));
      return std::nullopt;
    }
    return eval_file(world_.fetch_text(id.value()));
  }

  static std::filesystem::path relative_to(const SourceFile & file, const std::string & target)
  {
    std::filesystem::path path(target);
    if (path.is_absolute() || file.path().empty()) {
      return path.lexically_normal();
    }
    return (file.path().parent_path() / path).lexically_normal();
  }

  const World & world_;
  SourceErrors & errors_;
  std::vector<SourceId> route_;
};

bool has_error(const SourceErrors & errors)
{
  return std::any_of(errors.begin(), errors.end(), [](const SourceError & e) {
    return e.severity == Severity::Error;
  });
}

Document layout(const Module & module)
{
  Document doc;
  doc.pages.emplace_back();
  for (const auto & block : module.content) {
    switch (block.kind) {
      case BlockKind::Text:
        doc.pages.back().lines.push_back(block.text);
        break;
      case BlockKind::Image:
        doc.pages.back().lines.push_back(
          fmt::format("[image {} ({} bytes)]", block.text, block.byte_size));
        break;
      case BlockKind::FontChange:
        break;
      case BlockKind::PageBreak:
        doc.pages.emplace_back();
        break;
    }
  }
  return doc;
}

}  // namespace

ParsedMarkup parse_markup(const SourceFile & file)
{
  ParsedMarkup parsed;
  for (uint32_t i = 0; i < file.line_count(); ++i) {
    const auto line = file.get_line(i);
    if (line.empty() && i > 0 && i + 1 == file.line_count()) {
      // Nothing after the final newline
      break;
    }
    parsed.items.push_back(parse_line(file, line, file.line_offsets()[i], parsed.errors));
  }
  return parsed;
}

PassResult<Document> DirectiveEngine::compile(const World & world)
{
  PassResult<Document> result;
  Evaluator evaluator(world, result.errors);
  const auto module = evaluator.eval_file(world.main_source());
  if (!has_error(result.errors)) {
    result.output = layout(module);
  }
  return result;
}

PassResult<Module> DirectiveEngine::evaluate(const World & world, const SourceFile & source)
{
  PassResult<Module> result;
  Evaluator evaluator(world, result.errors);
  auto module = evaluator.eval_file(source);
  if (!has_error(result.errors)) {
    result.output = std::move(module);
  }
  return result;
}

}  // namespace typeset_lsp::engine
