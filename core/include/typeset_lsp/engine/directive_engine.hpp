// typeset_lsp/engine/directive_engine.hpp - Reference engine
//
// A small engine that understands `#name("arg")` directive lines and treats
// every other line as text. It exists to drive the World contract end to end:
// imports resolve and fetch other sources, images fetch binary resources and
// font directives consult the font book.
//
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "typeset_lsp/engine/engine.hpp"

namespace typeset_lsp::engine
{

/// One parsed line of markup
struct MarkupItem
{
  enum class Kind : uint8_t { Text, Directive };

  struct StringArg
  {
    std::string value;
    ByteRange span;  ///< Including the quotes
  };

  Kind kind = Kind::Text;
  ByteRange span;       ///< Whole line, without terminator
  std::string text;     ///< Line text (Text items)
  std::string name;     ///< Directive name without '#'
  ByteRange name_span;  ///< Including the '#'
  std::optional<StringArg> arg;
};

struct ParsedMarkup
{
  std::vector<MarkupItem> items;
  SourceErrors errors;
};

/// Parse one file (pure; memoized by DirectiveEngine)
[[nodiscard]] ParsedMarkup parse_markup(const SourceFile & file);

class DirectiveEngine final : public Engine
{
public:
  /// Memo cache function name for parse results
  static constexpr const char * k_parse_memo = "directive_engine::parse";

  [[nodiscard]] PassResult<Document> compile(const World & world) override;

  [[nodiscard]] PassResult<Module> evaluate(const World & world, const SourceFile & source) override;
};

}  // namespace typeset_lsp::engine
