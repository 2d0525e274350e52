// typeset_lsp/engine/engine.hpp - Compile/evaluate entry points
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "typeset_lsp/basic/diagnostic.hpp"
#include "typeset_lsp/basic/position.hpp"
#include "typeset_lsp/basic/source_id.hpp"
#include "typeset_lsp/engine/source_file.hpp"
#include "typeset_lsp/engine/world.hpp"

namespace typeset_lsp::engine
{

// ============================================================================
// Pass Outputs
// ============================================================================

/// An error or warning attached to a byte span of one source
struct SourceError
{
  SourceId source;
  ByteRange span;
  Severity severity = Severity::Error;
  std::string message;
  std::vector<std::string> hints;
};

using SourceErrors = std::vector<SourceError>;

enum class BlockKind : uint8_t {
  Text,
  Image,
  FontChange,
  PageBreak,
};

struct Block
{
  BlockKind kind = BlockKind::Text;
  std::string text;        ///< Text content, image path or font family
  size_t byte_size = 0;    ///< Image payload size
};

/// Result of evaluating one file
struct Module
{
  SourceId source;
  std::vector<Block> content;
};

struct Page
{
  std::vector<std::string> lines;
};

/// Result of a full compilation of the main source
struct Document
{
  std::vector<Page> pages;
};

template <typename T>
struct PassResult
{
  /// Present unless an error-severity SourceError was produced
  std::optional<T> output;
  SourceErrors errors;
};

// ============================================================================
// Engine
// ============================================================================

/**
 * A compiler driven through the World contract.
 *
 * Both entry points are synchronous and may block inside World queries, so
 * they must run on a thread that is allowed to block.
 */
class Engine
{
public:
  virtual ~Engine() = default;

  /// Evaluate and lay out world.main_source()
  [[nodiscard]] virtual PassResult<Document> compile(const World & world) = 0;

  /// Evaluate `source` only (no layout)
  [[nodiscard]] virtual PassResult<Module> evaluate(
    const World & world, const SourceFile & source) = 0;
};

}  // namespace typeset_lsp::engine
