// typeset_lsp/engine/world.hpp - The engine's synchronous query contract
#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>

#include "typeset_lsp/basic/bytes.hpp"
#include "typeset_lsp/basic/file_error.hpp"
#include "typeset_lsp/basic/source_id.hpp"
#include "typeset_lsp/engine/font.hpp"
#include "typeset_lsp/engine/library.hpp"
#include "typeset_lsp/engine/source_file.hpp"

namespace typeset_lsp::engine
{

/**
 * Everything the engine may ask about its environment during one pass.
 *
 * All queries are synchronous and may be called from any thread running a
 * pass. References returned by fetch_text() and main_source() must stay valid
 * for the lifetime of the World object; the engine holds on to them until the
 * pass ends.
 */
class World
{
public:
  virtual ~World() = default;

  [[nodiscard]] virtual const Library & library() const = 0;

  [[nodiscard]] virtual const FontBook & font_book() const = 0;

  /// The file this pass is about
  [[nodiscard]] virtual const SourceFile & main_source() const = 0;

  /// Map a path to a source id, loading the file if it is not known yet
  [[nodiscard]] virtual FileResult<SourceId> resolve(const std::filesystem::path & path) const = 0;

  /// Text of a resolved source. Has no error channel.
  [[nodiscard]] virtual const SourceFile & fetch_text(SourceId id) const = 0;

  [[nodiscard]] virtual FileResult<Bytes> fetch_binary_resource(
    const std::filesystem::path & path) const = 0;

  [[nodiscard]] virtual std::optional<Font> fetch_font(size_t index) const = 0;
};

}  // namespace typeset_lsp::engine
