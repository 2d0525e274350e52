// typeset_lsp/lsp/protocol.hpp - JSON encoding of protocol values
//
// Conversions between nlohmann::json and the editor-facing value types. No
// message framing happens here.
//
#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "typeset_lsp/basic/diagnostic.hpp"
#include "typeset_lsp/basic/position.hpp"

namespace typeset_lsp
{

// ADL hooks for nlohmann::json
void to_json(nlohmann::json & j, const LspPosition & pos);
void from_json(const nlohmann::json & j, LspPosition & pos);
void to_json(nlohmann::json & j, const LspRange & range);
void from_json(const nlohmann::json & j, LspRange & range);
void to_json(nlohmann::json & j, const Diagnostic & diagnostic);

}  // namespace typeset_lsp

namespace typeset_lsp::lsp
{

/// One entry of a didChange `contentChanges` array
struct ContentChange
{
  std::optional<LspRange> range;  ///< Absent for a full-document replacement
  std::string text;
};

/**
 * Decode a `contentChanges` array.
 *
 * Entries that are not objects, lack a string `text` or carry a malformed
 * `range` are skipped. A missing or null `range` means full replacement.
 */
[[nodiscard]] std::vector<ContentChange> decode_content_changes(const nlohmann::json & changes);

/// Build a `textDocument/publishDiagnostics` notification
[[nodiscard]] nlohmann::json make_publish_diagnostics(
  const Uri & uri, const std::vector<Diagnostic> & diagnostics);

/// Build a `window/logMessage` notification
[[nodiscard]] nlohmann::json make_log_message(int type, const std::string & message);

}  // namespace typeset_lsp::lsp
