// typeset_lsp/lsp/protocol.cpp - JSON encoding of protocol values
#include "typeset_lsp/lsp/protocol.hpp"

using nlohmann::json;

namespace typeset_lsp
{

void to_json(json & j, const LspPosition & pos)
{
  j = json{{"line", pos.line}, {"character", pos.character}};
}

void from_json(const json & j, LspPosition & pos)
{
  j.at("line").get_to(pos.line);
  j.at("character").get_to(pos.character);
}

void to_json(json & j, const LspRange & range)
{
  j = json{{"start", range.start}, {"end", range.end}};
}

void from_json(const json & j, LspRange & range)
{
  j.at("start").get_to(range.start);
  j.at("end").get_to(range.end);
}

void to_json(json & j, const Diagnostic & diagnostic)
{
  std::string message = diagnostic.message;
  for (const auto & hint : diagnostic.hints) {
    message += "\nhint: ";
    message += hint;
  }

  j = json{
    {"range", diagnostic.range},
    {"severity", static_cast<int>(diagnostic.severity)},
    {"source", diagnostic.source},
    {"message", std::move(message)},
  };
}

}  // namespace typeset_lsp

namespace typeset_lsp::lsp
{

std::vector<ContentChange> decode_content_changes(const json & changes)
{
  std::vector<ContentChange> out;
  if (!changes.is_array()) {
    return out;
  }

  for (const auto & c : changes) {
    if (!c.is_object() || !c.contains("text") || !c["text"].is_string()) {
      continue;
    }

    ContentChange change;
    change.text = c["text"].get<std::string>();
    if (c.contains("range") && !c["range"].is_null()) {
      try {
        change.range = c["range"].get<LspRange>();
      } catch (const json::exception &) {
        continue;
      }
    }
    out.push_back(std::move(change));
  }
  return out;
}

json make_publish_diagnostics(const Uri & uri, const std::vector<Diagnostic> & diagnostics)
{
  json notif;
  notif["jsonrpc"] = "2.0";
  notif["method"] = "textDocument/publishDiagnostics";
  notif["params"] = json{{"uri", uri.str()}, {"diagnostics", diagnostics}};
  return notif;
}

json make_log_message(int type, const std::string & message)
{
  json notif;
  notif["jsonrpc"] = "2.0";
  notif["method"] = "window/logMessage";
  notif["params"] = json{{"type", type}, {"message", message}};
  return notif;
}

}  // namespace typeset_lsp::lsp
