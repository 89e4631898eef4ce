// doc_json.hpp - Kind-tagged JSON records for document trees
//
// Every node maps to one object:
//   { "node_type": "Heading", "level": 2, "content": [...],
//     "metadata": {...}, "source_location": {...} }
// Child sequences use the field names of the node kind ("children",
// "content", "items", "rows", "cells"). Optional fields are omitted when
// unset. Reading re-runs the node constructors, so structural invariants
// hold for every tree produced here. Out-of-range heading levels are the
// exception: they are read back through Heading::make_unchecked, so trees
// holding malformed input round-trip and validation still reports them.

#pragma once
#ifndef DOCTREE_DOC_JSON_HPP
#define DOCTREE_DOC_JSON_HPP

#include "../ast_node.hpp"

#include <string>

namespace doctree {

Json::Value node_to_json(const Node& node);
Json::Value source_location_to_json(const SourceLocation& location);

// Throws DocError(SERIALIZATION_ERROR) for unknown kinds, missing or
// mistyped fields and structurally invalid records
NodePtr node_from_json(const Json::Value& value);
SourceLocation source_location_from_json(const Json::Value& value);

// node_from_json() that also requires a Document root
DocumentPtr document_from_json(const Json::Value& value);

std::string document_to_json_string(const Document& doc, bool pretty = true);
DocumentPtr document_from_json_string(const std::string& text);

} // namespace doctree

#endif // DOCTREE_DOC_JSON_HPP
