#pragma once
#ifndef DOCTREE_DOC_TEXT_HPP
#define DOCTREE_DOC_TEXT_HPP

#include "ast_node.hpp"

#include <set>
#include <string>

namespace doctree {

/**
 * Plain text of a subtree.
 *
 * Text, Code, CodeBlock and math content are collected in document order.
 * Inline content is concatenated directly; sibling blocks are separated by
 * joiner. Raw HTML, comments and images contribute nothing.
 */
std::string extract_text(const Node& node, const std::string& joiner = " ");
std::string extract_text(const NodeList& nodes, const std::string& joiner = " ");

// Number of whitespace-separated tokens
size_t count_words(const std::string& text);

// Word count of a node sequence's extracted text
size_t count_words(const NodeList& nodes);

/**
 * Filesystem and anchor safe slug.
 * Lower-cases, drops characters outside [a-z0-9], whitespace and '-',
 * collapses runs of whitespace and hyphens to one '-', trims hyphens and
 * bounds the length. Output matches [a-z0-9-]* with no leading or trailing
 * hyphen; empty input yields "".
 */
std::string slugify(const std::string& text, size_t max_length = 100);

// slugify() made unique against seen ("x", "x-1", "x-2", ...); records the result in seen.
// Text without any slug characters falls back to "section".
std::string unique_slug(const std::string& text, std::set<std::string>& seen);

} // namespace doctree

#endif // DOCTREE_DOC_TEXT_HPP
