#pragma once
#ifndef DOCTREE_DOC_ERROR_HPP
#define DOCTREE_DOC_ERROR_HPP

#include <stdexcept>
#include <string>

#include "../lib/log.h"

namespace doctree {

// Error categories raised by the document tree core
enum class DocErrorCode {
    INVALID_NODE,           // structural invariant violated at construction
    INVALID_ARGUMENT,       // bad parameter to an operation
    TARGET_NOT_FOUND,       // section target did not resolve
    AMBIGUOUS_TARGET,       // section target matched more than one heading
    INDEX_OUT_OF_RANGE,     // section index outside [0, count)
    INVALID_SPLIT_SPEC,     // malformed split specification string
    VALIDATION_FAILED,      // strict validation hit a finding
    SERIALIZATION_ERROR     // malformed serialized tree
};

const char* doc_error_code_name(DocErrorCode code);

// Fatal error thrown by constructors, section resolution and the splitter
class DocError : public std::runtime_error {
public:
    DocError(DocErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    DocErrorCode code() const { return code_; }

private:
    DocErrorCode code_;
};

// Logs the message at ERROR level on the given category, then throws DocError
[[noreturn]] void throw_doc_error(log_category_t* category, DocErrorCode code,
                                  const std::string& message);

} // namespace doctree

#endif // DOCTREE_DOC_ERROR_HPP
