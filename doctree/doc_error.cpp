#include "doc_error.hpp"

namespace doctree {

const char* doc_error_code_name(DocErrorCode code) {
    switch (code) {
    case DocErrorCode::INVALID_NODE: return "invalid_node";
    case DocErrorCode::INVALID_ARGUMENT: return "invalid_argument";
    case DocErrorCode::TARGET_NOT_FOUND: return "target_not_found";
    case DocErrorCode::AMBIGUOUS_TARGET: return "ambiguous_target";
    case DocErrorCode::INDEX_OUT_OF_RANGE: return "index_out_of_range";
    case DocErrorCode::INVALID_SPLIT_SPEC: return "invalid_split_spec";
    case DocErrorCode::VALIDATION_FAILED: return "validation_failed";
    case DocErrorCode::SERIALIZATION_ERROR: return "serialization_error";
    }
    return "unknown";
}

void throw_doc_error(log_category_t* category, DocErrorCode code, const std::string& message) {
    clog_error(category, "%s: %s", doc_error_code_name(code), message.c_str());
    throw DocError(code, message);
}

} // namespace doctree
