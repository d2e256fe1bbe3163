#include "core/QueryError.h"

int QueryError::code() const {
    switch (kind) {
        case QueryErrorKind::NoElementAtPosition: return QueryErrorCodes::SYMBOL_NOT_FOUND;
        case QueryErrorKind::NotATypeOrMethod: return QueryErrorCodes::SYMBOL_NOT_FOUND;
        case QueryErrorKind::NoProviderForLanguage: return QueryErrorCodes::UNSUPPORTED_LANGUAGE;
        case QueryErrorKind::IndexNotReady: return QueryErrorCodes::INDEX_NOT_READY;
        case QueryErrorKind::Cancelled: return QueryErrorCodes::REQUEST_CANCELLED;
        case QueryErrorKind::InvalidArguments: return QueryErrorCodes::INVALID_PARAMS;
        case QueryErrorKind::InternalError: return QueryErrorCodes::INTERNAL_ERROR;
    }
    return QueryErrorCodes::INTERNAL_ERROR;
}

std::string QueryError::kindName() const {
    switch (kind) {
        case QueryErrorKind::NoElementAtPosition: return "no_element_at_position";
        case QueryErrorKind::NoProviderForLanguage: return "no_provider_for_language";
        case QueryErrorKind::NotATypeOrMethod: return "not_a_type_or_method";
        case QueryErrorKind::IndexNotReady: return "index_not_ready";
        case QueryErrorKind::Cancelled: return "cancelled";
        case QueryErrorKind::InvalidArguments: return "invalid_arguments";
        case QueryErrorKind::InternalError: return "internal_error";
    }
    return "internal_error";
}

QueryError QueryError::noElementAtPosition(const std::string& file, int line, int column) {
    return {QueryErrorKind::NoElementAtPosition,
            "No element found at position " + file + ":" + std::to_string(line) + ":" + std::to_string(column)};
}

QueryError QueryError::noElementNamed(const std::string& qualifiedName) {
    return {QueryErrorKind::NoElementAtPosition,
            "Type '" + qualifiedName + "' not found. Verify the fully qualified name is correct."};
}

QueryError QueryError::noProviderForLanguage(const std::string& language, const std::string& supported) {
    return {QueryErrorKind::NoProviderForLanguage,
            "No handler available for language: " + language + ". Supported languages: [" + supported + "]"};
}

QueryError QueryError::notATypeOrMethod(const std::string& message) {
    return {QueryErrorKind::NotATypeOrMethod, message};
}

QueryError QueryError::indexNotReady() {
    return {QueryErrorKind::IndexNotReady, "Code model is still being indexed, try again later"};
}

QueryError QueryError::cancelled() {
    return {QueryErrorKind::Cancelled, "Query was cancelled"};
}

QueryError QueryError::invalidArguments(const std::string& message) {
    return {QueryErrorKind::InvalidArguments, message};
}

QueryError QueryError::internal(const std::string& message) {
    return {QueryErrorKind::InternalError, message};
}
