#pragma once
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

enum class QueryErrorKind {
    NoElementAtPosition,
    NoProviderForLanguage,
    NotATypeOrMethod,
    IndexNotReady,
    Cancelled,
    InvalidArguments,
    InternalError
};

// JSON-RPC style codes reported by the tool layer.
namespace QueryErrorCodes {
    constexpr int INVALID_PARAMS = -32602;
    constexpr int INTERNAL_ERROR = -32603;
    constexpr int INDEX_NOT_READY = -32001;
    constexpr int SYMBOL_NOT_FOUND = -32002;
    constexpr int UNSUPPORTED_LANGUAGE = -32003;
    constexpr int REQUEST_CANCELLED = -32800;
}

struct QueryError {
    QueryErrorKind kind = QueryErrorKind::InternalError;
    std::string message;

    int code() const;
    // "no_element_at_position", "index_not_ready", ...
    std::string kindName() const;

    static QueryError noElementAtPosition(const std::string& file, int line, int column);
    static QueryError noElementNamed(const std::string& qualifiedName);
    static QueryError noProviderForLanguage(const std::string& language, const std::string& supported);
    static QueryError notATypeOrMethod(const std::string& message);
    static QueryError indexNotReady();
    static QueryError cancelled();
    static QueryError invalidArguments(const std::string& message);
    static QueryError internal(const std::string& message);
};

/**
 * @brief Result-or-error value returned by every façade query.
 */
template <typename T>
class QueryResult {
public:
    QueryResult(T value) : data(std::move(value)) {}
    QueryResult(QueryError error) : data(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(data); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(data); }
    T& value() { return std::get<T>(data); }
    const QueryError& error() const { return std::get<QueryError>(data); }

private:
    std::variant<T, QueryError> data;
};

// Thrown from deep inside a traversal; converted to QueryError at the façade.
class QueryCancelledException : public std::runtime_error {
public:
    QueryCancelledException() : std::runtime_error("Query cancelled") {}
};

class IndexNotReadyException : public std::runtime_error {
public:
    explicit IndexNotReadyException(const std::string& message = "Code model index is not ready")
        : std::runtime_error(message) {}
};
