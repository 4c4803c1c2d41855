#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

enum class ErrorKind {
    INVALID_FORMAT,
    INVALID_ARGUMENT,
    OUT_OF_RANGE,
    DUPLICATE_ENTITY,
    NOT_FOUND,
    REFERENCED_ENTITY,
    UNSUPPORTED_CAPABILITY,
    MUTUALLY_EXCLUSIVE_PARAMETERS,
    MISSING_DEPENDENT_PARAMETERS,
    STORE_FAILURE
};

std::string error_kind_name(ErrorKind kind);

// Every failure of the engine is reported as a NetConfigError. The optional
// diagnostics list carries context for the operator (registered DNS servers,
// compatible affinity groups, ...).
class NetConfigError : public std::runtime_error
{
private:
    ErrorKind error_kind;
    std::vector<std::string> diagnostic_items;

public:
    NetConfigError(ErrorKind kind, const std::string& message,
                   std::vector<std::string> diagnostics = {});

    ErrorKind kind() const { return error_kind; }
    const std::vector<std::string>& diagnostics() const { return diagnostic_items; }
};

#endif
