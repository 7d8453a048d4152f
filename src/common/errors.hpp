#pragma once

#include <stdexcept>
#include <string>

namespace honeyforge {

enum class ErrorKind {
    PathViolation,
    IOFailure,
    SourceNotFound,
    AlreadyExists,
    ParseError
};

inline std::string toErrorKindString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::PathViolation:
        return "path_violation";
    case ErrorKind::IOFailure:
        return "io_failure";
    case ErrorKind::SourceNotFound:
        return "source_not_found";
    case ErrorKind::AlreadyExists:
        return "already_exists";
    case ErrorKind::ParseError:
        return "parse_error";
    }
    return "io_failure";
}

// Fatal failure of a materialization, snapshot or template load.
class ForgeError : public std::runtime_error {
public:
    ForgeError(ErrorKind kind, const std::string &message)
        : std::runtime_error(message)
        , m_kind(kind)
    {
    }

    ErrorKind kind() const
    {
        return m_kind;
    }

private:
    ErrorKind m_kind;
};

} // namespace honeyforge
