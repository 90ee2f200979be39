#ifndef LINALG_ERROR_H
#define LINALG_ERROR_H

#include "linalg_common.h"
#include "linalg_error_types.h"
#include <string>
#include <string_view>
#include <vector>

namespace Linalg {

namespace Code {

struct Error {
    ErrorCode code = NO_ERROR_FOUND;
    std::string context; //Offending token, name or path
    size_t console_start; //Index of start for console
    size_t console_len; //Length of console message
    const std::string* buffer = nullptr;

    Error() noexcept = default;
    Error(ErrorCode code, std::string_view context, size_t start, size_t len, const std::string* const error_out) alloc_except;

    std::string_view consoleMessage() const noexcept;
};

class ErrorStream {
private:
    std::string error_buffer;
    std::vector<Error> errors;

public:
    ErrorStream() = default;
    ErrorStream(const ErrorStream&) = delete;
    ErrorStream& operator=(const ErrorStream&) = delete;

    void reset() noexcept;
    bool noErrors() const noexcept;
    void fail(ErrorCode code, std::string_view context = std::string_view()) alloc_except;
    void fail(ErrorCode code, std::string_view context, const std::string& str) alloc_except;
    const std::vector<Error>& getErrors() const noexcept;
    ErrorCode firstCode() const noexcept;
    std::string_view firstMessage() const noexcept;
};

}

}

#endif // LINALG_ERROR_H
