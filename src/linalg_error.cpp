#include "linalg_error.h"

#include "linalg_logging.h"

namespace Linalg {

namespace Code {

Error::Error(ErrorCode code, std::string_view context, size_t start, size_t len, const std::string* const error_out) alloc_except
    : code(code), context(context), console_start(start), console_len(len), buffer(error_out) {}

std::string_view Error::consoleMessage() const noexcept {
    assert(buffer != nullptr);
    return std::string_view(buffer->data()+console_start, console_len);
}

void ErrorStream::reset() noexcept {
    error_buffer.clear();
    errors.clear();
}

bool ErrorStream::noErrors() const noexcept {
    return errors.empty();
}

void ErrorStream::fail(ErrorCode code, std::string_view context) alloc_except {
    const size_t start = error_buffer.size();
    error_buffer += getMessage(code);

    if(shouldQuote(code) && !context.empty()){
        error_buffer += ": ";
        error_buffer += context;
    }else if(shouldQuote(code) && isParseError(code)){
        error_buffer += ": end of expression";
    }

    errors.push_back(Error(code, context, start, error_buffer.size()-start, &error_buffer));
    logger->debug("fail({:d}, {:s})", static_cast<int>(code), cStr(std::string(context)));
}

void ErrorStream::fail(ErrorCode code, std::string_view context, const std::string& str) alloc_except {
    const size_t start = error_buffer.size();
    error_buffer += str;

    errors.push_back(Error(code, context, start, str.size(), &error_buffer));
    logger->debug("fail({:d}, {:s})", static_cast<int>(code), cStr(str));
}

const std::vector<Error>& ErrorStream::getErrors() const noexcept {
    return errors;
}

ErrorCode ErrorStream::firstCode() const noexcept {
    return errors.empty() ? NO_ERROR_FOUND : errors.front().code;
}

std::string_view ErrorStream::firstMessage() const noexcept {
    return errors.empty() ? std::string_view() : errors.front().consoleMessage();
}

}

}
