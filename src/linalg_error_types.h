#ifndef LINALG_ERROR_TYPES_H
#define LINALG_ERROR_TYPES_H

#include <string_view>

namespace Linalg {

namespace Code {

enum ErrorCode {
    NO_ERROR_FOUND,

    //Parse
    UNEXPECTED_TOKEN,
    UNEXPECTED_END,
    EXPECTED_OPEN_PAREN,
    EXPECTED_CLOSE_PAREN,
    UNKNOWN_PROPERTY,

    //Evaluation
    UNKNOWN_PLACEHOLDER,
    UNKNOWN_FUNCTION,
    UNKNOWN_OPERATOR,
    INVALID_ARGS,
    POWER_NOT_SCALAR,
    TYPE_ERROR,
    DIMENSION_MISMATCH,
    NOT_SQUARE,
    SINGULAR_MATRIX,
    NOT_POSITIVE_DEFINITE,
    COMPLEX_EIGENVALUES,
    NO_CONVERGENCE,
    INVALID_DIMENSION,
    NON_FINITE_INTEGER,
    ARRAY_TOO_LARGE,

    //Loading
    FILE_NOT_FOUND,
    NOT_NPY_FILE,
    INVALID_PLACEHOLDER_FILE,
    RESERVED_PIPE_FILE,
    NPY_CORRUPTED,
    NPY_UNSUPPORTED_DTYPE,
    NPY_UNSUPPORTED_SHAPE,
    STDIN_UNPARSEABLE,

    //Output
    UNSUPPORTED_FORMAT,
    FILE_WRITE_FAILED,
    NPY_TUPLE,

    NUM_ERROR_CODES,
};

inline constexpr std::string_view getMessage(ErrorCode code) noexcept {
    switch (code) {
        case NO_ERROR_FOUND: return "No error";
        case UNEXPECTED_TOKEN: return "Unexpected token";
        case UNEXPECTED_END: return "Unexpected end of expression";
        case EXPECTED_OPEN_PAREN: return "Expected opening parenthesis after function";
        case EXPECTED_CLOSE_PAREN: return "Expected closing parenthesis ')'";
        case UNKNOWN_PROPERTY: return "Unknown property";
        case UNKNOWN_PLACEHOLDER: return "Unknown placeholder";
        case UNKNOWN_FUNCTION: return "Unknown function";
        case UNKNOWN_OPERATOR: return "Unknown operator";
        case INVALID_ARGS: return "Wrong number of arguments";
        case POWER_NOT_SCALAR: return "Power must be a scalar";
        case TYPE_ERROR: return "Operand has the wrong type";
        case DIMENSION_MISMATCH: return "Dimension mismatch";
        case NOT_SQUARE: return "Matrix must be square";
        case SINGULAR_MATRIX: return "Singular matrix";
        case NOT_POSITIVE_DEFINITE: return "Matrix is not positive definite";
        case COMPLEX_EIGENVALUES: return "Eigenvalues are complex";
        case NO_CONVERGENCE: return "Decomposition did not converge";
        case INVALID_DIMENSION: return "Dimension must be a non-negative integer";
        case NON_FINITE_INTEGER: return "Integer argument must be finite and in range";
        case ARRAY_TOO_LARGE: return "Unable to allocate array";
        case FILE_NOT_FOUND: return "File not found";
        case NOT_NPY_FILE: return "File must be a .npy file";
        case INVALID_PLACEHOLDER_FILE: return "File name must be a single uppercase letter followed by .npy (e.g., A.npy)";
        case RESERVED_PIPE_FILE: return "'pipe.npy' is a reserved filename for piping operations. Use {PIPE} placeholder to access data from stdin";
        case NPY_CORRUPTED: return "Corrupted .npy data";
        case NPY_UNSUPPORTED_DTYPE: return "Unsupported .npy dtype";
        case NPY_UNSUPPORTED_SHAPE: return "Only arrays of rank 0, 1 or 2 are supported";
        case STDIN_UNPARSEABLE: return "Failed to parse input as NPY or text";
        case UNSUPPORTED_FORMAT: return "Unsupported format type";
        case FILE_WRITE_FAILED: return "Cannot write file";
        case NPY_TUPLE: return "A tuple result cannot be written as a single .npy stream; use --components with --output";
        case NUM_ERROR_CODES: break;
    }

    return "Unknown error";
}

inline constexpr bool isParseError(ErrorCode code) noexcept {
    return code >= UNEXPECTED_TOKEN && code <= UNKNOWN_PROPERTY;
}

inline constexpr bool shouldQuote(ErrorCode code) noexcept {
    switch (code) {
        case UNEXPECTED_TOKEN:
        case EXPECTED_OPEN_PAREN:
        case UNKNOWN_PROPERTY:
        case UNKNOWN_PLACEHOLDER:
        case UNKNOWN_FUNCTION:
        case UNKNOWN_OPERATOR:
        case INVALID_ARGS:
        case TYPE_ERROR:
        case DIMENSION_MISMATCH:
        case NOT_SQUARE:
        case ARRAY_TOO_LARGE:
        case FILE_NOT_FOUND:
        case NOT_NPY_FILE:
        case INVALID_PLACEHOLDER_FILE:
        case NPY_CORRUPTED:
        case NPY_UNSUPPORTED_DTYPE:
        case NPY_UNSUPPORTED_SHAPE:
        case STDIN_UNPARSEABLE:
        case UNSUPPORTED_FORMAT:
        case FILE_WRITE_FAILED:
            return true;
        default:
            return false;
    }
}

}

}

#endif // LINALG_ERROR_TYPES_H
