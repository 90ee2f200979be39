#ifndef LINALG_BUILTINS_H
#define LINALG_BUILTINS_H

#include "linalg_common.h"
#include <array>
#include <string_view>

namespace Linalg {

namespace Code {

enum BuiltinId {
    BUILTIN_INV,
    BUILTIN_PINV,
    BUILTIN_MATRIX_POWER,
    BUILTIN_EXP,
    BUILTIN_SIN,
    BUILTIN_COS,
    BUILTIN_DET,
    BUILTIN_TRACE,
    BUILTIN_TR,
    BUILTIN_NORM,
    BUILTIN_RANK,
    BUILTIN_COND,
    BUILTIN_SUM,
    BUILTIN_PROD,
    BUILTIN_MEAN,
    BUILTIN_STD,
    BUILTIN_SVD,
    BUILTIN_EIG,
    BUILTIN_QR,
    BUILTIN_LU,
    BUILTIN_CHOLESKY,
    BUILTIN_SOLVE,
    BUILTIN_LSTSQ,
    BUILTIN_EYE,
    BUILTIN_DIAG,
    BUILTIN_RAND,
    BUILTIN_ZEROS,
    BUILTIN_ONES,

    NUM_BUILTINS,
};

//Shape of the result, which decides whether it reaches the formatter as a tuple
enum BuiltinCategory {
    MATRIX_TO_MATRIX,
    MATRIX_TO_SCALAR,
    MATRIX_TO_TUPLE,
    SOLVE_CONSTRUCT,
};

struct BuiltinInfo {
    std::string_view name;
    BuiltinCategory category;
    size_t min_args;
    size_t max_args;
};

inline constexpr std::array<BuiltinInfo, NUM_BUILTINS> BUILTINS {{
    {"inv", MATRIX_TO_MATRIX, 1, 1},
    {"pinv", MATRIX_TO_MATRIX, 1, 1},
    {"matrix_power", MATRIX_TO_MATRIX, 2, 2},
    {"exp", MATRIX_TO_MATRIX, 1, 1},
    {"sin", MATRIX_TO_MATRIX, 1, 1},
    {"cos", MATRIX_TO_MATRIX, 1, 1},
    {"det", MATRIX_TO_SCALAR, 1, 1},
    {"trace", MATRIX_TO_SCALAR, 1, 1},
    {"tr", MATRIX_TO_SCALAR, 1, 1},
    {"norm", MATRIX_TO_SCALAR, 1, 1},
    {"rank", MATRIX_TO_SCALAR, 1, 1},
    {"cond", MATRIX_TO_SCALAR, 1, 1},
    {"sum", MATRIX_TO_SCALAR, 1, 1},
    {"prod", MATRIX_TO_SCALAR, 1, 1},
    {"mean", MATRIX_TO_SCALAR, 1, 1},
    {"std", MATRIX_TO_SCALAR, 1, 1},
    {"svd", MATRIX_TO_TUPLE, 1, 1},
    {"eig", MATRIX_TO_TUPLE, 1, 1},
    {"qr", MATRIX_TO_TUPLE, 1, 1},
    {"lu", MATRIX_TO_TUPLE, 1, 1},
    {"cholesky", MATRIX_TO_MATRIX, 1, 1}, //Lower factor only
    {"solve", SOLVE_CONSTRUCT, 2, 2},
    {"lstsq", SOLVE_CONSTRUCT, 2, 2},
    {"eye", SOLVE_CONSTRUCT, 1, 1},
    {"diag", SOLVE_CONSTRUCT, 1, 1},
    {"rand", SOLVE_CONSTRUCT, 1, 2},
    {"zeros", SOLVE_CONSTRUCT, 1, 2},
    {"ones", SOLVE_CONSTRUCT, 1, 2},
}};

//Returns NUM_BUILTINS for names outside the registry
BuiltinId lookupBuiltin(std::string_view name) noexcept;
const BuiltinInfo& builtinInfo(BuiltinId id) noexcept;
bool acceptsArity(BuiltinId id, size_t num_args) noexcept;

}

}

#endif // LINALG_BUILTINS_H
