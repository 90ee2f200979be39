#include "linalg_builtins.h"

namespace Linalg {

namespace Code {

static LINALG_STATIC_MAP<std::string_view, BuiltinId> builtin_names {
    {"inv", BUILTIN_INV},
    {"pinv", BUILTIN_PINV},
    {"matrix_power", BUILTIN_MATRIX_POWER},
    {"exp", BUILTIN_EXP},
    {"sin", BUILTIN_SIN},
    {"cos", BUILTIN_COS},
    {"det", BUILTIN_DET},
    {"trace", BUILTIN_TRACE},
    {"tr", BUILTIN_TR},
    {"norm", BUILTIN_NORM},
    {"rank", BUILTIN_RANK},
    {"cond", BUILTIN_COND},
    {"sum", BUILTIN_SUM},
    {"prod", BUILTIN_PROD},
    {"mean", BUILTIN_MEAN},
    {"std", BUILTIN_STD},
    {"svd", BUILTIN_SVD},
    {"eig", BUILTIN_EIG},
    {"qr", BUILTIN_QR},
    {"lu", BUILTIN_LU},
    {"cholesky", BUILTIN_CHOLESKY},
    {"solve", BUILTIN_SOLVE},
    {"lstsq", BUILTIN_LSTSQ},
    {"eye", BUILTIN_EYE},
    {"diag", BUILTIN_DIAG},
    {"rand", BUILTIN_RAND},
    {"zeros", BUILTIN_ZEROS},
    {"ones", BUILTIN_ONES},
};

BuiltinId lookupBuiltin(std::string_view name) noexcept {
    auto lookup = builtin_names.find(name);
    return lookup == builtin_names.end() ? NUM_BUILTINS : lookup->second;
}

const BuiltinInfo& builtinInfo(BuiltinId id) noexcept {
    assert(id < NUM_BUILTINS);
    return BUILTINS[id];
}

bool acceptsArity(BuiltinId id, size_t num_args) noexcept {
    const BuiltinInfo& info = builtinInfo(id);
    return num_args >= info.min_args && num_args <= info.max_args;
}

}

}
