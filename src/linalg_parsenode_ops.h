#ifndef LINALG_PARSENODE_OPS_H
#define LINALG_PARSENODE_OPS_H

#include <string_view>

namespace Linalg {

namespace Code {

enum Op {
    OP_PLACEHOLDER,
    OP_CONSTANT,
    OP_ADDITION,
    OP_SUBTRACTION,
    OP_ELEMENTWISE_MULTIPLY,
    OP_MATRIX_MULTIPLY,
    OP_POWER,
    OP_TRANSPOSE,
    OP_UNARY_MINUS,
    OP_CALL,
    OP_ERROR,

    NUM_OPS,
};

inline constexpr std::string_view opSymbol(Op op) noexcept {
    switch (op) {
        case OP_ADDITION: return "+";
        case OP_SUBTRACTION: return "-";
        case OP_ELEMENTWISE_MULTIPLY: return "*";
        case OP_MATRIX_MULTIPLY: return "@";
        case OP_POWER: return "^";
        case OP_TRANSPOSE: return ".T";
        case OP_UNARY_MINUS: return "-";
        default: return "";
    }
}

inline constexpr bool isBinary(Op op) noexcept {
    return op >= OP_ADDITION && op <= OP_POWER;
}

}

}

#endif // LINALG_PARSENODE_OPS_H
