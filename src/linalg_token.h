#ifndef LINALG_TOKEN_H
#define LINALG_TOKEN_H

#include <string>

namespace Linalg {

namespace Code {

enum LinalgTokenType {
    PLUS,
    MINUS,
    MULTIPLY,
    MATMUL,
    CARET,
    LEFTPAREN,
    RIGHTPAREN,
    COMMA,
    PERIOD,
    PLACEHOLDER,
    NUMBER,
    IDENTIFIER,
    ENDOFFILE,
};

struct Token {
    std::string text;
    LinalgTokenType type;

    Token(const std::string& text, LinalgTokenType type) noexcept
        : text(text), type(type) {}
};

}

}

#endif // LINALG_TOKEN_H
