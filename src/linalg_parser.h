#ifndef LINALG_PARSER_H
#define LINALG_PARSER_H

#include "linalg_error.h"
#include "linalg_parse_tree.h"
#include "linalg_scanner.h"
#include <vector>

namespace Linalg {

namespace Code {

class Parser {
public:
    Parser(const Scanner& scanner, ErrorStream& errors) noexcept;
    void parseAll() alloc_except;
    ParseTree parse_tree;

private:
    void reset() noexcept;
    ParseNode expression() alloc_except;
    ParseNode term() alloc_except;
    ParseNode power() alloc_except;
    ParseNode factor() alloc_except;
    ParseNode placeholder() alloc_except;
    ParseNode number() alloc_except;
    ParseNode functionCall() alloc_except;
    ParseNode error(ErrorCode code) alloc_except;
    ParseNode error(ErrorCode code, const std::string& context) alloc_except;
    void advance() noexcept;
    bool match(LinalgTokenType type) noexcept;
    bool peek(LinalgTokenType type) const noexcept;
    LinalgTokenType currentType() const noexcept;
    const std::string& currentText() const noexcept;
    bool noErrors() const noexcept;
    void recover() noexcept;

    const std::vector<Token>& tokens;
    ErrorStream& errors;
    size_t index DEBUG_INIT_NONE;
    ParseNode error_node DEBUG_INIT_NONE;
};

}

}

#endif // LINALG_PARSER_H
