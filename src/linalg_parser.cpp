#include "linalg_parser.h"

#include "linalg_builtins.h"
#include "linalg_logging.h"
#include <cstdlib>

namespace Linalg {

namespace Code {

Parser::Parser(const Scanner& scanner, ErrorStream& errors) noexcept
    : tokens(scanner.tokens), errors(errors) {
    assert(!tokens.empty() && tokens.back().type == ENDOFFILE);
}

void Parser::parseAll() alloc_except {
    reset();

    ParseNode pn = expression();
    if(!peek(ENDOFFILE)) pn = error(UNEXPECTED_TOKEN);

    parse_tree.root = noErrors() ? pn : NONE;
    assert(parse_tree.inFinalState());

    if(noErrors()) logger->debug("Parser::parseAll() -> {:s}", parse_tree.str());
}

void Parser::reset() noexcept {
    parse_tree.clear();
    index = 0;
    error_node = NONE;
}

ParseNode Parser::expression() alloc_except {
    ParseNode n = term();

    for(;;){
        switch (currentType()) {
            case PLUS: advance(); n = parse_tree.addBinary(OP_ADDITION, n, term()); break;
            case MINUS: advance(); n = parse_tree.addBinary(OP_SUBTRACTION, n, term()); break;
            default: return n;
        }
    }
}

ParseNode Parser::term() alloc_except {
    ParseNode n = power();

    for(;;){
        switch (currentType()) {
            case MULTIPLY: advance(); n = parse_tree.addBinary(OP_ELEMENTWISE_MULTIPLY, n, power()); break;
            case MATMUL: advance(); n = parse_tree.addBinary(OP_MATRIX_MULTIPLY, n, power()); break;
            default: return n;
        }
    }
}

ParseNode Parser::power() alloc_except {
    ParseNode n = factor();

    //Not chained: A^2^3 leaves the second '^' as a trailing token
    if(match(CARET)) n = parse_tree.addBinary(OP_POWER, n, factor());

    return n;
}

ParseNode Parser::factor() alloc_except {
    switch (currentType()) {
        case LEFTPAREN:{
            advance();
            ParseNode n = expression();
            if(!match(RIGHTPAREN)) return error(EXPECTED_CLOSE_PAREN);
            return n;
        }
        case IDENTIFIER:
            if(lookupBuiltin(currentText()) != NUM_BUILTINS) return functionCall();
            return error(UNEXPECTED_TOKEN);
        case PLACEHOLDER: return placeholder();
        case NUMBER: return number();
        case MINUS:
            advance();
            return parse_tree.addUnary(OP_UNARY_MINUS, factor());
        case ENDOFFILE: return error(UNEXPECTED_END);
        default: return error(UNEXPECTED_TOKEN);
    }
}

ParseNode Parser::placeholder() alloc_except {
    assert(currentText().size() == 1);
    ParseNode n = parse_tree.addPlaceholder(currentText().front());
    advance();

    if(!match(PERIOD)) return n;

    if(currentText() != "T") return error(UNKNOWN_PROPERTY);
    advance();

    return parse_tree.addUnary(OP_TRANSPOSE, n);
}

ParseNode Parser::number() alloc_except {
    double val = std::strtod(currentText().c_str(), nullptr);
    advance();

    return parse_tree.addConstant(val);
}

ParseNode Parser::functionCall() alloc_except {
    const std::string& name = currentText();
    BuiltinId id = lookupBuiltin(name);
    assert(id != NUM_BUILTINS);
    advance();

    if(!match(LEFTPAREN)) return error(EXPECTED_OPEN_PAREN, name);

    parse_tree.prepareNary();
    if(!peek(RIGHTPAREN)){
        do {
            parse_tree.addNaryChild(expression());
        } while(match(COMMA));
    }

    if(!match(RIGHTPAREN)){
        parse_tree.cancelNary();
        return error(EXPECTED_CLOSE_PAREN);
    }

    return parse_tree.finishNary(OP_CALL, id);
}

ParseNode Parser::error(ErrorCode code) alloc_except {
    return error(code, currentText());
}

ParseNode Parser::error(ErrorCode code, const std::string& context) alloc_except {
    if(noErrors()){
        errors.fail(code, context);
        error_node = parse_tree.addTerminal(OP_ERROR, code);
        logger->debug("Parser::error({:s}) at token {:d}", cStr(context), index);
    }

    recover();

    return error_node;
}

void Parser::advance() noexcept {
    index++;
}

bool Parser::match(LinalgTokenType type) noexcept {
    if(tokens[index].type == type){
        advance();
        return true;
    }else{
        return false;
    }
}

bool Parser::peek(LinalgTokenType type) const noexcept {
    return tokens[index].type == type;
}

LinalgTokenType Parser::currentType() const noexcept {
    return tokens[index].type;
}

const std::string& Parser::currentText() const noexcept {
    return tokens[index].text;
}

bool Parser::noErrors() const noexcept {
    return errors.noErrors();
}

void Parser::recover() noexcept {
    index = tokens.size()-1;
}

}

}
