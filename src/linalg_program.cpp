#include "linalg_program.h"

#include "linalg_interpreter.h"
#include "linalg_logging.h"
#include "linalg_parser.h"
#include "linalg_scanner.h"
#include <fmt/format.h>

namespace Linalg {

Code::Value Program::evaluate(std::string_view expression, const Code::Environment& environment){
    error_code = Code::NO_ERROR_FOUND;
    if(!parse(expression)){
        error_code = error_stream.firstCode();
        return &error_code;
    }

    Code::Interpreter interpreter(parse_tree, environment);
    if(seed.has_value()) interpreter.seed(seed.value());

    Code::Value result = interpreter.run();
    if(interpreter.status == Code::Interpreter::RUNTIME_ERROR){
        error_stream.fail(interpreter.error_code, interpreter.error_context);
        error_code = interpreter.error_code;
        logger->debug("Program::evaluate() failed: {:s}", errorMessage());
        return &error_code;
    }

    logger->info("Evaluated {:s} -> {:s}", cStr(std::string(expression)), Code::Interpreter::shape(result));

    return result;
}

bool Program::parse(std::string_view expression){
    error_stream.reset();
    parse_tree.clear();

    Code::Scanner scanner(expression);
    scanner.scanAll();
    logger->debug("Tokens: {:s}", fmt::join(scanner.tokenStrings(), " "));

    Code::Parser parser(scanner, error_stream);
    parser.parseAll();
    parse_tree = std::move(parser.parse_tree);

    if(!noErrors()) logger->debug("Program::parse() failed: {:s}", errorMessage());

    return noErrors();
}

std::vector<std::string> Program::tokenize(std::string_view expression){
    Code::Scanner scanner(expression);
    scanner.scanAll();

    return scanner.tokenStrings();
}

void Program::setSeed(uint32_t value) noexcept {
    seed = value;
}

bool Program::noErrors() const noexcept {
    return error_stream.noErrors();
}

const std::vector<Code::Error>& Program::errors() const noexcept {
    return error_stream.getErrors();
}

std::string_view Program::errorMessage() const noexcept {
    return error_stream.firstMessage();
}

}
