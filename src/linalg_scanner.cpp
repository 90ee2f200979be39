#include "linalg_scanner.h"

#include "linalg_logging.h"
#include <cctype>
#include <cstdlib>

namespace Linalg {

namespace Code {

static constexpr std::string_view PIPE_PLACEHOLDER = "{PIPE}";
static constexpr std::string_view PIPE_ALIAS = "{P}";
static constexpr std::string_view SEPARATED_SYMBOLS = "+-*@^(),.";

Scanner::Scanner(std::string_view source) alloc_except
    : source(source) {}

void Scanner::scanAll() alloc_except {
    tokens.clear();

    const std::string spaced = separateSymbols(rewritePlaceholders(source));

    size_t start = 0;
    while(start < spaced.size()){
        while(start < spaced.size() && std::isspace(static_cast<unsigned char>(spaced[start]))) start++;
        size_t end = start;
        while(end < spaced.size() && !std::isspace(static_cast<unsigned char>(spaced[end]))) end++;
        if(end > start) createToken(spaced.substr(start, end-start));
        start = end;
    }

    tokens.push_back(Token("", ENDOFFILE));
    logger->debug("Scanner::scanAll() -> {:d} tokens", tokens.size()-1);
}

std::vector<std::string> Scanner::tokenStrings() const alloc_except {
    std::vector<std::string> strs;
    for(const Token& token : tokens)
        if(token.type != ENDOFFILE) strs.push_back(token.text);

    return strs;
}

std::string Scanner::rewritePlaceholders(std::string_view source) alloc_except {
    std::string aliased;
    for(size_t i = 0; i < source.size();){
        if(source.substr(i, PIPE_PLACEHOLDER.size()) == PIPE_PLACEHOLDER){
            aliased += PIPE_ALIAS;
            i += PIPE_PLACEHOLDER.size();
        }else{
            aliased += source[i++];
        }
    }

    //{X} -> X for exactly one uppercase letter, anything else passes through
    std::string out;
    for(size_t i = 0; i < aliased.size();){
        if(aliased[i] == '{' && i+2 < aliased.size() &&
           aliased[i+1] >= 'A' && aliased[i+1] <= 'Z' && aliased[i+2] == '}'){
            out += aliased[i+1];
            i += 3;
        }else{
            out += aliased[i++];
        }
    }

    return out;
}

std::string Scanner::separateSymbols(const std::string& source) alloc_except {
    std::string out;
    out.reserve(source.size()*2);

    for(size_t i = 0; i < source.size(); i++){
        const char ch = source[i];
        if(SEPARATED_SYMBOLS.find(ch) != std::string_view::npos && isSeparated(source, i)){
            out += ' ';
            out += ch;
            out += ' ';
        }else{
            out += ch;
        }
    }

    return out;
}

bool Scanner::isSeparated(const std::string& source, size_t index) noexcept {
    if(source[index] != '.') return true;

    //A decimal point belongs to its numeric literal
    const bool digit_before = index > 0 && std::isdigit(static_cast<unsigned char>(source[index-1]));
    const bool digit_after = index+1 < source.size() && std::isdigit(static_cast<unsigned char>(source[index+1]));

    return !(digit_before || digit_after);
}

LinalgTokenType Scanner::classify(const std::string& text) noexcept {
    if(text.size() == 1){
        switch (text.front()) {
            case '+': return PLUS;
            case '-': return MINUS;
            case '*': return MULTIPLY;
            case '@': return MATMUL;
            case '^': return CARET;
            case '(': return LEFTPAREN;
            case ')': return RIGHTPAREN;
            case ',': return COMMA;
            case '.': return PERIOD;
            default:
                if(text.front() >= 'A' && text.front() <= 'Z') return PLACEHOLDER;
        }
    }

    //strtod also reads hexadecimal, which is not a numeric literal here
    if(text.empty() || text.find_first_of("xX") != std::string::npos) return IDENTIFIER;
    char* end = nullptr;
    std::strtod(text.c_str(), &end);

    return end == text.c_str() + text.size() ? NUMBER : IDENTIFIER;
}

void Scanner::createToken(const std::string& text) alloc_except {
    tokens.push_back( Token(text, classify(text)) );
}

}

}
