#include <linalg_scanner.h>
#include "fixtures.h"
#include "report.h"

static bool sameTypes(const std::vector<Token>& tokens, const std::vector<LinalgTokenType>& expected){
    if(tokens.size() != expected.size()) return false;
    for(size_t i = 0; i < tokens.size(); i++){
        if(tokens[i].type != expected[i])
            return false;
    }
    return true;
}

static std::string toString(const std::vector<LinalgTokenType>& types){
    std::string str = "{";
    if(!types.empty()) str += std::to_string(types.front());
    for(size_t i = 1; i < types.size(); i++)
        str += ", " + std::to_string(types[i]);
    str += "}";

    return str;
}

static std::string toString(const std::vector<Token>& tokens){
    std::vector<LinalgTokenType> types;
    for(const Token& token : tokens) types.push_back(token.type);

    return toString(types);
}

static std::string toString(const std::vector<std::string>& strs){
    std::string str = "[";
    for(size_t i = 0; i < strs.size(); i++){
        if(i) str += ", ";
        str += "'" + strs[i] + "'";
    }
    str += "]";

    return str;
}

static bool testTokenTypes(const std::string& input, const std::vector<LinalgTokenType>& expected, int line){
    Scanner scanner(input);
    scanner.scanAll();

    if(!sameTypes(scanner.tokens, expected)){
        std::cout << "Line " << line << ", Scanner does not get expected result for \"" << input << "\":\n";
        std::cout << "Expected: " << toString(expected) << '\n'
                  << "Actual:   " << toString(scanner.tokens) << std::endl;
        return false;
    }

    return true;
}

static bool testTokenStrings(const std::string& input, const std::vector<std::string>& expected, int line){
    std::vector<std::string> actual = Program::tokenize(input);

    if(actual != expected){
        std::cout << "Line " << line << ", Tokenize does not get expected result for \"" << input << "\":\n";
        std::cout << "Expected: " << toString(expected) << '\n'
                  << "Actual:   " << toString(actual) << std::endl;
        return false;
    }

    return true;
}

inline bool testScanner(){
    bool passing = true;

    passing &= testTokenStrings("{A}+{B}", {"A", "+", "B"}, __LINE__);
    passing &= testTokenStrings("{A}.T", {"A", ".", "T"}, __LINE__);
    passing &= testTokenStrings("{PIPE}", {"P"}, __LINE__);
    passing &= testTokenStrings("{P} @ {PIPE}", {"P", "@", "P"}, __LINE__);
    passing &= testTokenStrings("2.5", {"2.5"}, __LINE__);
    passing &= testTokenStrings(".5*{A}", {".5", "*", "A"}, __LINE__);
    passing &= testTokenStrings("{AB}", {"{AB}"}, __LINE__);
    passing &= testTokenStrings("{a}", {"{a}"}, __LINE__);
    passing &= testTokenStrings("det({A})", {"det", "(", "A", ")"}, __LINE__);
    passing &= testTokenStrings("tr({A}@{B}.T)+det({A})",
        {"tr", "(", "A", "@", "B", ".", "T", ")", "+", "det", "(", "A", ")"}, __LINE__);
    passing &= testTokenStrings("zeros(2,3)", {"zeros", "(", "2", ",", "3", ")"}, __LINE__);
    passing &= testTokenStrings("  {A}\t^ -1 ", {"A", "^", "-", "1"}, __LINE__);
    passing &= testTokenStrings("", {}, __LINE__);

    passing &= testTokenTypes("{A}+{B}", {PLACEHOLDER, PLUS, PLACEHOLDER, ENDOFFILE}, __LINE__);
    passing &= testTokenTypes("{A}.T", {PLACEHOLDER, PERIOD, PLACEHOLDER, ENDOFFILE}, __LINE__);
    passing &= testTokenTypes("{A}.inv", {PLACEHOLDER, PERIOD, IDENTIFIER, ENDOFFILE}, __LINE__);
    passing &= testTokenTypes("-{A}*2.5e3", {MINUS, PLACEHOLDER, MULTIPLY, NUMBER, ENDOFFILE}, __LINE__);
    passing &= testTokenTypes("{A}@{B}^2", {PLACEHOLDER, MATMUL, PLACEHOLDER, CARET, NUMBER, ENDOFFILE}, __LINE__);
    passing &= testTokenTypes("solve({A}, {B})",
        {IDENTIFIER, LEFTPAREN, PLACEHOLDER, COMMA, PLACEHOLDER, RIGHTPAREN, ENDOFFILE}, __LINE__);
    passing &= testTokenTypes("{AB}", {IDENTIFIER, ENDOFFILE}, __LINE__);
    passing &= testTokenTypes("0x10", {IDENTIFIER, ENDOFFILE}, __LINE__);
    passing &= testTokenTypes("inf", {NUMBER, ENDOFFILE}, __LINE__);
    passing &= testTokenTypes("", {ENDOFFILE}, __LINE__);

    report("Scanner", passing);
    return passing;
}
