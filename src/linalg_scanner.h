#ifndef LINALG_SCANNER_H
#define LINALG_SCANNER_H

#include "linalg_common.h"
#include "linalg_token.h"
#include <string>
#include <string_view>
#include <vector>

namespace Linalg {

namespace Code {

class Scanner {
public:
    Scanner(std::string_view source) alloc_except;
    void scanAll() alloc_except;
    std::vector<std::string> tokenStrings() const alloc_except;

    static std::string rewritePlaceholders(std::string_view source) alloc_except;
    static std::string separateSymbols(const std::string& source) alloc_except;
    static LinalgTokenType classify(const std::string& text) noexcept;

    std::vector<Token> tokens;

private:
    void createToken(const std::string& text) alloc_except;
    static bool isSeparated(const std::string& source, size_t index) noexcept;

    std::string source;
};

}

}

#endif // LINALG_SCANNER_H
