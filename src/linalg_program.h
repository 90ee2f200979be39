#ifndef LINALG_PROGRAM_H
#define LINALG_PROGRAM_H

#include "linalg_common.h"
#include "linalg_error.h"
#include "linalg_parse_tree.h"
#include "linalg_value.h"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Linalg {

//One expression evaluation: scan, parse, interpret
class Program {
public:
    Code::Value evaluate(std::string_view expression, const Code::Environment& environment);
    bool parse(std::string_view expression);
    static std::vector<std::string> tokenize(std::string_view expression);
    void setSeed(uint32_t seed) noexcept;
    bool noErrors() const noexcept;
    const std::vector<Code::Error>& errors() const noexcept;
    std::string_view errorMessage() const noexcept;

    Code::ParseTree parse_tree;

private:
    Code::ErrorStream error_stream;
    Code::ErrorCode error_code = Code::NO_ERROR_FOUND;
    std::optional<uint32_t> seed;
};

}

#endif // LINALG_PROGRAM_H
