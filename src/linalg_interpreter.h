#ifndef LINALG_INTERPRETER_H
#define LINALG_INTERPRETER_H

#include "linalg_builtins.h"
#include "linalg_parse_tree.h"
#include "linalg_value.h"
#include <array>
#include <random>
#include <string>
#include <vector>

namespace Linalg {

namespace Code {

class Interpreter {
public:
    enum Status {
        NORMAL = 0,
        RUNTIME_ERROR = 15,
    };

    Status status = NORMAL;
    ErrorCode error_code = NO_ERROR_FOUND;
    ParseNode error_node = NONE;
    std::string error_context;

    Interpreter(const ParseTree& parse_tree, const Environment& environment);
    Value run();
    void seed(uint32_t value) noexcept;

    static std::string shape(const Value& v);
    static bool matchesCategory(const Value& v, BuiltinCategory category) noexcept;

    //2^30 doubles is 8 GiB
    static constexpr Eigen::Index MAX_ELEMENTS = Eigen::Index(1) << 30;

private:
    const ParseTree& parse_tree;
    const Environment& environment;
    std::mt19937 generator;

    typedef Value (Interpreter::*Builtin)(const std::vector<Value>& args, ParseNode pn);
    static const std::array<Builtin, NUM_BUILTINS> builtins;

    void reset() noexcept;
    Value error(ErrorCode code, ParseNode pn, const std::string& context = std::string());
    Value interpretExpr(ParseNode pn);
    Value placeholder(ParseNode pn);
    Value unaryDispatch(ParseNode pn);
    Value binaryDispatch(ParseNode pn);
    Value elementwise(Op type, const Value& lhs, const Value& rhs, ParseNode pn);
    Value matmul(const Value& lhs, const Value& rhs, ParseNode pn);
    Value pow(const Value& base, const Value& exponent, ParseNode pn);
    Value call(ParseNode pn);

    const Eigen::MatrixXd* requireMatrix(const Value& v, ParseNode pn);
    const Eigen::MatrixXd* requireSquare(const Value& v, ParseNode pn);
    bool readDimension(const Value& v, ParseNode pn, Eigen::Index& dim);
    bool checkSize(Eigen::Index rows, Eigen::Index cols, ParseNode pn);
    bool readShape(const std::vector<Value>& args, ParseNode pn, Eigen::Index& rows, Eigen::Index& cols);
    const Eigen::MatrixXd* requireRhs(const Value& a, const Value& b, ParseNode pn);
    Value fill(const std::vector<Value>& args, ParseNode pn, double val);
    template<typename F> Value map(const Value& v, ParseNode pn, F f);
    template<typename F> Value reduce(const Value& v, ParseNode pn, F f);

    Value inv(const std::vector<Value>& args, ParseNode pn);
    Value pinv(const std::vector<Value>& args, ParseNode pn);
    Value matrixPower(const std::vector<Value>& args, ParseNode pn);
    Value exp(const std::vector<Value>& args, ParseNode pn);
    Value sin(const std::vector<Value>& args, ParseNode pn);
    Value cos(const std::vector<Value>& args, ParseNode pn);
    Value det(const std::vector<Value>& args, ParseNode pn);
    Value trace(const std::vector<Value>& args, ParseNode pn);
    Value norm(const std::vector<Value>& args, ParseNode pn);
    Value rank(const std::vector<Value>& args, ParseNode pn);
    Value cond(const std::vector<Value>& args, ParseNode pn);
    Value sum(const std::vector<Value>& args, ParseNode pn);
    Value prod(const std::vector<Value>& args, ParseNode pn);
    Value mean(const std::vector<Value>& args, ParseNode pn);
    Value stdev(const std::vector<Value>& args, ParseNode pn);
    Value svd(const std::vector<Value>& args, ParseNode pn);
    Value eig(const std::vector<Value>& args, ParseNode pn);
    Value qr(const std::vector<Value>& args, ParseNode pn);
    Value lu(const std::vector<Value>& args, ParseNode pn);
    Value cholesky(const std::vector<Value>& args, ParseNode pn);
    Value solve(const std::vector<Value>& args, ParseNode pn);
    Value lstsq(const std::vector<Value>& args, ParseNode pn);
    Value eye(const std::vector<Value>& args, ParseNode pn);
    Value diag(const std::vector<Value>& args, ParseNode pn);
    Value rand(const std::vector<Value>& args, ParseNode pn);
    Value zeros(const std::vector<Value>& args, ParseNode pn);
    Value ones(const std::vector<Value>& args, ParseNode pn);
};

}

}

#endif // LINALG_INTERPRETER_H
