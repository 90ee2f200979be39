#include "linalg_interpreter.h"

#include "linalg_logging.h"
#include <cmath>
#include <new>
#include <Eigen/LU>

namespace Linalg {

namespace Code {

//Integers beyond this cannot be represented after truncation
static constexpr double MAX_INTEGER_ARG = 9.2e18;

static size_t rankOf(const Value& v) noexcept {
    switch (v.index()) {
        case double_index: return 0;
        case VectorXd_index: return 1;
        default: return 2;
    }
}

//Scalars become 1x1 and vectors become rows, following numpy broadcasting
static Eigen::MatrixXd asRows(const Value& v){
    switch (v.index()) {
        case double_index: return Eigen::MatrixXd::Constant(1, 1, std::get<double>(v));
        case VectorXd_index: return std::get<Eigen::VectorXd>(v).transpose();
        default: return std::get<Eigen::MatrixXd>(v);
    }
}

static bool broadcastDim(Eigen::Index a, Eigen::Index b, Eigen::Index& out) noexcept {
    if(a == b || b == 1){
        out = a;
        return true;
    }else if(a == 1){
        out = b;
        return true;
    }else{
        return false;
    }
}

static Eigen::MatrixXd expand(const Eigen::MatrixXd& m, Eigen::Index rows, Eigen::Index cols){
    if(m.rows() == rows && m.cols() == cols) return m;
    return m.replicate(m.rows() == rows ? 1 : rows, m.cols() == cols ? 1 : cols);
}

Interpreter::Interpreter(const ParseTree& parse_tree, const Environment& environment)
    : parse_tree(parse_tree), environment(environment) {
    std::random_device device;
    generator.seed(device());
}

Value Interpreter::run(){
    reset();
    assert(parse_tree.root != NONE);

    Value v;
    try {
        v = interpretExpr(parse_tree.root);
    } catch (const std::bad_alloc&) {
        return error(ARRAY_TOO_LARGE, parse_tree.root, "out of memory");
    }
    if(status == RUNTIME_ERROR) return &error_code;

    logger->debug("Interpreter::run() -> {:s}", shape(v));

    return v;
}

void Interpreter::seed(uint32_t value) noexcept {
    generator.seed(value);
}

bool Interpreter::matchesCategory(const Value& v, BuiltinCategory category) noexcept {
    switch (category) {
        case MATRIX_TO_SCALAR: return v.index() == double_index;
        case MATRIX_TO_TUPLE: return v.index() == Tuple_index;
        //Elementwise functions keep a scalar argument scalar
        case MATRIX_TO_MATRIX:
        case SOLVE_CONSTRUCT:
            return v.index() == double_index || v.index() == VectorXd_index || v.index() == MatrixXd_index;
        default: return false;
    }
}

std::string Interpreter::shape(const Value& v){
    switch (v.index()) {
        case RuntimeError: return "error";
        case double_index: return "scalar";
        case VectorXd_index: return "(" + std::to_string(std::get<Eigen::VectorXd>(v).size()) + ",)";
        case MatrixXd_index:{
            const Eigen::MatrixXd& m = std::get<Eigen::MatrixXd>(v);
            return "(" + std::to_string(m.rows()) + ", " + std::to_string(m.cols()) + ")";
        }
        case Tuple_index: return "tuple of " + std::to_string(std::get<Tuple>(v).size());
        default: assert(false); return "";
    }
}

void Interpreter::reset() noexcept {
    status = NORMAL;
    error_code = NO_ERROR_FOUND;
    error_node = NONE;
    error_context.clear();
}

Value Interpreter::error(ErrorCode code, ParseNode pn, const std::string& context){
    if(status == NORMAL){
        error_code = code;
        error_node = pn;
        error_context = context;
        logger->debug("Interpreter::error({:d}, {:s})", static_cast<int>(code), cStr(context));
    }
    status = RUNTIME_ERROR;

    return &error_code;
}

Value Interpreter::interpretExpr(ParseNode pn){
    switch (parse_tree.getOp(pn)) {
        case OP_PLACEHOLDER: return placeholder(pn);
        case OP_CONSTANT: return parse_tree.getDouble(pn);
        case OP_ADDITION:
        case OP_SUBTRACTION:
        case OP_ELEMENTWISE_MULTIPLY:
        case OP_MATRIX_MULTIPLY:
        case OP_POWER:
            return binaryDispatch(pn);
        case OP_TRANSPOSE:
        case OP_UNARY_MINUS:
            return unaryDispatch(pn);
        case OP_CALL: return call(pn);
        default: return error(UNKNOWN_OPERATOR, pn, std::to_string(parse_tree.getOp(pn)));
    }
}

Value Interpreter::placeholder(ParseNode pn){
    const std::string name(1, parse_tree.getPlaceholder(pn));

    if(name == "P"){
        auto lookup = environment.find("PIPE");
        if(lookup != environment.end()) return toValue(lookup->second);
    }

    auto lookup = environment.find(name);
    if(lookup == environment.end()) return error(UNKNOWN_PLACEHOLDER, pn, name);

    return toValue(lookup->second);
}

Value Interpreter::unaryDispatch(ParseNode pn){
    Value v = interpretExpr(parse_tree.child(pn));
    if(status == RUNTIME_ERROR) return v;

    switch (parse_tree.getOp(pn)) {
        case OP_TRANSPOSE:
            switch (v.index()) {
                case double_index: return v;
                case VectorXd_index: return v;
                case MatrixXd_index: return Eigen::MatrixXd(std::get<Eigen::MatrixXd>(v).transpose());
                default: return error(TYPE_ERROR, pn, "cannot transpose a " + shape(v));
            }
        case OP_UNARY_MINUS:
            switch (v.index()) {
                case double_index: return -std::get<double>(v);
                case VectorXd_index: return Eigen::VectorXd(-std::get<Eigen::VectorXd>(v));
                case MatrixXd_index: return Eigen::MatrixXd(-std::get<Eigen::MatrixXd>(v));
                default: return error(TYPE_ERROR, pn, "cannot negate a " + shape(v));
            }
        default:
            return error(UNKNOWN_OPERATOR, pn, std::string(opSymbol(parse_tree.getOp(pn))));
    }
}

Value Interpreter::binaryDispatch(ParseNode pn){
    Value lhs = interpretExpr(parse_tree.lhs(pn));
    if(status == RUNTIME_ERROR) return lhs;
    Value rhs = interpretExpr(parse_tree.rhs(pn));
    if(status == RUNTIME_ERROR) return rhs;

    const Op type = parse_tree.getOp(pn);
    switch (type) {
        case OP_ADDITION:
        case OP_SUBTRACTION:
        case OP_ELEMENTWISE_MULTIPLY:
            return elementwise(type, lhs, rhs, pn);
        case OP_MATRIX_MULTIPLY: return matmul(lhs, rhs, pn);
        case OP_POWER: return pow(lhs, rhs, pn);
        default: return error(UNKNOWN_OPERATOR, pn, std::string(opSymbol(type)));
    }
}

Value Interpreter::elementwise(Op type, const Value& lhs, const Value& rhs, ParseNode pn){
    if(lhs.index() == Tuple_index || rhs.index() == Tuple_index)
        return error(TYPE_ERROR, pn,
            "unsupported operands for " + std::string(opSymbol(type)) + ": " + shape(lhs) + " and " + shape(rhs));

    if(lhs.index() == double_index && rhs.index() == double_index){
        const double a = std::get<double>(lhs);
        const double b = std::get<double>(rhs);
        switch (type) {
            case OP_ADDITION: return a + b;
            case OP_SUBTRACTION: return a - b;
            default: return a * b;
        }
    }

    const Eigen::MatrixXd a = asRows(lhs);
    const Eigen::MatrixXd b = asRows(rhs);
    Eigen::Index rows, cols;
    if(!broadcastDim(a.rows(), b.rows(), rows) || !broadcastDim(a.cols(), b.cols(), cols))
        return error(DIMENSION_MISMATCH, pn,
            "operands could not be broadcast together with shapes " + shape(lhs) + " " + shape(rhs));

    Eigen::MatrixXd result;
    switch (type) {
        case OP_ADDITION: result = expand(a, rows, cols) + expand(b, rows, cols); break;
        case OP_SUBTRACTION: result = expand(a, rows, cols) - expand(b, rows, cols); break;
        default: result = expand(a, rows, cols).cwiseProduct(expand(b, rows, cols)); break;
    }

    if(std::max(rankOf(lhs), rankOf(rhs)) == 2) return result;
    return Eigen::VectorXd(result.transpose());
}

Value Interpreter::matmul(const Value& lhs, const Value& rhs, ParseNode pn){
    if(rankOf(lhs) == 0 || rankOf(rhs) == 0 || lhs.index() == Tuple_index || rhs.index() == Tuple_index)
        return error(TYPE_ERROR, pn, "matmul operands must be arrays, got " + shape(lhs) + " and " + shape(rhs));

    const std::string mismatch = "matmul inner dimensions differ for " + shape(lhs) + " and " + shape(rhs);

    if(lhs.index() == MatrixXd_index){
        const Eigen::MatrixXd& a = std::get<Eigen::MatrixXd>(lhs);
        if(rhs.index() == MatrixXd_index){
            const Eigen::MatrixXd& b = std::get<Eigen::MatrixXd>(rhs);
            if(a.cols() != b.rows()) return error(DIMENSION_MISMATCH, pn, mismatch);
            return Eigen::MatrixXd(a * b);
        }else{
            const Eigen::VectorXd& b = std::get<Eigen::VectorXd>(rhs);
            if(a.cols() != b.size()) return error(DIMENSION_MISMATCH, pn, mismatch);
            return Eigen::VectorXd(a * b);
        }
    }

    const Eigen::VectorXd& a = std::get<Eigen::VectorXd>(lhs);
    if(rhs.index() == MatrixXd_index){
        const Eigen::MatrixXd& b = std::get<Eigen::MatrixXd>(rhs);
        if(a.size() != b.rows()) return error(DIMENSION_MISMATCH, pn, mismatch);
        return Eigen::VectorXd(b.transpose() * a);
    }else{
        const Eigen::VectorXd& b = std::get<Eigen::VectorXd>(rhs);
        if(a.size() != b.size()) return error(DIMENSION_MISMATCH, pn, mismatch);
        return a.dot(b);
    }
}

Value Interpreter::pow(const Value& base, const Value& exponent, ParseNode pn){
    if(exponent.index() != double_index) return error(POWER_NOT_SCALAR, pn);
    const double e = std::trunc(std::get<double>(exponent));
    if(!std::isfinite(e) || std::abs(e) > MAX_INTEGER_ARG) return error(NON_FINITE_INTEGER, pn);

    const Eigen::MatrixXd* a = requireSquare(base, pn);
    if(a == nullptr) return &error_code;

    Eigen::MatrixXd z;
    if(e < 0){
        Eigen::FullPivLU<Eigen::MatrixXd> lu(*a);
        if(!lu.isInvertible()) return error(SINGULAR_MATRIX, pn);
        z = lu.inverse();
    }else{
        z = *a;
    }

    Eigen::MatrixXd result = Eigen::MatrixXd::Identity(a->rows(), a->cols());
    unsigned long long k = static_cast<unsigned long long>(std::abs(e));
    while(k){
        if(k & 1) result = result * z;
        k >>= 1;
        if(k) z = z * z;
    }

    return result;
}

Value Interpreter::call(ParseNode pn){
    const BuiltinId id = parse_tree.getBuiltin(pn);
    const BuiltinInfo& info = builtinInfo(id);

    std::vector<Value> args;
    args.reserve(parse_tree.getNumArgs(pn));
    for(size_t i = 0; i < parse_tree.getNumArgs(pn); i++){
        ParseNode arg = parse_tree.arg(pn, i);
        Value v = interpretExpr(arg);
        if(status == RUNTIME_ERROR) return v;
        if(v.index() == Tuple_index)
            return error(TYPE_ERROR, arg, std::string(info.name) + "() cannot take a tuple argument");
        args.push_back(std::move(v));
    }

    if(!acceptsArity(id, args.size())){
        std::string expected = info.min_args == info.max_args ?
            std::to_string(info.min_args) :
            std::to_string(info.min_args) + " or " + std::to_string(info.max_args);
        expected += info.max_args == 1 ? " argument" : " arguments";
        return error(INVALID_ARGS, pn,
            std::string(info.name) + "() takes " + expected + " (" + std::to_string(args.size()) + " given)");
    }

    logger->debug("Interpreter::call({:s}, {:d} args)", info.name, args.size());

    Value result;
    try {
        result = (this->*builtins[id])(args, pn);
    } catch (const std::bad_alloc&) {
        return error(ARRAY_TOO_LARGE, pn, std::string(info.name) + "() ran out of memory");
    }
    assert(status == RUNTIME_ERROR || matchesCategory(result, info.category));

    return result;
}

const Eigen::MatrixXd* Interpreter::requireMatrix(const Value& v, ParseNode pn){
    if(v.index() == MatrixXd_index) return &std::get<Eigen::MatrixXd>(v);

    error(TYPE_ERROR, pn, "expected a 2-D array, got " + shape(v));
    return nullptr;
}

const Eigen::MatrixXd* Interpreter::requireSquare(const Value& v, ParseNode pn){
    if(v.index() != MatrixXd_index){
        error(NOT_SQUARE, pn, shape(v));
        return nullptr;
    }

    const Eigen::MatrixXd& m = std::get<Eigen::MatrixXd>(v);
    if(m.rows() != m.cols()){
        error(NOT_SQUARE, pn, shape(v));
        return nullptr;
    }

    return &m;
}

bool Interpreter::readDimension(const Value& v, ParseNode pn, Eigen::Index& dim){
    if(v.index() != double_index){
        error(TYPE_ERROR, pn, "dimension must be a scalar, got " + shape(v));
        return false;
    }

    const double d = std::trunc(std::get<double>(v));
    if(!std::isfinite(d) || d > MAX_INTEGER_ARG){
        error(NON_FINITE_INTEGER, pn);
        return false;
    }else if(d < 0){
        error(INVALID_DIMENSION, pn);
        return false;
    }

    dim = static_cast<Eigen::Index>(d);
    return true;
}

bool Interpreter::checkSize(Eigen::Index rows, Eigen::Index cols, ParseNode pn){
    if(rows != 0 && cols > MAX_ELEMENTS / rows){
        error(ARRAY_TOO_LARGE, pn, "shape (" + std::to_string(rows) + ", " + std::to_string(cols) + ")");
        return false;
    }

    return true;
}

}

}
