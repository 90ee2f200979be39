#include <linalg_interpreter.h>
#include <linalg_program.h>
#include "fixtures.h"
#include "report.h"

template<typename T>
static bool testExpression(const std::string& in, const Environment& env, const T& expect, int line){
    Program program;
    Value result = program.evaluate(in, env);

    if(!program.noErrors() || !approx(result, expect)){
        std::cout << "Line " << line << ", Interpretation case failed.\n"
                     "Expression:    " << in << "\n"
                     "Eval expected: " << toString(Value(expect)) << "\n"
                     "Eval actual:   " << toString(result) << ' ' << program.errorMessage() << "\n" << std::endl;
        return false;
    }

    return true;
}

static bool testFailure(const std::string& in, const Environment& env, ErrorCode code, const std::string& message, int line){
    Program program;
    Value result = program.evaluate(in, env);

    const bool is_error = result.index() == RuntimeError && *std::get<ErrorCode*>(result) == code;
    const bool message_matches = message.empty() || program.errorMessage() == message;
    if(!is_error || program.noErrors() || !message_matches){
        std::cout << "Line " << line << ", Expected failure \"" << getMessage(code) << "\" for " << in << "\n"
                     "Expected: " << message << "\n"
                     "Actual:   " << toString(result) << ' ' << program.errorMessage() << std::endl;
        return false;
    }

    return true;
}

inline bool testInterpreter(){
    bool passing = true;
    const Environment env = sampleEnvironment();
    const Eigen::MatrixXd A = std::get<Eigen::MatrixXd>(env.at("A"));
    const Eigen::MatrixXd B = std::get<Eigen::MatrixXd>(env.at("B"));

    passing &= testExpression("{A}", env, A, __LINE__);
    passing &= testExpression("{A}+{B}", env, matrix({{6, 8}, {10, 12}}), __LINE__);
    passing &= testExpression("{A}-{B}", env, matrix({{-4, -4}, {-4, -4}}), __LINE__);
    passing &= testExpression("{A}*{B}", env, matrix({{5, 12}, {21, 32}}), __LINE__);
    passing &= testExpression("{A}@{B}", env, matrix({{19, 22}, {43, 50}}), __LINE__);
    passing &= testExpression("{A}.T", env, matrix({{1, 3}, {2, 4}}), __LINE__);
    passing &= testExpression("-{A}", env, Eigen::MatrixXd(-A), __LINE__);
    passing &= testExpression("det({A})", env, -2.0, __LINE__);
    passing &= testExpression("tr({A}@{B}.T)+det({A})", env, 68.0, __LINE__);
    passing &= testExpression("{A}-{B}-{A}", env, Eigen::MatrixXd(-B), __LINE__);
    passing &= testExpression("{A}+{B}@{A}", env, Eigen::MatrixXd(A + B*A), __LINE__);
    passing &= testExpression("({A})", env, A, __LINE__);
    passing &= testExpression("2*{A}+1", env, matrix({{3, 5}, {7, 9}}), __LINE__);
    passing &= testExpression("{A}*0.5", env, matrix({{0.5, 1}, {1.5, 2}}), __LINE__);
    passing &= testExpression("1.5-2", env, -0.5, __LINE__);
    passing &= testExpression(".5+.25", env, 0.75, __LINE__);
    passing &= testExpression("1e3", env, 1000.0, __LINE__);

    //Power truncates the exponent
    passing &= testExpression("{A}^2", env, matrix({{7, 10}, {15, 22}}), __LINE__);
    passing &= testExpression("{A}^2.5", env, matrix({{7, 10}, {15, 22}}), __LINE__);
    passing &= testExpression("{A}^0", env, matrix({{1, 0}, {0, 1}}), __LINE__);
    passing &= testExpression("{A}^-1", env, matrix({{-2, 1}, {1.5, -0.5}}), __LINE__);
    passing &= testExpression("-{A}^2", env, matrix({{7, 10}, {15, 22}}), __LINE__);
    passing &= testExpression("{A}^3", env, Eigen::MatrixXd(A*A*A), __LINE__);
    passing &= testExpression("{A}^(1+1)", env, matrix({{7, 10}, {15, 22}}), __LINE__);

    //Vectors and broadcasting
    Environment vec_env = sampleEnvironment();
    vec_env["V"] = vec({1, 1});
    vec_env["W"] = vec({1, 2, 3});
    passing &= testExpression("{A}@{V}", vec_env, vec({3, 7}), __LINE__);
    passing &= testExpression("{V}@{A}", vec_env, vec({4, 6}), __LINE__);
    passing &= testExpression("{V}@{V}", vec_env, 2.0, __LINE__);
    passing &= testExpression("{A}+{V}", vec_env, matrix({{2, 3}, {4, 5}}), __LINE__);
    passing &= testExpression("{V}*3", vec_env, vec({3, 3}), __LINE__);
    passing &= testExpression("{V}.T", vec_env, vec({1, 1}), __LINE__);
    passing &= testExpression("-{W}", vec_env, vec({-1, -2, -3}), __LINE__);

    //Piped data
    Environment pipe_env;
    pipe_env["PIPE"] = matrix({{2, 0}, {0, 2}});
    passing &= testExpression("{PIPE}", pipe_env, matrix({{2, 0}, {0, 2}}), __LINE__);
    passing &= testExpression("{P}", pipe_env, matrix({{2, 0}, {0, 2}}), __LINE__);
    passing &= testExpression("det({P})+det({PIPE})", pipe_env, 8.0, __LINE__);
    pipe_env["P"] = 5.0;
    passing &= testExpression("{P}", pipe_env, matrix({{2, 0}, {0, 2}}), __LINE__);
    pipe_env.erase("PIPE");
    passing &= testExpression("{P}", pipe_env, 5.0, __LINE__);

    passing &= testFailure("{Z}", env, UNKNOWN_PLACEHOLDER, "Unknown placeholder: Z", __LINE__);
    passing &= testFailure("{P}", env, UNKNOWN_PLACEHOLDER, "Unknown placeholder: P", __LINE__);
    passing &= testFailure("{A}@2", env, TYPE_ERROR, "", __LINE__);
    passing &= testFailure("{A}^{B}", env, POWER_NOT_SCALAR, "Power must be a scalar", __LINE__);
    passing &= testFailure("{A}^inf", env, NON_FINITE_INTEGER, "", __LINE__);
    passing &= testFailure("{V}^2", vec_env, NOT_SQUARE, "Matrix must be square: (2,)", __LINE__);
    passing &= testFailure("{A}+{W}", vec_env, DIMENSION_MISMATCH,
        "Dimension mismatch: operands could not be broadcast together with shapes (2, 2) (3,)", __LINE__);
    passing &= testFailure("{A}@{W}", vec_env, DIMENSION_MISMATCH, "", __LINE__);
    passing &= testFailure("zeros(2, 2)^-1", env, SINGULAR_MATRIX, "Singular matrix", __LINE__);
    passing &= testFailure("svd({A})+1", env, TYPE_ERROR, "", __LINE__);
    passing &= testFailure("-svd({A})", env, TYPE_ERROR, "", __LINE__);
    passing &= testFailure("{A}+{Z}", env, UNKNOWN_PLACEHOLDER, "Unknown placeholder: Z", __LINE__);

    //Parse errors stop evaluation
    passing &= testFailure("det({A}", env, EXPECTED_CLOSE_PAREN, "Expected closing parenthesis ')'", __LINE__);
    passing &= testFailure("{A}+", env, UNEXPECTED_END, "", __LINE__);

    //A program can be reused after a failure
    Program program;
    program.evaluate("{Z}", env);
    Value result = program.evaluate("det({A})", env);
    if(!program.noErrors() || !approx(result, -2.0)){
        std::cout << "Line " << __LINE__ << ", Program did not recover after a failed evaluation" << std::endl;
        passing = false;
    }

    report("Interpreter", passing);
    return passing;
}
