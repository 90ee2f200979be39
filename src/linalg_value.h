#ifndef LINALG_VALUE_H
#define LINALG_VALUE_H

#include "linalg_common.h"
#include "linalg_error_types.h"
#include <string>
#include <variant>
#include <vector>
#include <Eigen/Dense>

namespace Linalg {

namespace Code {

//A single array or scalar, as stored in the environment and in tuples
typedef std::variant<
    double,
    Eigen::VectorXd,
    Eigen::MatrixXd
> Numeric;

static constexpr size_t numeric_double_index = 0;
static constexpr size_t numeric_VectorXd_index = 1;
static constexpr size_t numeric_MatrixXd_index = 2;

typedef std::vector<Numeric> Tuple;

typedef std::variant<
    ErrorCode*,
    double,
    Eigen::VectorXd,
    Eigen::MatrixXd,
    Tuple
> Value;

static constexpr size_t RuntimeError = 0;
static constexpr size_t double_index = 1;
static constexpr size_t VectorXd_index = 2;
static constexpr size_t MatrixXd_index = 3;
static constexpr size_t Tuple_index = 4;

typedef LINALG_UNORDERED_MAP<std::string, Numeric> Environment;

inline Value toValue(const Numeric& n) alloc_except {
    switch (n.index()) {
        case numeric_double_index: return std::get<double>(n);
        case numeric_VectorXd_index: return std::get<Eigen::VectorXd>(n);
        default: return std::get<Eigen::MatrixXd>(n);
    }
}

//Precondition: v is not a tuple or error
inline Numeric toNumeric(Value&& v) alloc_except {
    switch (v.index()) {
        case double_index: return std::get<double>(v);
        case VectorXd_index: return std::move(std::get<Eigen::VectorXd>(v));
        case MatrixXd_index: return std::move(std::get<Eigen::MatrixXd>(v));
        default: assert(false); return 0.0;
    }
}

}

}

#endif // LINALG_VALUE_H
