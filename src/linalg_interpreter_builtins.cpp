#include "linalg_interpreter.h"

#include <cmath>
#include <limits>
#include <Eigen/Cholesky>
#include <Eigen/Eigenvalues>
#include <Eigen/LU>
#include <Eigen/QR>
#include <Eigen/SVD>

namespace Linalg {

namespace Code {

static constexpr double PINV_RCOND = 1e-15;

static Eigen::VectorXd flatten(const Value& v){
    switch (v.index()) {
        case double_index: return Eigen::VectorXd::Constant(1, std::get<double>(v));
        case VectorXd_index: return std::get<Eigen::VectorXd>(v);
        default:{
            const Eigen::MatrixXd& m = std::get<Eigen::MatrixXd>(v);
            return Eigen::Map<const Eigen::VectorXd>(m.data(), m.size());
        }
    }
}

const std::array<Interpreter::Builtin, NUM_BUILTINS> Interpreter::builtins {
    &Interpreter::inv,
    &Interpreter::pinv,
    &Interpreter::matrixPower,
    &Interpreter::exp,
    &Interpreter::sin,
    &Interpreter::cos,
    &Interpreter::det,
    &Interpreter::trace,
    &Interpreter::trace,
    &Interpreter::norm,
    &Interpreter::rank,
    &Interpreter::cond,
    &Interpreter::sum,
    &Interpreter::prod,
    &Interpreter::mean,
    &Interpreter::stdev,
    &Interpreter::svd,
    &Interpreter::eig,
    &Interpreter::qr,
    &Interpreter::lu,
    &Interpreter::cholesky,
    &Interpreter::solve,
    &Interpreter::lstsq,
    &Interpreter::eye,
    &Interpreter::diag,
    &Interpreter::rand,
    &Interpreter::zeros,
    &Interpreter::ones,
};

template<typename F> Value Interpreter::map(const Value& v, ParseNode pn, F f){
    switch (v.index()) {
        case double_index: return f(std::get<double>(v));
        case VectorXd_index: return Eigen::VectorXd(std::get<Eigen::VectorXd>(v).unaryExpr(f));
        case MatrixXd_index: return Eigen::MatrixXd(std::get<Eigen::MatrixXd>(v).unaryExpr(f));
        default: return error(TYPE_ERROR, pn, shape(v));
    }
}

template<typename F> Value Interpreter::reduce(const Value& v, ParseNode pn, F f){
    if(v.index() == Tuple_index) return error(TYPE_ERROR, pn, shape(v));
    return f(flatten(v));
}

Value Interpreter::inv(const std::vector<Value>& args, ParseNode pn){
    const Eigen::MatrixXd* a = requireSquare(args[0], pn);
    if(a == nullptr) return &error_code;

    Eigen::FullPivLU<Eigen::MatrixXd> lu(*a);
    if(!lu.isInvertible()) return error(SINGULAR_MATRIX, pn);

    return Eigen::MatrixXd(lu.inverse());
}

Value Interpreter::pinv(const std::vector<Value>& args, ParseNode pn){
    const Eigen::MatrixXd* a = requireMatrix(args[0], pn);
    if(a == nullptr) return &error_code;

    Eigen::JacobiSVD<Eigen::MatrixXd> svd(*a, Eigen::ComputeThinU | Eigen::ComputeThinV);
    const Eigen::VectorXd& s = svd.singularValues();
    const double cutoff = s.size() ? PINV_RCOND * s.maxCoeff() : 0.0;

    Eigen::VectorXd s_inv(s.size());
    for(Eigen::Index i = 0; i < s.size(); i++)
        s_inv[i] = s[i] > cutoff ? 1.0 / s[i] : 0.0;

    return Eigen::MatrixXd(svd.matrixV() * s_inv.asDiagonal() * svd.matrixU().transpose());
}

Value Interpreter::matrixPower(const std::vector<Value>& args, ParseNode pn){
    return pow(args[0], args[1], pn);
}

Value Interpreter::exp(const std::vector<Value>& args, ParseNode pn){
    return map(args[0], pn, [](double x){ return std::exp(x); });
}

Value Interpreter::sin(const std::vector<Value>& args, ParseNode pn){
    return map(args[0], pn, [](double x){ return std::sin(x); });
}

Value Interpreter::cos(const std::vector<Value>& args, ParseNode pn){
    return map(args[0], pn, [](double x){ return std::cos(x); });
}

Value Interpreter::det(const std::vector<Value>& args, ParseNode pn){
    const Eigen::MatrixXd* a = requireSquare(args[0], pn);
    if(a == nullptr) return &error_code;

    return a->determinant();
}

Value Interpreter::trace(const std::vector<Value>& args, ParseNode pn){
    const Eigen::MatrixXd* a = requireMatrix(args[0], pn);
    if(a == nullptr) return &error_code;

    return a->trace();
}

Value Interpreter::norm(const std::vector<Value>& args, ParseNode){
    switch (args[0].index()) {
        case double_index: return std::abs(std::get<double>(args[0]));
        case VectorXd_index: return std::get<Eigen::VectorXd>(args[0]).norm();
        default: return std::get<Eigen::MatrixXd>(args[0]).norm();
    }
}

Value Interpreter::rank(const std::vector<Value>& args, ParseNode){
    if(args[0].index() != MatrixXd_index){
        //Rank of a scalar or vector is whether it has any nonzero entry
        return (flatten(args[0]).array() != 0.0).any() ? 1.0 : 0.0;
    }

    const Eigen::MatrixXd& a = std::get<Eigen::MatrixXd>(args[0]);
    if(a.size() == 0) return 0.0;

    Eigen::JacobiSVD<Eigen::MatrixXd> svd(a);
    const Eigen::VectorXd& s = svd.singularValues();
    const double tol = s.maxCoeff() * std::max(a.rows(), a.cols()) * std::numeric_limits<double>::epsilon();

    return static_cast<double>((s.array() > tol).count());
}

Value Interpreter::cond(const std::vector<Value>& args, ParseNode pn){
    const Eigen::MatrixXd* a = requireMatrix(args[0], pn);
    if(a == nullptr) return &error_code;
    if(a->size() == 0) return error(DIMENSION_MISMATCH, pn, "cond() of an empty array");

    Eigen::JacobiSVD<Eigen::MatrixXd> svd(*a);
    const Eigen::VectorXd& s = svd.singularValues();

    return s[0] / s[s.size()-1];
}

Value Interpreter::sum(const std::vector<Value>& args, ParseNode pn){
    return reduce(args[0], pn, [](const Eigen::VectorXd& x){ return x.sum(); });
}

Value Interpreter::prod(const std::vector<Value>& args, ParseNode pn){
    return reduce(args[0], pn, [](const Eigen::VectorXd& x){ return x.prod(); });
}

Value Interpreter::mean(const std::vector<Value>& args, ParseNode pn){
    return reduce(args[0], pn, [](const Eigen::VectorXd& x){
        return x.size() ? x.mean() : std::numeric_limits<double>::quiet_NaN();
    });
}

Value Interpreter::stdev(const std::vector<Value>& args, ParseNode pn){
    return reduce(args[0], pn, [](const Eigen::VectorXd& x){
        if(x.size() == 0) return std::numeric_limits<double>::quiet_NaN();
        return std::sqrt((x.array() - x.mean()).square().mean());
    });
}

Value Interpreter::svd(const std::vector<Value>& args, ParseNode pn){
    const Eigen::MatrixXd* a = requireMatrix(args[0], pn);
    if(a == nullptr) return &error_code;

    Eigen::JacobiSVD<Eigen::MatrixXd> svd(*a, Eigen::ComputeFullU | Eigen::ComputeFullV);

    return Tuple {
        Eigen::MatrixXd(svd.matrixU()),
        Eigen::VectorXd(svd.singularValues()),
        Eigen::MatrixXd(svd.matrixV().transpose()),
    };
}

Value Interpreter::eig(const std::vector<Value>& args, ParseNode pn){
    const Eigen::MatrixXd* a = requireSquare(args[0], pn);
    if(a == nullptr) return &error_code;

    Eigen::EigenSolver<Eigen::MatrixXd> solver(*a);
    if(solver.info() != Eigen::Success) return error(NO_CONVERGENCE, pn);
    if((solver.eigenvalues().imag().array() != 0.0).any()) return error(COMPLEX_EIGENVALUES, pn);

    return Tuple {
        Eigen::VectorXd(solver.eigenvalues().real()),
        Eigen::MatrixXd(solver.eigenvectors().real()),
    };
}

Value Interpreter::qr(const std::vector<Value>& args, ParseNode pn){
    const Eigen::MatrixXd* a = requireMatrix(args[0], pn);
    if(a == nullptr) return &error_code;

    const Eigen::Index k = std::min(a->rows(), a->cols());
    Eigen::HouseholderQR<Eigen::MatrixXd> qr(*a);
    Eigen::MatrixXd q = qr.householderQ() * Eigen::MatrixXd::Identity(a->rows(), k);
    Eigen::MatrixXd r = qr.matrixQR().topRows(k).triangularView<Eigen::Upper>();

    return Tuple {q, r};
}

Value Interpreter::lu(const std::vector<Value>& args, ParseNode pn){
    const Eigen::MatrixXd* a = requireSquare(args[0], pn);
    if(a == nullptr) return &error_code;

    //Eigen factors P A = L U, the result is reported as A = P L U
    Eigen::PartialPivLU<Eigen::MatrixXd> lu(*a);
    Eigen::MatrixXd p = lu.permutationP().transpose() * Eigen::MatrixXd::Identity(a->rows(), a->cols());
    Eigen::MatrixXd l = lu.matrixLU().triangularView<Eigen::UnitLower>();
    Eigen::MatrixXd u = lu.matrixLU().triangularView<Eigen::Upper>();

    return Tuple {p, l, u};
}

Value Interpreter::cholesky(const std::vector<Value>& args, ParseNode pn){
    const Eigen::MatrixXd* a = requireSquare(args[0], pn);
    if(a == nullptr) return &error_code;

    Eigen::LLT<Eigen::MatrixXd> llt(*a);
    if(llt.info() != Eigen::Success) return error(NOT_POSITIVE_DEFINITE, pn);

    return Eigen::MatrixXd(llt.matrixL());
}

const Eigen::MatrixXd* Interpreter::requireRhs(const Value& a, const Value& b, ParseNode pn){
    const Eigen::MatrixXd* m = requireMatrix(a, pn);
    if(m == nullptr) return nullptr;

    Eigen::Index rows;
    switch (b.index()) {
        case VectorXd_index: rows = std::get<Eigen::VectorXd>(b).size(); break;
        case MatrixXd_index: rows = std::get<Eigen::MatrixXd>(b).rows(); break;
        default:
            error(TYPE_ERROR, pn, "right-hand side must be an array, got " + shape(b));
            return nullptr;
    }

    if(rows != m->rows()){
        error(DIMENSION_MISMATCH, pn, "left-hand side " + shape(a) + " and right-hand side " + shape(b));
        return nullptr;
    }

    return m;
}

Value Interpreter::solve(const std::vector<Value>& args, ParseNode pn){
    if(requireSquare(args[0], pn) == nullptr) return &error_code;
    const Eigen::MatrixXd* a = requireRhs(args[0], args[1], pn);
    if(a == nullptr) return &error_code;

    Eigen::FullPivLU<Eigen::MatrixXd> lu(*a);
    if(!lu.isInvertible()) return error(SINGULAR_MATRIX, pn);

    if(args[1].index() == VectorXd_index) return Eigen::VectorXd(lu.solve(std::get<Eigen::VectorXd>(args[1])));
    else return Eigen::MatrixXd(lu.solve(std::get<Eigen::MatrixXd>(args[1])));
}

Value Interpreter::lstsq(const std::vector<Value>& args, ParseNode pn){
    const Eigen::MatrixXd* a = requireRhs(args[0], args[1], pn);
    if(a == nullptr) return &error_code;

    //Minimum norm solution with the default cutoff eps * max(M, N)
    Eigen::JacobiSVD<Eigen::MatrixXd> svd(*a, Eigen::ComputeThinU | Eigen::ComputeThinV);
    svd.setThreshold(std::numeric_limits<double>::epsilon() * std::max(a->rows(), a->cols()));

    if(args[1].index() == VectorXd_index) return Eigen::VectorXd(svd.solve(std::get<Eigen::VectorXd>(args[1])));
    else return Eigen::MatrixXd(svd.solve(std::get<Eigen::MatrixXd>(args[1])));
}

Value Interpreter::eye(const std::vector<Value>& args, ParseNode pn){
    Eigen::Index n;
    if(!readDimension(args[0], pn, n) || !checkSize(n, n, pn)) return &error_code;

    return Eigen::MatrixXd(Eigen::MatrixXd::Identity(n, n));
}

Value Interpreter::diag(const std::vector<Value>& args, ParseNode pn){
    switch (args[0].index()) {
        case VectorXd_index: return Eigen::MatrixXd(std::get<Eigen::VectorXd>(args[0]).asDiagonal());
        case MatrixXd_index: return Eigen::VectorXd(std::get<Eigen::MatrixXd>(args[0]).diagonal());
        default: return error(TYPE_ERROR, pn, "diag() expects a 1-D or 2-D array, got " + shape(args[0]));
    }
}

bool Interpreter::readShape(const std::vector<Value>& args, ParseNode pn, Eigen::Index& rows, Eigen::Index& cols){
    if(!readDimension(args[0], pn, rows)) return false;
    if(args.size() == 1){
        cols = 0;
        if(rows <= MAX_ELEMENTS) return true;
        error(ARRAY_TOO_LARGE, pn, "shape (" + std::to_string(rows) + ",)");
        return false;
    }

    return readDimension(args[1], pn, cols) && checkSize(rows, cols, pn);
}

Value Interpreter::rand(const std::vector<Value>& args, ParseNode pn){
    Eigen::Index rows, cols;
    if(!readShape(args, pn, rows, cols)) return &error_code;

    std::uniform_real_distribution<double> distribution(0.0, 1.0);

    if(args.size() == 1){
        Eigen::VectorXd v(rows);
        for(Eigen::Index i = 0; i < rows; i++) v[i] = distribution(generator);
        return v;
    }

    //Row-major fill so a seeded sequence reads left to right
    Eigen::MatrixXd m(rows, cols);
    for(Eigen::Index i = 0; i < rows; i++)
        for(Eigen::Index j = 0; j < cols; j++)
            m(i, j) = distribution(generator);

    return m;
}

Value Interpreter::fill(const std::vector<Value>& args, ParseNode pn, double val){
    Eigen::Index rows, cols;
    if(!readShape(args, pn, rows, cols)) return &error_code;

    if(args.size() == 1) return Eigen::VectorXd(Eigen::VectorXd::Constant(rows, val));
    else return Eigen::MatrixXd(Eigen::MatrixXd::Constant(rows, cols, val));
}

Value Interpreter::zeros(const std::vector<Value>& args, ParseNode pn){
    return fill(args, pn, 0.0);
}

Value Interpreter::ones(const std::vector<Value>& args, ParseNode pn){
    return fill(args, pn, 1.0);
}

}

}
