#ifndef FIXTURES_H
#define FIXTURES_H

#include <linalg_program.h>
#include <linalg_value.h>
#include <algorithm>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace Linalg;
using namespace Code;

inline std::string readFile(const std::string& filename){
    std::ifstream in(filename, std::ios::binary);
    if(!in.is_open()) std::cout << "Failed to open " << filename << std::endl;
    assert(in.is_open());

    std::stringstream buffer;
    buffer << in.rdbuf();

    std::string str = buffer.str();
    str.erase( std::remove(str.begin(), str.end(), '\r'), str.end() );

    return str;
}

inline Eigen::MatrixXd matrix(std::initializer_list<std::initializer_list<double>> rows){
    Eigen::MatrixXd m(rows.size(), rows.size() ? rows.begin()->size() : 0);
    Eigen::Index i = 0;
    for(const auto& row : rows){
        Eigen::Index j = 0;
        for(double x : row) m(i, j++) = x;
        i++;
    }

    return m;
}

inline Eigen::VectorXd vec(std::initializer_list<double> vals){
    Eigen::VectorXd v(vals.size());
    Eigen::Index i = 0;
    for(double x : vals) v[i++] = x;

    return v;
}

//A = [[1, 2], [3, 4]], B = [[5, 6], [7, 8]]
inline Environment sampleEnvironment(){
    Environment env;
    env["A"] = matrix({{1, 2}, {3, 4}});
    env["B"] = matrix({{5, 6}, {7, 8}});

    return env;
}

inline std::string toString(const Value& v){
    std::stringstream ss;
    switch (v.index()) {
        case RuntimeError: ss << "error " << static_cast<int>(*std::get<ErrorCode*>(v)); break;
        case double_index: ss << std::get<double>(v); break;
        case VectorXd_index: ss << std::get<Eigen::VectorXd>(v).transpose(); break;
        case MatrixXd_index: ss << std::get<Eigen::MatrixXd>(v); break;
        case Tuple_index: ss << "tuple of " << std::get<Tuple>(v).size(); break;
    }

    return ss.str();
}

inline bool approx(const Value& v, double expected, double tol = 1e-9){
    return v.index() == double_index && std::abs(std::get<double>(v) - expected) <= tol;
}

inline bool approx(const Value& v, const Eigen::VectorXd& expected, double tol = 1e-9){
    if(v.index() != VectorXd_index) return false;
    const Eigen::VectorXd& a = std::get<Eigen::VectorXd>(v);
    return a.size() == expected.size() && (a.size() == 0 || (a - expected).cwiseAbs().maxCoeff() <= tol);
}

inline bool approx(const Value& v, const Eigen::MatrixXd& expected, double tol = 1e-9){
    if(v.index() != MatrixXd_index) return false;
    const Eigen::MatrixXd& a = std::get<Eigen::MatrixXd>(v);
    return a.rows() == expected.rows() && a.cols() == expected.cols() &&
           (a.size() == 0 || (a - expected).cwiseAbs().maxCoeff() <= tol);
}

inline std::filesystem::path scratchDir(){
    std::filesystem::path dir = std::filesystem::temp_directory_path() / "linalg_test";
    std::filesystem::create_directories(dir);

    return dir;
}

#endif // FIXTURES_H
