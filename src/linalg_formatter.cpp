#include "linalg_formatter.h"

#include "linalg_interpreter.h"
#include "linalg_logging.h"
#include "linalg_npy.h"
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <nlohmann/json.hpp>
#include <vector>

namespace Linalg {

using namespace Code;

static constexpr double SCIENTIFIC_MIN = 1e8;
static constexpr std::string_view TABLE_TITLE = "Matrix Result";

//A vector is displayed as a single row
static Eigen::MatrixXd rowsOf(const Numeric& a){
    switch (a.index()) {
        case numeric_double_index: return Eigen::MatrixXd::Constant(1, 1, std::get<double>(a));
        case numeric_VectorXd_index: return std::get<Eigen::VectorXd>(a).transpose();
        default: return std::get<Eigen::MatrixXd>(a);
    }
}

static Numeric numericOf(const Value& v){
    switch (v.index()) {
        case double_index: return std::get<double>(v);
        case VectorXd_index: return std::get<Eigen::VectorXd>(v);
        default: return std::get<Eigen::MatrixXd>(v);
    }
}

static std::string join(const std::vector<std::string>& parts, std::string_view delimiter){
    std::string out;
    for(size_t i = 0; i < parts.size(); i++){
        if(i) out += delimiter;
        out += parts[i];
    }

    return out;
}

static std::string repeat(std::string_view str, size_t n){
    std::string out;
    out.reserve(str.size()*n);
    for(size_t i = 0; i < n; i++) out += str;

    return out;
}

//JSON has no token for NaN or infinity
static nlohmann::json jsonNumber(double x){
    if(std::isfinite(x)) return x;
    else return nullptr;
}

Formatter::Formatter(const Settings& settings, ErrorStream& errors) noexcept
    : settings(settings), errors(errors) {}

bool Formatter::format(const Value& result, std::string& out){
    out.clear();
    const std::string& path = settings.output_path;

    logger->debug("Formatter::format({:s}) as {:s}", Interpreter::shape(result), formatName(settings.format));

    if(writesBinary()){
        if(result.index() == Tuple_index){
            errors.fail(NPY_TUPLE);
            return false;
        }
        out = writeNpy(numericOf(result));
        return true;
    }

    switch (result.index()) {
        case double_index: return formatScalar(std::get<double>(result), path, out);
        case VectorXd_index:
        case MatrixXd_index:
            return formatArray(thresholded(numericOf(result)), path, out);
        case Tuple_index: return formatTuple(std::get<Tuple>(result), path, out);
        default:
            assert(false);
            return false;
    }
}

bool Formatter::writesBinary() const noexcept {
    return settings.format == FORMAT_NPY && settings.write_to_stdout && settings.output_path.empty();
}

std::string Formatter::number(double x) const {
    return fmt::format("{:.{}g}", x, settings.precision);
}

std::string Formatter::repr(double x){
    std::string str = fmt::format("{}", x);
    if(str.find_first_of(".en") == std::string::npos) str += ".0";

    return str;
}

std::string Formatter::plain(const Numeric& a) const {
    if(a.index() == numeric_VectorXd_index){
        const Eigen::VectorXd& v = std::get<Eigen::VectorXd>(a);
        std::vector<std::string> lines;
        for(Eigen::Index i = 0; i < v.size(); i++) lines.push_back(number(v[i]));
        return join(lines, "\n");
    }

    const Eigen::MatrixXd m = rowsOf(a);
    std::vector<std::string> lines;
    for(Eigen::Index i = 0; i < m.rows(); i++){
        std::vector<std::string> cells;
        for(Eigen::Index j = 0; j < m.cols(); j++) cells.push_back(number(m(i, j)));
        lines.push_back(join(cells, "\t"));
    }

    return join(lines, "\n");
}

std::string Formatter::text(const Numeric& a) const {
    const Eigen::MatrixXd m = rowsOf(a);
    const bool is_matrix = a.index() == numeric_MatrixXd_index;

    double max_abs = 0;
    for(Eigen::Index i = 0; i < m.size(); i++)
        if(std::isfinite(m.data()[i])) max_abs = std::max(max_abs, std::abs(m.data()[i]));
    const bool scientific = max_abs >= SCIENTIFIC_MIN;

    //Every element shares the fraction width of the longest trimmed fraction
    std::vector<std::string> whole(m.size());
    std::vector<std::string> frac(m.size());
    std::vector<std::string> exponent(m.size());
    size_t whole_width = 0;
    size_t frac_width = 0;
    for(Eigen::Index k = 0; k < m.size(); k++){
        const double x = m.data()[k];
        if(!std::isfinite(x)){
            whole[k] = fmt::format("{}", x);
            continue;
        }

        std::string str = scientific ? fmt::format("{:.{}e}", x, settings.precision) :
                                       fmt::format("{:.{}f}", x, settings.precision);
        if(scientific){
            const size_t e = str.find('e');
            exponent[k] = str.substr(e);
            str.resize(e);
        }

        const size_t point = str.find('.');
        whole[k] = str.substr(0, point);
        if(point != std::string::npos){
            frac[k] = str.substr(point+1);
            while(!frac[k].empty() && frac[k].back() == '0') frac[k].pop_back();
        }

        whole_width = std::max(whole_width, whole[k].size());
        frac_width = std::max(frac_width, frac[k].size());
    }

    if(scientific){
        for(Eigen::Index k = 0; k < m.size(); k++){
            const double x = m.data()[k];
            if(!std::isfinite(x)) continue;
            std::string str = fmt::format("{:.{}e}", x, frac_width);
            const size_t e = str.find('e');
            const size_t point = str.find('.');
            whole[k] = str.substr(0, point == std::string::npos ? e : point);
            frac[k] = point == std::string::npos ? std::string() : str.substr(point+1, e-point-1);
            exponent[k] = str.substr(e);
            whole_width = std::max(whole_width, whole[k].size());
        }
    }

    const size_t width = whole_width + 1 + frac_width + (scientific ? 4 : 0);

    auto element = [&](Eigen::Index k){
        if(!std::isfinite(m.data()[k])){
            const std::string& str = whole[k];
            return std::string(width > str.size() ? width - str.size() : 0, ' ') + str;
        }
        std::string str(whole_width - whole[k].size(), ' ');
        str += whole[k];
        str += '.';
        str += frac[k];
        if(scientific) str += exponent[k];
        else str.append(frac_width - frac[k].size(), ' ');
        return str;
    };

    std::vector<std::string> rows;
    for(Eigen::Index i = 0; i < m.rows(); i++){
        std::vector<std::string> cells;
        for(Eigen::Index j = 0; j < m.cols(); j++) cells.push_back(element(j*m.rows() + i));
        rows.push_back('[' + join(cells, " ") + ']');
    }

    if(!is_matrix) return rows.empty() ? "[]" : rows.front();
    return '[' + join(rows, "\n ") + ']';
}

std::string Formatter::csv(const Numeric& a) const {
    const Eigen::MatrixXd m = rowsOf(a);

    std::string out;
    for(Eigen::Index i = 0; i < m.rows(); i++){
        std::vector<std::string> cells;
        for(Eigen::Index j = 0; j < m.cols(); j++) cells.push_back(repr(m(i, j)));
        out += join(cells, ",");
        out += '\n';
    }

    return out;
}

std::string Formatter::latex(const Numeric& a) const {
    const Eigen::MatrixXd m = rowsOf(a);

    std::vector<std::string> lines;
    lines.push_back("\\begin{bmatrix}");
    for(Eigen::Index i = 0; i < m.rows(); i++){
        std::vector<std::string> cells;
        for(Eigen::Index j = 0; j < m.cols(); j++) cells.push_back(number(m(i, j)));
        lines.push_back(join(cells, " & ") + " \\\\");
    }
    lines.push_back("\\end{bmatrix}");

    return join(lines, "\n");
}

std::string Formatter::json(const Numeric& a){
    nlohmann::json out;

    switch (a.index()) {
        case numeric_double_index:
            out = jsonNumber(std::get<double>(a));
            break;
        case numeric_VectorXd_index:{
            const Eigen::VectorXd& v = std::get<Eigen::VectorXd>(a);
            out = nlohmann::json::array();
            for(Eigen::Index i = 0; i < v.size(); i++) out.push_back(jsonNumber(v[i]));
            break;
        }
        default:{
            const Eigen::MatrixXd& m = std::get<Eigen::MatrixXd>(a);
            out = nlohmann::json::array();
            for(Eigen::Index i = 0; i < m.rows(); i++){
                nlohmann::json row = nlohmann::json::array();
                for(Eigen::Index j = 0; j < m.cols(); j++) row.push_back(jsonNumber(m(i, j)));
                out.push_back(std::move(row));
            }
        }
    }

    return out.dump(2);
}

std::string Formatter::table(const Numeric& a) const {
    const Eigen::MatrixXd m = rowsOf(a);

    std::vector<std::string> headers;
    std::vector<size_t> widths;
    for(Eigen::Index j = 0; j < m.cols(); j++){
        headers.push_back("[" + std::to_string(j) + "]");
        widths.push_back(headers.back().size());
    }

    std::vector<std::vector<std::string>> cells(m.rows());
    for(Eigen::Index i = 0; i < m.rows(); i++){
        for(Eigen::Index j = 0; j < m.cols(); j++){
            cells[i].push_back(number(m(i, j)));
            widths[j] = std::max(widths[j], cells[i].back().size());
        }
    }

    auto border = [&](std::string_view left, std::string_view fill, std::string_view mid, std::string_view right){
        std::vector<std::string> segments;
        for(size_t w : widths) segments.push_back(repeat(fill, w+2));
        return std::string(left) + join(segments, mid) + std::string(right) + '\n';
    };

    auto row = [&](const std::vector<std::string>& entries, std::string_view edge){
        std::vector<std::string> segments;
        for(size_t j = 0; j < entries.size(); j++)
            segments.push_back(' ' + entries[j] + std::string(widths[j] - entries[j].size(), ' ') + ' ');
        return std::string(edge) + join(segments, edge) + std::string(edge) + '\n';
    };

    size_t total = 1;
    for(size_t w : widths) total += w + 3;

    std::string out;
    if(total > TABLE_TITLE.size()){
        const size_t left = (total - TABLE_TITLE.size()) / 2;
        out += std::string(left, ' ');
        out += TABLE_TITLE;
        out += std::string(total - TABLE_TITLE.size() - left, ' ');
    }else{
        out += TABLE_TITLE;
    }
    out += '\n';

    out += border("┏", "━", "┳", "┓");
    out += row(headers, "┃");
    out += border("┡", "━", "╇", "┩");
    for(const auto& entries : cells) out += row(entries, "│");
    out += border("└", "─", "┴", "┘");

    return out;
}

std::string Formatter::savetxt(const Numeric& a, char delimiter) const {
    std::string out;

    if(a.index() == numeric_VectorXd_index){
        const Eigen::VectorXd& v = std::get<Eigen::VectorXd>(a);
        for(Eigen::Index i = 0; i < v.size(); i++){
            out += number(v[i]);
            out += '\n';
        }
        return out;
    }

    const Eigen::MatrixXd m = rowsOf(a);
    for(Eigen::Index i = 0; i < m.rows(); i++){
        std::vector<std::string> cells;
        for(Eigen::Index j = 0; j < m.cols(); j++) cells.push_back(number(m(i, j)));
        out += join(cells, std::string(1, delimiter));
        out += '\n';
    }

    return out;
}

Numeric Formatter::thresholded(const Numeric& a) const {
    const double threshold = settings.threshold;
    auto clip = [threshold](double x){ return std::abs(x) < threshold ? 0.0 : x; };

    switch (a.index()) {
        case numeric_double_index: return clip(std::get<double>(a));
        case numeric_VectorXd_index: return Eigen::VectorXd(std::get<Eigen::VectorXd>(a).unaryExpr(clip));
        default: return Eigen::MatrixXd(std::get<Eigen::MatrixXd>(a).unaryExpr(clip));
    }
}

bool Formatter::formatScalar(double x, const std::string& path, std::string& out){
    if(std::abs(x) < settings.threshold) x = 0;

    if(path.empty()){
        out = number(x);
        return true;
    }

    //Every format, npy included, saves a scalar as its text
    if(!writeFile(path, number(x))) return false;
    out = "Scalar saved to " + path;

    return true;
}

bool Formatter::formatArray(const Numeric& a, const std::string& path, std::string& out){
    if(!path.empty()){
        if(!saveArray(a, path)) return false;
        out = "Array saved to " + path;
        return true;
    }

    switch (settings.format) {
        case FORMAT_PLAIN: out = plain(a); return true;
        case FORMAT_TEXT: out = text(a); return true;
        case FORMAT_CSV: out = csv(a); return true;
        case FORMAT_LATEX: out = latex(a); return true;
        case FORMAT_JSON: out = json(a); return true;
        case FORMAT_TABLE: out = table(a); return true;
        default:
            errors.fail(UNSUPPORTED_FORMAT, formatName(settings.format));
            return false;
    }
}

bool Formatter::formatTuple(const Tuple& t, const std::string& path, std::string& out){
    if(settings.save_components && !path.empty()){
        std::string ext = std::filesystem::path(path).extension().string();
        const std::string base = path.substr(0, path.size() - ext.size());
        if(ext.empty()) ext = settings.format == FORMAT_NPY ? ".npy" : ".txt";

        for(size_t i = 0; i < t.size(); i++){
            const std::string component_path = base + "_" + std::to_string(i) + ext;
            if(t[i].index() == numeric_double_index){
                if(!writeFile(component_path, repr(std::get<double>(t[i])))) return false;
            }else if(!saveArray(thresholded(t[i]), component_path)){
                return false;
            }
        }

        out = "Components saved to " + base + "_*" + ext;
        return true;
    }

    std::vector<std::string> parts;
    for(size_t i = 0; i < t.size(); i++){
        std::string component;
        if(t[i].index() == numeric_double_index) component = repr(std::get<double>(t[i]));
        else if(!formatArray(thresholded(t[i]), std::string(), component)) return false;

        if(settings.format == FORMAT_PLAIN){
            parts.push_back("COMPONENT_" + std::to_string(i));
            parts.push_back(component);
        }else{
            parts.push_back("Component " + std::to_string(i) + ":\n" + component);
        }
    }

    out = join(parts, "\n\n");
    if(path.empty()) return true;

    if(!writeFile(path, out)) return false;
    out = "Result saved to " + path;

    return true;
}

bool Formatter::saveArray(const Numeric& a, const std::string& path){
    switch (settings.format) {
        case FORMAT_NPY: return writeFile(path, writeNpy(a));
        case FORMAT_TEXT: return writeFile(path, savetxt(a, ' '));
        case FORMAT_CSV: return writeFile(path, savetxt(a, ','));
        case FORMAT_LATEX: return writeFile(path, latex(a));
        case FORMAT_JSON: return writeFile(path, json(a));
        case FORMAT_TABLE: return writeFile(path, table(a));
        case FORMAT_PLAIN: return writeFile(path, plain(a));
        default:
            errors.fail(UNSUPPORTED_FORMAT, formatName(settings.format));
            return false;
    }
}

bool Formatter::writeFile(const std::string& path, const std::string& contents){
    std::ofstream out(path, std::ios::binary);
    if(!out.is_open()){
        errors.fail(FILE_WRITE_FAILED, path);
        return false;
    }

    out << contents;
    out.close();
    if(out.fail()){
        errors.fail(FILE_WRITE_FAILED, path);
        return false;
    }

    logger->info("Wrote {:d} bytes to {:s}", contents.size(), path);

    return true;
}

}
