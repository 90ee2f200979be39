#include "linalg_npy.h"

#include "linalg_logging.h"
#include <cstdint>
#include <cstring>
#include <limits>
#include <vector>

namespace Linalg {

namespace Code {

static constexpr size_t NPY_PREAMBLE_V1 = 10;
static constexpr size_t NPY_PREAMBLE_V2 = 12;
static constexpr size_t NPY_ALIGNMENT = 64;
static constexpr size_t NPY_MAX_DIM = static_cast<size_t>(std::numeric_limits<Eigen::Index>::max());

struct NpyHeader {
    char byte_order = '<';
    char kind = 'f';
    size_t item_size = 8;
    bool fortran_order = false;
    std::vector<size_t> shape;
};

static bool hostIsLittleEndian() noexcept {
    const uint16_t probe = 1;
    uint8_t first;
    std::memcpy(&first, &probe, 1);
    return first == 1;
}

static uint64_t readUnsigned(const char* src, size_t bytes, bool little_endian) noexcept {
    uint64_t val = 0;
    for(size_t i = 0; i < bytes; i++){
        const uint8_t b = static_cast<uint8_t>(src[little_endian ? i : bytes-1-i]);
        val |= static_cast<uint64_t>(b) << (8*i);
    }

    return val;
}

static double readElement(const char* src, const NpyHeader& header) noexcept {
    const bool little_endian = header.byte_order == '<' || header.byte_order == '|' ||
                               (header.byte_order == '=' && hostIsLittleEndian());
    const uint64_t raw = readUnsigned(src, header.item_size, little_endian);

    switch (header.kind) {
        case 'f':
            if(header.item_size == 8){
                double d;
                std::memcpy(&d, &raw, sizeof(d));
                return d;
            }else{
                const uint32_t bits = static_cast<uint32_t>(raw);
                float f;
                std::memcpy(&f, &bits, sizeof(f));
                return f;
            }
        case 'i':{
            //Sign extend from item_size bytes
            const unsigned shift = static_cast<unsigned>(64 - 8*header.item_size);
            return static_cast<double>(static_cast<int64_t>(raw << shift) >> shift);
        }
        case 'b': return raw != 0 ? 1.0 : 0.0;
        default: return static_cast<double>(raw);
    }
}

static std::string_view dictValue(std::string_view dict, std::string_view key) noexcept {
    const std::string quoted = "'" + std::string(key) + "'";
    size_t start = dict.find(quoted);
    if(start == std::string_view::npos) return std::string_view();
    start = dict.find(':', start + quoted.size());
    if(start == std::string_view::npos) return std::string_view();
    start = dict.find_first_not_of(' ', start+1);
    if(start == std::string_view::npos) return std::string_view();

    size_t end;
    switch (dict[start]) {
        case '\'': end = dict.find('\'', start+1); if(end != std::string_view::npos) end++; break;
        case '(': end = dict.find(')', start+1); if(end != std::string_view::npos) end++; break;
        default: end = dict.find_first_of(",}", start); break;
    }

    if(end == std::string_view::npos) return std::string_view();
    return dict.substr(start, end-start);
}

static bool parseDescr(std::string_view descr, NpyHeader& header) noexcept {
    //e.g. '<f8'
    if(descr.size() < 5 || descr.front() != '\'' || descr.back() != '\'') return false;
    descr = descr.substr(1, descr.size()-2);
    if(descr.size() != 3) return false;

    header.byte_order = descr[0];
    header.kind = descr[1];
    header.item_size = static_cast<size_t>(descr[2] - '0');

    if(header.byte_order != '<' && header.byte_order != '>' && header.byte_order != '|' && header.byte_order != '=')
        return false;

    switch (header.kind) {
        case 'f': return header.item_size == 4 || header.item_size == 8;
        case 'i':
        case 'u': return header.item_size == 1 || header.item_size == 2 || header.item_size == 4 || header.item_size == 8;
        case 'b': return header.item_size == 1;
        default: return false;
    }
}

static bool parseShape(std::string_view shape, std::vector<size_t>& dims) noexcept {
    if(shape.size() < 2 || shape.front() != '(' || shape.back() != ')') return false;
    shape = shape.substr(1, shape.size()-2);

    size_t val = 0;
    bool in_number = false;
    for(char ch : shape){
        if(ch >= '0' && ch <= '9'){
            const size_t digit = static_cast<size_t>(ch - '0');
            if(val > (NPY_MAX_DIM - digit) / 10) return false;
            val = 10*val + digit;
            in_number = true;
        }else if(ch == ','){
            if(!in_number) return false;
            dims.push_back(val);
            val = 0;
            in_number = false;
        }else if(ch != ' ' && ch != 'L'){
            return false;
        }
    }
    if(in_number) dims.push_back(val);

    return true;
}

bool isNpy(std::string_view bytes) noexcept {
    return bytes.substr(0, NPY_MAGIC.size()) == NPY_MAGIC;
}

bool readNpy(std::string_view bytes, std::string_view source, Numeric& out, ErrorStream& errors){
    if(!isNpy(bytes) || bytes.size() < NPY_PREAMBLE_V1){
        errors.fail(NPY_CORRUPTED, source);
        return false;
    }

    const uint8_t major = static_cast<uint8_t>(bytes[6]);
    size_t header_start;
    size_t header_len;
    if(major == 1){
        header_start = NPY_PREAMBLE_V1;
        header_len = readUnsigned(bytes.data()+8, 2, true);
    }else if((major == 2 || major == 3) && bytes.size() >= NPY_PREAMBLE_V2){
        header_start = NPY_PREAMBLE_V2;
        header_len = readUnsigned(bytes.data()+8, 4, true);
    }else{
        errors.fail(NPY_CORRUPTED, source);
        return false;
    }

    if(header_start + header_len > bytes.size()){
        errors.fail(NPY_CORRUPTED, source);
        return false;
    }

    const std::string_view dict = bytes.substr(header_start, header_len);
    NpyHeader header;

    const std::string_view descr = dictValue(dict, "descr");
    if(!parseDescr(descr, header)){
        errors.fail(NPY_UNSUPPORTED_DTYPE, std::string(descr) + " in " + std::string(source));
        return false;
    }

    const std::string_view order = dictValue(dict, "fortran_order");
    if(order != "True" && order != "False"){
        errors.fail(NPY_CORRUPTED, source);
        return false;
    }
    header.fortran_order = (order == "True");

    if(!parseShape(dictValue(dict, "shape"), header.shape)){
        errors.fail(NPY_CORRUPTED, source);
        return false;
    }else if(header.shape.size() > 2){
        errors.fail(NPY_UNSUPPORTED_SHAPE, source);
        return false;
    }

    //Checked so a crafted shape cannot wrap past the payload size
    size_t count = 1;
    for(size_t dim : header.shape){
        if(dim != 0 && count > NPY_MAX_DIM / dim){
            errors.fail(NPY_CORRUPTED, source);
            return false;
        }
        count *= dim;
    }

    const std::string_view data = bytes.substr(header_start + header_len);
    if(count > data.size() / header.item_size){
        errors.fail(NPY_CORRUPTED, source);
        return false;
    }

    switch (header.shape.size()) {
        case 0:
            out = readElement(data.data(), header);
            break;
        case 1:{
            Eigen::VectorXd v(static_cast<Eigen::Index>(count));
            for(size_t i = 0; i < count; i++) v[i] = readElement(data.data() + i*header.item_size, header);
            out = std::move(v);
            break;
        }
        default:{
            const size_t rows = header.shape[0];
            const size_t cols = header.shape[1];
            Eigen::MatrixXd m(static_cast<Eigen::Index>(rows), static_cast<Eigen::Index>(cols));
            for(size_t i = 0; i < rows; i++){
                for(size_t j = 0; j < cols; j++){
                    const size_t flat = header.fortran_order ? j*rows + i : i*cols + j;
                    m(i, j) = readElement(data.data() + flat*header.item_size, header);
                }
            }
            out = std::move(m);
        }
    }

    logger->debug("readNpy({:s}): {:c}{:c}{:d}, rank {:d}",
                  source, header.byte_order, header.kind, header.item_size, header.shape.size());

    return true;
}

static void appendDouble(std::string& out, double val){
    uint64_t raw;
    std::memcpy(&raw, &val, sizeof(raw));
    for(size_t i = 0; i < sizeof(raw); i++) out += static_cast<char>((raw >> (8*i)) & 0xFF);
}

std::string writeNpy(const Numeric& n) alloc_except {
    std::string shape;
    switch (n.index()) {
        case numeric_double_index: shape = "()"; break;
        case numeric_VectorXd_index: shape = "(" + std::to_string(std::get<Eigen::VectorXd>(n).size()) + ",)"; break;
        default:{
            const Eigen::MatrixXd& m = std::get<Eigen::MatrixXd>(n);
            shape = "(" + std::to_string(m.rows()) + ", " + std::to_string(m.cols()) + ")";
        }
    }

    std::string dict = "{'descr': '<f8', 'fortran_order': False, 'shape': " + shape + ", }";
    const size_t unpadded = NPY_PREAMBLE_V1 + dict.size() + 1;
    dict.append((NPY_ALIGNMENT - unpadded % NPY_ALIGNMENT) % NPY_ALIGNMENT, ' ');
    dict += '\n';

    std::string out(NPY_MAGIC);
    out += '\x01';
    out += '\x00';
    out += static_cast<char>(dict.size() & 0xFF);
    out += static_cast<char>((dict.size() >> 8) & 0xFF);
    out += dict;

    switch (n.index()) {
        case numeric_double_index:
            appendDouble(out, std::get<double>(n));
            break;
        case numeric_VectorXd_index:{
            const Eigen::VectorXd& v = std::get<Eigen::VectorXd>(n);
            for(Eigen::Index i = 0; i < v.size(); i++) appendDouble(out, v[i]);
            break;
        }
        default:{
            const Eigen::MatrixXd& m = std::get<Eigen::MatrixXd>(n);
            for(Eigen::Index i = 0; i < m.rows(); i++)
                for(Eigen::Index j = 0; j < m.cols(); j++)
                    appendDouble(out, m(i, j));
        }
    }

    return out;
}

}

}
