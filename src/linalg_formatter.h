#ifndef LINALG_FORMATTER_H
#define LINALG_FORMATTER_H

#include "linalg_error.h"
#include "linalg_settings.h"
#include "linalg_value.h"
#include <string>

namespace Linalg {

class Formatter {
public:
    Formatter(const Settings& settings, Code::ErrorStream& errors) noexcept;

    //Produces the text to print, or the binary .npy stream when writesBinary()
    bool format(const Code::Value& result, std::string& out);
    bool writesBinary() const noexcept;

    std::string number(double x) const;
    static std::string repr(double x);
    std::string plain(const Code::Numeric& a) const;
    std::string text(const Code::Numeric& a) const;
    std::string csv(const Code::Numeric& a) const;
    std::string latex(const Code::Numeric& a) const;
    static std::string json(const Code::Numeric& a);
    std::string table(const Code::Numeric& a) const;
    std::string savetxt(const Code::Numeric& a, char delimiter) const;

private:
    const Settings& settings;
    Code::ErrorStream& errors;

    Code::Numeric thresholded(const Code::Numeric& a) const;
    bool formatScalar(double x, const std::string& path, std::string& out);
    bool formatArray(const Code::Numeric& a, const std::string& path, std::string& out);
    bool formatTuple(const Code::Tuple& t, const std::string& path, std::string& out);
    bool saveArray(const Code::Numeric& a, const std::string& path);
    bool writeFile(const std::string& path, const std::string& contents);
};

}

#endif // LINALG_FORMATTER_H
