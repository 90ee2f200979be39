#include <linalg_formatter.h>
#include <linalg_loader.h>
#include <linalg_npy.h>
#include "fixtures.h"
#include "report.h"

#include <limits>

static Settings withFormat(OutputFormat format){
    Settings settings;
    settings.format = format;

    return settings;
}

static bool testFormat(const Settings& settings, const Value& v, const std::string& expect, int line){
    ErrorStream errors;
    Formatter formatter(settings, errors);
    std::string out;

    if(!formatter.format(v, out) || out != expect){
        std::cout << "Line " << line << ", Formatted " << formatName(settings.format) << " output differs:\n"
                  << "Expected: " << expect << '\n'
                  << "Actual:   " << out << ' ' << errors.firstMessage() << std::endl;
        return false;
    }

    return true;
}

static bool testFormatRejected(const Settings& settings, const Value& v, ErrorCode code, int line){
    ErrorStream errors;
    Formatter formatter(settings, errors);
    std::string out;

    if(formatter.format(v, out) || errors.firstCode() != code){
        std::cout << "Line " << line << ", Formatting should fail with \"" << getMessage(code) << "\"\n"
                  << "Actual: " << out << ' ' << errors.firstMessage() << std::endl;
        return false;
    }

    return true;
}

static bool testFileOutput(){
    bool passing = true;
    const std::filesystem::path dir = scratchDir() / "formatter";
    std::filesystem::create_directories(dir);
    const Value A = matrix({{1, 2}, {3, 4}});

    Settings settings = withFormat(FORMAT_CSV);
    settings.output_path = (dir / "result.csv").string();
    passing &= testFormat(settings, A, "Array saved to " + settings.output_path, __LINE__);
    if(readFile(settings.output_path) != "1,2\n3,4\n"){
        std::cout << "Line " << __LINE__ << ", CSV file contents differ: " << readFile(settings.output_path) << std::endl;
        passing = false;
    }

    settings = withFormat(FORMAT_TEXT);
    settings.output_path = (dir / "vector.txt").string();
    passing &= testFormat(settings, vec({0.5, 2}), "Array saved to " + settings.output_path, __LINE__);
    if(readFile(settings.output_path) != "0.5\n2\n"){
        std::cout << "Line " << __LINE__ << ", Text file contents differ: " << readFile(settings.output_path) << std::endl;
        passing = false;
    }

    settings = withFormat(FORMAT_NPY);
    settings.output_path = (dir / "A.npy").string();
    passing &= testFormat(settings, A, "Array saved to " + settings.output_path, __LINE__);
    {
        ErrorStream errors;
        Numeric loaded;
        if(!loadNpyFile(settings.output_path, loaded, errors) || !approx(toValue(loaded), std::get<Eigen::MatrixXd>(A))){
            std::cout << "Line " << __LINE__ << ", Saved .npy did not load back" << std::endl;
            passing = false;
        }
    }

    settings = withFormat(FORMAT_PLAIN);
    settings.output_path = (dir / "scalar.txt").string();
    passing &= testFormat(settings, 0.5, "Scalar saved to " + settings.output_path, __LINE__);
    if(readFile(settings.output_path) != "0.5"){
        std::cout << "Line " << __LINE__ << ", Scalar file contents differ" << std::endl;
        passing = false;
    }

    settings = withFormat(FORMAT_NPY);
    settings.output_path = (dir / "scalar.npy").string();
    passing &= testFormat(settings, 2.0/3, "Scalar saved to " + settings.output_path, __LINE__);
    if(readFile(settings.output_path) != "0.6667"){
        std::cout << "Line " << __LINE__ << ", Scalar saved with npy format should be text" << std::endl;
        passing = false;
    }

    const Value tuple = Tuple{matrix({{1, 0}, {0, 1}}), vec({2, 3})};
    settings = withFormat(FORMAT_NPY);
    settings.save_components = true;
    settings.output_path = (dir / "parts").string();
    passing &= testFormat(settings, tuple, "Components saved to " + settings.output_path + "_*.npy", __LINE__);
    {
        ErrorStream errors;
        Numeric first, second;
        if(!loadNpyFile((dir / "parts_0.npy").string(), first, errors) ||
           !loadNpyFile((dir / "parts_1.npy").string(), second, errors) ||
           !approx(toValue(first), matrix({{1, 0}, {0, 1}})) || !approx(toValue(second), vec({2, 3}))){
            std::cout << "Line " << __LINE__ << ", Saved components did not load back" << std::endl;
            passing = false;
        }
    }

    settings = withFormat(FORMAT_CSV);
    settings.save_components = true;
    settings.output_path = (dir / "parts.csv").string();
    passing &= testFormat(settings, tuple, "Components saved to " + (dir / "parts").string() + "_*.csv", __LINE__);
    if(readFile((dir / "parts_1.csv").string()) != "2\n3\n"){
        std::cout << "Line " << __LINE__ << ", CSV component contents differ" << std::endl;
        passing = false;
    }

    settings = withFormat(FORMAT_TEXT);
    settings.output_path = (dir / "combined.txt").string();
    passing &= testFormat(settings, tuple, "Result saved to " + settings.output_path, __LINE__);
    if(readFile(settings.output_path) != "Component 0:\n[[1. 0.]\n [0. 1.]]\n\nComponent 1:\n[2. 3.]"){
        std::cout << "Line " << __LINE__ << ", Combined tuple contents differ" << std::endl;
        passing = false;
    }

    settings = withFormat(FORMAT_CSV);
    settings.output_path = (dir / "missing" / "result.csv").string();
    passing &= testFormatRejected(settings, A, FILE_WRITE_FAILED, __LINE__);

    std::filesystem::remove_all(dir);

    return passing;
}

inline bool testFormatter(){
    bool passing = true;
    const Value A = matrix({{1, 2}, {3, 4}});
    const Value V = vec({0.5, 2});

    if(Formatter::repr(1) != "1.0" || Formatter::repr(0.1) != "0.1" || Formatter::repr(-2.5) != "-2.5" ||
       Formatter::repr(1e20) != "1e+20"){
        std::cout << "Line " << __LINE__ << ", repr() differs" << std::endl;
        passing = false;
    }

    //Scalars
    passing &= testFormat(withFormat(FORMAT_PLAIN), -2.0, "-2", __LINE__);
    passing &= testFormat(withFormat(FORMAT_PLAIN), 1.0/3, "0.3333", __LINE__);
    passing &= testFormat(withFormat(FORMAT_JSON), 68.0, "68", __LINE__);
    passing &= testFormat(withFormat(FORMAT_PLAIN), 1e-12, "0", __LINE__);
    passing &= testFormat(withFormat(FORMAT_PLAIN), 12345678.0, "1.235e+07", __LINE__);

    //Arrays
    passing &= testFormat(withFormat(FORMAT_PLAIN), A, "1\t2\n3\t4", __LINE__);
    passing &= testFormat(withFormat(FORMAT_PLAIN), V, "0.5\n2", __LINE__);
    passing &= testFormat(withFormat(FORMAT_TEXT), A, "[[1. 2.]\n [3. 4.]]", __LINE__);
    passing &= testFormat(withFormat(FORMAT_TEXT), V, "[0.5 2. ]", __LINE__);
    passing &= testFormat(withFormat(FORMAT_TEXT), matrix({{-1.5, 10}, {0.25, 3}}),
        "[[-1.5  10.  ]\n [ 0.25  3.  ]]", __LINE__);
    passing &= testFormat(withFormat(FORMAT_CSV), A, "1.0,2.0\n3.0,4.0\n", __LINE__);
    passing &= testFormat(withFormat(FORMAT_CSV), V, "0.5,2.0\n", __LINE__);
    passing &= testFormat(withFormat(FORMAT_LATEX), A,
        "\\begin{bmatrix}\n1 & 2 \\\\\n3 & 4 \\\\\n\\end{bmatrix}", __LINE__);
    passing &= testFormat(withFormat(FORMAT_JSON), A,
        "[\n  [\n    1.0,\n    2.0\n  ],\n  [\n    3.0,\n    4.0\n  ]\n]", __LINE__);
    passing &= testFormat(withFormat(FORMAT_JSON), V, "[\n  0.5,\n  2.0\n]", __LINE__);
    passing &= testFormat(withFormat(FORMAT_JSON), vec({std::numeric_limits<double>::quiet_NaN(), -std::numeric_limits<double>::infinity(), 1e20}),
        "[\n  null,\n  null,\n  1e+20\n]", __LINE__);
    passing &= testFormat(withFormat(FORMAT_JSON), Eigen::MatrixXd(0, 0), "[]", __LINE__);
    passing &= testFormat(withFormat(FORMAT_TABLE), A,
        "Matrix Result\n"
        "┏━━━━━┳━━━━━┓\n"
        "┃ [0] ┃ [1] ┃\n"
        "┡━━━━━╇━━━━━┩\n"
        "│ 1   │ 2   │\n"
        "│ 3   │ 4   │\n"
        "└─────┴─────┘\n", __LINE__);

    //Threshold and precision
    passing &= testFormat(withFormat(FORMAT_PLAIN), matrix({{1e-12, 1}, {-1e-11, 2}}), "0\t1\n0\t2", __LINE__);
    Settings precise = withFormat(FORMAT_PLAIN);
    precise.precision = 6;
    precise.threshold = 0;
    passing &= testFormat(precise, vec({1.0/3, 1e-12}), "0.333333\n1e-12", __LINE__);

    //Tuples
    const Value tuple = Tuple{vec({1, 2}), 3.0};
    passing &= testFormat(withFormat(FORMAT_PLAIN), tuple, "COMPONENT_0\n\n1\n2\n\nCOMPONENT_1\n\n3.0", __LINE__);
    passing &= testFormat(withFormat(FORMAT_TEXT), tuple, "Component 0:\n[1. 2.]\n\nComponent 1:\n3.0", __LINE__);

    //Binary output
    Settings piping = withFormat(FORMAT_NPY);
    piping.write_to_stdout = true;
    passing &= testFormat(piping, A, writeNpy(std::get<Eigen::MatrixXd>(A)), __LINE__);
    passing &= testFormat(piping, 2.5, writeNpy(2.5), __LINE__);
    passing &= testFormatRejected(piping, tuple, NPY_TUPLE, __LINE__);
    passing &= testFormatRejected(withFormat(FORMAT_NPY), A, UNSUPPORTED_FORMAT, __LINE__);

    passing &= testFileOutput();

    report("Formatter", passing);
    return passing;
}
