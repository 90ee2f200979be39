#include "report.h"
#include "fixtures.h"
#include <linalg_formatter.h>
#include <linalg_interpreter.h>
#include <linalg_npy.h>
#include <linalg_parser.h>
#include <linalg_program.h>
#include <linalg_scanner.h>

#ifdef NDEBUG
#define DEBUG_CAP(x) x
#else
#define DEBUG_CAP(x) 2
#endif

static constexpr size_t ITER_SCANNER = DEBUG_CAP(200000);
static constexpr size_t ITER_PARSER = DEBUG_CAP(200000);
static constexpr size_t ITER_INTERPRETER = DEBUG_CAP(20000);
static constexpr size_t ITER_DECOMPOSITION = DEBUG_CAP(2000);
static constexpr size_t ITER_NPY = DEBUG_CAP(20000);
static constexpr size_t ITER_FORMAT = DEBUG_CAP(2000);

inline void runBenchmark(){
    const std::string src = "tr({A}@{B}.T) + det({A}) * norm(inv({A})^2 - {B})";
    Environment env = sampleEnvironment();
    env["M"] = Eigen::MatrixXd(Eigen::MatrixXd::Random(40, 40));

    Code::Scanner scanner(src);

    startClock();
    for(size_t i = 0; i < ITER_SCANNER; i++)
        scanner.scanAll();
    report("Scanner", ITER_SCANNER);

    ErrorStream errors;
    Code::Parser parser(scanner, errors);

    startClock();
    for(size_t i = 0; i < ITER_PARSER; i++)
        parser.parseAll();
    report("Parser", ITER_PARSER);

    Code::Interpreter interpreter(parser.parse_tree, env);

    startClock();
    for(size_t i = 0; i < ITER_INTERPRETER; i++)
        interpreter.run();
    report("Interpreter", ITER_INTERPRETER);

    Program program;

    startClock();
    for(size_t i = 0; i < ITER_DECOMPOSITION; i++)
        program.evaluate("svd({M})", env);
    report("SVD 40x40", ITER_DECOMPOSITION);

    const std::string bytes = writeNpy(env.at("M"));
    Numeric decoded;

    startClock();
    for(size_t i = 0; i < ITER_NPY; i++)
        readNpy(bytes, "benchmark", decoded, errors);
    report("NPY decode", ITER_NPY);

    Settings settings;
    settings.format = FORMAT_TEXT;
    Formatter formatter(settings, errors);
    const Value value = toValue(env.at("M"));
    std::string out;

    startClock();
    for(size_t i = 0; i < ITER_FORMAT; i++)
        formatter.format(value, out);
    report("Format text", ITER_FORMAT);

    recordResults();
}
