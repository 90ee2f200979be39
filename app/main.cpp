#include "linalg_prompt.h"

#include <linalg_formatter.h>
#include <linalg_loader.h>
#include <linalg_logging.h>
#include <linalg_program.h>
#include <linalg_settings.h>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#ifndef LINALG_VERSION
#define LINALG_VERSION "0.0.0"
#endif

using namespace Linalg;

static constexpr std::string_view USAGE =
    "usage: linalg [-h] [--prompt] [--output OUTPUT] [--npy] [--precision PRECISION]\n"
    "              [--format {text,csv,npy,latex,json,table,plain}] [--pretty] [--verbose]\n"
    "              [--threshold THRESHOLD] [--components] [--log LOG] [--version]\n"
    "              [expression] [files ...]\n";

static constexpr std::string_view HELP =
    "\n"
    "Linear algebra calculator for operations on NumPy arrays\n"
    "\n"
    "positional arguments:\n"
    "  expression            Expression string with placeholders like {A}, {B}, or {P} for piped input\n"
    "  files                 NumPy .npy files to use as inputs\n"
    "\n"
    "options:\n"
    "  -h, --help            show this help message and exit\n"
    "  --prompt              Display the language reference\n"
    "  --output, -o OUTPUT   Output file path (default: print to console)\n"
    "  --npy, -n             Use NPY format for output, writes binary data to stdout when piping\n"
    "  --precision PRECISION Significant digits (default: 4)\n"
    "  --format, -f FORMAT   Output format: text, csv, npy, latex, json, table, plain (default: plain)\n"
    "  --pretty              Use table output (overrides --format)\n"
    "  --verbose, -v         Log each stage to stderr\n"
    "  --threshold, -t THRESHOLD\n"
    "                        Hide values below threshold (default: 1e-10)\n"
    "  --components, -c      For tuple outputs, save components separately\n"
    "  --log LOG             Also write the log to LOG\n"
    "  --version             Show version number and exit\n";

struct Arguments {
    std::optional<std::string> expression;
    std::vector<std::string> files;
    std::string output_path;
    std::string format = "plain";
    std::string log_path;
    int precision = Settings::DEFAULT_PRECISION;
    double threshold = Settings::DEFAULT_THRESHOLD;
    bool npy = false;
    bool pretty = false;
    bool verbose = false;
    bool components = false;
    bool prompt = false;
    bool version = false;
    bool help = false;
};

static int fail(std::string_view message){
    logger->error("{:s}", message);
    std::cerr << "Error: " << message << std::endl;
    return EXIT_FAILURE;
}

static bool readInt(const std::string& str, int& out) noexcept {
    char* end = nullptr;
    const long val = std::strtol(str.c_str(), &end, 10);
    if(str.empty() || end != str.c_str() + str.size() || val < 0 || val > 100) return false;
    out = static_cast<int>(val);
    return true;
}

static bool readDouble(const std::string& str, double& out) noexcept {
    char* end = nullptr;
    out = std::strtod(str.c_str(), &end);
    return !str.empty() && end == str.c_str() + str.size();
}

//Returns an error message, or an empty string on success
static std::string parseArguments(int argc, char* argv[], Arguments& args){
    bool positional_only = false;

    for(int i = 1; i < argc; i++){
        std::string arg = argv[i];
        std::string value;
        bool has_inline_value = false;

        if(!positional_only && arg.size() > 2 && arg.compare(0, 2, "--") == 0){
            const size_t eq = arg.find('=');
            if(eq != std::string::npos){
                value = arg.substr(eq+1);
                arg.resize(eq);
                has_inline_value = true;
            }
        }

        auto takeValue = [&](std::string& dest) -> bool {
            if(has_inline_value){
                dest = value;
                return true;
            }else if(i+1 < argc){
                dest = argv[++i];
                return true;
            }
            return false;
        };

        if(positional_only || arg.empty() || arg.front() != '-' || arg == "-"){
            if(!args.expression.has_value()) args.expression = arg;
            else args.files.push_back(arg);
        }else if(arg == "--"){
            positional_only = true;
        }else if(arg == "-h" || arg == "--help"){
            args.help = true;
        }else if(arg == "--prompt"){
            args.prompt = true;
        }else if(arg == "--version"){
            args.version = true;
        }else if(arg == "-n" || arg == "--npy"){
            args.npy = true;
        }else if(arg == "--pretty"){
            args.pretty = true;
        }else if(arg == "-v" || arg == "--verbose"){
            args.verbose = true;
        }else if(arg == "-c" || arg == "--components"){
            args.components = true;
        }else if(arg == "-o" || arg == "--output"){
            if(!takeValue(args.output_path)) return "argument " + arg + ": expected one argument";
        }else if(arg == "-f" || arg == "--format"){
            if(!takeValue(args.format)) return "argument " + arg + ": expected one argument";
            if(lookupFormat(args.format) == NUM_OUTPUT_FORMATS)
                return "argument " + arg + ": invalid choice: '" + args.format +
                       "' (choose from 'text', 'csv', 'npy', 'latex', 'json', 'table', 'plain')";
        }else if(arg == "--log"){
            if(!takeValue(args.log_path)) return "argument " + arg + ": expected one argument";
        }else if(arg == "--precision"){
            std::string str;
            if(!takeValue(str)) return "argument " + arg + ": expected one argument";
            if(!readInt(str, args.precision)) return "argument " + arg + ": invalid int value: '" + str + "'";
        }else if(arg == "-t" || arg == "--threshold"){
            std::string str;
            if(!takeValue(str)) return "argument " + arg + ": expected one argument";
            if(!readDouble(str, args.threshold)) return "argument " + arg + ": invalid float value: '" + str + "'";
        }else if(arg.size() > 1 && std::isdigit(static_cast<unsigned char>(arg[1]))){
            //Negative numbers are never options
            if(!args.expression.has_value()) args.expression = arg;
            else args.files.push_back(arg);
        }else{
            return "unrecognized arguments: " + arg;
        }
    }

    return std::string();
}

static Settings makeSettings(const Arguments& args){
    Settings settings;
    settings.format = lookupFormat(args.format);
    settings.precision = args.precision;
    settings.threshold = args.threshold;
    settings.output_path = args.output_path;
    settings.save_components = args.components;
    settings.verbose = args.verbose;
    settings.log_path = args.log_path;

    if(args.npy && settings.format == FORMAT_PLAIN) settings.format = FORMAT_NPY;
    if(args.pretty) settings.format = FORMAT_TABLE;
    settings.write_to_stdout = args.npy && settings.format == FORMAT_NPY;

    return settings;
}

int main(int argc, char* argv[]){
    Arguments args;
    const std::string argument_error = parseArguments(argc, argv, args);
    if(!argument_error.empty()){
        std::cerr << USAGE << "linalg: error: " << argument_error << std::endl;
        return EXIT_FAILURE;
    }

    if(args.help){
        std::cout << USAGE << HELP;
        return EXIT_SUCCESS;
    }else if(args.version){
        std::cout << "linalg " << LINALG_VERSION << std::endl;
        return EXIT_SUCCESS;
    }

    try{
        initLogging(args.verbose, args.log_path);
    }catch(const spdlog::spdlog_ex& ex){
        std::cerr << "Error: cannot open log file " << args.log_path << ": " << ex.what() << std::endl;
        return EXIT_FAILURE;
    }

    if(args.prompt){
        std::cout << LANGUAGE_REFERENCE << std::endl;
        return EXIT_SUCCESS;
    }else if(!args.expression.has_value()){
        std::cout << USAGE << HELP;
        return EXIT_FAILURE;
    }

    Code::ErrorStream errors;
    std::optional<Code::Numeric> stdin_value;
    if(!Code::readFromStdin(stdin_value, errors)) return fail(errors.firstMessage());
    if(stdin_value.has_value()) logger->info("Data detected from stdin, available as {:s} placeholder", "{PIPE}");

    if(args.files.empty() && !stdin_value.has_value()){
        std::cout << USAGE << HELP;
        return EXIT_FAILURE;
    }

    logger->info("Loading matrices from {:d} files...", args.files.size());
    Code::Environment environment;
    if(!Code::loadMatrices(args.files, stdin_value, environment, errors)) return fail(errors.firstMessage());

    logger->info("Parsing expression: {:s}", args.expression.value());
    Program program;
    const Code::Value result = program.evaluate(args.expression.value(), environment);
    if(!program.noErrors()) return fail(program.errorMessage());

    logger->info("Formatting result...");
    const Settings settings = makeSettings(args);
    Formatter formatter(settings, errors);
    std::string out;
    if(!formatter.format(result, out)) return fail(errors.firstMessage());

    if(!settings.output_path.empty()){
        logger->info("{:s}", out);
    }else if(formatter.writesBinary()){
        std::fwrite(out.data(), 1, out.size(), stdout);
        std::fflush(stdout);
    }else if(!out.empty()){
        std::cout << out << std::endl;
    }

    return EXIT_SUCCESS;
}
