//Evaluate malformed expressions and make sure each one is rejected with a single error

#include <linalg_program.h>
#include "fixtures.h"
#include "report.h"

#include <filesystem>
using std::filesystem::directory_iterator;

inline bool testErrorAndNoCrash(const std::filesystem::path& path){
    std::string in = readFile(path.string());
    while(!in.empty() && in.back() == '\n') in.pop_back();

    Program program;
    Value result = program.evaluate(in, sampleEnvironment());
    const bool had_error = result.index() == RuntimeError && program.errors().size() == 1;

    if(!had_error){
        std::cout << "Ill-formed case \"" << path.stem().string() << "\" was not rejected.\n"
                     "Source:      " << in << "\n"
                     "Eval actual: " << toString(result) << "\n" << std::endl;
    }

    return had_error;
}

inline bool testIllFormed(){
    bool passing = true;

    for(directory_iterator end, dir(BASE_TEST_DIR "/errors"); dir != end; dir++)
        if(std::filesystem::is_regular_file(dir->path()))
            passing &= testErrorAndNoCrash(dir->path());

    report("Ill-formed", passing);
    return passing;
}
