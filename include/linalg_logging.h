#ifndef LINALG_LOGGING_H
#define LINALG_LOGGING_H

#include "spdlog/spdlog.h"
#include "spdlog/sinks/basic_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include <memory>
#include <string>
#include <vector>

namespace Linalg {
//No sinks until initLogging() is called
inline std::shared_ptr<spdlog::logger> logger = std::make_shared<spdlog::logger>("linalg");
}

namespace Linalg {

inline void initLogging(bool verbose, const std::string& log_path = std::string()){
    std::vector<spdlog::sink_ptr> sinks;
    if(verbose) sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if(!log_path.empty()) sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_path));

    logger = std::make_shared<spdlog::logger>("linalg", sinks.begin(), sinks.end());
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    logger->set_pattern("[%l] %v");
    logger->flush_on(spdlog::level::info);
}

inline std::string cStr(const std::string& str){
    std::string out;
    out += '"';
    for(char ch : str){
        if(ch == '\n' || ch == '\r'){
            out += "\\n";
        }else{
            if(ch == '"' || ch == '\\') out += '\\';
            out += ch;
        }
    }
    out += '"';

    return out;
}

}

#endif // LINALG_LOGGING_H
