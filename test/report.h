#ifndef REPORT_H
#define REPORT_H

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fmt/format.h>
#include <fstream>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

constexpr size_t name_width = 20;

inline void report(const std::string& test_name, bool pass){
    std::cout << fmt::format("-- {:<{}}{}", test_name + ":", name_width + 1, pass ? "pass" : "FAIL") << std::endl;
}

struct Timing {
    std::string name;
    double avg_ns;
};

inline std::chrono::steady_clock::time_point start_time;
inline std::vector<Timing> timings;

//Averages from the previous run in this build tree, compared against the current run
inline std::unordered_map<std::string, double> previous_timings;
inline bool previous_loaded = false;

#ifdef NDEBUG
inline const std::filesystem::path timing_file = std::filesystem::path(TEST_OUTPUT_DIR) / "benchmark_release.csv";
#else
inline const std::filesystem::path timing_file = std::filesystem::path(TEST_OUTPUT_DIR) / "benchmark_debug.csv";
#endif

inline void startClock(){
    start_time = std::chrono::steady_clock::now();
}

inline void loadPreviousTimings(){
    previous_loaded = true;
    std::cout << "Benchmark" << std::endl;

    std::ifstream in(timing_file);
    std::string line;
    std::getline(in, line); //Header
    while(std::getline(in, line)){
        const size_t split = line.find(',');
        if(split == std::string::npos) continue;
        previous_timings[line.substr(0, split)] = std::strtod(line.c_str() + split + 1, nullptr);
    }
}

inline std::string formatDuration(double ns){
    if(ns < 1e3) return fmt::format("{:.1f} ns", ns);
    else if(ns < 1e6) return fmt::format("{:.2f} us", ns/1e3);
    else if(ns < 1e9) return fmt::format("{:.2f} ms", ns/1e6);
    else return fmt::format("{:.3f} s", ns/1e9);
}

inline void report(const std::string& test_name, size_t N){
    const std::chrono::duration<double, std::nano> elapsed = std::chrono::steady_clock::now() - start_time;
    const double avg_ns = elapsed.count() / static_cast<double>(N);
    timings.push_back({test_name, avg_ns});

    if(!previous_loaded) loadPreviousTimings();

    std::string line = fmt::format("-- {:<{}}{:<{}}", test_name + ":", name_width + 1, formatDuration(avg_ns), name_width);

    auto lookup = previous_timings.find(test_name);
    if(lookup == previous_timings.end() || lookup->second <= 0){
        line += "no previous run";
    }else{
        const double percent = 100*avg_ns / lookup->second;
        line += fmt::format("{:.0f}% of previous", percent);
        if(percent > 110) line += "   !!!!";
    }

    std::cout << line << std::endl;
}

inline void recordResults(){
    std::error_code ec;
    std::filesystem::create_directories(TEST_OUTPUT_DIR, ec);
    if(ec){
        std::cout << "Cannot create " TEST_OUTPUT_DIR ": " << ec.message() << std::endl;
        return;
    }

    std::ofstream out(timing_file);
    out << "test,avg runtime (ns)\n";
    for(const Timing& t : timings)
        out << t.name << ',' << fmt::format("{:.1f}", t.avg_ns) << '\n';
}

#endif // REPORT_H
