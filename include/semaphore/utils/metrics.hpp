#pragma once

#include <cstdint>
#include <fstream>
#include <iomanip>
#include <string>
#include <chrono>
#include <mutex>

#include "../air/semaphore_air.hpp"

namespace semaphore {

struct Stopwatch {
    std::chrono::steady_clock::time_point t0 = std::chrono::steady_clock::now();

    double elapsed_ms() const {
        auto d = std::chrono::steady_clock::now() - t0;
        return std::chrono::duration<double, std::milli>(d).count();
    }
};

inline void dump_metrics(
    const std::string & path,
    const char * tag,
    const air::SemaphoreAir & air,
    double elapsed_ms,
    size_t proof_bytes
) {
    if (path.empty()) return;

    static std::mutex mu;
    static std::string opened;
    static std::ofstream f;

    std::lock_guard<std::mutex> lock(mu);

    if (opened != path) {
        if (f.is_open()) f.close();
        f.clear();
        f.open(path, std::ios::app | std::ios::ate);

        if (!f) {
            opened.clear();
            return;
        }

        if (f.tellp() == 0)
            f << "tag,depth,trace_length,trace_width,transition_constraints,"
                 "boundary_constraints,max_degree,elapsed_ms,proof_bytes\n";
        opened = path;
    }

    const auto& reg = air.registry();

    f << tag << ","
      << air.depth() << ","
      << air.trace_length() << ","
      << air.trace_width() << ","
      << reg.count(air::ConstraintKind::TRANSITION) << ","
      << reg.count(air::ConstraintKind::BOUNDARY) << ","
      << reg.max_degree(air::ConstraintKind::TRANSITION) << ","
      << std::fixed << std::setprecision(3) << elapsed_ms << ","
      << proof_bytes << "\n";
    f.flush();
}

}
