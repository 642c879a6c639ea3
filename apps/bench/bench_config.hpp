#pragma once

#include <cstdint>
#include <string>

struct BenchConfig {
    int num_threads = 4;
    int num_ids = 10000;
    std::int64_t max_size = 1000;
    int payload_bytes = 64;
    double conditional_ratio = 0.5;
    bool use_s3 = false;
};

// Returns an error message for the first invalid option, or an empty string.
inline std::string ValidateBenchConfig(const BenchConfig& cfg) {
    if (cfg.num_threads <= 0) return "--threads must be positive";
    if (cfg.num_ids < 0) return "--ids must not be negative";
    if (cfg.payload_bytes <= 0) return "--payload-bytes must be positive";
    if (cfg.conditional_ratio < 0.0 || cfg.conditional_ratio > 1.0)
        return "--conditional-ratio must be between 0.0 and 1.0";
    return {};
}
