#pragma once

#include "types.hpp"
#include <string>
#include <cstdlib>

namespace trackmap {

namespace table_defaults {
    constexpr char kTrackingDir[] = "/trackmap/completed";
    constexpr std::int64_t kMaxSize = 10000;
}

namespace s3_defaults {
    constexpr char kEndpoint[] = "http://127.0.0.1:9000";
    constexpr char kRegion[] = "us-east-1";
    constexpr char kBucket[] = "trackmap";
    constexpr char kAccessKeyId[] = "minioadmin";
    constexpr char kSecretAccessKey[] = "minioadmin";
    constexpr bool kUsePathStyle = true;
}

inline std::string GetEnv(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

inline bool GetEnvBool(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (!value) return defaultValue;
    return std::string(value) == "1" || std::string(value) == "true" || std::string(value) == "TRUE";
}

// Unparsable or non-positive values fall back to the default.
inline std::int64_t GetEnvInt(const char* name, std::int64_t defaultValue) {
    const char* value = std::getenv(name);
    if (!value) return defaultValue;
    char* end = nullptr;
    long long parsed = std::strtoll(value, &end, 10);
    if (end == value || *end != '\0' || parsed <= 0) return defaultValue;
    return static_cast<std::int64_t>(parsed);
}

inline void ApplyTableConfigDefaults(Config& cfg) {
    if (cfg.tracking_dir.empty())
        cfg.tracking_dir = GetEnv("TRK_TRACKING_DIR", table_defaults::kTrackingDir);
    if (cfg.max_size == 0)
        cfg.max_size = GetEnvInt("TRK_MAX_SIZE", table_defaults::kMaxSize);
}

inline void ApplyS3ConfigDefaults(Config& cfg) {
    if (cfg.s3_endpoint.empty())
        cfg.s3_endpoint = GetEnv("TRK_S3_ENDPOINT", s3_defaults::kEndpoint);
    if (cfg.s3_region.empty())
        cfg.s3_region = GetEnv("TRK_S3_REGION", s3_defaults::kRegion);
    if (cfg.s3_bucket.empty())
        cfg.s3_bucket = GetEnv("TRK_S3_BUCKET", s3_defaults::kBucket);
    if (cfg.aws_access_key_id.empty())
        cfg.aws_access_key_id = GetEnv("TRK_AWS_ACCESS_KEY_ID", s3_defaults::kAccessKeyId);
    if (cfg.aws_secret_access_key.empty())
        cfg.aws_secret_access_key = GetEnv("TRK_AWS_SECRET_ACCESS_KEY", s3_defaults::kSecretAccessKey);

    // The environment overrides the field only when set.
    if (std::getenv("TRK_S3_USE_PATH_STYLE")) {
        cfg.s3_use_path_style = GetEnvBool("TRK_S3_USE_PATH_STYLE", s3_defaults::kUsePathStyle);
    }
}

} // namespace trackmap
