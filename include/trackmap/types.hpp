#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace trackmap {

// Modification stamp assigned by the store on every write. Totally ordered.
using Stamp = std::int64_t;

using Bytes = std::vector<std::uint8_t>;

// Version guard value that matches any node version.
constexpr std::int32_t kAnyVersion = -1;

struct NodeStat {
    Stamp czxid = 0;           // stamp of the create
    Stamp mzxid = 0;           // stamp of the last data write
    std::int32_t version = 0;  // number of data writes since create
    std::uint32_t num_children = 0;
};

struct Config {
    std::string tracking_dir;
    std::int64_t max_size = 0; // 0 means "take from environment or default"

    // S3 Configuration
    std::string s3_endpoint;
    std::string s3_region;
    std::string s3_bucket;
    std::string aws_access_key_id;
    std::string aws_secret_access_key;
    bool s3_use_path_style = true;
};

} // namespace trackmap
