#pragma once

#include "coordination_store.hpp"
#include "types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace trackmap {

/**
 * @class S3CoordinationStore
 * @brief CoordinationStore over an S3 bucket.
 *
 * Node "/a/b" is the object "a/b". Directories are key prefixes and exist implicitly.
 * The modification stamp is the object's LastModified time, which S3 reports with
 * one-second resolution (expressed in milliseconds). Every write within the same second
 * shares a stamp, so an eviction pass also removes all entries written in the second of
 * the cutoff; at high insert rates that is well above the cleanup quota. Objects have no
 * write counter: the reported version is always 0.
 *
 * Any number of instances may coexist; the AWS SDK is initialized with the first and
 * shut down with the last.
 */
class S3CoordinationStore : public CoordinationStore {
public:
    explicit S3CoordinationStore(const Config& cfg);
    ~S3CoordinationStore() override;

    std::vector<std::string> ListChildren(const std::string& dir) override;
    std::optional<NodeStat> Exists(const std::string& path) override;
    void Create(const std::string& path, const Bytes& data) override;
    void SetData(const std::string& path, const Bytes& data,
                 std::int32_t version = kAnyVersion) override;
    Bytes GetData(const std::string& path) override;
    void Delete(const std::string& path, std::int32_t version = kAnyVersion) override;
    void EnsurePath(const std::string& path) override;

private:
    struct S3StoreImpl;
    std::unique_ptr<S3StoreImpl> p_impl;
};

} // namespace trackmap
