#pragma once

#include "trackmap/memory_store.hpp"
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace trackmap {
namespace testing {

/**
 * MemoryCoordinationStore with hooks that run before selected calls.
 * A hook may mutate the store through the *Direct methods to simulate another client, or throw.
 */
class FaultInjectingStore : public MemoryCoordinationStore {
public:
    using Hook = std::function<void(const std::string& path)>;

    Hook before_exists;
    Hook before_delete;
    Hook before_list;

    std::vector<std::string> deleted_paths;
    int list_calls = 0;

    std::vector<std::string> ListChildren(const std::string& dir) override {
        ++list_calls;
        if (before_list) before_list(dir);
        return MemoryCoordinationStore::ListChildren(dir);
    }

    std::optional<NodeStat> Exists(const std::string& path) override {
        if (before_exists) before_exists(path);
        auto stat = MemoryCoordinationStore::Exists(path);
        auto forced = forced_stamps.find(path);
        if (stat && forced != forced_stamps.end()) {
            stat->mzxid = forced->second;
        }
        return stat;
    }

    void Delete(const std::string& path, std::int32_t version = kAnyVersion) override {
        if (before_delete) before_delete(path);
        MemoryCoordinationStore::Delete(path, version);
        deleted_paths.push_back(path);
    }

    // Overrides the stamp Exists() reports for a path, to produce ties.
    std::map<std::string, Stamp> forced_stamps;

    // Bypass the hooks, as another client would.
    void DeleteDirect(const std::string& path) { MemoryCoordinationStore::Delete(path); }
    void CreateDirect(const std::string& path) { MemoryCoordinationStore::Create(path, {}); }
};

} // namespace testing
} // namespace trackmap
