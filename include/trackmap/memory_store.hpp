#pragma once

#include "coordination_store.hpp"
#include <map>
#include <mutex>

namespace trackmap {

/**
 * @class MemoryCoordinationStore
 * @brief In-process CoordinationStore.
 *
 * Thread-safe. Stamps come from a single counter shared by every write, so they are
 * strictly increasing across the whole namespace. The root node "/" always exists.
 */
class MemoryCoordinationStore : public CoordinationStore {
public:
    MemoryCoordinationStore();

    std::vector<std::string> ListChildren(const std::string& dir) override;
    std::optional<NodeStat> Exists(const std::string& path) override;
    void Create(const std::string& path, const Bytes& data) override;
    void SetData(const std::string& path, const Bytes& data,
                 std::int32_t version = kAnyVersion) override;
    Bytes GetData(const std::string& path) override;
    void Delete(const std::string& path, std::int32_t version = kAnyVersion) override;
    void EnsurePath(const std::string& path) override;
    std::size_t CountChildren(const std::string& dir) override;

    // Stamp the next write will receive.
    Stamp NextStamp() const;

private:
    struct Node {
        Bytes data;
        NodeStat stat;
    };

    // Assumes lock is held
    void create_locked(const std::string& path, const Bytes& data);
    Node& node_locked(const std::string& path);

    mutable std::mutex mutex_;
    std::map<std::string, Node> nodes_; // full path -> node
    Stamp last_stamp_ = 0;
};

} // namespace trackmap
