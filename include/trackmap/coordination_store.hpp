#pragma once

#include "types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace trackmap {

/**
 * @class CoordinationStore
 * @brief Hierarchical namespace of named nodes, addressed by paths like "/a/b/c".
 *
 * Every write is assigned a stamp that is comparable across the whole namespace.
 * Individual calls are consistent, but nothing groups several calls into a transaction.
 * Failures are reported by throwing a StoreError subclass (see errors.hpp).
 */
class CoordinationStore {
public:
    virtual ~CoordinationStore() = default;

    /**
     * @brief Lists the names (not full paths) of the children of a node.
     * @throws NoNodeError if dir does not exist.
     */
    virtual std::vector<std::string> ListChildren(const std::string& dir) = 0;

    /**
     * @brief Reads the stat of a node.
     * @return The stat, or std::nullopt if the node does not exist.
     */
    virtual std::optional<NodeStat> Exists(const std::string& path) = 0;

    /**
     * @brief Creates a node holding data.
     * @throws NodeExistsError if the node is already present.
     * @throws NoNodeError if the parent node is missing.
     */
    virtual void Create(const std::string& path, const Bytes& data) = 0;

    /**
     * @brief Overwrites the data of an existing node.
     * @throws NoNodeError if the node is absent.
     * @throws BadVersionError if version is not kAnyVersion and does not match.
     */
    virtual void SetData(const std::string& path, const Bytes& data,
                         std::int32_t version = kAnyVersion) = 0;

    /**
     * @brief Reads the data of a node.
     * @throws NoNodeError if the node is absent.
     */
    virtual Bytes GetData(const std::string& path) = 0;

    /**
     * @brief Deletes a node.
     * @throws NoNodeError if the node is absent.
     * @throws BadVersionError if version is not kAnyVersion and does not match.
     * @throws NotEmptyError if the node still has children.
     */
    virtual void Delete(const std::string& path, std::int32_t version = kAnyVersion) = 0;

    // Creates path and any missing ancestors with empty data.
    virtual void EnsurePath(const std::string& path) = 0;

    virtual std::size_t CountChildren(const std::string& dir) {
        return ListChildren(dir).size();
    }
};

// Joins a directory path and a child name.
inline std::string ChildPath(const std::string& dir, const std::string& child) {
    if (dir == "/") {
        return "/" + child;
    }
    return dir + "/" + child;
}

} // namespace trackmap
