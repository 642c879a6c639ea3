#pragma once

#include "coordination_store.hpp"
#include "types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace trackmap {

/**
 * @class TrackingTable
 * @brief Map from tracking ids to opaque payloads kept as one node per id under a directory.
 *
 * The node for id "x" is `<dir>/mn-x`. The store is borrowed and must outlive the table.
 * Store failures propagate as StoreError exceptions.
 */
class TrackingTable {
public:
    static constexpr char kKeyPrefix[] = "mn-";

    // Creates dir (and its ancestors) in the store if missing.
    TrackingTable(CoordinationStore& store, std::string dir);
    virtual ~TrackingTable() = default;

    /**
     * @brief Stores payload under id, overwriting any existing payload.
     */
    virtual void Put(const std::string& id, const Bytes& payload);

    /**
     * @brief Stores payload under id only if id is not tracked yet.
     * @return True if a new entry was created, false if id was already present.
     */
    virtual bool PutIfAbsent(const std::string& id, const Bytes& payload);

    std::optional<Bytes> Get(const std::string& id);
    bool Contains(const std::string& id);
    std::size_t Size();

    /**
     * @brief Removes id regardless of its version.
     * @return False if id was not present.
     */
    bool Remove(const std::string& id);

    // Removes every entry. Entries removed concurrently by someone else are skipped.
    void Clear();

    // Tracked ids, with the key prefix stripped.
    std::vector<std::string> Keys();

    const std::string& Dir() const { return dir_; }

protected:
    std::string NodePath(const std::string& id) const;

    // Inverse of the key encoding; names without the prefix are returned unchanged.
    static std::string StripKeyPrefix(const std::string& child);

    CoordinationStore& store_;
    const std::string dir_;

private:
    TrackingTable(const TrackingTable&) = delete;
    TrackingTable& operator=(const TrackingTable&) = delete;
};

} // namespace trackmap
