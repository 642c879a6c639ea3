#include "trackmap/tracking_table.hpp"
#include "trackmap/errors.hpp"

#include <cstring>
#include <stdexcept>
#include <utility>

namespace trackmap {

TrackingTable::TrackingTable(CoordinationStore& store, std::string dir)
    : store_(store), dir_(std::move(dir)) {
    store_.EnsurePath(dir_);
}

void TrackingTable::Put(const std::string& id, const Bytes& payload) {
    const std::string path = NodePath(id);
    // Another client may create or delete the node between the two calls.
    while (true) {
        try {
            store_.Create(path, payload);
            return;
        } catch (const NodeExistsError&) {
        }
        try {
            store_.SetData(path, payload);
            return;
        } catch (const NoNodeError&) {
        }
    }
}

bool TrackingTable::PutIfAbsent(const std::string& id, const Bytes& payload) {
    try {
        store_.Create(NodePath(id), payload);
    } catch (const NodeExistsError&) {
        return false;
    }
    return true;
}

std::optional<Bytes> TrackingTable::Get(const std::string& id) {
    try {
        return store_.GetData(NodePath(id));
    } catch (const NoNodeError&) {
        return std::nullopt;
    }
}

bool TrackingTable::Contains(const std::string& id) {
    return store_.Exists(NodePath(id)).has_value();
}

std::size_t TrackingTable::Size() {
    return store_.CountChildren(dir_);
}

bool TrackingTable::Remove(const std::string& id) {
    try {
        store_.Delete(NodePath(id));
    } catch (const NoNodeError&) {
        return false;
    }
    return true;
}

void TrackingTable::Clear() {
    for (const auto& child : store_.ListChildren(dir_)) {
        try {
            store_.Delete(ChildPath(dir_, child));
        } catch (const NoNodeError&) {
            // already removed by another client
        }
    }
}

std::vector<std::string> TrackingTable::Keys() {
    std::vector<std::string> keys;
    for (const auto& child : store_.ListChildren(dir_)) {
        keys.push_back(StripKeyPrefix(child));
    }
    return keys;
}

std::string TrackingTable::NodePath(const std::string& id) const {
    if (id.empty() || id.find('/') != std::string::npos) {
        throw std::invalid_argument("invalid tracking id: '" + id + "'");
    }
    return ChildPath(dir_, kKeyPrefix + id);
}

std::string TrackingTable::StripKeyPrefix(const std::string& child) {
    const std::size_t len = std::strlen(kKeyPrefix);
    if (child.compare(0, len, kKeyPrefix) == 0) {
        return child.substr(len);
    }
    return child;
}

} // namespace trackmap
