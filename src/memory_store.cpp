#include "trackmap/memory_store.hpp"
#include "trackmap/errors.hpp"

#include <stdexcept>
#include <utility>

namespace trackmap {

namespace {

void ValidatePath(const std::string& path) {
    if (path.empty() || path.front() != '/') {
        throw std::invalid_argument("path must start with '/': " + path);
    }
    if (path.size() > 1 && path.back() == '/') {
        throw std::invalid_argument("path must not end with '/': " + path);
    }
    if (path.find("//") != std::string::npos) {
        throw std::invalid_argument("path has an empty segment: " + path);
    }
}

std::string ParentOf(const std::string& path) {
    auto slash = path.rfind('/');
    return slash == 0 ? "/" : path.substr(0, slash);
}

// Key prefix shared by every descendant of dir in the ordered node map.
std::string DescendantPrefix(const std::string& dir) {
    return dir == "/" ? "/" : dir + "/";
}

} // namespace

MemoryCoordinationStore::MemoryCoordinationStore() {
    nodes_["/"] = Node{};
}

std::vector<std::string> MemoryCoordinationStore::ListChildren(const std::string& dir) {
    ValidatePath(dir);
    std::lock_guard<std::mutex> lock(mutex_);
    if (nodes_.find(dir) == nodes_.end()) {
        throw NoNodeError(dir);
    }

    const std::string prefix = DescendantPrefix(dir);
    std::vector<std::string> children;
    for (auto it = nodes_.lower_bound(prefix);
         it != nodes_.end() && it->first.compare(0, prefix.size(), prefix) == 0; ++it) {
        std::string rest = it->first.substr(prefix.size());
        if (!rest.empty() && rest.find('/') == std::string::npos) {
            children.push_back(std::move(rest));
        }
    }
    return children;
}

std::optional<NodeStat> MemoryCoordinationStore::Exists(const std::string& path) {
    ValidatePath(path);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nodes_.find(path);
    if (it == nodes_.end()) {
        return std::nullopt;
    }
    return it->second.stat;
}

void MemoryCoordinationStore::Create(const std::string& path, const Bytes& data) {
    ValidatePath(path);
    std::lock_guard<std::mutex> lock(mutex_);
    create_locked(path, data);
}

void MemoryCoordinationStore::SetData(const std::string& path, const Bytes& data,
                                      std::int32_t version) {
    ValidatePath(path);
    std::lock_guard<std::mutex> lock(mutex_);
    Node& node = node_locked(path);
    if (version != kAnyVersion && version != node.stat.version) {
        throw BadVersionError(path);
    }
    node.data = data;
    node.stat.mzxid = ++last_stamp_;
    ++node.stat.version;
}

Bytes MemoryCoordinationStore::GetData(const std::string& path) {
    ValidatePath(path);
    std::lock_guard<std::mutex> lock(mutex_);
    return node_locked(path).data;
}

void MemoryCoordinationStore::Delete(const std::string& path, std::int32_t version) {
    ValidatePath(path);
    if (path == "/") {
        throw std::invalid_argument("cannot delete the root node");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    Node& node = node_locked(path);
    if (version != kAnyVersion && version != node.stat.version) {
        throw BadVersionError(path);
    }
    if (node.stat.num_children > 0) {
        throw NotEmptyError(path);
    }
    nodes_.erase(path);
    --nodes_.at(ParentOf(path)).stat.num_children;
}

void MemoryCoordinationStore::EnsurePath(const std::string& path) {
    ValidatePath(path);
    std::lock_guard<std::mutex> lock(mutex_);
    if (nodes_.count(path)) {
        return;
    }
    // Walk down from the root creating every missing segment.
    std::size_t pos = 0;
    while (pos != std::string::npos) {
        pos = path.find('/', pos + 1);
        std::string prefix = path.substr(0, pos);
        if (!nodes_.count(prefix)) {
            create_locked(prefix, {});
        }
    }
}

std::size_t MemoryCoordinationStore::CountChildren(const std::string& dir) {
    ValidatePath(dir);
    std::lock_guard<std::mutex> lock(mutex_);
    return node_locked(dir).stat.num_children;
}

Stamp MemoryCoordinationStore::NextStamp() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_stamp_ + 1;
}

void MemoryCoordinationStore::create_locked(const std::string& path, const Bytes& data) {
    if (nodes_.count(path)) {
        throw NodeExistsError(path);
    }
    auto parent = nodes_.find(ParentOf(path));
    if (parent == nodes_.end()) {
        throw NoNodeError(ParentOf(path));
    }

    Node node;
    node.data = data;
    node.stat.czxid = node.stat.mzxid = ++last_stamp_;
    nodes_.emplace(path, std::move(node));
    ++parent->second.stat.num_children;
}

MemoryCoordinationStore::Node& MemoryCoordinationStore::node_locked(const std::string& path) {
    auto it = nodes_.find(path);
    if (it == nodes_.end()) {
        throw NoNodeError(path);
    }
    return it->second;
}

} // namespace trackmap
