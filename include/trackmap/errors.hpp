#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace trackmap {

// Base of every failure reported by a CoordinationStore.
class StoreError : public std::runtime_error {
public:
    StoreError(const std::string& what, std::string path)
        : std::runtime_error(what + ": " + path), path_(std::move(path)) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// The store could not be reached or answered with an unexpected error.
class StoreUnavailableError : public StoreError {
public:
    StoreUnavailableError(const std::string& detail, std::string path)
        : StoreError("store unavailable (" + detail + ")", std::move(path)) {}
};

class NoNodeError : public StoreError {
public:
    explicit NoNodeError(std::string path) : StoreError("no node", std::move(path)) {}
};

class NodeExistsError : public StoreError {
public:
    explicit NodeExistsError(std::string path) : StoreError("node exists", std::move(path)) {}
};

class BadVersionError : public StoreError {
public:
    explicit BadVersionError(std::string path) : StoreError("bad version", std::move(path)) {}
};

class NotEmptyError : public StoreError {
public:
    explicit NotEmptyError(std::string path) : StoreError("node has children", std::move(path)) {}
};

} // namespace trackmap
