#pragma once
#include <cstdint>

#include "instance_store.hpp"
#include "log.hpp"
#include "utils.hpp"

namespace lazycell {

// One isolated execution context. Every Local<T> has at most one value per Instance,
// and all of them are destroyed with it.
class Instance {
public:
    Instance() : id_(next_instance_id()), store_(id_) {
        logger()->trace("instance {} created", id_);
    }

    ~Instance() { logger()->trace("instance {} tearing down", id_); }

    Instance(const Instance&) = delete;
    Instance& operator=(const Instance&) = delete;

    std::uint64_t id() const noexcept { return id_; }

    InstanceStore&       store()       noexcept { return store_; }
    const InstanceStore& store() const noexcept { return store_; }

private:
    const std::uint64_t id_;
    InstanceStore store_;
};

} // namespace lazycell
