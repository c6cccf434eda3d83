/*
 * Melrose Networks (Melrose Labs Ltd) - https://melrosenetworks.com
 * Date: 2026-01-04
 * Support: support@melrosenetworks.com
 * Disclaimer: Provided "as is" without warranty; use at your own risk.
 * Title: handle_registry.h
 * Description: Ordered registry mapping a destination (stream/topic name) to the
 *              single handle that serves it. Owns the handles, preserves insertion
 *              order for fair round-robin draining, and closes them best-effort.
 */

#pragma once

#include <cstddef>
#include <exception>
#include <iostream>
#include <memory>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace kbridge {
namespace client {

template <typename Handle>
class HandleRegistry {
public:
    struct Entry {
        std::string destination;
        std::unique_ptr<Handle> handle;
    };

    HandleRegistry() = default;
    HandleRegistry(HandleRegistry&&) = default;
    HandleRegistry& operator=(HandleRegistry&&) = default;
    HandleRegistry(const HandleRegistry&) = delete;
    HandleRegistry& operator=(const HandleRegistry&) = delete;

    // Returns nullptr if the destination has no handle
    Handle* find(const std::string& destination) const {
        auto it = index_.find(destination);
        if (it == index_.end()) {
            return nullptr;
        }
        return entries_[it->second].handle.get();
    }

    bool contains(const std::string& destination) const {
        return index_.count(destination) > 0;
    }

    // Adds a handle for a new destination. A destination keeps at most one
    // handle: returns false and leaves the registry untouched if already present.
    bool insert(const std::string& destination, std::unique_ptr<Handle> handle) {
        if (contains(destination)) {
            return false;
        }
        index_.emplace(destination, entries_.size());
        entries_.push_back(Entry{destination, std::move(handle)});
        return true;
    }

    // Destinations in insertion order
    std::vector<std::string> destinations() const {
        std::vector<std::string> result;
        result.reserve(entries_.size());
        for (const auto& entry : entries_) {
            result.push_back(entry.destination);
        }
        return result;
    }

    std::set<std::string> destination_set() const {
        std::set<std::string> result;
        for (const auto& entry : entries_) {
            result.insert(entry.destination);
        }
        return result;
    }

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    typename std::vector<Entry>::const_iterator begin() const { return entries_.begin(); }
    typename std::vector<Entry>::const_iterator end() const { return entries_.end(); }

    // Close every handle. Failures are reported and never propagated.
    void close_all(const char* owner) const {
        for (const auto& entry : entries_) {
            if (!entry.handle) {
                continue;
            }
            try {
                entry.handle->close();
            } catch (const std::exception& e) {
                std::cerr << owner << ": Unable to close handle for stream "
                          << entry.destination << ": " << e.what() << std::endl;
            }
        }
    }

    void clear() {
        entries_.clear();
        index_.clear();
    }

private:
    std::vector<Entry> entries_;
    std::unordered_map<std::string, std::size_t> index_;
};

} // namespace client
} // namespace kbridge
