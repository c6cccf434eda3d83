// Scripted stream handles for exercising the consumer and producer without a store.

#pragma once

#include "kbridge/client/errors.h"
#include "kbridge/client/stream_handle.h"
#include <algorithm>
#include <atomic>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace stub {

struct ReaderScript {
    std::deque<std::string> events;
    bool reinit_when_drained = false;   // throw ReinitializationRequiredError once empty
    bool throw_on_close = false;
    bool block_until_closed = false;    // park reads until the reader is closed
};

// Shared bookkeeping of everything the stub factory handed out
struct Ledger {
    std::mutex mutex;
    std::map<std::string, ReaderScript> scripts;
    std::vector<std::string> reader_groups;
    std::vector<std::string> reader_ids;
    std::map<std::string, int> readers_created;
    std::map<std::string, int> readers_closed;
    std::map<std::string, int> writers_created;
    std::map<std::string, int> writers_closed;
    std::map<std::string, int> writers_initialized;
    std::map<std::string, int> writers_flushed;
    std::map<std::string, std::vector<std::string>> written;
    std::set<std::string> failing_writes;    // streams whose writes fail
    std::set<std::string> failing_flushes;
    std::string fail_reader_creation_for;
    int reads = 0;
};

class StubReader : public kbridge::client::StreamReader {
public:
    StubReader(std::shared_ptr<Ledger> ledger, std::string stream, std::string group)
        : ledger_(std::move(ledger)), stream_(std::move(stream)), group_(std::move(group)) {}

    kbridge::client::EventRead read_next_event(std::chrono::milliseconds timeout) override {
        kbridge::client::EventRead result;
        if (closed_.load()) {
            throw kbridge::client::StreamError("Reader for " + stream_ + " is closed");
        }
        bool block = false;
        {
            std::lock_guard<std::mutex> lock(ledger_->mutex);
            ledger_->reads++;
            auto& script = ledger_->scripts[stream_];
            if (!script.events.empty()) {
                result.event = script.events.front();
                result.position = position_++;
                script.events.pop_front();
                return result;
            }
            if (script.reinit_when_drained) {
                throw kbridge::client::ReinitializationRequiredError("reader group " + group_ + " was reset");
            }
            block = script.block_until_closed;
        }
        if (block) {
            for (int i = 0; i < 5000 && !closed_.load(); ++i) {
                std::this_thread::sleep_for(std::chrono::milliseconds(1));
            }
            throw kbridge::client::StreamError("Reader for " + stream_ + " is closed");
        }
        // Nothing available: behave like a real reader and wait out a short timeout
        std::this_thread::sleep_for(std::min(timeout, std::chrono::milliseconds(5)));
        return result;
    }

    void close() override {
        closed_ = true;
        std::lock_guard<std::mutex> lock(ledger_->mutex);
        ledger_->readers_closed[stream_]++;
        if (ledger_->scripts[stream_].throw_on_close) {
            throw kbridge::client::StreamError("close failed for " + stream_);
        }
    }

    const std::string& stream() const override { return stream_; }
    const std::string& reader_group() const override { return group_; }

private:
    std::shared_ptr<Ledger> ledger_;
    std::string stream_;
    std::string group_;
    int64_t position_ = 0;
    std::atomic<bool> closed_{false};
};

class StubWriter : public kbridge::client::StreamWriter {
public:
    StubWriter(std::shared_ptr<Ledger> ledger, std::string stream)
        : ledger_(std::move(ledger)), stream_(std::move(stream)) {}

    void init() override {
        std::lock_guard<std::mutex> lock(ledger_->mutex);
        ledger_->writers_initialized[stream_]++;
    }

    std::future<void> write_event(const std::string& payload) override {
        std::promise<void> promise;
        std::lock_guard<std::mutex> lock(ledger_->mutex);
        if (ledger_->failing_writes.count(stream_)) {
            promise.set_exception(std::make_exception_ptr(
                kbridge::client::StreamError("write to " + stream_ + " rejected")));
        } else {
            ledger_->written[stream_].push_back(payload);
            promise.set_value();
        }
        return promise.get_future();
    }

    void flush() override {
        std::lock_guard<std::mutex> lock(ledger_->mutex);
        ledger_->writers_flushed[stream_]++;
        if (ledger_->failing_flushes.count(stream_)) {
            throw kbridge::client::StreamError("flush failed for " + stream_);
        }
    }

    void close() override {
        std::lock_guard<std::mutex> lock(ledger_->mutex);
        ledger_->writers_closed[stream_]++;
    }

    const std::string& stream() const override { return stream_; }

private:
    std::shared_ptr<Ledger> ledger_;
    std::string stream_;
};

class StubFactory : public kbridge::client::StreamClientFactory {
public:
    StubFactory() : ledger_(std::make_shared<Ledger>()) {}

    std::unique_ptr<kbridge::client::StreamReader> create_reader(const std::string& /*scope*/,
                                                                 const std::string& stream,
                                                                 const std::string& reader_group,
                                                                 const std::string& reader_id) override {
        std::lock_guard<std::mutex> lock(ledger_->mutex);
        if (stream == ledger_->fail_reader_creation_for) {
            throw kbridge::client::StreamError("cannot create reader for " + stream);
        }
        ledger_->reader_groups.push_back(reader_group);
        ledger_->reader_ids.push_back(reader_id);
        ledger_->readers_created[stream]++;
        return std::make_unique<StubReader>(ledger_, stream, reader_group);
    }

    std::unique_ptr<kbridge::client::StreamWriter> create_writer(const std::string& /*scope*/,
                                                                 const std::string& stream) override {
        std::lock_guard<std::mutex> lock(ledger_->mutex);
        ledger_->writers_created[stream]++;
        return std::make_unique<StubWriter>(ledger_, stream);
    }

    // Queue count events named <stream>-<i> for the stream
    void script(const std::string& stream, int count) {
        std::lock_guard<std::mutex> lock(ledger_->mutex);
        for (int i = 0; i < count; ++i) {
            ledger_->scripts[stream].events.push_back(stream + "-" + std::to_string(i));
        }
    }

    Ledger& ledger() { return *ledger_; }

private:
    std::shared_ptr<Ledger> ledger_;
};

} // namespace stub
