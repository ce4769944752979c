#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>
#include "utils/scheduler.hpp"

namespace jukebox {

// Get/set with TTL, hashes and sets. Backs failure counts, relay session
// cookies and playback statistics.
class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual bool set(const std::string& key, const std::string& value,
                     std::optional<std::chrono::seconds> ttl = std::nullopt) = 0;
    virtual bool del(const std::string& key) = 0;
    virtual bool exists(const std::string& key) = 0;

    virtual bool hset(const std::string& key, const std::string& field, const std::string& value) = 0;
    virtual std::optional<std::string> hget(const std::string& key, const std::string& field) = 0;
    virtual std::map<std::string, std::string> hgetall(const std::string& key) = 0;

    virtual bool sadd(const std::string& key, const std::string& member) = 0;
    virtual std::vector<std::string> smembers(const std::string& key) = 0;
    virtual bool srem(const std::string& key, const std::string& member) = 0;

    // Drop rows whose TTL has passed; returns how many were removed
    virtual int purge_expired() = 0;
};

class Database : public KeyValueStore {
public:
    using ClockFn = std::function<TimePoint()>;

    explicit Database(ClockFn clock = [] { return Clock::now(); });
    ~Database() override;

    // Disable copy
    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    // Open (":memory:" works) and create tables
    bool initialize(const std::string& db_path = "data/jukebox.db");
    void close();
    bool is_open() const { return db_ != nullptr; }

    int purge_expired() override;

    std::optional<std::string> get(const std::string& key) override;
    bool set(const std::string& key, const std::string& value,
             std::optional<std::chrono::seconds> ttl = std::nullopt) override;
    bool del(const std::string& key) override;
    bool exists(const std::string& key) override;

    bool hset(const std::string& key, const std::string& field, const std::string& value) override;
    std::optional<std::string> hget(const std::string& key, const std::string& field) override;
    std::map<std::string, std::string> hgetall(const std::string& key) override;

    bool sadd(const std::string& key, const std::string& member) override;
    std::vector<std::string> smembers(const std::string& key) override;
    bool srem(const std::string& key, const std::string& member) override;

private:
    sqlite3* db_ = nullptr;
    std::mutex db_mutex_;
    ClockFn clock_;

    bool create_tables();
    bool execute(const std::string& sql);
    int64_t now_ms() const;
};

} // namespace jukebox
