#pragma once
#include "url_record.h"
#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Concurrent short_code -> UrlRecord map.
//
// The map itself sits behind a shared_mutex: inserts are exclusive, every
// other operation is shared. Each entry's counter is atomic, so increments
// run concurrently with lookups and with each other without losing updates.
// Records handed out are copies; callers never see a half-written entry.
class UrlStore {
public:
    UrlStore() = default;
    UrlStore(const UrlStore&) = delete;
    UrlStore& operator=(const UrlStore&) = delete;

    void insert(const std::string& code, const UrlRecord& rec);     // add or overwrite
    bool try_insert(const std::string& code, const UrlRecord& rec); // false if code taken

    std::optional<UrlRecord> get(const std::string& code) const;
    bool increment_access(const std::string& code);

    std::vector<UrlRecord> list_all() const;
    std::size_t count() const;
    std::uint64_t total_clicks() const;

private:
    struct Entry {
        UrlRecord rec;                       // access_count unused, see clicks
        std::atomic<std::uint64_t> clicks{0};

        UrlRecord snapshot() const;
    };

    std::unique_ptr<Entry> make_entry(const UrlRecord& rec);

    mutable std::shared_mutex mu_;
    std::unordered_map<std::string, std::unique_ptr<Entry>> map_;
    std::uint64_t next_seq_ = 0;          // guarded by exclusive mu_
};
