#include "url_store.h"
#include <mutex>

UrlRecord UrlStore::Entry::snapshot() const {
    UrlRecord out = rec;
    out.access_count = clicks.load(std::memory_order_relaxed);
    return out;
}

std::unique_ptr<UrlStore::Entry> UrlStore::make_entry(const UrlRecord& rec) {
    auto e = std::make_unique<Entry>();
    e->rec = rec;
    e->rec.seq = ++next_seq_;
    e->clicks.store(rec.access_count, std::memory_order_relaxed);
    return e;
}

void UrlStore::insert(const std::string& code, const UrlRecord& rec) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    map_[code] = make_entry(rec);
}

bool UrlStore::try_insert(const std::string& code, const UrlRecord& rec) {
    std::unique_lock<std::shared_mutex> lk(mu_);
    if (map_.count(code)) return false;
    map_.emplace(code, make_entry(rec));
    return true;
}

std::optional<UrlRecord> UrlStore::get(const std::string& code) const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = map_.find(code);
    if (it == map_.end()) return std::nullopt;
    return it->second->snapshot();
}

bool UrlStore::increment_access(const std::string& code) {
    std::shared_lock<std::shared_mutex> lk(mu_);
    auto it = map_.find(code);
    if (it == map_.end()) return false;
    it->second->clicks.fetch_add(1, std::memory_order_relaxed);
    return true;
}

std::vector<UrlRecord> UrlStore::list_all() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    std::vector<UrlRecord> out;
    out.reserve(map_.size());
    for (const auto& kv : map_) out.push_back(kv.second->snapshot());
    return out;
}

std::size_t UrlStore::count() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    return map_.size();
}

std::uint64_t UrlStore::total_clicks() const {
    std::shared_lock<std::shared_mutex> lk(mu_);
    std::uint64_t sum = 0;
    for (const auto& kv : map_) sum += kv.second->clicks.load(std::memory_order_relaxed);
    return sum;
}
