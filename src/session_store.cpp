#include "foundry/session_store.hpp"
#include "foundry/error.hpp"
#include <algorithm>
#include <cstdio>

namespace foundry {

std::string make_session_key(const std::string& user_id, const std::string& project_id) {
    return user_id + ":" + project_id;
}

// ---------- Lease ----------

SessionStore::Lease::Lease(std::shared_ptr<Record> record, std::string id)
    : record_(std::move(record)), id_(std::move(id)) {}

SessionStore::Lease::~Lease() { release(); }

SessionStore::Lease::Lease(Lease&& o) noexcept
    : record_(std::move(o.record_)), id_(std::move(o.id_)) {}

SessionStore::Lease& SessionStore::Lease::operator=(Lease&& o) noexcept {
    if (this != &o) {
        release();
        record_ = std::move(o.record_);
        id_ = std::move(o.id_);
    }
    return *this;
}

void SessionStore::Lease::release() noexcept {
    if (!record_) return;
    {
        std::lock_guard<std::mutex> lock(record_->mutex);
        record_->busy = false;
    }
    record_.reset();
}

// ---------- SessionStore ----------

std::string SessionStore::next_id() {
    char buf[40];
    std::snprintf(buf, sizeof(buf), "conv_%016llx",
                  static_cast<unsigned long long>(rng_()));
    return buf;
}

std::string SessionStore::open(const std::string& session_key, const std::string& project_id,
                               const std::string& model,
                               const std::optional<std::string>& conversation_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (conversation_id) {
        auto it = records_.find(*conversation_id);
        if (it != records_.end()) {
            std::lock_guard<std::mutex> rlock(it->second->mutex);
            const Conversation& c = it->second->conversation;
            if (c.project_id == project_id && c.session_key == session_key) {
                active_[session_key] = *conversation_id;
                return *conversation_id;
            }
        }
    }

    auto act = active_.find(session_key);
    if (act != active_.end() && records_.count(act->second)) {
        return act->second;
    }

    std::string id;
    do {
        id = next_id();
    } while (records_.count(id));

    auto record = std::make_shared<Record>();
    auto now = Clock::now();
    record->conversation.id = id;
    record->conversation.session_key = session_key;
    record->conversation.project_id = project_id;
    record->conversation.model = model;
    record->conversation.created_at = now;
    record->conversation.updated_at = now;
    records_.emplace(id, std::move(record));
    active_[session_key] = id;
    return id;
}

SessionStore::Lease SessionStore::acquire(const std::string& id) {
    std::shared_ptr<Record> record;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(id);
        if (it == records_.end()) throw FoundryError("Conversation not found: " + id);
        record = it->second;
    }
    std::lock_guard<std::mutex> rlock(record->mutex);
    if (record->busy) throw ConversationBusyError(id);
    record->busy = true;
    return Lease(std::move(record), id);
}

std::optional<Conversation> SessionStore::snapshot(const std::string& id) const {
    std::shared_ptr<Record> record;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(id);
        if (it == records_.end()) return std::nullopt;
        record = it->second;
    }
    std::lock_guard<std::mutex> rlock(record->mutex);
    return record->conversation;
}

std::vector<Conversation> SessionStore::list(const std::string& project_id) const {
    std::vector<std::shared_ptr<Record>> records;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, r] : records_) records.push_back(r);
    }
    std::vector<Conversation> out;
    for (const auto& r : records) {
        std::lock_guard<std::mutex> rlock(r->mutex);
        if (r->conversation.project_id == project_id) out.push_back(r->conversation);
    }
    std::sort(out.begin(), out.end(), [](const Conversation& a, const Conversation& b) {
        return a.updated_at > b.updated_at;
    });
    return out;
}

std::optional<std::string> SessionStore::active(const std::string& session_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = active_.find(session_key);
    if (it == active_.end()) return std::nullopt;
    return it->second;
}

bool SessionStore::clear(const std::string& session_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_.erase(session_key) > 0;
}

bool SessionStore::rename(const std::string& id, const std::string& title) {
    std::shared_ptr<Record> record;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(id);
        if (it == records_.end()) return false;
        record = it->second;
    }
    auto first = title.find_first_not_of(" \t\r\n");
    auto last = title.find_last_not_of(" \t\r\n");
    std::string trimmed = first == std::string::npos ? "" : title.substr(first, last - first + 1);
    if (trimmed.size() > 200) trimmed.resize(200);

    std::lock_guard<std::mutex> rlock(record->mutex);
    record->conversation.title = std::move(trimmed);
    record->conversation.updated_at = Clock::now();
    return true;
}

bool SessionStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.erase(id) == 0) return false;
    for (auto it = active_.begin(); it != active_.end();) {
        if (it->second == id) it = active_.erase(it);
        else ++it;
    }
    return true;
}

std::size_t SessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

} // namespace foundry
