#pragma once
#include "types.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace foundry {

/// In-memory owner of every Conversation.
///
/// A session key ("user_id:project_id") points at its active conversation.
/// Writers go through a Lease, and at most one Lease exists per conversation
/// at a time, which is what keeps two requests from streaming into the same
/// transcript.
class SessionStore {
private:
    struct Record {
        std::mutex mutex;
        Conversation conversation;
        bool busy = false;
    };

public:
    /// Exclusive write access to one conversation. Releasing it (destruction
    /// or move-assignment) frees the conversation for the next request.
    class Lease {
    public:
        Lease() = default;
        ~Lease();
        Lease(Lease&& o) noexcept;
        Lease& operator=(Lease&& o) noexcept;
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        [[nodiscard]] const std::string& id() const noexcept { return id_; }
        [[nodiscard]] bool valid() const noexcept { return record_ != nullptr; }

        /// Run `fn(Conversation&)` under the conversation's lock.
        template <typename F>
        auto with(F&& fn) {
            std::lock_guard<std::mutex> lock(record_->mutex);
            return fn(record_->conversation);
        }

    private:
        friend class SessionStore;
        Lease(std::shared_ptr<Record> record, std::string id);
        void release() noexcept;

        std::shared_ptr<Record> record_;
        std::string id_;
    };

    /// Resolve the conversation a request writes to. An existing
    /// `conversation_id` owned by the same session wins and becomes its
    /// active conversation; otherwise the session's active conversation is
    /// reused, or a new one is created. Returns its id.
    std::string open(const std::string& session_key, const std::string& project_id,
                     const std::string& model,
                     const std::optional<std::string>& conversation_id = std::nullopt);

    /// Throws ConversationBusyError if another request holds the lease,
    /// FoundryError if the id is unknown.
    [[nodiscard]] Lease acquire(const std::string& id);

    [[nodiscard]] std::optional<Conversation> snapshot(const std::string& id) const;

    /// Conversations of `project_id`, most recently updated first.
    [[nodiscard]] std::vector<Conversation> list(const std::string& project_id) const;

    [[nodiscard]] std::optional<std::string> active(const std::string& session_key) const;

    /// Forget the session's active conversation; the next request starts a
    /// new one. Returns false if there was none.
    bool clear(const std::string& session_key);

    /// Trimmed and capped at 200 bytes. Returns false for an unknown id.
    bool rename(const std::string& id, const std::string& title);

    /// Drop a conversation. A request still holding its lease finishes
    /// against the detached record.
    bool remove(const std::string& id);

    [[nodiscard]] std::size_t size() const;

private:
    std::string next_id();

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Record>> records_;
    std::map<std::string, std::string> active_;
    std::mt19937_64 rng_{std::random_device{}()};
};

/// "user_id:project_id"
[[nodiscard]] std::string make_session_key(const std::string& user_id, const std::string& project_id);

} // namespace foundry
