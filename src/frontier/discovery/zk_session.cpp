/**
 * @file zk_session.cpp
 * @brief ZooKeeper C client adapter for the coordination boundary.
 *
 * Ownership: ZooKeeperSession owns the zhandle and a SessionContext that is
 * registered as the context of every callback. zookeeper_close() runs in the
 * session destructor before the context is released, so callbacks never see
 * a dangling context.
 */
#include "frontier/discovery/zk_session.hpp"
#include "frontier/config/constants.hpp"
#include "frontier/discovery/event_queue.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstring>
#include <mutex>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>
#include <zookeeper/zookeeper.h>

namespace frontier::discovery {
using namespace frontier::config::constants;

//------------------------------- Error mapping --------------------------------

CoordErrc classify_zk_error(int rc) noexcept {
    switch (rc) {
        case ZNONODE:           return CoordErrc::NoNode;
        case ZCONNECTIONLOSS:   return CoordErrc::ConnectionLoss;
        case ZSESSIONEXPIRED:   return CoordErrc::SessionExpired;
        case ZOPERATIONTIMEOUT: return CoordErrc::Timeout;
        case ZBADARGUMENTS:     return CoordErrc::BadArguments;
        case ZCLOSING:
        case ZINVALIDSTATE:     return CoordErrc::Closed;
        default:                return CoordErrc::SystemError;
    }
}

// ZOO_*_STATE are extern consts, hence no switch.
SessionState session_state_of(int state) noexcept {
    if (state == ZOO_CONNECTED_STATE)       return SessionState::Connected;
    if (state == ZOO_EXPIRED_SESSION_STATE) return SessionState::Expired;
    if (state == ZOO_AUTH_FAILED_STATE)     return SessionState::AuthFailed;
    if (state == ZOO_CONNECTING_STATE ||
        state == ZOO_ASSOCIATING_STATE)     return SessionState::Disconnected;
    return SessionState::Closed;
}

namespace {

frontier_detail::unexpected<CoordError> zk_error(int rc, const std::string& what) {
    return frontier_detail::unexpected(CoordError{classify_zk_error(rc), rc, what + ": " + zerror(rc)});
}

//------------------------------- Subscription ---------------------------------

/// State of one watch_recursive() call, shared by its callbacks and its stream.
struct Subscription {
    zhandle_t*            zh{nullptr};
    std::string           root;
    EventQueue            queue;
    std::mutex            mu;
    std::set<std::string> functions; // children of root seen by the last listing
};

std::string backends_path(const std::string& root, const std::string& function) {
    return root + "/" + function + "/" + BACKENDS_NODE;
}

/// "<root>/<function>/backends" → "<function>"; empty when the path has another shape.
std::string function_of(const Subscription& s, std::string_view path) {
    if (path.size() <= s.root.size() + 1 || path.substr(0, s.root.size()) != s.root ||
        path[s.root.size()] != '/') {
        return {};
    }
    path.remove_prefix(s.root.size() + 1);
    return std::string(path.substr(0, path.find('/')));
}

void arm_children(Subscription* s);
void arm_backends(Subscription* s, const std::string& path, bool announce);

struct ExistsCall {
    Subscription* sub;
    std::string   path;
    bool          announce; // report an already existing node as created
};

void on_backends_exists(int rc, const struct Stat*, const void* data) {
    std::unique_ptr<ExistsCall> call(static_cast<ExistsCall*>(const_cast<void*>(data)));
    if (rc == ZOK && call->announce) {
        call->sub->queue.push(WatchEvent{EventType::NodeCreated, SessionState::Connected, call->path});
    } else if (rc != ZOK && rc != ZNONODE && rc != ZCLOSING) {
        spdlog::warn("ZooKeeper exists watch on {} failed: {}", call->path, zerror(rc));
    }
}

void on_backends_event(zhandle_t*, int type, int, const char* path, void* ctx) {
    if (type == ZOO_SESSION_EVENT) return; // delivered once by the session watcher

    auto* s = static_cast<Subscription*>(ctx);
    const std::string p = path ? path : "";

    EventType et;
    if (type == ZOO_CREATED_EVENT)      et = EventType::NodeCreated;
    else if (type == ZOO_CHANGED_EVENT) et = EventType::NodeDataChanged;
    else if (type == ZOO_DELETED_EVENT) et = EventType::NodeDeleted;
    else return;

    bool listed = false;
    {
        std::lock_guard<std::mutex> lk(s->mu);
        listed = s->functions.count(function_of(*s, p)) != 0;
    }
    // Re-arm before publishing: requests on one session are ordered, so any
    // read the consumer issues for this event is covered by the new watch.
    if (listed) arm_backends(s, p, /*announce=*/false);
    s->queue.push(WatchEvent{et, SessionState::Connected, p});
}

void on_children_listed(int rc, const struct String_vector* strings, const void* data) {
    auto* s = static_cast<Subscription*>(const_cast<void*>(data));
    if (rc != ZOK) {
        if (rc != ZCLOSING) spdlog::warn("ZooKeeper child watch on {} failed: {}", s->root, zerror(rc));
        return;
    }

    std::vector<std::string> added;
    {
        std::lock_guard<std::mutex> lk(s->mu);
        std::set<std::string> now;
        for (int32_t i = 0; strings && i < strings->count; ++i) now.insert(strings->data[i]);
        for (const auto& name : now) {
            if (!s->functions.count(name)) added.push_back(name);
        }
        s->functions = std::move(now);
    }
    // A backends node written before our exists watch landed would otherwise go unseen.
    for (const auto& name : added) arm_backends(s, backends_path(s->root, name), /*announce=*/true);
}

void on_root_event(zhandle_t*, int type, int, const char*, void* ctx) {
    if (type != ZOO_CHILD_EVENT) return;
    auto* s = static_cast<Subscription*>(ctx);
    s->queue.push(WatchEvent{EventType::NodeChildrenChanged, SessionState::Connected, s->root});
    arm_children(s);
}

void arm_children(Subscription* s) {
    const int rc = zoo_awget_children(s->zh, s->root.c_str(), on_root_event, s, on_children_listed, s);
    if (rc != ZOK) spdlog::warn("ZooKeeper re-arm of {} failed: {}", s->root, zerror(rc));
}

void arm_backends(Subscription* s, const std::string& path, bool announce) {
    auto call = std::make_unique<ExistsCall>(ExistsCall{s, path, announce});
    const int rc = zoo_awexists(s->zh, path.c_str(), on_backends_event, s, on_backends_exists, call.get());
    if (rc == ZOK) {
        call.release(); // owned by on_backends_exists
    } else {
        spdlog::warn("ZooKeeper watch on {} failed: {}", path, zerror(rc));
    }
}

class ZkWatchStream final : public WatchStream {
public:
    explicit ZkWatchStream(std::shared_ptr<Subscription> sub) : sub_(std::move(sub)) {}
    WatchEvent next() override { return sub_->queue.next(); }
    void close() override { sub_->queue.close(); }

private:
    std::shared_ptr<Subscription> sub_;
};

//------------------------------- Session --------------------------------------

struct SessionContext {
    std::mutex              mu;
    std::condition_variable cv;
    int                     state{0};
    bool                    state_seen{false};
    std::vector<std::shared_ptr<Subscription>> subscriptions;
};

void on_session_event(zhandle_t*, int type, int state, const char*, void* ctx) {
    if (type != ZOO_SESSION_EVENT) return;
    auto* c = static_cast<SessionContext*>(ctx);

    std::vector<std::shared_ptr<Subscription>> subs;
    {
        std::lock_guard<std::mutex> lk(c->mu);
        c->state = state;
        c->state_seen = true;
        subs = c->subscriptions;
    }
    c->cv.notify_all();

    const SessionState st = session_state_of(state);
    spdlog::trace("ZooKeeper session state: {}", to_string(st));
    for (auto& s : subs) s->queue.push(WatchEvent{EventType::Session, st, {}});
}

class ZooKeeperSession final : public CoordinationSession {
public:
    ZooKeeperSession(zhandle_t* zh, std::unique_ptr<SessionContext> ctx) noexcept
        : zh_(zh), ctx_(std::move(ctx)) {}

    ~ZooKeeperSession() override {
        {
            std::lock_guard<std::mutex> lk(ctx_->mu);
            for (auto& s : ctx_->subscriptions) s->queue.close();
        }
        // Joins the client threads; no callback runs after this returns.
        zookeeper_close(zh_);
    }

    ZooKeeperSession(const ZooKeeperSession&) = delete;
    ZooKeeperSession& operator=(const ZooKeeperSession&) = delete;

    frontier_detail::expected<std::vector<std::string>, CoordError>
    list_children(std::string_view path) override {
        const std::string p(path);
        String_vector children{};
        int rc;
        {
            std::lock_guard<std::mutex> lk(op_mu_);
            rc = zoo_get_children(zh_, p.c_str(), 0, &children);
        }
        if (rc != ZOK) return zk_error(rc, "list children of " + p);

        std::vector<std::string> out;
        out.reserve(static_cast<std::size_t>(children.count));
        for (int32_t i = 0; i < children.count; ++i) out.emplace_back(children.data[i]);
        deallocate_String_vector(&children);
        return out;
    }

    frontier_detail::expected<NodeData, CoordError>
    get_data(std::string_view path) override {
        const std::string p(path);
        std::lock_guard<std::mutex> lk(op_mu_);

        for (int attempt = 0; attempt < ZK_GET_DATA_ATTEMPTS; ++attempt) {
            struct Stat stat{};
            int rc = zoo_exists(zh_, p.c_str(), 0, &stat);
            if (rc != ZOK) return zk_error(rc, "exists " + p);

            std::vector<char> buf(static_cast<std::size_t>(std::max(stat.dataLength, 0)));
            int len = static_cast<int>(buf.size());
            rc = zoo_get(zh_, p.c_str(), 0, buf.data(), &len, &stat);
            if (rc != ZOK) return zk_error(rc, "get data of " + p);

            if (stat.dataLength <= static_cast<int>(buf.size())) {
                const auto n = static_cast<std::ptrdiff_t>(std::max(len, 0)); // -1 means null payload
                return NodeData{std::vector<std::uint8_t>(buf.begin(), buf.begin() + n), stat.version};
            }
            // Node grew between the two calls; read again with the new size.
        }
        return frontier_detail::unexpected(
            CoordError{CoordErrc::SystemError, 0, "data of " + p + " kept changing size"});
    }

    frontier_detail::expected<std::unique_ptr<WatchStream>, CoordError>
    watch_recursive(std::string_view path) override {
        auto sub = std::make_shared<Subscription>();
        sub->zh = zh_;
        sub->root = std::string(path);
        {
            std::lock_guard<std::mutex> lk(ctx_->mu);
            ctx_->subscriptions.push_back(sub);
        }

        String_vector children{};
        int rc;
        {
            std::lock_guard<std::mutex> lk(op_mu_);
            rc = zoo_wget_children(zh_, sub->root.c_str(), on_root_event, sub.get(), &children);
        }
        if (rc != ZOK) return zk_error(rc, "watch " + sub->root);

        std::vector<std::string> names;
        {
            std::lock_guard<std::mutex> lk(sub->mu);
            for (int32_t i = 0; i < children.count; ++i) {
                sub->functions.insert(children.data[i]);
                names.emplace_back(children.data[i]);
            }
        }
        deallocate_String_vector(&children);

        for (const auto& name : names) arm_backends(sub.get(), backends_path(sub->root, name), false);
        return std::unique_ptr<WatchStream>(std::make_unique<ZkWatchStream>(std::move(sub)));
    }

private:
    std::mutex                      op_mu_;  ///< One synchronous call at a time
    zhandle_t*                      zh_;
    std::unique_ptr<SessionContext> ctx_;
};

} // namespace

//------------------------------- Factory --------------------------------------

bool valid_environment(const std::string& environment) noexcept {
    if (environment.empty() || environment == "." || environment == "..") return false;
    for (char c : environment) {
        if (c == '/' || static_cast<unsigned char>(c) < 0x20 || c == 0x7f) return false;
    }
    return true;
}

ZooKeeperSessionFactory::ZooKeeperSessionFactory(config::CoordinationConfig cfg)
    : cfg_(std::move(cfg)) {
    zoo_set_debug_level(ZOO_LOG_LEVEL_WARN);
}

frontier_detail::expected<std::unique_ptr<CoordinationSession>, CoordError>
ZooKeeperSessionFactory::connect() {
    if (!valid_environment(cfg_.environment)) {
        return frontier_detail::unexpected(
            CoordError{CoordErrc::InvalidPath, 0, "Failed to chroot to env " + cfg_.environment});
    }

    auto ctx = std::make_unique<SessionContext>();
    const std::string hosts = cfg_.hosts + "/" + cfg_.environment; // chroot suffix
    zhandle_t* zh = zookeeper_init(hosts.c_str(), on_session_event,
                                   static_cast<int>(cfg_.session_timeout_ms),
                                   nullptr, ctx.get(), 0);
    if (!zh) {
        const int err = errno;
        return frontier_detail::unexpected(
            CoordError{CoordErrc::SystemError, err, "Error connecting to ZooKeeper: " + std::string(std::strerror(err))});
    }

    int state = 0;
    bool settled = false;
    {
        std::unique_lock<std::mutex> lk(ctx->mu);
        settled = ctx->cv.wait_for(lk, std::chrono::milliseconds(cfg_.session_timeout_ms), [&] {
            return ctx->state_seen &&
                   (ctx->state == ZOO_CONNECTED_STATE ||
                    ctx->state == ZOO_EXPIRED_SESSION_STATE ||
                    ctx->state == ZOO_AUTH_FAILED_STATE);
        });
        state = ctx->state;
    }

    if (!settled || state != ZOO_CONNECTED_STATE) {
        zookeeper_close(zh);
        const bool timed_out = !settled;
        return frontier_detail::unexpected(CoordError{
            timed_out ? CoordErrc::Timeout : CoordErrc::SessionExpired, 0,
            "Error connecting to ZooKeeper at " + cfg_.hosts +
                (timed_out ? ": timed out" : ": session rejected")});
    }

    spdlog::trace("Connected to ZooKeeper {} (env {})", cfg_.hosts, cfg_.environment);
    return std::unique_ptr<CoordinationSession>(std::make_unique<ZooKeeperSession>(zh, std::move(ctx)));
}

} // namespace frontier::discovery
