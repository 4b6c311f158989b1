/**
 * @file discovery_watcher.cpp
 * @brief Initial scan, supervised watch loop and incremental directory updates.
 */
#include "frontier/discovery/discovery_watcher.hpp"
#include "frontier/codec/backend_codec.hpp"
#include "frontier/config/constants.hpp"
#include "frontier/obs/observability.hpp"
#include "frontier/routing/hash_ring.hpp"

#include <chrono>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace frontier::discovery {
using namespace frontier::config::constants;

namespace {

frontier_detail::unexpected<DiscoveryError>
fail(DiscoveryErrc code, std::string detail, std::optional<CoordErrc> cause = std::nullopt) {
    return frontier_detail::unexpected(DiscoveryError{code, cause, std::move(detail)});
}

frontier_detail::unexpected<DiscoveryError>
fail(DiscoveryErrc code, const CoordError& e) {
    return fail(code, e.detail, e.code);
}

bool is_terminal(SessionState s) noexcept {
    return s == SessionState::Disconnected || s == SessionState::Expired ||
           s == SessionState::Closed || s == SessionState::AuthFailed;
}

bool ends_with(std::string_view s, std::string_view suffix) noexcept {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

} // namespace

const char* to_string(DiscoveryErrc e) noexcept {
    switch (e) {
        case DiscoveryErrc::Connect:           return "connect";
        case DiscoveryErrc::Subscribe:         return "subscribe";
        case DiscoveryErrc::List:              return "list";
        case DiscoveryErrc::Fetch:             return "fetch";
        case DiscoveryErrc::Decode:            return "decode";
        case DiscoveryErrc::InvalidFunctionId: return "invalid_function_id";
        case DiscoveryErrc::SessionLost:       return "session_lost";
        case DiscoveryErrc::Stopped:           return "stopped";
    }
    return "unknown";
}

DiscoveryWatcher::DiscoveryWatcher(std::shared_ptr<SessionFactory> factory,
                                   routing::BackendDirectory& directory,
                                   config::DiscoveryConfig cfg,
                                   obs::Observer* observer)
    : factory_(std::move(factory)), directory_(directory), cfg_(std::move(cfg)), observer_(observer) {}

DiscoveryWatcher::~DiscoveryWatcher() {
    stop();
}

//------------------------------- Loading --------------------------------------

std::string DiscoveryWatcher::backends_path(const routing::FunctionId& function_id) const {
    return cfg_.function_root + "/" + routing::to_string(function_id) + "/" + BACKENDS_NODE;
}

std::optional<routing::FunctionId> DiscoveryWatcher::function_from_path(std::string_view path) const {
    const std::string_view root = cfg_.function_root;
    if (path.size() <= root.size() + 1 || path.substr(0, root.size()) != root || path[root.size()] != '/') {
        return std::nullopt;
    }
    path.remove_prefix(root.size() + 1);
    return routing::parse_function_id(path.substr(0, path.find('/')));
}

frontier_detail::expected<void, DiscoveryError>
DiscoveryWatcher::load_backends(CoordinationSession& session, const routing::FunctionId& function_id) {
    const std::string path = backends_path(function_id);

    auto data = session.get_data(path);
    if (!data) return fail(DiscoveryErrc::Fetch, data.error());

    auto backends = codec::decode_backends(data->bytes);
    if (!backends) {
        return fail(DiscoveryErrc::Decode, path + ": " + codec::to_string(backends.error()));
    }

    auto ring = std::make_shared<const routing::HashRing>(
        routing::HashRing::build(*backends, cfg_.replicas));

    const auto previous = directory_.get(function_id);
    spdlog::trace("Updating backends for function {}: old={}, new={} (version {})",
                  routing::to_string(function_id),
                  previous ? previous->backend_count() : 0,
                  ring->backend_count(),
                  data->version);

    directory_.put(function_id, std::move(ring));
    return {};
}

frontier_detail::expected<void, DiscoveryError> DiscoveryWatcher::scan(CoordinationSession& session) {
    auto names = session.list_children(cfg_.function_root);
    if (!names) return fail(DiscoveryErrc::List, names.error());

    std::vector<routing::FunctionId> functions;
    functions.reserve(names->size());
    for (const auto& name : *names) {
        auto id = routing::parse_function_id(name);
        if (!id) return fail(DiscoveryErrc::InvalidFunctionId, "invalid function znode name: " + name);
        functions.push_back(*id);
    }

    for (const auto& id : functions) {
        auto r = load_backends(session, id);
        if (r) continue;
        if (r.error().cause == CoordErrc::NoNode) {
            // Function node without a backends node yet: nothing to route to.
            directory_.remove(id);
            continue;
        }
        return r;
    }

    const auto dropped = directory_.retain_only(functions);
    if (dropped != 0) spdlog::debug("Resync dropped {} deleted function(s)", dropped);
    return {};
}

frontier_detail::expected<void, DiscoveryError> DiscoveryWatcher::initial_load() {
    auto session = factory_->connect();
    if (!session) return fail(DiscoveryErrc::Connect, session.error());
    spdlog::trace("Connected to coordination service");

    auto r = scan(**session);
    if (r) spdlog::info("Loaded {} function(s) from {}", directory_.size(), cfg_.function_root);
    return r;
}

//------------------------------- Watching -------------------------------------

frontier_detail::expected<void, DiscoveryError>
DiscoveryWatcher::apply(CoordinationSession& session, const WatchEvent& ev) {
    spdlog::trace("Coordination event: type={} state={} path={}",
                  to_string(ev.type), to_string(ev.state), ev.path);

    if (ev.type == EventType::Session) {
        if (is_terminal(ev.state)) {
            spdlog::error("Coordination session disconnected or terminal ({})", to_string(ev.state));
            return fail(DiscoveryErrc::SessionLost,
                        std::string("session ") + to_string(ev.state));
        }
        return {};
    }

    if (!ends_with(ev.path, std::string("/") + BACKENDS_NODE)) return {};

    switch (ev.type) {
        case EventType::NodeCreated:
        case EventType::NodeDataChanged: {
            auto id = function_from_path(ev.path);
            if (!id) return fail(DiscoveryErrc::InvalidFunctionId, "invalid function znode path: " + ev.path);
            spdlog::debug("Function {} {}", routing::to_string(*id),
                          ev.type == EventType::NodeCreated ? "created" : "backends updated");
            auto r = load_backends(session, *id);
            if (!r && r.error().cause == CoordErrc::NoNode) {
                // Deleted again before we could read it; the delete notification follows.
                directory_.remove(*id);
                return {};
            }
            return r;
        }
        case EventType::NodeDeleted: {
            auto id = function_from_path(ev.path);
            if (!id) return fail(DiscoveryErrc::InvalidFunctionId, "invalid function znode path: " + ev.path);
            spdlog::debug("Function {} deleted", routing::to_string(*id));
            directory_.remove(*id);
            return {};
        }
        default:
            spdlog::warn("Unexpected coordination event: type={} path={}", to_string(ev.type), ev.path);
            return {};
    }
}

frontier_detail::expected<void, DiscoveryError> DiscoveryWatcher::run_once() {
    if (stopping_.load(std::memory_order_acquire)) return fail(DiscoveryErrc::Stopped, "stopping");

    // Connected: brand-new session and subscription, never a resumed one.
    auto session = factory_->connect();
    if (!session) return fail(DiscoveryErrc::Connect, session.error());

    auto stream = (*session)->watch_recursive(cfg_.function_root);
    if (!stream) return fail(DiscoveryErrc::Subscribe, stream.error());

    {
        std::lock_guard<std::mutex> lk(mu_);
        if (stopping_.load(std::memory_order_acquire)) return fail(DiscoveryErrc::Stopped, "stopping");
        active_stream_ = stream->get();
    }
    struct Detach {
        DiscoveryWatcher* w;
        ~Detach() {
            w->watching_.store(false, std::memory_order_release);
            std::lock_guard<std::mutex> lk(w->mu_);
            w->active_stream_ = nullptr;
        }
    } detach{this};

    spdlog::trace("Watching {}", cfg_.function_root);

    // Catch up on whatever changed while no subscription was active.
    if (auto r = scan(**session); !r) return r;
    watching_.store(true, std::memory_order_release);

    for (;;) {
        const WatchEvent ev = (*stream)->next();
        if (stopping_.load(std::memory_order_acquire)) return fail(DiscoveryErrc::Stopped, "stopping");
        if (auto r = apply(**session, ev); !r) return r;
    }
}

//------------------------------- Supervisor -----------------------------------

void DiscoveryWatcher::supervise() {
    const auto delay = std::chrono::milliseconds(cfg_.restart_delay_ms);
    while (!stopping_.load(std::memory_order_acquire)) {
        iterations_.fetch_add(1, std::memory_order_relaxed);
        const auto r = run_once();
        if (stopping_.load(std::memory_order_acquire)) break;

        const std::string reason = std::string(to_string(r.error().code)) + ": " + r.error().detail;
        spdlog::error("Error in watch loop: {}", reason);
        restarts_.fetch_add(1, std::memory_order_relaxed);
        if (observer_) observer_->record_discovery_restart(reason);

        std::unique_lock<std::mutex> lk(mu_);
        cv_.wait_for(lk, delay, [this] { return stopping_.load(std::memory_order_acquire); });
    }
}

void DiscoveryWatcher::start() {
    if (worker_.joinable()) return;
    stopping_.store(false, std::memory_order_release);
    worker_ = std::thread([this] { supervise(); });
}

void DiscoveryWatcher::stop() {
    {
        std::lock_guard<std::mutex> lk(mu_);
        stopping_.store(true, std::memory_order_release);
        if (active_stream_) active_stream_->close();
    }
    cv_.notify_all();
    if (worker_.joinable()) worker_.join();
}

} // namespace frontier::discovery
