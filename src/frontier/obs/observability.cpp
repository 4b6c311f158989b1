/**
 * @file observability.cpp
 * @brief spdlog-backed Observer and default logger setup.
 */
#include "frontier/obs/observability.hpp"
#include "frontier/config/constants.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace frontier::obs {

    const char* to_string(RouteOutcome o) noexcept {
        switch (o) {
            case RouteOutcome::Routed:        return "routed";
            case RouteOutcome::NotFound:      return "not_found";
            case RouteOutcome::Unavailable:   return "unavailable";
            case RouteOutcome::UpstreamError: return "upstream_error";
            case RouteOutcome::BadRequest:    return "bad_request";
        }
        return "unknown";
    }

    class SimpleObserver : public Observer {
    public:
        void record(const RouteEvent& e) override {
            {
                std::lock_guard<std::mutex> lk(mu_);
                ctr_.requests++;
                switch (e.outcome) {
                    case RouteOutcome::Routed:        ctr_.routed++; break;
                    case RouteOutcome::NotFound:      ctr_.not_found++; break;
                    case RouteOutcome::Unavailable:   ctr_.unavailable++; break;
                    case RouteOutcome::UpstreamError: ctr_.upstream_errors++; break;
                    case RouteOutcome::BadRequest:    ctr_.bad_requests++; break;
                }
            }
            spdlog::debug(R"({{"function":"{}","client":"{}","backend":"{}","trace_id":"{}","outcome":"{}","status":{},"latency_us":{}}})",
                          e.function_id, e.client_ip, e.backend, e.trace_id,
                          to_string(e.outcome), e.status, e.latency_us);
        }

        void record_discovery_restart(std::string_view reason) override {
            uint64_t n = 0;
            {
                std::lock_guard<std::mutex> lk(mu_);
                n = ++ctr_.discovery_restarts;
            }
            spdlog::warn("Discovery restart #{}: {}", n, reason);
        }

        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_simple_observer() {
        static SimpleObserver obs; // process-wide singleton
        return &obs;
    }

    void init_logging(std::string_view level) {
        spdlog::drop("frontier");
        auto logger = spdlog::stdout_color_mt("frontier");
        logger->set_pattern(config::constants::LOG_PATTERN);
        logger->set_level(spdlog::level::from_str(std::string(level)));
        spdlog::set_default_logger(std::move(logger));
    }

} // namespace frontier::obs
