#include "config.hpp"
#include "cache_provider.hpp"
#include "health.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <signal.h>
#include <atomic>
#include <regex>
#include <thread>

std::atomic<bool> shutdown_requested{false};

void signal_handler(int signal) {
    spdlog::info("Received signal {}, initiating shutdown", signal);
    shutdown_requested = true;
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("tiercache", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

void send_json(httplib::Response& res, int status, const nlohmann::json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void handle_invalidate(CacheProvider& provider, const httplib::Request& req, httplib::Response& res) {
    nlohmann::json body;
    try {
        body = nlohmann::json::parse(req.body);
    } catch (const std::exception&) {
        send_json(res, 400, {{"ok", false}, {"error", "Invalid JSON body"}});
        return;
    }

    auto cache = provider.get();

    try {
        size_t removed = 0;
        if (body.contains("key") && body["key"].is_string()) {
            cache->remove(body["key"].get<std::string>());
            removed = 1;
        } else if (body.contains("tag") && body["tag"].is_string()) {
            removed = cache->invalidate_by_tag(body["tag"].get<std::string>());
        } else if (body.contains("pattern") && body["pattern"].is_string()) {
            removed = cache->invalidate_by_pattern(body["pattern"].get<std::string>());
        } else {
            send_json(res, 400, {{"ok", false}, {"error", "Expected one of key, tag or pattern"}});
            return;
        }

        spdlog::info("Invalidation {} removed {} entries", body.dump(), removed);
        send_json(res, 200, {{"ok", true}, {"removed", removed}});

    } catch (const std::regex_error& e) {
        send_json(res, 400, {{"ok", false}, {"error", std::string("Invalid pattern: ") + e.what()}});
    }
}

int main(int argc, char* argv[]) {
    try {
        auto config = Config::from_env();
        setup_logging(config.log_level);

        spdlog::info("==============================================");
        spdlog::info("tiercache v{}", config.service_version);
        spdlog::info("==============================================");

        config.validate();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        CacheProvider provider(TieredCacheOptions::from_config(config));
        HealthCheck health(provider, config);

        // Connect eagerly so the first request does not pay for it
        provider.get();

        httplib::Server server;

        server.Get("/health", [&health](const httplib::Request&, httplib::Response& res) {
            send_json(res, 200, health.get_status());
        });

        server.Get("/stats", [&provider](const httplib::Request&, httplib::Response& res) {
            send_json(res, 200, provider.get()->get_stats());
        });

        server.Post("/invalidate", [&provider](const httplib::Request& req, httplib::Response& res) {
            handle_invalidate(provider, req, res);
        });

        server.Post("/clear", [&provider](const httplib::Request&, httplib::Response& res) {
            provider.get()->clear();
            spdlog::info("Cache cleared");
            send_json(res, 200, {{"ok", true}});
        });

        std::thread http_thread([&server, &config]() {
            spdlog::info("Starting HTTP server on {}:{}", config.listen_addr, config.listen_port);
            server.listen(config.listen_addr.c_str(), config.listen_port);
        });

        spdlog::info("tiercache started");

        while (!shutdown_requested) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        spdlog::info("Stopping services...");
        server.stop();
        if (http_thread.joinable()) http_thread.join();

        provider.get()->flush();

        spdlog::info("Shutdown complete");
        return 0;

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
