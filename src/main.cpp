#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <optional>
#include <string>

#include "search_engine.hpp"
#include "tools/AnalysisTools.hpp"
#include "tools/ToolRegistry.hpp"

using json = nlohmann::json;

class SharpmapServer {
public:
    SharpmapServer(std::string host, int port, long long query_timeout_ms)
        : host_(std::move(host)),
          port_(port),
          query_timeout_ms_(query_timeout_ms),
          engine_(std::make_shared<sharpmap::SearchEngine>())
    {
        sharpmap::register_analysis_tools(registry_, engine_);
        setup_routes();
    }

    bool run() {
        spdlog::info("🚀 Starting sharpmap tool server on {}:{}", host_, port_);
        return server_.listen(host_, port_);
    }

private:
    std::string host_;
    int port_;
    long long query_timeout_ms_;  // 0 = no deadline
    httplib::Server server_;
    std::shared_ptr<sharpmap::SearchEngine> engine_;
    sharpmap::ToolRegistry registry_;

    static void send_json(httplib::Response& res, const json& body) {
        res.set_content(body.dump(), "application/json");
    }

    // Error records map onto HTTP statuses; tool failures still carry the
    // structured body.
    static int status_for(const json& record) {
        if (record.value("success", false)) return 200;
        std::string code = record["error"].value("code", "");
        if (code == "NOT_FOUND") return 404;
        if (code == "PERMISSION_DENIED") return 403;
        if (code == "CANCELLED") return 409;
        return 400;
    }

    static std::optional<long long> timeout_param(const httplib::Request& req) {
        if (!req.has_param("timeout_ms")) return std::nullopt;
        try {
            return std::stoll(req.get_param_value("timeout_ms"));
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }

    // The registry is read-only once routes are set up. Each call gets its
    // own token; a positive per-request timeout overrides the server default.
    json call(const std::string& name, const json& args, long long timeout_ms) {
        if (timeout_ms <= 0) timeout_ms = query_timeout_ms_;
        if (timeout_ms <= 0) return registry_.dispatch(name, args);

        auto token = sharpmap::CancellationToken::after(std::chrono::milliseconds(timeout_ms));
        json record = registry_.dispatch(name, args, &token);
        if (status_for(record) == 409) {
            spdlog::warn("⏱️  {} hit its {} ms deadline", name, timeout_ms);
        }
        return record;
    }

    void setup_routes() {
        server_.Options("/(.*)", [](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            res.set_header("Access-Control-Allow-Headers", "Content-Type");
            res.status = 204;
        });

        server_.set_pre_routing_handler([](const httplib::Request&, httplib::Response& res) {
            res.set_header("Access-Control-Allow-Origin", "*");
            return httplib::Server::HandlerResponse::Unhandled;
        });

        server_.Get("/health", [this](const httplib::Request&, httplib::Response& res) {
            send_json(res, {{"status", "healthy"}, {"tools", registry_.size()}});
        });

        auto list_tools = [this](const httplib::Request&, httplib::Response& res) {
            send_json(res, {{"tools", registry_.get_manifest_json()}});
        };
        server_.Get("/tools/list", list_tools);
        server_.Post("/tools/list", list_tools);

        server_.Post("/tools/call", [this](const httplib::Request& req, httplib::Response& res) {
            try {
                auto body = json::parse(req.body);
                std::string name = body.value("name", "");
                json record = call(name, body.value("arguments", json::object()),
                                   body.value("timeout_ms", 0LL));
                res.status = status_for(record);
                send_json(res, record);
            } catch (const json::exception& e) {
                res.status = 400;
                send_json(res, sharpmap::error_record(sharpmap::ErrorCode::InvalidArgument,
                                                      std::string("Malformed request body: ") + e.what()));
            }
        });

        server_.Post("/tools/:name", [this](const httplib::Request& req, httplib::Response& res) {
            try {
                auto args = req.body.empty() ? json::object() : json::parse(req.body);
                json record = call(req.path_params.at("name"), args, timeout_param(req).value_or(0));
                res.status = status_for(record);
                send_json(res, record);
            } catch (const json::exception& e) {
                res.status = 400;
                send_json(res, sharpmap::error_record(sharpmap::ErrorCode::InvalidArgument,
                                                      std::string("Malformed request body: ") + e.what()));
            }
        });
    }
};

namespace {

void print_usage(const char* argv0) {
    spdlog::info("Usage: {} [--host ADDR] [--port N] [--query-timeout-ms N] "
                 "[--log-level trace|debug|info|warn|error]", argv0);
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);

    std::string host = "127.0.0.1";
    int port = 5002;
    long long query_timeout_ms = 0;
    std::string log_level;
    if (const char* env = std::getenv("SHARPMAP_LOG_LEVEL")) log_level = env;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) {
                spdlog::error("❌ Missing value for {}", arg);
                print_usage(argv[0]);
                std::exit(2);
            }
            return argv[++i];
        };
        if (arg == "--host") {
            host = next();
        } else if (arg == "--port") {
            std::string value = next();
            try {
                port = std::stoi(value);
            } catch (const std::exception&) {
                spdlog::error("❌ Invalid port: {}", value);
                return 2;
            }
        } else if (arg == "--query-timeout-ms") {
            std::string value = next();
            try {
                query_timeout_ms = std::stoll(value);
            } catch (const std::exception&) {
                spdlog::error("❌ Invalid timeout: {}", value);
                return 2;
            }
        } else if (arg == "--log-level") {
            log_level = next();
        } else if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else {
            spdlog::error("❌ Unknown option: {}", arg);
            print_usage(argv[0]);
            return 2;
        }
    }
    if (!log_level.empty()) spdlog::set_level(spdlog::level::from_str(log_level));

    SharpmapServer server(host, port, query_timeout_ms);
    if (!server.run()) {
        spdlog::error("❌ Could not bind {}:{}", host, port);
        return 1;
    }
    return 0;
}
