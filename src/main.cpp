#include <httplib.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <functional>
#include <memory>
#include <string>

#include "similarity_analyzer.hpp"
#include "similarity_config.hpp"
#include "ai/GeminiService.hpp"
#include "io/ProjectFileSource.hpp"
#include "KeyManager.hpp"
#include "LogManager.hpp"

using json = nlohmann::json;

class SimilarityServer {
public:
    SimilarityServer(int port, code_similarity::SimilarityConfig config)
        : port_(port)
    {
        auto key_manager = std::make_shared<code_similarity::KeyManager>();
        auto generator = std::make_shared<code_similarity::GeminiService>(key_manager);
        auto file_source = std::make_shared<code_similarity::LocalProjectFileSource>();
        analyzer_ = std::make_unique<code_similarity::SimilarityAnalyzer>(file_source, generator, config);

        unsubscribe_progress_ = analyzer_->on_progress([](int progress) {
            spdlog::info("📊 Analysis progress: {}%", progress);
        });
        setup_routes();
    }

    ~SimilarityServer() {
        if (unsubscribe_progress_) unsubscribe_progress_();
    }

    void run() {
        spdlog::info("🚀 Starting code similarity service on port {}", port_);
        if (!server_.listen("127.0.0.1", port_)) {
            spdlog::error("❌ Could not bind 127.0.0.1:{}", port_);
        }
    }

private:
    int port_;
    httplib::Server server_;
    std::unique_ptr<code_similarity::SimilarityAnalyzer> analyzer_;
    std::function<void()> unsubscribe_progress_;

    static void send_json(httplib::Response& res, const json& body, int status = 200) {
        res.status = status;
        res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
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

        server_.Post("/api/similarity/analyze", [this](const httplib::Request& req, httplib::Response& res) {
            this->handle_analyze(req, res);
        });

        server_.Post("/api/similarity/compare", [this](const httplib::Request& req, httplib::Response& res) {
            this->handle_compare(req, res);
        });

        server_.Get("/api/similarity/report", [this](const httplib::Request& req, httplib::Response& res) {
            std::string project_path = req.get_param_value("project_path");
            auto report = analyzer_->get_last_report(project_path);
            if (!report) {
                send_json(res, {{"error", "No report for " + project_path}}, 404);
                return;
            }
            send_json(res, report->to_json());
        });

        server_.Post("/api/similarity/cache/clear", [this](const httplib::Request&, httplib::Response& res) {
            analyzer_->clear_cache();
            send_json(res, {{"success", true}});
        });

        server_.Get("/api/similarity/status", [this](const httplib::Request&, httplib::Response& res) {
            send_json(res, {
                {"is_analyzing", analyzer_->is_analyzing()},
                {"progress", analyzer_->analysis_progress()}
            });
        });

        server_.Get("/api/admin/interactions", [](const httplib::Request&, httplib::Response& res) {
            send_json(res, {{"logs", code_similarity::LogManager::instance().get_logs_json()}});
        });
    }

    void handle_analyze(const httplib::Request& req, httplib::Response& res) {
        try {
            auto body = json::parse(req.body);
            std::string project_path = body.value("project_path", "");
            if (project_path.empty()) project_path = body.value("projectPath", "");
            if (project_path.empty()) throw std::runtime_error("Missing project_path");

            auto report = analyzer_->analyze_project(project_path);
            send_json(res, report.to_json());
        } catch (const code_similarity::AnalysisInProgressError& e) {
            send_json(res, {{"error", e.what()}}, 409);
        } catch (const std::exception& e) {
            spdlog::error("❌ Analyze request error: {}", e.what());
            send_json(res, {{"error", e.what()}}, 500);
        }
    }

    void handle_compare(const httplib::Request& req, httplib::Response& res) {
        try {
            auto body = json::parse(req.body);
            std::string file1 = body.value("file1", "");
            std::string file2 = body.value("file2", "");
            if (file1.empty() || file2.empty()) throw std::runtime_error("Missing file1/file2");

            json matches = json::array();
            for (const auto& m : analyzer_->compare_files(file1, file2)) matches.push_back(m.to_json());
            send_json(res, {{"matches", matches}});
        } catch (const std::exception& e) {
            spdlog::error("❌ Compare request error: {}", e.what());
            send_json(res, {{"error", e.what()}}, 500);
        }
    }
};

int main(int argc, char* argv[]) {
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
    spdlog::set_level(spdlog::level::info);
    if (const char* level = std::getenv("CODE_SIMILARITY_LOG_LEVEL")) {
        spdlog::set_level(spdlog::level::from_str(level));
    }

    int port = 5003;
    if (argc > 1) {
        port = std::atoi(argv[1]);
    } else if (const char* env_port = std::getenv("CODE_SIMILARITY_PORT")) {
        port = std::atoi(env_port);
    }
    if (port <= 0) {
        spdlog::error("Invalid port, expected a positive number");
        return 1;
    }

    // Analysis knobs come from the working directory's config, if any
    auto config = code_similarity::ProjectConfig::load(".").similarity;

    SimilarityServer server(port, config);
    server.run();
    return 0;
}
