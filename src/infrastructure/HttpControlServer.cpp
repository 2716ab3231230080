/**
 * @file HttpControlServer.cpp
 * @brief Implementation of HttpControlServer.
 */

#include "infrastructure/HttpControlServer.hpp"
#include "application/TranscriptExporter.hpp"
#include "application/TranscriptionScheduler.hpp"
#include "domain/SchedulerErrors.hpp"
#include "infrastructure/JobRepositoryFs.hpp"

#include <httplib.h>
#include <iostream>
#include <nlohmann/json.hpp>

namespace stenodesk::infrastructure {

using json = nlohmann::json;
using application::ExportFormat;
using application::TranscriptExporter;
using domain::SchedulerErrorCode;

namespace {

const char* kJson = "application/json";

json ProgressJson(const application::ProgressReport& report) {
    json j;
    j["status"] = domain::StatusToString(report.status);
    j["current"] = report.progress.current;
    j["duration"] = report.progress.duration ? json(*report.progress.duration) : json(nullptr);
    j["progress"] = report.progress.percent ? json(*report.progress.percent) : json(nullptr);
    j["elapsed"] = report.elapsedSeconds ? json(*report.elapsedSeconds) : json(nullptr);
    j["live"] = report.live;
    return j;
}

json SegmentsJson(const std::vector<domain::Segment>& segments) {
    json arr = json::array();
    for (const auto& s : segments) {
        arr.push_back({{"start", s.start}, {"end", s.end}, {"text", s.text}});
    }
    return arr;
}

} // namespace

HttpControlServer::HttpControlServer(std::shared_ptr<application::TranscriptionScheduler> scheduler)
    : m_scheduler(std::move(scheduler)), m_server(std::make_unique<httplib::Server>()) {
    registerRoutes();
}

HttpControlServer::~HttpControlServer() {
    stop();
}

int HttpControlServer::StatusFor(const std::exception& e) {
    const auto* err = dynamic_cast<const domain::SchedulerError*>(&e);
    if (!err) {
        return 500;
    }
    switch (err->code()) {
        case SchedulerErrorCode::NotFound: return 404;
        case SchedulerErrorCode::PreconditionFailed: return 409;
        case SchedulerErrorCode::AlreadyRunning: return 409;
        case SchedulerErrorCode::Cancelled: return 499;
        case SchedulerErrorCode::EngineFailure: return 400;
        case SchedulerErrorCode::Persistence: return 500;
    }
    return 500;
}

void HttpControlServer::SendError(httplib::Response& res, const std::exception& e) {
    res.status = StatusFor(e);
    json body;
    if (res.status == 499) {
        body["status"] = "interrupted";
    }
    body["detail"] = e.what();
    res.set_content(body.dump(), kJson);
}

void HttpControlServer::registerRoutes() {
    auto& svr = *m_server;

    svr.Get("/api/health", [this](const httplib::Request&, httplib::Response& res) {
        json j;
        j["status"] = "ok";
        j["owner"] = m_scheduler->ownerId();
        auto current = m_scheduler->currentJobId();
        j["current_job"] = current ? json(*current) : json(nullptr);
        res.set_content(j.dump(), kJson);
    });

    svr.Get("/api/jobs", [this](const httplib::Request&, httplib::Response& res) {
        try {
            json arr = json::array();
            for (const auto& job : m_scheduler->listJobs()) {
                arr.push_back(JobRepositoryFs::ToJson(job));
            }
            res.set_content(arr.dump(), kJson);
        } catch (const std::exception& e) {
            SendError(res, e);
        }
    });

    svr.Post("/api/jobs", [this](const httplib::Request& req, httplib::Response& res) {
        try {
            json body = json::parse(req.body);
            auto job = m_scheduler->registerMedia(body.at("media_path").get<std::string>(), body.value("name", ""));
            res.status = 201;
            res.set_content(JobRepositoryFs::ToJson(job).dump(), kJson);
        } catch (const json::exception& e) {
            res.status = 400;
            res.set_content(json{{"detail", e.what()}}.dump(), kJson);
        } catch (const std::exception& e) {
            SendError(res, e);
        }
    });

    svr.Get(R"(/api/jobs/([0-9a-f]+))", [this](const httplib::Request& req, httplib::Response& res) {
        try {
            res.set_content(JobRepositoryFs::ToJson(m_scheduler->getJob(req.matches[1])).dump(), kJson);
        } catch (const std::exception& e) {
            SendError(res, e);
        }
    });

    svr.Delete(R"(/api/jobs/([0-9a-f]+))", [this](const httplib::Request& req, httplib::Response& res) {
        try {
            m_scheduler->removeJob(req.matches[1]);
            res.set_content(json{{"message", "Job deleted"}}.dump(), kJson);
        } catch (const std::exception& e) {
            SendError(res, e);
        }
    });

    svr.Post(R"(/api/jobs/([0-9a-f]+)/transcribe)", [this](const httplib::Request& req, httplib::Response& res) {
        try {
            auto result = m_scheduler->submit(req.matches[1]);
            json j;
            j["transcription"] = SegmentsJson(result.segments);
            j["elapsed"] = result.elapsedSeconds;
            res.set_content(j.dump(), kJson);
        } catch (const std::exception& e) {
            SendError(res, e);
        }
    });

    svr.Post(R"(/api/jobs/([0-9a-f]+)/pause)", [this](const httplib::Request& req, httplib::Response& res) {
        try {
            res.set_content(ProgressJson(m_scheduler->pause(req.matches[1])).dump(), kJson);
        } catch (const std::exception& e) {
            SendError(res, e);
        }
    });

    svr.Post(R"(/api/jobs/([0-9a-f]+)/resume)", [this](const httplib::Request& req, httplib::Response& res) {
        try {
            m_scheduler->resume(req.matches[1]);
            res.set_content(json{{"status", "transcribing"}}.dump(), kJson);
        } catch (const std::exception& e) {
            SendError(res, e);
        }
    });

    svr.Post(R"(/api/jobs/([0-9a-f]+)/cancel)", [this](const httplib::Request& req, httplib::Response& res) {
        try {
            bool cancelled = m_scheduler->cancelJob(req.matches[1]);
            res.set_content(json{{"cancelled", cancelled}}.dump(), kJson);
        } catch (const std::exception& e) {
            SendError(res, e);
        }
    });

    svr.Get(R"(/api/jobs/([0-9a-f]+)/progress)", [this](const httplib::Request& req, httplib::Response& res) {
        try {
            res.set_content(ProgressJson(m_scheduler->getProgress(req.matches[1])).dump(), kJson);
        } catch (const std::exception& e) {
            SendError(res, e);
        }
    });

    svr.Get(R"(/api/jobs/([0-9a-f]+)/export)", [this](const httplib::Request& req, httplib::Response& res) {
        try {
            auto job = m_scheduler->getJob(req.matches[1]);
            ExportFormat format = TranscriptExporter::ParseFormat(
                req.has_param("format") ? req.get_param_value("format") : "txt");
            if (job.segments.empty()) {
                throw domain::PreconditionFailedError("Job has no transcription yet: " + job.id);
            }
            std::string filename = job.id + "." + TranscriptExporter::Extension(format);
            res.set_header("Content-Disposition", "attachment; filename=\"" + filename + "\"");
            res.set_content(TranscriptExporter::Render(job.segments, format), TranscriptExporter::MimeType(format).c_str());
        } catch (const std::exception& e) {
            SendError(res, e);
        }
    });

    svr.Post("/api/queue", [this](const httplib::Request& req, httplib::Response& res) {
        try {
            json body = json::parse(req.body);
            auto result = m_scheduler->enqueue(body.at("ids").get<std::vector<std::string>>());
            res.set_content(json{{"queued", result.queued}, {"skipped", result.skipped}}.dump(), kJson);
        } catch (const json::exception& e) {
            res.status = 400;
            res.set_content(json{{"detail", e.what()}}.dump(), kJson);
        } catch (const std::exception& e) {
            SendError(res, e);
        }
    });

    svr.Post("/api/stop-all", [this](const httplib::Request&, httplib::Response& res) {
        try {
            m_scheduler->cancelAll();
            res.set_content(json{{"message", "Stopped"}}.dump(), kJson);
        } catch (const std::exception& e) {
            SendError(res, e);
        }
    });
}

bool HttpControlServer::start(const std::string& host, int port) {
    if (port == 0) {
        port = m_server->bind_to_any_port(host.c_str());
        if (port < 0) {
            std::cerr << "[HttpControlServer] Could not bind any port on " << host << std::endl;
            return false;
        }
    } else if (!m_server->bind_to_port(host.c_str(), port)) {
        std::cerr << "[HttpControlServer] Could not bind " << host << ":" << port << std::endl;
        return false;
    }
    m_port = port;
    m_thread = std::thread([this] { m_server->listen_after_bind(); });
    std::cout << "[HttpControlServer] Listening on " << host << ":" << port << std::endl;
    return true;
}

void HttpControlServer::stop() {
    if (m_server) {
        m_server->stop();
    }
    if (m_thread.joinable()) {
        m_thread.join();
    }
}

} // namespace stenodesk::infrastructure
