#include <cassert>
#include <httplib.h>
#include <iostream>
#include <nlohmann/json.hpp>
#include <thread>

#include "application/TranscriptionScheduler.hpp"
#include "infrastructure/HttpControlServer.hpp"
#include "infrastructure/JobRepositoryFs.hpp"
#include "infrastructure/PersistenceService.hpp"
#include "test/TestSupport.hpp"

using namespace stenodesk;
using infrastructure::HttpControlServer;
using json = nlohmann::json;

int main() {
    std::cout << "[Test] Starting HttpControlServer Test..." << std::endl;

    assert(HttpControlServer::StatusFor(domain::NotFoundError("x")) == 404);
    assert(HttpControlServer::StatusFor(domain::AlreadyRunningError("x")) == 409);
    assert(HttpControlServer::StatusFor(domain::PreconditionFailedError("x")) == 409);
    assert(HttpControlServer::StatusFor(domain::CancelledError()) == 499);
    assert(HttpControlServer::StatusFor(domain::EngineFailureError("x")) == 400);
    assert(HttpControlServer::StatusFor(domain::PersistenceError("x")) == 500);
    assert(HttpControlServer::StatusFor(std::runtime_error("x")) == 500);
    std::cout << "[PASS] Error status mapping." << std::endl;

    test::TempDir dir("http");
    auto persistence = std::make_shared<infrastructure::PersistenceService>();
    auto repo = std::make_shared<infrastructure::JobRepositoryFs>(dir.str(), persistence);
    auto engine = std::make_shared<test::FakeTranscriptionEngine>(test::MakeSegments(3), 30.0);
    auto scheduler = std::make_shared<application::TranscriptionScheduler>(repo, engine, nullptr);
    assert(scheduler->startup());

    HttpControlServer server(scheduler);
    assert(server.start("127.0.0.1", 0));
    assert(server.port() > 0);
    httplib::Client client("127.0.0.1", server.port());

    auto res = client.Get("/api/health");
    assert(res && res->status == 200);
    assert(json::parse(res->body)["status"] == "ok");
    assert(json::parse(res->body)["current_job"].is_null());

    std::string media = dir.touch("talk.wav");
    res = client.Post("/api/jobs", json{{"media_path", media}, {"name", "Talk"}}.dump(), "application/json");
    assert(res && res->status == 201);
    json created = json::parse(res->body);
    std::string id = created["id"].get<std::string>();
    assert(created["status"] == "waiting");
    assert(created["name"] == "Talk");

    res = client.Post("/api/jobs", "{}", "application/json");
    assert(res && res->status == 400);
    res = client.Post("/api/jobs", json{{"media_path", dir.str() + "/nope.wav"}}.dump(), "application/json");
    assert(res && res->status == 404);
    std::cout << "[PASS] Registration" << std::endl;

    res = client.Get(("/api/jobs/" + id).c_str());
    assert(res && res->status == 200 && json::parse(res->body)["id"] == id);
    res = client.Get("/api/jobs/ffff");
    assert(res && res->status == 404);

    res = client.Post(("/api/jobs/" + id + "/pause").c_str(), "", "application/json");
    assert(res && res->status == 409);
    res = client.Get(("/api/jobs/" + id + "/export?format=vtt").c_str());
    assert(res && res->status == 409);

    res = client.Post(("/api/jobs/" + id + "/transcribe").c_str(), "", "application/json");
    assert(res && res->status == 200);
    assert(json::parse(res->body)["transcription"].size() == 3);

    res = client.Get(("/api/jobs/" + id + "/progress").c_str());
    assert(res && res->status == 200);
    json progress = json::parse(res->body);
    assert(progress["status"] == "done");
    assert(progress["progress"] == 100.0);
    assert(progress["live"] == false);
    std::cout << "[PASS] Transcribe and progress" << std::endl;

    res = client.Get(("/api/jobs/" + id + "/export?format=srt").c_str());
    assert(res && res->status == 200);
    assert(res->get_header_value("Content-Type") == "application/x-subrip");
    assert(res->body.rfind("1\n00:00:00,000 --> 00:00:10,000\nseg-0\n\n", 0) == 0);
    res = client.Get(("/api/jobs/" + id + "/export?format=docx").c_str());
    assert(res && res->status == 409);
    std::cout << "[PASS] Export" << std::endl;

    res = client.Post("/api/queue", json{{"ids", json::array({id})}}.dump(), "application/json");
    assert(res && res->status == 200);
    assert(json::parse(res->body)["skipped"].size() == 1);
    res = client.Post("/api/queue", json{{"ids", json::array({"abc"})}}.dump(), "application/json");
    assert(res && res->status == 404);
    res = client.Post("/api/queue", "not json", "application/json");
    assert(res && res->status == 400);

    res = client.Post("/api/stop-all", "", "application/json");
    assert(res && res->status == 200);

    res = client.Delete(("/api/jobs/" + id).c_str());
    assert(res && res->status == 200);
    res = client.Get(("/api/jobs/" + id).c_str());
    assert(res && res->status == 404);
    std::cout << "[PASS] Queue, stop-all and delete" << std::endl;

    // A transcribe request in flight is answered once stop-all interrupts it,
    // which lets the listener shut down.
    std::string longId = json::parse(client.Post("/api/jobs", json{{"media_path", dir.touch("long.wav")}}.dump(),
                                                 "application/json")->body)["id"].get<std::string>();
    engine->holdAt(engine->emitted() + 1);
    int inflightStatus = 0;
    std::string inflightBody;
    std::thread inflight([&] {
        httplib::Client other("127.0.0.1", server.port());
        other.set_read_timeout(30, 0);
        auto r = other.Post(("/api/jobs/" + longId + "/transcribe").c_str(), "", "application/json");
        if (r) {
            inflightStatus = r->status;
            inflightBody = r->body;
        }
    });
    assert(engine->waitUntilHeld());
    assert(scheduler->pause(longId).live);
    engine->release();

    scheduler->cancelAll();
    inflight.join();
    assert(inflightStatus == 499);
    assert(json::parse(inflightBody)["status"] == "interrupted");
    assert(scheduler->getJob(longId).status == domain::JobStatus::Interrupted);

    server.stop();
    scheduler->shutdown();
    std::cout << "[PASS] Stop-all releases an in-flight transcribe before the server stops" << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
