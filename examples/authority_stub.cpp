// Minimal remote authority for manual testing of the sync engine.
//
// Accepts POST <submit_path> with a JSON submission, deduplicates by the
// Idempotency-Key header and answers with server-adjusted authoritative
// fields. Work orders starting with "INVALID" are rejected with
// error_code "InvalidWorkOrder"; --flaky N answers the first N requests
// with 503.

#include "fts/core/config.hpp"
#include "fts/core/logging.hpp"
#include "fts/model/codec.hpp"
#include "fts/network/http_parser.hpp"
#include "fts/network/http_types.hpp"
#include "fts/network/socket.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <map>
#include <string>

using fts::network::HttpRequest;
using fts::network::HttpRequestParser;
using fts::network::HttpResponse;
using fts::network::HttpStatus;
using fts::network::HttpMethod;
using fts::network::Socket;

using json = nlohmann::json;

namespace {

volatile std::sig_atomic_t g_stop = 0;

void on_signal(int) {
    g_stop = 1;
}

HttpResponse make_json_response(HttpStatus status, const json& body) {
    HttpResponse response(status);
    response.set_header("Content-Type", "application/json");
    response.set_header("Connection", "close");
    response.set_body(body.dump());
    return response;
}

HttpResponse make_rejection(HttpStatus status, const std::string& code, const std::string& message) {
    return make_json_response(status, json{{"error_code", code}, {"message", message}});
}

struct RemoteSession {
    std::string remote_id;
    fts::Timestamp clock_in_time;
};

class Authority {
public:
    Authority(std::string submit_path, int flaky) : submit_path_(std::move(submit_path)), flaky_(flaky) {}

    HttpResponse handle(const HttpRequest& request) {
        spdlog::info("{} {}", fts::network::HttpMethodUtils::to_string(request.method), request.url);

        if (request.url != submit_path_) {
            return make_rejection(HttpStatus::NOT_FOUND, "NotFound", "Unknown path " + request.url);
        }
        if (request.method != HttpMethod::POST) {
            return make_rejection(HttpStatus::METHOD_NOT_ALLOWED, "MethodNotAllowed", "POST only");
        }
        if (flaky_ > 0) {
            --flaky_;
            return make_rejection(HttpStatus::SERVICE_UNAVAILABLE, "Unavailable", "Try again later");
        }

        const std::string key = request.get_header("Idempotency-Key");
        if (key.empty()) {
            return make_rejection(HttpStatus::BAD_REQUEST, "MissingIdempotencyKey", "Idempotency-Key required");
        }
        auto replay = responses_.find(key);
        if (replay != responses_.end()) {
            spdlog::info("Duplicate submission {} answered from the record", key);
            return replay->second;
        }

        auto doc = json::parse(request.body_as_string(), nullptr, false);
        if (doc.is_discarded()) {
            return make_rejection(HttpStatus::BAD_REQUEST, "MalformedJson", "Body is not JSON");
        }
        auto submission = fts::model::submission_from_json(doc);
        if (submission.is_error()) {
            return make_rejection(HttpStatus::BAD_REQUEST, "MalformedSubmission", submission.error().message);
        }

        HttpResponse response = apply(submission.value());
        // Only decisions are remembered; a retried key gets the same answer.
        if (response.status_code < 500) {
            responses_[key] = response;
        }
        return response;
    }

private:
    HttpResponse apply(const fts::model::Submission& submission) {
        const auto& payload = submission.payload;
        if (payload.work_order_id.rfind("INVALID", 0) == 0) {
            return make_rejection(HttpStatus::UNPROCESSABLE_ENTITY, "InvalidWorkOrder",
                                  "Work order " + payload.work_order_id + " is closed");
        }

        fts::model::AuthoritativeSessionFields fields;
        switch (submission.operation) {
            case fts::model::OperationType::CreateClockIn: {
                if (sessions_.count(payload.session_id) != 0) {
                    return make_rejection(HttpStatus::CONFLICT, "DuplicateClockIn", "Session already open");
                }
                // Server time is authoritative: round up to the next whole second.
                auto millis = fts::to_unix_millis(payload.occurred_at);
                auto adjusted = fts::from_unix_millis(((millis + 999) / 1000) * 1000);
                RemoteSession session{"R" + std::to_string(++next_id_), adjusted};
                sessions_[payload.session_id] = session;
                fields.remote_id = session.remote_id;
                fields.clock_in_time = session.clock_in_time;
                fields.rate_type = payload.rate_type;
                fields.work_order_id = payload.work_order_id;
                break;
            }

            case fts::model::OperationType::CreateClockOut: {
                auto it = sessions_.find(payload.session_id);
                if (it == sessions_.end()) {
                    return make_rejection(HttpStatus::UNPROCESSABLE_ENTITY, "UnknownSession",
                                          "No clock-in for session " + payload.session_id);
                }
                auto millis = fts::to_unix_millis(payload.occurred_at);
                auto adjusted = fts::from_unix_millis((millis / 1000) * 1000);
                if (adjusted <= it->second.clock_in_time) {
                    return make_rejection(HttpStatus::UNPROCESSABLE_ENTITY, "ClockOutBeforeClockIn",
                                          "Clock-out must follow clock-in");
                }
                fields.remote_id = it->second.remote_id;
                fields.clock_in_time = it->second.clock_in_time;
                fields.clock_out_time = adjusted;
                fields.duration_seconds =
                    std::chrono::duration_cast<std::chrono::seconds>(adjusted - it->second.clock_in_time).count();
                break;
            }

            case fts::model::OperationType::UpdateRate: {
                auto it = sessions_.find(payload.session_id);
                if (it == sessions_.end()) {
                    return make_rejection(HttpStatus::UNPROCESSABLE_ENTITY, "UnknownSession",
                                          "No clock-in for session " + payload.session_id);
                }
                fields.remote_id = it->second.remote_id;
                fields.rate_type = payload.rate_type;
                break;
            }
        }
        return make_json_response(HttpStatus::OK, fts::model::authoritative_fields_to_json(fields));
    }

    std::string submit_path_;
    int flaky_;
    int next_id_ = 0;
    std::map<std::string, RemoteSession> sessions_;
    std::map<std::string, HttpResponse> responses_;
};

void serve_connection(Socket& client, Authority& authority) {
    auto timeouts = client.set_timeouts(5000);
    if (timeouts.is_error()) {
        spdlog::warn("{}", timeouts.error().message);
    }

    HttpRequestParser parser;
    while (true) {
        auto chunk = client.receive(4096);
        if (chunk.is_error()) {
            spdlog::warn("Receive failed: {}", chunk.error().message);
            return;
        }
        if (chunk.value().empty()) {
            return;
        }
        auto parsed = parser.parse(reinterpret_cast<const char*>(chunk.value().data()), chunk.value().size());
        if (parsed.is_error()) {
            auto sent = client.send_all(
                make_rejection(HttpStatus::BAD_REQUEST, "MalformedRequest", parsed.error().message).serialize());
            if (sent.is_error()) {
                spdlog::warn("Send failed: {}", sent.error().message);
            }
            return;
        }
        if (parsed.value()) {
            break;
        }
    }

    auto sent = client.send_all(authority.handle(parser.get_request()).serialize());
    if (sent.is_error()) {
        spdlog::warn("Send failed: {}", sent.error().message);
    }
}

} // namespace

int main(int argc, char* argv[]) {
    fts::init_logging(fts::LoggingConfig{});

    fts::RemoteConfig remote;
    int flaky = 0;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            remote.port = static_cast<uint16_t>(std::stoi(argv[++i]));
        } else if (arg == "--flaky" && i + 1 < argc) {
            flaky = std::stoi(argv[++i]);
        } else if (arg == "--path" && i + 1 < argc) {
            remote.submit_path = argv[++i];
        }
    }

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    Socket listener;
    auto created = listener.create();
    if (created.is_error()) {
        spdlog::error("{}", created.error().message);
        return 1;
    }
    auto reuse = listener.set_reuse_address(true);
    if (reuse.is_error()) {
        spdlog::warn("{}", reuse.error().message);
    }
    auto bound = listener.bind("0.0.0.0", remote.port);
    if (bound.is_error()) {
        spdlog::error("{}", bound.error().message);
        return 1;
    }
    auto listening = listener.listen();
    if (listening.is_error()) {
        spdlog::error("{}", listening.error().message);
        return 1;
    }

    spdlog::info("Authority stub listening on port {} at {}", remote.port, remote.submit_path);

    Authority authority(remote.submit_path, flaky);
    while (!g_stop) {
        auto client = listener.accept();
        if (client.is_error()) {
            if (g_stop) {
                break;
            }
            spdlog::warn("{}", client.error().message);
            continue;
        }
        serve_connection(*client.value(), authority);
    }

    spdlog::info("Authority stub stopped");
    fts::shutdown_logging();
    return 0;
}
