#include "fts/network/http_remote_endpoint.hpp"

#include "fts/model/codec.hpp"
#include "fts/network/http_parser.hpp"
#include "fts/network/socket.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace fts::network {
namespace {

constexpr size_t kReceiveChunk = 4096;

bool is_transient_status(int status) {
    return status == static_cast<int>(HttpStatus::REQUEST_TIMEOUT) ||
           status == static_cast<int>(HttpStatus::TOO_MANY_REQUESTS) ||
           (status >= 500 && status < 600);
}

std::string rejection_reason(const HttpResponse& response) {
    auto doc = nlohmann::json::parse(response.body_as_string(), nullptr, false);
    if (doc.is_object()) {
        auto code = doc.find("error_code");
        if (code != doc.end() && code->is_string() && !code->get<std::string>().empty()) {
            return code->get<std::string>();
        }
    }
    return "HTTP " + std::to_string(response.status_code) +
           (response.reason_phrase.empty() ? "" : " " + response.reason_phrase);
}

} // namespace

Result<model::AuthoritativeSessionFields> interpret_submit_response(const HttpResponse& response) {
    using Fields = model::AuthoritativeSessionFields;

    if (response.is_success()) {
        auto doc = nlohmann::json::parse(response.body_as_string(), nullptr, false);
        if (doc.is_discarded()) {
            return Err<Fields>(Error::permanent("MalformedResponse"));
        }
        auto fields = model::authoritative_fields_from_json(doc);
        if (fields.is_error()) {
            return Err<Fields>(Error::permanent("MalformedResponse: " + fields.error().message));
        }
        return fields;
    }

    if (is_transient_status(response.status_code)) {
        return Err<Fields>(Error::transient(rejection_reason(response)));
    }
    return Err<Fields>(Error::permanent(rejection_reason(response)));
}

Result<HttpRequest> HttpRemoteEndpoint::build_request(model::OperationType operation,
                                                      const model::ActionPayload& payload,
                                                      const std::string& idempotency_key) const {
    model::Submission submission{operation, payload, idempotency_key};
    auto body = model::dump_json(model::submission_to_json(submission));
    if (body.is_error()) {
        return Err<HttpRequest>(body.error());
    }

    HttpRequest request;
    request.method = HttpMethod::POST;
    request.url = config_.submit_path;
    request.set_header("Host", config_.host + ":" + std::to_string(config_.port));
    request.set_header("Content-Type", "application/json");
    request.set_header("Accept", "application/json");
    request.set_header("Connection", "close");
    request.set_header("Idempotency-Key", idempotency_key);
    request.set_body(body.value());
    return Ok(request);
}

Result<model::AuthoritativeSessionFields> HttpRemoteEndpoint::submit(model::OperationType operation,
                                                                     const model::ActionPayload& payload,
                                                                     const std::string& idempotency_key) {
    auto request = build_request(operation, payload, idempotency_key);
    if (request.is_error()) {
        return Err<model::AuthoritativeSessionFields>(Error::permanent(request.error().message));
    }

    auto response = exchange(request.value());
    if (response.is_error()) {
        spdlog::debug("Submission {} not delivered: {}", idempotency_key, response.error().message);
        return Err<model::AuthoritativeSessionFields>(Error::transient(response.error().message));
    }

    spdlog::debug("Submission {} answered with HTTP {}", idempotency_key, response.value().status_code);
    return interpret_submit_response(response.value());
}

Result<HttpResponse> HttpRemoteEndpoint::exchange(const HttpRequest& request) {
    Socket socket;
    auto connected = socket.connect(config_.host, config_.port, config_.timeout_ms);
    if (connected.is_error()) {
        return Err<HttpResponse>(connected.error());
    }
    auto timeouts = socket.set_timeouts(config_.timeout_ms);
    if (timeouts.is_error()) {
        return Err<HttpResponse>(timeouts.error());
    }

    auto sent = socket.send_all(request.serialize());
    if (sent.is_error()) {
        return Err<HttpResponse>(sent.error());
    }

    HttpResponseParser parser;
    while (true) {
        auto chunk = socket.receive(kReceiveChunk);
        if (chunk.is_error()) {
            return Err<HttpResponse>(chunk.error());
        }

        if (chunk.value().empty()) {
            auto finished = parser.finish();
            if (finished.is_error()) {
                return Err<HttpResponse>(finished.error());
            }
            break;
        }

        auto parsed = parser.parse(reinterpret_cast<const char*>(chunk.value().data()), chunk.value().size());
        if (parsed.is_error()) {
            return Err<HttpResponse>(parsed.error());
        }
        if (parsed.value()) {
            break;
        }
    }
    return Ok(parser.get_response());
}

} // namespace fts::network
