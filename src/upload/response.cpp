#include "wopan/upload/response.hpp"

namespace wopan::upload {

namespace {

using nlohmann::json;

std::string scalar_text(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number()) {
        return value.dump();
    }
    return {};
}

/// A zero or non-scalar fid does not mark the file as finalized
std::string fid_text(const json& value) {
    if (value.is_number() && value == 0) {
        return {};
    }
    return scalar_text(value);
}

std::string excerpt(const std::string& body) {
    constexpr std::size_t kMax = 200;
    return body.size() <= kMax ? body : body.substr(0, kMax) + "...";
}

} // namespace

Expected<RemoteResponse> interpret_response(const transport::TransportResponse& response) {
    if (response.status_code < 200 || response.status_code >= 300) {
        return Err<RemoteResponse>(make_error(
            ErrorKind::TransientTransport,
            "HTTP " + std::to_string(response.status_code) + ": " + excerpt(response.body)));
    }

    json body = json::parse(response.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return Err<RemoteResponse>(make_error(
            ErrorKind::TransientTransport,
            "Response is not a JSON object: " + excerpt(response.body)));
    }

    RemoteResponse decoded;
    if (auto it = body.find("code"); it != body.end()) {
        decoded.code = scalar_text(*it);
    }
    if (auto it = body.find("msg"); it != body.end()) {
        decoded.message = scalar_text(*it);
    }
    if (auto data = body.find("data"); data != body.end() && data->is_object()) {
        if (auto fid = data->find("fid"); fid != data->end()) {
            decoded.fid = fid_text(*fid);
        }
    }
    decoded.raw = std::move(body);

    if (!decoded.accepted()) {
        const auto message = decoded.message.empty() ? std::string("Unknown error") : decoded.message;
        return Err<RemoteResponse>(make_error(ErrorKind::ApplicationProtocol, "Wopan API Error: " + message));
    }
    return Ok<RemoteResponse, Error>(std::move(decoded));
}

} // namespace wopan::upload
