#include "responses.hpp"

namespace {

const char* PLAIN_TEXT = "text/plain; charset=utf-8";

HttpResponse json_error(int code, const std::string& message) {
    HttpResponse response(code, create_error_response(code, message).dump(), "application/json; charset=utf-8");
    response.headers.emplace_back("Access-Control-Allow-Origin", "*");
    response.headers.emplace_back("Cache-Control", "no-store");
    return response;
}

} // namespace

json create_error_response(int code, const std::string& message) {
    return {
        {"error", true},
        {"code", code},
        {"message", message}
    };
}

HttpResponse preflight_response() {
    HttpResponse response(204, "", "");
    response.headers = {
        {"Access-Control-Allow-Origin", "*"},
        {"Access-Control-Allow-Methods", "GET,HEAD,OPTIONS"},
        {"Access-Control-Allow-Headers", "*"},
        {"Access-Control-Max-Age", "86400"},
    };
    return response;
}

HttpResponse method_not_allowed_response() {
    return HttpResponse(405, "Method not allowed", PLAIN_TEXT);
}

HttpResponse invalid_target_response() {
    return HttpResponse(400, "Invalid target", PLAIN_TEXT);
}

HttpResponse bad_gateway_response() {
    return json_error(502, "Bad gateway");
}

HttpResponse internal_error_response() {
    return json_error(500, "Internal server error");
}
