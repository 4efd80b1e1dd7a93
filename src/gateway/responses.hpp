#pragma once

#include "transport/common.h"

#include <string>

json create_error_response(int code, const std::string& message);

HttpResponse preflight_response();
HttpResponse method_not_allowed_response();
HttpResponse invalid_target_response();
HttpResponse bad_gateway_response();
HttpResponse internal_error_response();
