#pragma once
#include <nlohmann/json.hpp>

#include "observers.hpp"
#include "session.hpp"
#include "types.hpp"

namespace httplib {
class Server;
}

// Fields missing from `body` keep the config defaults. Throws ConfigurationError.
RunConfiguration run_configuration_from_json(const nlohmann::json& body,
                                             const RunConfiguration& defaults);

// Registers the HTTP control routes (run, preview, video, status, metrics).
void register_routes(httplib::Server& svr, TimelapseSession& session, StatusBoard& board);
