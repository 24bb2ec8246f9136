#include "control_server.hpp"

#include <httplib.h>
#include <spdlog/spdlog.h>

#include <limits>
#include <string>

#include "errors.hpp"

namespace {

void reply(httplib::Response& res, int status, const nlohmann::json& body) {
  res.status = status;
  res.set_content(body.dump(2, ' ', false, nlohmann::json::error_handler_t::replace),
                  "application/json");
}

void reply_error(httplib::Response& res, int status, const std::string& message) {
  reply(res, status, nlohmann::json{{"error", message}});
}

nlohmann::json parse_body(const httplib::Request& req) {
  if (req.body.empty()) return nlohmann::json::object();
  auto j = nlohmann::json::parse(req.body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    throw ConfigurationError("Request body must be a JSON object");
  }
  return j;
}

int get_int(const nlohmann::json& body, const char* key) {
  const auto v = body.at(key).get<long long>();
  if (v > std::numeric_limits<int>::max() || v < std::numeric_limits<int>::min()) {
    throw ConfigurationError(std::string("Invalid run request: ") + key + " out of range");
  }
  return static_cast<int>(v);
}

}  // namespace

RunConfiguration run_configuration_from_json(const nlohmann::json& body,
                                             const RunConfiguration& defaults) {
  RunConfiguration cfg = defaults;
  try {
    if (body.contains("experiment")) cfg.experiment_name = body.at("experiment").get<std::string>();
    if (body.contains("interval_seconds")) cfg.interval_seconds = get_int(body, "interval_seconds");
    if (body.contains("interval_minutes"))
      cfg.interval_seconds = interval_from_minutes(body.at("interval_minutes").get<long long>());
    if (body.contains("total_shots")) cfg.total_shots = get_int(body, "total_shots");
    if (body.contains("resolution"))
      cfg.resolution = parse_resolution(body.at("resolution").get<std::string>());
    if (body.contains("auto_video")) cfg.auto_video = body.at("auto_video").get<bool>();
  } catch (const nlohmann::json::exception& e) {
    throw ConfigurationError(std::string("Invalid run request: ") + e.what());
  }
  return cfg;
}

void register_routes(httplib::Server& svr, TimelapseSession& session, StatusBoard& board) {
  svr.Get("/healthz", [](const httplib::Request&, httplib::Response& res) {
    res.set_content("{\"status\":\"ok\"}", "application/json");
  });

  svr.Get("/run/status", [&](const httplib::Request&, httplib::Response& res) {
    nlohmann::json j = board.to_json();
    j["state"] = to_string(session.state());
    j["active"] = session.active();
    j["preview"] = session.preview_running();
    if (auto run = session.current_run()) j["folder"] = run->directory.string();
    reply(res, 200, j);
  });

  svr.Post("/run/start", [&](const httplib::Request& req, httplib::Response& res) {
    try {
      const auto cfg =
          run_configuration_from_json(parse_body(req), default_run_configuration(session.config()));
      auto handle = session.start_run(cfg);
      if (!handle) {
        reply_error(res, 409, "A timelapse is already running");
        return;
      }
      board.reset(cfg.total_shots);
      reply(res, 200, {{"started", true}, {"folder", handle->directory.string()}});
    } catch (const ConfigurationError& e) {
      reply_error(res, 400, e.what());
    } catch (const CommandNotFoundError& e) {
      spdlog::error("{}", e.what());
      reply_error(res, 503, e.what());
    } catch (const std::runtime_error& e) {
      spdlog::error("Failed to start timelapse: {}", e.what());
      reply_error(res, 500, e.what());
    } catch (const nlohmann::json::exception& e) {
      spdlog::error("Failed to start timelapse: {}", e.what());
      reply_error(res, 500, e.what());
    }
  });

  svr.Post("/run/stop", [&](const httplib::Request&, httplib::Response& res) {
    reply(res, 200, {{"stopping", session.cancel_run()}});
  });

  svr.Post("/preview/start", [&](const httplib::Request&, httplib::Response& res) {
    if (session.active()) {
      reply_error(res, 409, "Preview is unavailable while a timelapse is running");
      return;
    }
    try {
      reply(res, 200, {{"started", session.start_preview()}});
    } catch (const CommandNotFoundError& e) {
      reply_error(res, 503, e.what());
    } catch (const std::runtime_error& e) {
      reply_error(res, 500, std::string("Error starting preview: ") + e.what());
    }
  });

  svr.Post("/preview/stop", [&](const httplib::Request&, httplib::Response& res) {
    reply(res, 200, {{"stopped", session.stop_preview()}});
  });

  svr.Post("/video/assemble", [&](const httplib::Request& req, httplib::Response& res) {
    try {
      const auto body = parse_body(req);
      std::string folder = body.value("folder", std::string{});
      if (folder.empty()) {
        auto run = session.current_run();
        if (!run) {
          reply_error(res, 400, "No folder given and no run in this session");
          return;
        }
        folder = run->directory.string();
      }
      const auto video = session.assemble_video(folder, body.value("fps", 0),
                                                body.value("output", std::string{}));
      reply(res, 200, {{"video", video.string()}});
    } catch (const ConfigurationError& e) {
      reply_error(res, 400, e.what());
    } catch (const EncodingError& e) {
      spdlog::error("Error creating video: {}", e.what());
      reply_error(res, 500, e.what());
    } catch (const nlohmann::json::exception& e) {
      reply_error(res, 400, e.what());
    }
  });

  svr.Get("/metrics", [&](const httplib::Request&, httplib::Response& res) {
    auto& m = session.metrics();
    res.set_content(m.prometheus_text(m.snapshot()), "text/plain; version=0.0.4");
  });
}
