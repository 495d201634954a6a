#include "opsrelay/app/api/api_server.hpp"

#include "opsrelay/app/application.hpp"
#include "opsrelay/app/http/http_server.hpp"
#include "opsrelay/app/http/router.hpp"
#include "opsrelay/app/http/sse_channel.hpp"
#include "opsrelay/app/services/batch_service.hpp"
#include "opsrelay/core/coroutine.hpp"
#include "opsrelay/execution/execution_queue.hpp"
#include "opsrelay/streaming/stream_frame.hpp"
#include "opsrelay/streaming/streaming_hub.hpp"
#include "opsrelay/util/json.hpp"
#include "opsrelay/util/log.hpp"
#include "opsrelay/util/time.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace opsrelay {

using namespace http;

namespace api_dto {

struct BatchRequestDto {
  std::vector<std::string> target_node_ids;
  std::vector<std::string> target_group_ids;
  std::string type;
  std::string action;
  std::map<std::string, JsonValue> parameters;
};

struct BatchResponseDto {
  std::string batch_id;
  std::vector<std::string> execution_ids;
  std::size_t target_count{0};
  std::vector<std::string> expanded_node_ids;
};

struct ExecutionDto {
  std::string id;
  std::optional<std::string> batch_id;
  std::optional<std::size_t> batch_position;
  std::string node_id;
  std::string type;
  std::string action;
  std::map<std::string, std::string> parameters;
  std::string status;
  std::string submitted_at;
  std::optional<std::string> started_at;
  std::optional<std::string> completed_at;
  std::optional<int> exit_code;
  std::optional<std::string> error;
};

struct QueuedExecutionDto {
  std::string id;
  std::string type;
  std::string node_id;
  std::string action;
  std::string enqueued_at;
  std::int64_t wait_time{0};
};

struct QueueDto {
  std::size_t running{0};
  std::size_t queued{0};
  std::size_t limit{0};
  std::size_t available{0};
  std::size_t max_queue_size{0};
  std::vector<QueuedExecutionDto> queued_executions;
};

struct QueueStatusResponseDto {
  QueueDto queue;
};

struct BatchStatsDto {
  std::size_t total{0};
  std::size_t queued{0};
  std::size_t running{0};
  std::size_t success{0};
  std::size_t failed{0};
  std::size_t cancelled{0};
};

struct BatchStatusDto {
  std::string id;
  std::string type;
  std::string action;
  std::vector<std::string> target_nodes;
  std::string status;
  std::string created_at;
  int progress{0};
  BatchStatsDto stats;
  std::vector<ExecutionDto> executions;
};

struct ErrorBodyDto {
  std::string code;
  std::string message;
};

struct ErrorResponseDto {
  ErrorBodyDto error;
};

struct ExecutionCancelDto {
  bool cancelled{true};
  std::string id;
};

struct BatchCancelDto {
  std::size_t cancelled{0};
  std::string batch_id;
};

struct HealthDto {
  std::string status;
  std::size_t running{0};
  std::size_t queued{0};
  std::string timestamp;
};

} // namespace api_dto

} // namespace opsrelay

namespace glz {

template <> struct meta<opsrelay::api_dto::BatchRequestDto> {
  using T = opsrelay::api_dto::BatchRequestDto;
  static constexpr auto value = object(
      "targetNodeIds", &T::target_node_ids, "targetGroupIds",
      &T::target_group_ids, "type", &T::type, "action", &T::action,
      "parameters", &T::parameters);
};

template <> struct meta<opsrelay::api_dto::BatchResponseDto> {
  using T = opsrelay::api_dto::BatchResponseDto;
  static constexpr auto value =
      object("batchId", &T::batch_id, "executionIds", &T::execution_ids,
             "targetCount", &T::target_count, "expandedNodeIds",
             &T::expanded_node_ids);
};

template <> struct meta<opsrelay::api_dto::ExecutionDto> {
  using T = opsrelay::api_dto::ExecutionDto;
  static constexpr auto value = object(
      "id", &T::id, "batchId", &T::batch_id, "batchPosition",
      &T::batch_position, "nodeId", &T::node_id, "type", &T::type, "action",
      &T::action, "parameters", &T::parameters, "status", &T::status,
      "submittedAt", &T::submitted_at, "startedAt", &T::started_at,
      "completedAt", &T::completed_at, "exitCode", &T::exit_code, "error",
      &T::error);
};

template <> struct meta<opsrelay::api_dto::QueuedExecutionDto> {
  using T = opsrelay::api_dto::QueuedExecutionDto;
  static constexpr auto value =
      object("id", &T::id, "type", &T::type, "nodeId", &T::node_id, "action",
             &T::action, "enqueuedAt", &T::enqueued_at, "waitTime",
             &T::wait_time);
};

template <> struct meta<opsrelay::api_dto::QueueDto> {
  using T = opsrelay::api_dto::QueueDto;
  static constexpr auto value =
      object("running", &T::running, "queued", &T::queued, "limit", &T::limit,
             "available", &T::available, "maxQueueSize", &T::max_queue_size,
             "queuedExecutions", &T::queued_executions);
};

template <> struct meta<opsrelay::api_dto::QueueStatusResponseDto> {
  using T = opsrelay::api_dto::QueueStatusResponseDto;
  static constexpr auto value = object("queue", &T::queue);
};

template <> struct meta<opsrelay::api_dto::BatchStatsDto> {
  using T = opsrelay::api_dto::BatchStatsDto;
  static constexpr auto value =
      object("total", &T::total, "queued", &T::queued, "running", &T::running,
             "success", &T::success, "failed", &T::failed, "cancelled",
             &T::cancelled);
};

template <> struct meta<opsrelay::api_dto::BatchStatusDto> {
  using T = opsrelay::api_dto::BatchStatusDto;
  static constexpr auto value =
      object("id", &T::id, "type", &T::type, "action", &T::action,
             "targetNodes", &T::target_nodes, "status", &T::status,
             "createdAt", &T::created_at, "progress", &T::progress, "stats",
             &T::stats, "executions", &T::executions);
};

template <> struct meta<opsrelay::api_dto::ErrorBodyDto> {
  using T = opsrelay::api_dto::ErrorBodyDto;
  static constexpr auto value = object("code", &T::code, "message", &T::message);
};

template <> struct meta<opsrelay::api_dto::ErrorResponseDto> {
  using T = opsrelay::api_dto::ErrorResponseDto;
  static constexpr auto value = object("error", &T::error);
};

template <> struct meta<opsrelay::api_dto::ExecutionCancelDto> {
  using T = opsrelay::api_dto::ExecutionCancelDto;
  static constexpr auto value = object("cancelled", &T::cancelled, "id", &T::id);
};

template <> struct meta<opsrelay::api_dto::BatchCancelDto> {
  using T = opsrelay::api_dto::BatchCancelDto;
  static constexpr auto value =
      object("cancelled", &T::cancelled, "batchId", &T::batch_id);
};

template <> struct meta<opsrelay::api_dto::HealthDto> {
  using T = opsrelay::api_dto::HealthDto;
  static constexpr auto value =
      object("status", &T::status, "running", &T::running, "queued",
             &T::queued, "timestamp", &T::timestamp);
};

} // namespace glz

namespace opsrelay {

auto status_from_error(const std::error_code &ec) -> HttpStatus {
  if (ec.category() == error_category()) {
    switch (static_cast<Error>(ec.value())) {
    case Error::NotFound:
    case Error::FileNotFound:
      return HttpStatus::NotFound;
    case Error::InvalidArgument:
    case Error::ParseError:
    case Error::TargetResolution:
      return HttpStatus::BadRequest;
    case Error::QueueFull:
      return HttpStatus::TooManyRequests;
    case Error::InvalidState:
    case Error::AlreadyExists:
      return HttpStatus::Conflict;
    case Error::NotSupported:
      return HttpStatus::NotImplemented;
    case Error::ResourceExhausted:
    case Error::SystemNotRunning:
      return HttpStatus::ServiceUnavailable;
    default:
      break;
    }
  }
  return HttpStatus::InternalServerError;
}

auto queue_full_message(std::size_t max_queue_size) -> std::string {
  return std::format("Execution queue is full. Maximum queue size: {}. Please "
                     "wait for running executions to complete.",
                     max_queue_size);
}

namespace {

[[nodiscard]] auto error_code_name(const std::error_code &ec)
    -> std::string_view {
  if (ec.category() != error_category()) {
    return "INTERNAL_SERVER_ERROR";
  }
  switch (static_cast<Error>(ec.value())) {
  case Error::NotFound:
    return "NOT_FOUND";
  case Error::InvalidArgument:
  case Error::ParseError:
    return "INVALID_REQUEST";
  case Error::TargetResolution:
    return "TARGET_RESOLUTION_FAILED";
  case Error::QueueFull:
    return "QUEUE_FULL";
  case Error::InvalidState:
    return "INVALID_STATE";
  case Error::NotSupported:
    return "NOT_SUPPORTED";
  default:
    return "INTERNAL_SERVER_ERROR";
  }
}

template <typename T>
auto json_response_glz(const T &value, HttpStatus status = HttpStatus::Ok)
    -> HttpResponse {
  auto body = write_json_as(value);
  if (!body) {
    log::error("JSON serialization failed for API response");
    return HttpResponse::json(HttpStatus::InternalServerError,
                              R"({"error":{"code":"INTERNAL_SERVER_ERROR",)"
                              R"("message":"JSON serialization failed"}})");
  }
  return HttpResponse::json(status, *body);
}

auto error_response(HttpStatus status, std::string_view code,
                    std::string message) -> HttpResponse {
  return json_response_glz(
      api_dto::ErrorResponseDto{
          .error = {.code = std::string(code), .message = std::move(message)}},
      status);
}

auto error_response(const std::error_code &ec, std::string message)
    -> HttpResponse {
  return error_response(status_from_error(ec), error_code_name(ec),
                        std::move(message));
}

auto unavailable() -> HttpResponse {
  return error_response(HttpStatus::ServiceUnavailable, "UNAVAILABLE",
                        "Service is shutting down");
}

template <IsTypedId Id> auto id_strings(const std::vector<Id> &ids) {
  std::vector<std::string> out;
  out.reserve(ids.size());
  for (const auto &id : ids) {
    out.push_back(id.str());
  }
  return out;
}

auto optional_time(const std::optional<std::chrono::system_clock::time_point>
                       &tp) -> std::optional<std::string> {
  if (!tp) {
    return std::nullopt;
  }
  return util::format_iso8601(*tp);
}

auto to_dto(const ExecutionUnit &unit) -> api_dto::ExecutionDto {
  api_dto::ExecutionDto dto{
      .id = unit.id.str(),
      .batch_id = std::nullopt,
      .batch_position = unit.batch_position,
      .node_id = unit.target.str(),
      .type = std::string(to_string_view(unit.action.type)),
      .action = unit.action.action,
      .parameters = unit.action.parameters,
      .status = std::string(to_string_view(unit.status)),
      .submitted_at = util::format_iso8601(unit.submitted_at),
      .started_at = optional_time(unit.started_at),
      .completed_at = optional_time(unit.completed_at),
      .exit_code = unit.exit_code,
      .error = std::nullopt};
  if (unit.batch_id) {
    dto.batch_id = unit.batch_id->str();
  }
  if (!unit.error.empty()) {
    dto.error = unit.error;
  }
  return dto;
}

// String parameters pass through as-is; anything else as its JSON text.
auto to_parameters(const std::map<std::string, JsonValue> &raw)
    -> std::map<std::string, std::string> {
  std::map<std::string, std::string> out;
  for (const auto &[key, value] : raw) {
    if (value.is_string()) {
      out.emplace(key, value.get_string());
    } else {
      out.emplace(key, dump_json(value));
    }
  }
  return out;
}

auto parse_batch_request(std::string_view body) -> Result<BatchRequest> {
  auto dto = read_json_as<api_dto::BatchRequestDto>(body);
  if (!dto) {
    return fail(Error::InvalidArgument);
  }
  auto type = util::try_parse_enum<ActionType>(dto->type);
  if (!type) {
    return fail(Error::InvalidArgument);
  }

  BatchRequest request;
  request.action = ActionDescriptor{.type = *type,
                                    .action = std::move(dto->action),
                                    .parameters = to_parameters(dto->parameters)};
  for (auto &node : dto->target_node_ids) {
    if (!is_valid_id_text(node)) {
      return fail(Error::InvalidArgument);
    }
    request.target_node_ids.emplace_back(std::move(node));
  }
  for (auto &group : dto->target_group_ids) {
    if (!is_valid_id_text(group)) {
      return fail(Error::InvalidArgument);
    }
    request.target_group_ids.emplace_back(std::move(group));
  }
  return ok(std::move(request));
}

auto write_or_log(SseChannel &channel, const ExecutionId &id,
                  std::string_view frame) -> bool {
  if (auto r = channel.write(frame); !r) {
    log::debug("Replay to stream of execution {} failed: {}", id,
               r.error().message());
    return false;
  }
  return true;
}

} // namespace

struct ApiServer::Impl : std::enable_shared_from_this<Impl> {
  Application &app_;
  std::shared_ptr<HttpServer> server_;

  explicit Impl(Application &app)
      : app_(app), server_(std::make_shared<HttpServer>(app_.runtime())) {}

  void init() {
    setup_routes();
    setup_stream();
  }

  [[nodiscard]] auto create_batch(const HttpRequest &req) -> HttpResponse {
    auto request = parse_batch_request(req.body_as_string());
    if (!request) {
      return error_response(
          request.error(),
          "Invalid request body: expected {type: command|task|plan, action, "
          "targetNodeIds?, targetGroupIds?, parameters?}");
    }

    auto created = app_.batches().create_batch(std::move(*request));
    if (!created) {
      const auto &ec = created.error();
      if (ec == make_error_code(Error::QueueFull)) {
        return error_response(ec, queue_full_message(static_cast<std::size_t>(
                                      app_.config().execution_queue.max_queue_size)));
      }
      if (ec == make_error_code(Error::TargetResolution)) {
        return error_response(ec, "One or more target groups could not be "
                                  "resolved");
      }
      if (ec == make_error_code(Error::InvalidArgument)) {
        return error_response(ec, "Batch needs an action and at least one "
                                  "target node or group");
      }
      return error_response(ec, ec.message());
    }

    return json_response_glz(
        api_dto::BatchResponseDto{
            .batch_id = created->batch_id.str(),
            .execution_ids = id_strings(created->execution_ids),
            .target_count = created->target_count,
            .expanded_node_ids = id_strings(created->expanded_node_ids)},
        HttpStatus::Created);
  }

  [[nodiscard]] auto queue_status() -> HttpResponse {
    const auto status = app_.queue().queue_status();
    const auto now = std::chrono::system_clock::now();
    api_dto::QueueStatusResponseDto dto{
        .queue = {.running = status.running,
                  .queued = status.queued,
                  .limit = status.limit,
                  .available = status.limit > status.running
                                   ? status.limit - status.running
                                   : 0,
                  .max_queue_size = status.max_queue_size,
                  .queued_executions = {}}};
    dto.queue.queued_executions.reserve(status.queue.size());
    for (const auto &entry : status.queue) {
      dto.queue.queued_executions.push_back(
          {.id = entry.id.str(),
           .type = std::string(to_string_view(entry.type)),
           .node_id = entry.target.str(),
           .action = entry.action,
           .enqueued_at = util::format_iso8601(entry.enqueued_at),
           .wait_time = util::to_unix_millis(now) -
                        util::to_unix_millis(entry.enqueued_at)});
    }
    return json_response_glz(dto);
  }

  [[nodiscard]] auto batch_status(const BatchId &id) -> HttpResponse {
    auto status = app_.batches().get_batch_status(id);
    if (!status) {
      return error_response(status.error(),
                            std::format("Batch '{}' not found", id));
    }
    api_dto::BatchStatusDto dto{
        .id = status->batch_id.str(),
        .type = std::string(to_string_view(status->action.type)),
        .action = status->action.action,
        .target_nodes = id_strings(status->targets),
        .status = std::string(to_string_view(status->status)),
        .created_at = util::format_iso8601(status->created_at),
        .progress = status->progress,
        .stats = {.total = status->stats.total,
                  .queued = status->stats.queued,
                  .running = status->stats.running,
                  .success = status->stats.success,
                  .failed = status->stats.failed,
                  .cancelled = status->stats.cancelled},
        .executions = {}};
    dto.executions.reserve(status->executions.size());
    for (const auto &unit : status->executions) {
      dto.executions.push_back(to_dto(unit));
    }
    return json_response_glz(dto);
  }

  void setup_routes() {
    std::weak_ptr<Impl> weak_self = shared_from_this();
    auto &router = server_->router();

    router.get("/api/health", [weak_self](HttpRequest) -> task<HttpResponse> {
      auto self = weak_self.lock();
      if (!self)
        co_return unavailable();
      co_return json_response_glz(api_dto::HealthDto{
          .status = "ok",
          .running = self->app_.queue().running_count(),
          .queued = self->app_.queue().queued_count(),
          .timestamp = util::format_timestamp()});
    });

    router.post("/api/executions/batch",
                [weak_self](HttpRequest req) -> task<HttpResponse> {
                  auto self = weak_self.lock();
                  if (!self)
                    co_return unavailable();
                  co_return self->create_batch(req);
                });

    router.get("/api/executions/queue/status",
               [weak_self](HttpRequest) -> task<HttpResponse> {
                 auto self = weak_self.lock();
                 if (!self)
                   co_return unavailable();
                 co_return self->queue_status();
               });

    router.get("/api/executions/{id}",
               [weak_self](HttpRequest req) -> task<HttpResponse> {
                 auto self = weak_self.lock();
                 if (!self)
                   co_return unavailable();
                 const ExecutionId id{req.path_param("id").value_or("")};
                 auto unit = self->app_.queue().get_unit(id);
                 if (!unit) {
                   co_return error_response(
                       unit.error(),
                       std::format("Execution '{}' not found", id));
                 }
                 co_return json_response_glz(to_dto(*unit));
               });

    router.post("/api/executions/{id}/cancel",
                [weak_self](HttpRequest req) -> task<HttpResponse> {
                  auto self = weak_self.lock();
                  if (!self)
                    co_return unavailable();
                  const ExecutionId id{req.path_param("id").value_or("")};
                  if (auto r = self->app_.queue().cancel(id); !r) {
                    co_return error_response(
                        r.error(), std::format("Cannot cancel execution "
                                               "'{}': {}",
                                               id, r.error().message()));
                  }
                  co_return json_response_glz(api_dto::ExecutionCancelDto{
                      .cancelled = true, .id = id.str()});
                });

    router.get("/api/batches/{id}",
               [weak_self](HttpRequest req) -> task<HttpResponse> {
                 auto self = weak_self.lock();
                 if (!self)
                   co_return unavailable();
                 co_return self->batch_status(
                     BatchId{req.path_param("id").value_or("")});
               });

    router.post("/api/batches/{id}/cancel",
                [weak_self](HttpRequest req) -> task<HttpResponse> {
                  auto self = weak_self.lock();
                  if (!self)
                    co_return unavailable();
                  const BatchId id{req.path_param("id").value_or("")};
                  auto cancelled = self->app_.batches().cancel_batch(id);
                  if (!cancelled) {
                    co_return error_response(
                        cancelled.error(),
                        std::format("Batch '{}' not found", id));
                  }
                  co_return json_response_glz(api_dto::BatchCancelDto{
                      .cancelled = *cancelled, .batch_id = id.str()});
                });
  }

  void setup_stream() {
    std::weak_ptr<Impl> weak_self = shared_from_this();
    server_->add_stream_route(
        "/api/executions/{id}/stream",
        app_.config().streaming.max_pending_frames,
        [weak_self](HttpRequest req,
                    std::shared_ptr<SseChannel> channel) -> task<void> {
          auto self = weak_self.lock();
          if (!self) {
            channel->reject(unavailable());
            co_return;
          }
          const ExecutionId id{req.path_param("id").value_or("")};
          auto unit = self->app_.queue().get_unit(id);
          if (!unit) {
            channel->reject(error_response(
                unit.error(), std::format("Execution '{}' not found", id)));
            co_return;
          }

          channel->open();
          if (is_terminal(unit->status)) {
            // Finished before the client attached: replay the outcome.
            const auto start = serialize_sse(make_frame(
                FrameType::Start, id,
                JsonValue{{"message", std::string(kConnectedMessage)}}));
            if (write_or_log(*channel, id, start)) {
              write_or_log(*channel, id,
                           serialize_sse(terminal_frame_for(*unit)));
            }
            channel->close();
            co_return;
          }

          log::debug("SSE client attached to execution {}", id);
          self->app_.hub().subscribe(id, std::move(channel));
        });
  }

  [[nodiscard]] auto start() -> Result<void> {
    const auto &server = app_.config().server;
    return server_->start(server.host, server.port);
  }

  void stop() { server_->stop(); }
};

ApiServer::ApiServer(Application &app) : impl_(std::make_shared<Impl>(app)) {
  impl_->init();
}

ApiServer::~ApiServer() { impl_->stop(); }

auto ApiServer::start() -> Result<void> { return impl_->start(); }

auto ApiServer::stop() -> void { impl_->stop(); }

auto ApiServer::is_running() const -> bool {
  return impl_->server_->is_running();
}

auto ApiServer::port() const -> std::uint16_t {
  return impl_->server_->local_port();
}

auto ApiServer::http_server() -> HttpServer & { return *impl_->server_; }

} // namespace opsrelay
