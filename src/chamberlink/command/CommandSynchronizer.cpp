#include "command/CommandSynchronizer.hpp"

#include "log/TaggedLogger.hpp"

#include <algorithm>

namespace CL {

namespace {

using json = nlohmann::json;

auto response_message(json const& document) -> std::string {
    if (auto it = document.find("message"); it != document.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return "command failed";
}

} // namespace

CommandSynchronizer::CommandSynchronizer(ClientContext& context, EventBus& events,
                                         std::shared_ptr<HttpClientFactory> http, EndpointResolver resolver,
                                         ControlMap controls)
    : context_(context)
    , events_(events)
    , http_(std::move(http))
    , resolver_(std::move(resolver))
    , controls_(std::move(controls))
    , options_(context.options().commands) {}

auto CommandSynchronizer::execute(CommandRequest const& request) -> Expected<CommandResult> {
    return run(std::nullopt, request);
}

auto CommandSynchronizer::execute(Endpoint const& endpoint, CommandRequest const& request) -> Expected<CommandResult> {
    return run(endpoint, request);
}

auto CommandSynchronizer::admit() -> Expected<void> {
    std::lock_guard<std::mutex> lock(rateMutex_);
    auto const now = std::chrono::steady_clock::now();
    while (!recent_.empty() && now - recent_.front() >= options_.rate_limit_window) {
        recent_.pop_front();
    }
    if (recent_.size() >= static_cast<std::size_t>(options_.rate_limit_max_commands)) {
        return std::unexpected(Error{Error::Code::CommandRejected, "rate limit exceeded"});
    }
    recent_.push_back(now);
    return {};
}

void CommandSynchronizer::publishVisible(std::string const& control_key) {
    events_.publish(ControlsUpdated{control_key, read(control_key).value_or(json{})});
}

auto CommandSynchronizer::reject(CommandRequest const& request, std::string const& command_id,
                                 std::uint64_t generation, std::string message) -> Error {
    Error error{Error::Code::CommandRejected, std::move(message)};
    if (!table_.remove(request.control_key, generation)) {
        return Error{Error::Code::Superseded, "superseded by a newer command for " + request.control_key};
    }
    cl_log("Rolled back " + command_id + ": " + describeError(error), "Command");
    publishVisible(request.control_key);
    events_.publish(CommandFailed{request.control_key, command_id, error});
    return error;
}

auto CommandSynchronizer::run(std::optional<Endpoint> endpoint, CommandRequest const& request)
    -> Expected<CommandResult> {
    if (auto admitted = admit(); !admitted) {
        cl_log("Refused " + request.control_key + ": " + describeError(admitted.error()), "Command");
        return std::unexpected(admitted.error());
    }

    auto const command_id = request.control_key + "_" + std::to_string(nextCommand_++);
    auto const [generation, baseline] = table_.record(request.control_key, request.proposed_value, command_id,
                                                      [this] { return context_.snapshots().sequence(); });
    cl_log("Issued " + command_id + " -> " + request.path, "Command");
    events_.publish(OptimisticUpdate{request.control_key, request.proposed_value, command_id});
    publishVisible(request.control_key);

    if (!endpoint) {
        auto resolved = resolver_ ? resolver_()
                                  : Expected<Endpoint>{std::unexpected(Error{Error::Code::NotConnected, "no backend"})};
        if (!resolved) {
            return std::unexpected(reject(request, command_id, generation, "no backend: " + describeError(resolved.error())));
        }
        endpoint = std::move(*resolved);
    }

    auto client = http_->create(*endpoint, options_.request_timeout);
    auto reply  = client->post(request.path, request.body ? request.body->dump() : std::string{"{}"});
    if (!reply) {
        return std::unexpected(reject(request, command_id, generation, describeError(reply.error())));
    }

    json document;
    try {
        document = json::parse(reply->body);
    } catch (json::parse_error const&) {
        return std::unexpected(reject(request, command_id, generation,
                                      "malformed response (HTTP " + std::to_string(reply->status) + ")"));
    }
    if (!reply->ok()) {
        auto message = document.is_object() ? response_message(document) : std::string{"command failed"};
        return std::unexpected(
            reject(request, command_id, generation, "HTTP " + std::to_string(reply->status) + ": " + message));
    }
    auto const success = document.is_object() ? document.find("success") : document.end();
    if (success == document.end() || !success->is_boolean() || !success->get<bool>()) {
        auto message = document.is_object() ? response_message(document) : std::string{"malformed response"};
        return std::unexpected(reject(request, command_id, generation, message));
    }

    auto target = request.proposed_value;
    if (auto data = document.find("data"); data != document.end()) {
        if (auto confirmed = controls_.confirmedValue(request.control_key, *data)) {
            if (!valuesMatch(*confirmed, target) && table_.adopt(request.control_key, generation, *confirmed)) {
                cl_log(command_id + " adopted server value " + confirmed->dump(), "Command");
                events_.publish(OptimisticUpdate{request.control_key, *confirmed, command_id});
                publishVisible(request.control_key);
            }
            target = std::move(*confirmed);
        }
    }
    return reconcile(request, command_id, generation, baseline, target, std::move(document));
}

auto CommandSynchronizer::reconcile(CommandRequest const& request, std::string const& command_id,
                                    std::uint64_t generation, std::uint64_t baseline, json const& target,
                                    json response) -> Expected<CommandResult> {
    auto superseded = [&] {
        return std::unexpected(
            Error{Error::Code::Superseded, "superseded by a newer command for " + request.control_key});
    };
    auto succeed = [&]() -> Expected<CommandResult> {
        if (!table_.remove(request.control_key, generation)) {
            return superseded();
        }
        cl_log(command_id + " confirmed", "Command");
        events_.publish(CommandSucceeded{request.control_key, command_id, target});
        return CommandResult{command_id, target, std::move(response)};
    };

    auto path = controls_.pathFor(request.control_key);
    if (!path) {
        // Nothing in a snapshot can confirm an unmapped control; the response is all there is.
        return succeed();
    }

    auto const deadline = std::chrono::steady_clock::now() + options_.confirmation_timeout;
    auto       seen     = baseline;
    while (true) {
        if (!table_.isCurrent(request.control_key, generation)) {
            return superseded();
        }
        auto const now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        auto wait = std::min(options_.poll_interval,
                             std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now));
        if (auto snapshot = context_.snapshots().waitNewer(seen, wait)) {
            seen = snapshot->sequence;
            if (auto value = snapshot->valueAt(*path); value && valuesMatch(*value, target)) {
                return succeed();
            }
        }
    }

    if (!table_.linger(request.control_key, generation, context_.snapshots().sequence())) {
        return superseded();
    }
    Error error{Error::Code::ConfirmationTimeout,
                command_id + " not confirmed within " + std::to_string(options_.confirmation_timeout.count()) + "ms"};
    cl_log(describeError(error), "Command");
    events_.publish(CommandFailed{request.control_key, command_id, error});
    return std::unexpected(error);
}

auto CommandSynchronizer::read(std::string const& control_key) const -> std::optional<json> {
    if (auto optimistic = table_.value(control_key, context_.snapshots().sequence())) {
        return optimistic;
    }
    auto path = controls_.pathFor(control_key);
    if (!path) {
        return std::nullopt;
    }
    auto snapshot = context_.snapshots().latest();
    if (!snapshot) {
        return std::nullopt;
    }
    return snapshot->valueAt(*path);
}

bool CommandSynchronizer::isPending(std::string const& control_key) const {
    return table_.isPending(control_key);
}

auto CommandSynchronizer::pendingCommands() const -> std::vector<OptimisticEntry> {
    return table_.pending();
}

} // namespace CL
