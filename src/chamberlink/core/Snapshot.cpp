#include "core/Snapshot.hpp"

#include <cmath>

namespace CL {

namespace {

using json = nlohmann::json;

constexpr double kNumericTolerance = 1e-6;

auto stringify(json const& value) -> std::string {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_null()) {
        return {};
    }
    return value.dump();
}

} // namespace

auto lookupPath(json const& root, std::string_view path) -> std::optional<json> {
    json const* node = &root;
    while (!path.empty()) {
        auto dot     = path.find('.');
        auto segment = path.substr(0, dot);
        if (!node->is_object()) {
            return std::nullopt;
        }
        auto it = node->find(std::string{segment});
        if (it == node->end()) {
            return std::nullopt;
        }
        node = &*it;
        if (dot == std::string_view::npos) {
            break;
        }
        path.remove_prefix(dot + 1);
    }
    return *node;
}

auto Snapshot::valueAt(std::string_view path) const -> std::optional<json> {
    return lookupPath(state, path);
}

auto parseSnapshot(std::string_view frame) -> Expected<Snapshot> {
    json document;
    try {
        document = json::parse(frame);
    } catch (json::parse_error const& error) {
        return std::unexpected(Error{Error::Code::MalformedInput, std::string{"frame is not JSON: "} + error.what()});
    }
    if (!document.is_object()) {
        return std::unexpected(Error{Error::Code::MalformedInput, "frame is not a JSON object"});
    }

    auto data  = document.find("data");
    auto error = document.find("error");
    if (error != document.end() && !error->is_null() && (data == document.end() || !data->is_object())) {
        return std::unexpected(Error{Error::Code::UnknownError, "backend reported: " + stringify(*error)});
    }

    Snapshot snapshot;
    if (auto it = document.find("timestamp"); it != document.end()) {
        snapshot.timestamp = stringify(*it);
    }
    if (auto it = document.find("type"); it != document.end()) {
        snapshot.type = stringify(*it);
    }
    if (data != document.end() && data->is_object()) {
        snapshot.state = *data;
    } else {
        // The device streams bare status objects; only the synthetic source wraps them.
        snapshot.state = std::move(document);
    }
    return snapshot;
}

bool valuesMatch(json const& lhs, json const& rhs) {
    if (lhs.is_number() && rhs.is_number()) {
        return std::fabs(lhs.get<double>() - rhs.get<double>()) < kNumericTolerance;
    }
    return lhs == rhs;
}

} // namespace CL
