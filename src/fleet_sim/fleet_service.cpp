#include "fleet_sim/fleet_service.hpp"

#include <charconv>
#include <cmath>
#include <system_error>
#include <iterator>
#include <stdexcept>

#include <fmt/format.h>

#include "fleet_sim/errors.hpp"
#include "fleet_sim/simulation_clock.hpp"
#include "fleet_sim/version.hpp"

namespace fleet_sim {

namespace {

constexpr std::string_view k_api_prefix{"/api"};
constexpr std::string_view k_boats_path{"/boats"};
constexpr std::string_view k_reset_path{"/boats/reset"};
constexpr std::string_view k_health_path{"/health"};
constexpr char k_reset_message[] = "Boats reset to initial positions";

void append_json_string(fmt::memory_buffer& buffer, std::string_view value) {
    buffer.push_back('"');
    for (const char character : value) {
        switch (character) {
            case '"':
                fmt::format_to(std::back_inserter(buffer), R"(\")");
                break;
            case '\\':
                fmt::format_to(std::back_inserter(buffer), R"(\\)");
                break;
            case '\n':
                fmt::format_to(std::back_inserter(buffer), R"(\n)");
                break;
            case '\r':
                fmt::format_to(std::back_inserter(buffer), R"(\r)");
                break;
            case '\t':
                fmt::format_to(std::back_inserter(buffer), R"(\t)");
                break;
            default:
                if (static_cast<unsigned char>(character) < 0x20) {
                    fmt::format_to(std::back_inserter(buffer), "\\u{:04x}", static_cast<unsigned int>(character));
                } else {
                    buffer.push_back(character);
                }
        }
    }
    buffer.push_back('"');
}

void append_json_number(fmt::memory_buffer& buffer, double value) {
    if (!std::isfinite(value)) {
        fmt::format_to(std::back_inserter(buffer), "null");
        return;
    }
    fmt::format_to(std::back_inserter(buffer), "{}", value);
}

void append_status_object(fmt::memory_buffer& buffer, const VesselStatusView& view) {
    const auto out = std::back_inserter(buffer);
    fmt::format_to(out, R"({{"id":)");
    append_json_string(buffer, view.id);
    fmt::format_to(out, R"(,"latitude":)");
    append_json_number(buffer, view.latitude);
    fmt::format_to(out, R"(,"longitude":)");
    append_json_number(buffer, view.longitude);
    fmt::format_to(out, R"(,"status":)");
    append_json_string(buffer, view.status);
    fmt::format_to(out, R"(,"energyLevel":)");
    append_json_number(buffer, view.energy_level);
    fmt::format_to(out, R"(,"vesselName":)");
    append_json_string(buffer, view.vessel_name);
    fmt::format_to(out, R"(,"surveyType":)");
    append_json_string(buffer, view.survey_type);
    fmt::format_to(out, R"(,"project":)");
    append_json_string(buffer, view.project);
    fmt::format_to(out, R"(,"equipment":)");
    append_json_string(buffer, view.equipment);
    fmt::format_to(out, R"(,"areaCovered":)");
    append_json_number(buffer, view.area_covered);
    fmt::format_to(out, R"(,"speed":)");
    append_json_string(buffer, view.speed);
    fmt::format_to(out, R"(,"crewCount":{})", view.crew_count);
    fmt::format_to(out, R"(,"conditions":)");
    append_json_string(buffer, view.conditions);
    fmt::format_to(out, R"(,"heading":)");
    append_json_number(buffer, view.heading);
    buffer.push_back('}');
}

std::string_view reason_phrase(int status_code) {
    switch (status_code) {
        case 400:
            return "Bad Request";
        case 404:
            return "Not Found";
        case 405:
            return "Method Not Allowed";
        case 503:
            return "Service Unavailable";
        default:
            return "Internal Server Error";
    }
}

ApiResponse error_response(int status_code, std::string_view detail) {
    fmt::memory_buffer buffer;
    fmt::format_to(std::back_inserter(buffer), R"({{"status":{},"title":)", status_code);
    append_json_string(buffer, reason_phrase(status_code));
    fmt::format_to(std::back_inserter(buffer), R"(,"detail":)");
    append_json_string(buffer, detail);
    buffer.push_back('}');
    return ApiResponse{status_code, "application/problem+json", fmt::to_string(buffer)};
}

std::string_view strip_api_prefix(std::string_view path) {
    if (path.starts_with(k_api_prefix)
        && (path.size() == k_api_prefix.size() || path[k_api_prefix.size()] == '/')) {
        path.remove_prefix(k_api_prefix.size());
    }
    if (path.size() > 1 && path.back() == '/') {
        path.remove_suffix(1);
    }
    return path;
}

int hex_digit_value(char character) {
    if (character >= '0' && character <= '9') {
        return character - '0';
    }
    if (character >= 'a' && character <= 'f') {
        return character - 'a' + 10;
    }
    if (character >= 'A' && character <= 'F') {
        return character - 'A' + 10;
    }
    return -1;
}

}  // namespace

FleetService::FleetService(StateStore& state_store, FleetScheduler& scheduler, TickPolicy tick_policy)
    : state_store_(state_store),
      scheduler_(scheduler),
      tick_policy_(tick_policy),
      logger_(get_logger()) {
    logger_->info("Fleet service ready with {} tick policy", to_string(tick_policy_));
}

std::vector<VesselStatusView> FleetService::get_boats(double speed_multiplier) {
    SimulationClock::validate_speed_multiplier(speed_multiplier);
    if (tick_policy_ == TickPolicy::OnRequest) {
        const TickReport report = scheduler_.tick(speed_multiplier);
        if (report.persistence_failures > 0) {
            logger_->warn("Tick {} dropped {} vessel updates", report.tick_number, report.persistence_failures);
        }
    } else {
        scheduler_.set_speed_multiplier(speed_multiplier);
    }

    const FleetSnapshotPtr snapshot = state_store_.get_all_with_states();
    std::vector<VesselStatusView> list_views{};
    list_views.reserve(snapshot->size());
    for (const VesselRecord& record : *snapshot) {
        list_views.push_back(make_status_view(record));
    }
    return list_views;
}

VesselStatusView FleetService::get_boat(const std::string& vessel_id) const {
    return make_status_view(state_store_.get_by_id(vessel_id));
}

ResetResult FleetService::reset_boats() {
    const std::size_t reset_count = scheduler_.reset_all();
    return ResetResult{reset_count, k_reset_message};
}

ApiResponse FleetService::handle(std::string_view method, std::string_view target) {
    const std::size_t query_start = target.find('?');
    const std::string_view raw_path = target.substr(0, query_start);
    const std::string_view query = query_start == std::string_view::npos ? std::string_view{} : target.substr(query_start + 1);
    const std::string_view path = strip_api_prefix(raw_path);

    try {
        return dispatch(method, path, query);
    } catch (const ValidationError& exc) {
        logger_->warn("Rejected {} {}: {}", method, target, exc.what());
        return error_response(400, exc.what());
    } catch (const NotFoundError& exc) {
        return error_response(404, exc.what());
    } catch (const StoreTimeoutError& exc) {
        logger_->error("{} {} timed out: {}", method, target, exc.what());
        return error_response(503, exc.what());
    } catch (const std::exception& exc) {
        logger_->error("{} {} failed: {}", method, target, exc.what());
        return error_response(500, exc.what());
    }
}

TickPolicy FleetService::tick_policy() const noexcept {
    return tick_policy_;
}

ApiResponse FleetService::dispatch(std::string_view method, std::string_view path, std::string_view query) {
    if (path == k_reset_path) {
        if (method != "POST") {
            return error_response(405, fmt::format("{} not supported on {}", method, path));
        }
        const ResetResult result = reset_boats();
        fmt::memory_buffer buffer;
        fmt::format_to(std::back_inserter(buffer), R"({{"message":)");
        append_json_string(buffer, result.message);
        fmt::format_to(std::back_inserter(buffer), R"(,"count":{}}})", result.count);
        return ApiResponse{200, "application/json", fmt::to_string(buffer)};
    }

    if (path == k_boats_path) {
        if (method != "GET") {
            return error_response(405, fmt::format("{} not supported on {}", method, path));
        }
        const double speed_multiplier = parse_speed_parameter(find_query_parameter(query, "speed"));
        return ApiResponse{200, "application/json", to_json(get_boats(speed_multiplier))};
    }

    if (path.starts_with(k_boats_path) && path.size() > k_boats_path.size() + 1 && path[k_boats_path.size()] == '/') {
        if (method != "GET") {
            return error_response(405, fmt::format("{} not supported on {}", method, path));
        }
        const std::string vessel_id{path.substr(k_boats_path.size() + 1)};
        return ApiResponse{200, "application/json", to_json(get_boat(vessel_id))};
    }

    if (path == k_health_path) {
        if (method != "GET") {
            return error_response(405, fmt::format("{} not supported on {}", method, path));
        }
        return ApiResponse{200, "application/json", health_json()};
    }

    return error_response(404, fmt::format("No route for {}", path));
}

std::string FleetService::health_json() const {
    const FleetSnapshotPtr snapshot = state_store_.get_all_with_states();
    return fmt::format(
        R"({{"status":"Healthy","version":"{}","vessels":{},"ticks":{},"scheduler":"{}"}})",
        k_version,
        snapshot->size(),
        scheduler_.ticks_completed(),
        scheduler_.is_running() ? "running" : "idle"
    );
}

VesselStatusView make_status_view(const VesselRecord& record) {
    VesselStatusView view{};
    view.id = record.vessel.id;
    view.latitude = record.state.position.latitude_deg;
    view.longitude = record.state.position.longitude_deg;
    view.status = std::string{to_string(record.state.status())};
    view.energy_level = record.state.energy_level;
    view.vessel_name = record.vessel.vessel_name;
    view.survey_type = record.vessel.survey_type;
    view.project = record.vessel.project;
    view.equipment = record.vessel.equipment;
    view.area_covered = record.state.area_covered;
    view.speed = record.state.speed_description;
    view.crew_count = record.vessel.crew_count;
    view.conditions = record.state.conditions;
    view.heading = record.state.heading_deg;
    return view;
}

std::string decode_query_value(std::string_view raw_value) {
    std::string decoded{};
    decoded.reserve(raw_value.size());
    for (std::size_t index = 0; index < raw_value.size(); ++index) {
        const char character = raw_value[index];
        if (character == '+') {
            decoded.push_back(' ');
            continue;
        }
        if (character != '%') {
            decoded.push_back(character);
            continue;
        }
        const int high = index + 2 < raw_value.size() ? hex_digit_value(raw_value[index + 1]) : -1;
        const int low = high >= 0 ? hex_digit_value(raw_value[index + 2]) : -1;
        if (low < 0) {
            throw ValidationError(fmt::format("Malformed percent-encoding in '{}'", raw_value));
        }
        decoded.push_back(static_cast<char>(high * 16 + low));
        index += 2;
    }
    return decoded;
}

double parse_speed_parameter(std::optional<std::string_view> raw_value) {
    if (!raw_value.has_value()) {
        return FleetService::k_default_speed_multiplier;
    }
    const std::string text = decode_query_value(raw_value.value());
    double parsed_value = 0.0;
    const char* const text_end = text.data() + text.size();
    const auto [parse_end, parse_error] = std::from_chars(text.data(), text_end, parsed_value);
    if (text.empty() || parse_error != std::errc{} || parse_end != text_end) {
        throw ValidationError(fmt::format("Speed '{}' is not a number", text));
    }
    SimulationClock::validate_speed_multiplier(parsed_value);
    return parsed_value;
}

std::optional<std::string_view> find_query_parameter(std::string_view query, std::string_view key) {
    while (!query.empty()) {
        const std::size_t separator = query.find('&');
        const std::string_view pair = query.substr(0, separator);
        const std::size_t equals = pair.find('=');
        const std::string_view name = pair.substr(0, equals);
        if (name == key) {
            return equals == std::string_view::npos ? std::string_view{} : pair.substr(equals + 1);
        }
        if (separator == std::string_view::npos) {
            break;
        }
        query.remove_prefix(separator + 1);
    }
    return std::nullopt;
}

std::string to_json(const VesselStatusView& view) {
    fmt::memory_buffer buffer;
    append_status_object(buffer, view);
    return fmt::to_string(buffer);
}

std::string to_json(const std::vector<VesselStatusView>& views) {
    fmt::memory_buffer buffer;
    buffer.push_back('[');
    for (std::size_t index = 0; index < views.size(); ++index) {
        if (index > 0) {
            buffer.push_back(',');
        }
        append_status_object(buffer, views[index]);
    }
    buffer.push_back(']');
    return fmt::to_string(buffer);
}

std::string_view to_string(TickPolicy policy) noexcept {
    switch (policy) {
        case TickPolicy::Scheduled:
            return "scheduled";
        case TickPolicy::OnRequest:
            return "on_request";
    }
    return "unknown";
}

}  // namespace fleet_sim
