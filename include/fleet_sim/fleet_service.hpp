// === Fleet Service ===========================================================
//
// Request-level surface of the simulator: the boats listing with its speed
// parameter, single-vessel lookup, fleet reset and health. Requests arrive as
// a method and a request target; responses carry a status code and a JSON
// body. Transport framing lives outside this module.

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "fleet_sim/fleet_scheduler.hpp"
#include "fleet_sim/logging.hpp"
#include "fleet_sim/state_store.hpp"

namespace fleet_sim {

/** @brief How a boats listing relates to simulation ticks. */
enum class TickPolicy {
    Scheduled,  /**< Background loop ticks; a listing only updates the multiplier. */
    OnRequest   /**< Every listing runs one synchronous tick first. */
};

/** @brief Flattened vessel view returned by the boats endpoints. */
struct VesselStatusView final {
    std::string id{};
    double latitude{};
    double longitude{};
    std::string status{};
    double energy_level{};
    std::string vessel_name{};
    std::string survey_type{};
    std::string project{};
    std::string equipment{};
    double area_covered{};
    std::string speed{};
    int crew_count{};
    std::string conditions{};
    double heading{};
};

/** @brief Result of handling one request. */
struct ApiResponse final {
    int status_code{200};
    std::string content_type{"application/json"};
    std::string body{};
};

/** @brief Reset outcome returned to callers. */
struct ResetResult final {
    std::size_t count{};
    std::string message{};
};

class FleetService final {
  public:
    static constexpr double k_default_speed_multiplier{1.0};

    FleetService(StateStore& state_store, FleetScheduler& scheduler, TickPolicy tick_policy);

    /**
     * @brief Current fleet view, ticking first under TickPolicy::OnRequest.
     *
     * Throws ValidationError before any tick when the multiplier is invalid.
     */
    [[nodiscard]] std::vector<VesselStatusView> get_boats(double speed_multiplier);
    /** @brief View of one vessel; throws NotFoundError for unknown ids. */
    [[nodiscard]] VesselStatusView get_boat(const std::string& vessel_id) const;
    /** @brief Restore the whole fleet to its initial snapshot. */
    ResetResult reset_boats();

    /** @brief Route a request target such as "/boats?speed=2" and map failures to status codes. */
    [[nodiscard]] ApiResponse handle(std::string_view method, std::string_view target);

    [[nodiscard]] TickPolicy tick_policy() const noexcept;

  private:
    [[nodiscard]] ApiResponse dispatch(std::string_view method, std::string_view path, std::string_view query);
    [[nodiscard]] std::string health_json() const;

    StateStore& state_store_;
    FleetScheduler& scheduler_;
    TickPolicy tick_policy_;
    std::shared_ptr<spdlog::logger> logger_;
};

[[nodiscard]] VesselStatusView make_status_view(const VesselRecord& record);

/** @brief Percent-decode a query value ('+' is a space); throws ValidationError on bad escapes. */
[[nodiscard]] std::string decode_query_value(std::string_view raw_value);

/**
 * @brief Parse the optional "speed" query value.
 *
 * Missing values yield the default multiplier. The decoded value must be a
 * plain decimal number: whitespace, hex and trailing text throw
 * ValidationError, as do values outside [0.1, 10].
 */
[[nodiscard]] double parse_speed_parameter(std::optional<std::string_view> raw_value);

/** @brief Value of @p key in a URL query string, if present. */
[[nodiscard]] std::optional<std::string_view> find_query_parameter(std::string_view query, std::string_view key);

[[nodiscard]] std::string to_json(const VesselStatusView& view);
[[nodiscard]] std::string to_json(const std::vector<VesselStatusView>& views);

[[nodiscard]] std::string_view to_string(TickPolicy policy) noexcept;

}  // namespace fleet_sim
