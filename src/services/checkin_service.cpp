/**
 * @file checkin_service.cpp
 * @brief Implementation of the check-in orchestrator
 */

#include <checkin/services/checkin_service.hpp>

#include <checkin/compat/format.hpp>
#include <checkin/compat/time.hpp>
#include <checkin/integration/logger_adapter.hpp>

#include <cmath>

namespace checkin::services {

using integration::logger_adapter;
using integration::security_event_type;

namespace {

constexpr const char* kModule = "checkin_service";

using steady = std::chrono::steady_clock;

auto elapsed_ms(steady::time_point start) -> std::chrono::milliseconds {
    return std::chrono::duration_cast<std::chrono::milliseconds>(steady::now() - start);
}

}  // namespace

checkin_service::checkin_service(storage::checkin_database& db,
                                 storage::directory_interface& directory,
                                 workflow::location_lock_manager& locks,
                                 security::security_code_issuer& issuer,
                                 const core::clock_source& clock,
                                 const core::id_codec& codec,
                                 checkin_service_config config)
    : db_(db),
      directory_(directory),
      attendance_(db),
      locks_(locks),
      issuer_(issuer),
      clock_(clock),
      codec_(codec),
      config_(config) {}

auto checkin_service::get_config() const -> const checkin_service_config& {
    return config_;
}

// =============================================================================
// Check-in
// =============================================================================

auto checkin_service::check_in(const checkin_request& request, std::stop_token stop)
    -> Result<checkin_result> {
    const auto started = steady::now();

    auto resolution = resolve(request, clock_.now());
    if (resolution.is_err()) {
        return Result<checkin_result>(resolution.error());
    }
    if (auto* rejected = std::get_if<checkin_result>(&resolution.value())) {
        logger_adapter::debug("Check-in rejected for person '{}': {}",
                              request.person_id, rejected->message);
        return *rejected;
    }

    const auto& resolved = std::get<resolved_request>(resolution.value());
    auto admitted = admit(resolved, request.options, stop);

    auto duration = elapsed_ms(started);
    if (duration > config_.slow_operation_threshold) {
        logger_adapter::warn("Slow check-in for person={} location={}: {}ms",
                             resolved.person.pk, resolved.location.pk, duration.count());
    }
    return admitted;
}

auto checkin_service::resolve(const checkin_request& request,
                              std::chrono::system_clock::time_point now)
    -> Result<std::variant<resolved_request, checkin_result>> {
    using resolution = std::variant<resolved_request, checkin_result>;

    auto person_id = codec_.decode(request.person_id);
    if (!person_id) {
        return resolution{checkin_result::failed(
            checkin_failure::invalid_person_id, "Invalid person id")};
    }
    auto location_id = codec_.decode(request.location_id);
    auto schedule_id = codec_.decode(request.schedule_id);
    if (!location_id || !schedule_id) {
        return resolution{checkin_result::failed(
            checkin_failure::invalid_location_or_schedule_id,
            "Invalid location or schedule id")};
    }

    auto person = directory_.find_person(*person_id);
    if (person.is_err()) {
        return Result<resolution>(person.error());
    }
    if (!person.value()) {
        return resolution{checkin_result::failed(
            checkin_failure::person_not_found, "Person not found")};
    }
    if (person.value()->is_deceased) {
        return resolution{checkin_result::failed(
            checkin_failure::person_deceased, "Person is marked as deceased")};
    }
    if (!person.value()->is_active) {
        return resolution{checkin_result::failed(
            checkin_failure::person_inactive, "Person is not active")};
    }

    auto location = directory_.find_location(*location_id);
    if (location.is_err()) {
        return Result<resolution>(location.error());
    }
    if (!location.value()) {
        return resolution{checkin_result::failed(
            checkin_failure::location_not_found, "Location not found")};
    }
    if (!location.value()->is_active) {
        return resolution{checkin_result::failed(
            checkin_failure::location_inactive,
            checkin::compat::format("Location '{}' is not active",
                                    location.value()->name))};
    }

    auto schedule = directory_.find_schedule(*schedule_id);
    if (schedule.is_err()) {
        return Result<resolution>(schedule.error());
    }
    if (!schedule.value()) {
        return resolution{checkin_result::failed(
            checkin_failure::schedule_not_found, "Schedule not found")};
    }
    if (!schedule.value()->is_checkin_open_at(now)) {
        return resolution{checkin_result::failed(
            checkin_failure::outside_schedule,
            checkin::compat::format("Check-in for '{}' is not open right now",
                                    schedule.value()->name))};
    }

    return resolution{resolved_request{*person.value(), *location.value(),
                                       *schedule.value()}};
}

auto checkin_service::admit(const resolved_request& resolved,
                            const checkin_options& options,
                            std::stop_token stop) -> Result<checkin_result> {
    const auto& person = resolved.person;
    const auto& location = resolved.location;
    const auto today = checkin::compat::to_date_string(clock_.today());

    auto occurrence = attendance_.get_or_create_occurrence(
        location.pk, resolved.schedule.pk, today);
    if (occurrence.is_err()) {
        return Result<checkin_result>(occurrence.error());
    }
    const auto occurrence_id = occurrence.value().pk;

    int occupancy = 0;
    auto admitted = locks_.execute_with_location_lock(
        location.pk,
        [&]() -> Result<checkin_result> {
            return db_.transaction([&]() -> Result<checkin_result> {
                auto duplicate = attendance_.has_open_attendance(person.pk, occurrence_id);
                if (duplicate.is_err()) {
                    return Result<checkin_result>(duplicate.error());
                }
                if (duplicate.value()) {
                    return checkin_result::failed(
                        checkin_failure::already_checked_in,
                        checkin::compat::format("{} is already checked in",
                                                person.full_name()));
                }

                auto count = attendance_.count_open_for_location(location.pk, today);
                if (count.is_err()) {
                    return Result<checkin_result>(count.error());
                }
                if (location.hard_capacity && count.value() >= *location.hard_capacity) {
                    return checkin_result::failed(
                        checkin_failure::at_capacity,
                        checkin::compat::format("{} is at capacity ({}/{})",
                                                location.name, count.value(),
                                                *location.hard_capacity));
                }

                auto attended = attendance_.has_attended_location(person.pk, location.pk);
                if (attended.is_err()) {
                    return Result<checkin_result>(attended.error());
                }

                storage::attendance_record record;
                record.person_id = person.pk;
                record.occurrence_id = occurrence_id;
                record.start_time = clock_.now();
                record.is_first_time = !attended.value();
                record.notes = options.notes;

                if (options.generate_security_code) {
                    auto code = issuer_.issue(clock_.today());
                    if (code.is_err()) {
                        return Result<checkin_result>(code.error());
                    }
                    record.security_code_id = code.value().pk;
                    record.security_code = code.value().code;
                }

                auto inserted = attendance_.insert_attendance(record);
                if (inserted.is_err()) {
                    if (inserted.error().code == error_codes::duplicate_entry) {
                        return checkin_result::failed(
                            checkin_failure::already_checked_in,
                            checkin::compat::format("{} is already checked in",
                                                    person.full_name()));
                    }
                    return Result<checkin_result>(inserted.error());
                }

                occupancy = count.value() + 1;

                checkin_result result;
                result.success = true;
                result.attendance_id = codec_.encode(inserted.value());
                result.check_in_time = record.start_time;
                result.is_first_time = record.is_first_time;
                if (options.generate_security_code) {
                    result.security_code = record.security_code;
                }
                result.capacity_warning = is_warning_level(location, occupancy);
                return result;
            });
        },
        stop);

    if (admitted.is_err()) {
        if (admitted.error().code == error_codes::lock_timeout ||
            admitted.error().code == error_codes::operation_cancelled) {
            return admitted;
        }
        logger_adapter::error("Check-in failed for person={} location={}: {}",
                              person.pk, location.pk, admitted.error().message);
        return admitted;
    }

    auto result = admitted.value();
    result.person = summarize(person);
    result.location = summarize(location);
    if (!result.success) {
        return result;
    }

    result.message = checkin::compat::format("{} checked in to {}",
                                             person.full_name(), location.name);

    logger_adapter::log_check_in(person.pk, location.pk,
                                 codec_.decode(result.attendance_id).value_or(0),
                                 result.security_code.value_or(""));

    if (location.hard_capacity && occupancy >= *location.hard_capacity) {
        logger_adapter::log_security_event(
            security_event_type::capacity_reached,
            checkin::compat::format("{} reached capacity ({}/{})", location.name,
                                    occupancy, *location.hard_capacity),
            codec_.encode(location.pk));
    } else if (result.capacity_warning) {
        logger_adapter::info("{} is near capacity ({} checked in)",
                             location.name, occupancy);
    }

    return result;
}

auto checkin_service::batch_check_in(const std::vector<checkin_request>& requests,
                                     std::stop_token stop) -> batch_checkin_result {
    const auto started = steady::now();
    batch_checkin_result batch;
    batch.results.reserve(requests.size());

    for (const auto& request : requests) {
        checkin_result item;
        if (stop.stop_requested()) {
            item = checkin_result::failed(checkin_failure::cancelled,
                                          "Check-in cancelled");
        } else {
            auto outcome = check_in(request, stop);
            if (outcome.is_ok()) {
                item = outcome.value();
            } else if (outcome.error().code == error_codes::lock_timeout) {
                item = checkin_result::failed(
                    checkin_failure::transient_failure,
                    "Location is busy, please try again");
            } else if (outcome.error().code == error_codes::operation_cancelled) {
                item = checkin_result::failed(checkin_failure::cancelled,
                                              "Check-in cancelled");
            } else {
                item = checkin_result::failed(checkin_failure::system_error,
                                              outcome.error().message);
            }
        }

        if (item.success) {
            ++batch.success_count;
        } else {
            ++batch.failure_count;
        }
        batch.results.push_back(std::move(item));
    }

    auto duration = elapsed_ms(started);
    if (duration > config_.slow_batch_threshold) {
        logger_adapter::warn("Slow batch check-in of {} requests: {}ms",
                             requests.size(), duration.count());
    }
    logger_adapter::info("Batch check-in: {} succeeded, {} failed",
                         batch.success_count, batch.failure_count);
    return batch;
}

auto checkin_service::validate_check_in(const checkin_request& request)
    -> Result<checkin_validation> {
    auto resolution = resolve(request, clock_.now());
    if (resolution.is_err()) {
        return Result<checkin_validation>(resolution.error());
    }
    if (auto* rejected = std::get_if<checkin_result>(&resolution.value())) {
        return checkin_validation{false, rejected->failure, rejected->message};
    }

    const auto& resolved = std::get<resolved_request>(resolution.value());
    const auto today = checkin::compat::to_date_string(clock_.today());

    auto open = attendance_.find_open_by_location(resolved.location.pk, today);
    if (open.is_err()) {
        return Result<checkin_validation>(open.error());
    }
    // Validation never writes; a missing occurrence means nobody is in it yet
    auto occurrence = attendance_.find_occurrence(resolved.location.pk,
                                                  resolved.schedule.pk, today);
    if (occurrence.is_err()) {
        return Result<checkin_validation>(occurrence.error());
    }
    for (const auto& attendance : open.value()) {
        if (attendance.person_id == resolved.person.pk && occurrence.value()) {
            if (occurrence.value()->pk == attendance.occurrence_id) {
                return checkin_validation{
                    false, checkin_failure::already_checked_in,
                    checkin::compat::format("{} is already checked in",
                                            resolved.person.full_name())};
            }
        }
    }

    const auto count = static_cast<int>(open.value().size());
    if (resolved.location.hard_capacity && count >= *resolved.location.hard_capacity) {
        return checkin_validation{
            false, checkin_failure::at_capacity,
            checkin::compat::format("{} is at capacity", resolved.location.name)};
    }

    return checkin_validation{true, checkin_failure::none, "Check-in allowed"};
}

// =============================================================================
// Check-out
// =============================================================================

auto checkin_service::check_out(std::string_view attendance_id) -> Result<bool> {
    auto id = codec_.decode(attendance_id);
    if (!id) {
        return checkin_error<bool>(error_codes::invalid_id,
                                   "Invalid attendance id", kModule);
    }

    auto closed = attendance_.close_attendance(*id, clock_.now());
    if (closed.is_err()) {
        logger_adapter::error("Check-out failed for attendance={}: {}",
                              *id, closed.error().message);
        return closed;
    }

    logger_adapter::log_check_out(*id, closed.value());
    return closed;
}

// =============================================================================
// Queries
// =============================================================================

auto checkin_service::current_occupants(std::string_view location_id)
    -> Result<std::vector<occupant_entry>> {
    auto id = codec_.decode(location_id);
    if (!id) {
        return checkin_error<std::vector<occupant_entry>>(
            error_codes::invalid_id, "Invalid location id", kModule);
    }

    auto open = attendance_.find_open_by_location(
        *id, checkin::compat::to_date_string(clock_.today()));
    if (open.is_err()) {
        return Result<std::vector<occupant_entry>>(open.error());
    }

    std::vector<occupant_entry> occupants;
    occupants.reserve(open.value().size());
    for (const auto& attendance : open.value()) {
        auto person = directory_.find_person(attendance.person_id);
        if (person.is_err()) {
            return Result<std::vector<occupant_entry>>(person.error());
        }

        occupant_entry entry;
        entry.attendance_id = codec_.encode(attendance.pk);
        if (person.value()) {
            entry.person = summarize(*person.value());
        } else {
            entry.person.id = codec_.encode(attendance.person_id);
        }
        entry.check_in_time = attendance.start_time;
        entry.security_code = attendance.security_code;
        entry.is_first_time = attendance.is_first_time;
        occupants.push_back(std::move(entry));
    }
    return occupants;
}

auto checkin_service::person_history(std::string_view person_id, int window_days)
    -> Result<std::vector<attendance_summary>> {
    auto id = codec_.decode(person_id);
    if (!id) {
        return checkin_error<std::vector<attendance_summary>>(
            error_codes::invalid_id, "Invalid person id", kModule);
    }
    if (window_days <= 0) {
        return std::vector<attendance_summary>{};
    }

    const auto since = clock_.now() - std::chrono::days{window_days};
    auto history = attendance_.find_history(*id, since);
    if (history.is_err()) {
        return Result<std::vector<attendance_summary>>(history.error());
    }

    std::vector<attendance_summary> summaries;
    summaries.reserve(history.value().size());
    for (const auto& attendance : history.value()) {
        attendance_summary summary;
        summary.attendance_id = codec_.encode(attendance.pk);
        summary.location.id = codec_.encode(attendance.location_id);

        auto location = directory_.find_location(attendance.location_id);
        if (location.is_err()) {
            return Result<std::vector<attendance_summary>>(location.error());
        }
        if (location.value()) {
            summary.location.name = location.value()->name;
        }

        summary.occurrence_date = attendance.occurrence_date;
        summary.start_time = attendance.start_time;
        summary.end_time = attendance.end_time;
        summary.is_first_time = attendance.is_first_time;
        summary.security_code = attendance.security_code;
        summaries.push_back(std::move(summary));
    }
    return summaries;
}

auto checkin_service::person_history(std::string_view person_id)
    -> Result<std::vector<attendance_summary>> {
    return person_history(person_id, config_.default_history_days);
}

auto checkin_service::location_capacity(std::string_view location_id)
    -> Result<location_capacity_info> {
    auto id = codec_.decode(location_id);
    if (!id) {
        return checkin_error<location_capacity_info>(
            error_codes::invalid_id, "Invalid location id", kModule);
    }

    auto location = directory_.find_location(*id);
    if (location.is_err()) {
        return Result<location_capacity_info>(location.error());
    }
    if (!location.value()) {
        return checkin_error<location_capacity_info>(
            error_codes::not_found, "Location not found", kModule);
    }

    auto count = attendance_.count_open_for_location(
        *id, checkin::compat::to_date_string(clock_.today()));
    if (count.is_err()) {
        return Result<location_capacity_info>(count.error());
    }

    const auto& record = *location.value();
    location_capacity_info info;
    info.location = summarize(record);
    info.current_count = count.value();
    info.soft_capacity = record.soft_capacity;
    info.hard_capacity = record.hard_capacity;

    if (record.hard_capacity && info.current_count >= *record.hard_capacity) {
        info.status = capacity_status::full;
    } else if (is_warning_level(record, info.current_count)) {
        info.status = capacity_status::warning;
    }

    auto limit = record.hard_capacity ? record.hard_capacity : record.soft_capacity;
    if (limit && *limit > 0) {
        info.percentage_full = static_cast<int>(
            std::lround(100.0 * info.current_count / *limit));
    }
    return info;
}

// =============================================================================
// Helpers
// =============================================================================

auto checkin_service::is_warning_level(const storage::location_record& location,
                                       int count) const -> bool {
    if (location.soft_capacity && count >= *location.soft_capacity) {
        return true;
    }
    return location.hard_capacity &&
           count * 100 >= *location.hard_capacity * config_.near_capacity_percent;
}

auto checkin_service::summarize(const storage::person_record& person) const
    -> person_summary {
    return person_summary{codec_.encode(person.pk), person.display_first_name(),
                          person.last_name, person.full_name()};
}

auto checkin_service::summarize(const storage::location_record& location) const
    -> location_summary {
    return location_summary{codec_.encode(location.pk), location.name};
}

}  // namespace checkin::services
