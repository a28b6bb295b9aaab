/**
 * @file migration_record.hpp
 * @brief Applied schema migration entry
 */

#pragma once

#include <string>

namespace checkin::storage {

/**
 * @brief Represents a record of an applied database migration
 */
struct migration_record {
    int version{0};           ///< Schema version number
    std::string description;  ///< Description of the migration
    std::string applied_at;   ///< Timestamp when migration was applied
};

}  // namespace checkin::storage
