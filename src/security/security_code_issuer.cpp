/**
 * @file security_code_issuer.cpp
 * @brief Implementation of the security code issuer
 */

#include <checkin/security/security_code_issuer.hpp>

#include <checkin/compat/format.hpp>
#include <checkin/compat/time.hpp>
#include <checkin/integration/logger_adapter.hpp>

#include <openssl/crypto.h>
#include <openssl/rand.h>

#include <limits>
#include <unordered_set>
#include <vector>

namespace checkin::security {

using integration::logger_adapter;

namespace {

constexpr const char* kModule = "security_code_issuer";

/// Upper bound on the keyspace that may be scanned exhaustively
constexpr std::int64_t kMaxScannableKeyspace = 4'000'000;

}  // namespace

security_code_issuer::security_code_issuer(storage::attendance_repository& repository,
                                           const core::clock_source& clock,
                                           security_code_config config)
    : repository_(repository), clock_(clock), config_(std::move(config)) {}

auto security_code_issuer::get_config() const -> const security_code_config& {
    return config_;
}

auto security_code_issuer::keyspace_size() const noexcept -> std::int64_t {
    const auto base = static_cast<std::int64_t>(config_.alphabet.size());
    if (base == 0 || config_.length == 0) {
        return 0;
    }
    std::int64_t size = 1;
    for (std::size_t i = 0; i < config_.length; ++i) {
        if (size > std::numeric_limits<std::int64_t>::max() / base) {
            return std::numeric_limits<std::int64_t>::max();
        }
        size *= base;
    }
    return size;
}

auto security_code_issuer::codes_equal(std::string_view expected,
                                       std::string_view presented) -> bool {
    if (expected.empty() || expected.size() != presented.size()) {
        return false;
    }
    return CRYPTO_memcmp(expected.data(), presented.data(), expected.size()) == 0;
}

auto security_code_issuer::issue() -> Result<storage::security_code_record> {
    return issue(clock_.today());
}

auto security_code_issuer::issue(std::chrono::year_month_day date)
    -> Result<storage::security_code_record> {
    auto valid = validate_config();
    if (valid.is_err()) {
        return Result<storage::security_code_record>(valid.error());
    }

    const auto issue_date = checkin::compat::to_date_string(date);

    auto issued = repository_.count_codes_for_date(issue_date);
    if (issued.is_err()) {
        return Result<storage::security_code_record>(issued.error());
    }
    if (issued.value() >= keyspace_size()) {
        logger_adapter::error("Security code keyspace exhausted for {} ({} codes)",
                              issue_date, issued.value());
        return make_error<storage::security_code_record>(
            error_codes::exhausted_keyspace,
            checkin::compat::format("All {} security codes for {} are in use",
                                    keyspace_size(), issue_date),
            kModule);
    }

    for (int attempt = 0; attempt < config_.max_random_attempts; ++attempt) {
        auto code = random_code();
        if (code.is_err()) {
            return Result<storage::security_code_record>(code.error());
        }

        auto stored = repository_.insert_security_code(issue_date, code.value(), clock_.now());
        if (stored.is_err()) {
            return Result<storage::security_code_record>(stored.error());
        }
        if (stored.value()) {
            return *stored.value();
        }
        logger_adapter::debug("Security code collision on {} (attempt {})",
                              issue_date, attempt + 1);
    }

    return scan_for_free_code(issue_date);
}

auto security_code_issuer::validate_config() const -> VoidResult {
    if (config_.alphabet.size() < 2) {
        return checkin_void_error(error_codes::invalid_configuration,
                                  "Security code alphabet needs at least two characters",
                                  kModule);
    }
    if (config_.alphabet.size() > 256) {
        return checkin_void_error(error_codes::invalid_configuration,
                                  "Security code alphabet is larger than 256 characters",
                                  kModule);
    }
    if (config_.length == 0 || config_.length > 16) {
        return checkin_void_error(error_codes::invalid_configuration,
                                  "Security code length must be between 1 and 16",
                                  kModule);
    }

    std::unordered_set<char> seen;
    for (char c : config_.alphabet) {
        if (!seen.insert(c).second) {
            return checkin_void_error(
                error_codes::invalid_configuration,
                checkin::compat::format("Security code alphabet repeats '{}'", c),
                kModule);
        }
    }
    return ok();
}

auto security_code_issuer::random_code() const -> Result<std::string> {
    const auto base = static_cast<unsigned>(config_.alphabet.size());
    // Largest multiple of base that fits in a byte; values above it are
    // rejected so every character is equally likely.
    const unsigned limit = 256 - (256 % base);

    std::string code;
    code.reserve(config_.length);

    unsigned char buffer[32];
    while (code.size() < config_.length) {
        if (RAND_bytes(buffer, sizeof(buffer)) != 1) {
            return make_error<std::string>(error_codes::random_source_failure,
                                           "RAND_bytes failed", kModule);
        }
        for (unsigned char byte : buffer) {
            if (byte >= limit) {
                continue;
            }
            code.push_back(config_.alphabet[byte % base]);
            if (code.size() == config_.length) {
                break;
            }
        }
    }
    return code;
}

auto security_code_issuer::code_at(std::int64_t index) const -> std::string {
    const auto base = static_cast<std::int64_t>(config_.alphabet.size());
    std::string code(config_.length, config_.alphabet[0]);
    for (std::size_t pos = config_.length; pos-- > 0;) {
        code[pos] = config_.alphabet[static_cast<std::size_t>(index % base)];
        index /= base;
    }
    return code;
}

auto security_code_issuer::scan_for_free_code(const std::string& issue_date)
    -> Result<storage::security_code_record> {
    const auto keyspace = keyspace_size();
    if (keyspace > kMaxScannableKeyspace) {
        return make_error<storage::security_code_record>(
            error_codes::exhausted_keyspace,
            checkin::compat::format("No free security code found for {} after {} attempts",
                                    issue_date, config_.max_random_attempts),
            kModule);
    }

    auto taken_codes = repository_.list_codes_for_date(issue_date);
    if (taken_codes.is_err()) {
        return Result<storage::security_code_record>(taken_codes.error());
    }
    std::unordered_set<std::string> taken(taken_codes.value().begin(),
                                          taken_codes.value().end());

    logger_adapter::warn("Scanning for a free security code on {} ({} of {} in use)",
                         issue_date, taken.size(), keyspace);

    for (std::int64_t index = 0; index < keyspace; ++index) {
        auto candidate = code_at(index);
        if (taken.count(candidate) != 0) {
            continue;
        }

        auto stored = repository_.insert_security_code(issue_date, candidate, clock_.now());
        if (stored.is_err()) {
            return Result<storage::security_code_record>(stored.error());
        }
        if (stored.value()) {
            return *stored.value();
        }
        // Taken concurrently since the list was read
    }

    logger_adapter::error("Security code keyspace exhausted for {}", issue_date);
    return make_error<storage::security_code_record>(
        error_codes::exhausted_keyspace,
        checkin::compat::format("All {} security codes for {} are in use",
                                keyspace, issue_date),
        kModule);
}

}  // namespace checkin::security
