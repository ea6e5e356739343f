#pragma once

#include <stdexcept>
#include <string>

/**
 * @file errors.hpp
 * @brief Exceptions for failures that abort a whole request.
 *
 * Routine outcomes (seat conflicts, expired holds, declined payments, policy
 * rejections) are never thrown; they come back as typed result structs.
 * Only the three cases below propagate as exceptions.
 */

namespace showseat {

/**
 * @brief The inventory could not apply a transition (storage unavailable).
 *
 * Thrown after any partially applied seat transitions have been rolled back.
 */
class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& what) : std::runtime_error(what) {}
};

/** @brief Malformed or inconsistent configuration / catalog file. */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @brief A (show, seat) was about to hold two non-Available states at once,
 * or a booking was asked for an illegal status transition.
 *
 * Unreachable in a correct run; always logged with SHOWSEAT_WARN before
 * being thrown.
 */
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& what) : std::logic_error(what) {}
};

} // namespace showseat
