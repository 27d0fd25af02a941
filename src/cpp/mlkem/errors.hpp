/**
 * ML-KEM error types
 *
 * The core only fails at its boundary: a buffer of the wrong length or an
 * unknown parameter set. Decapsulation of a well-formed ciphertext never
 * reports failure (implicit rejection).
 */

#ifndef MLKEM_ERRORS_HPP
#define MLKEM_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace mlkem {

/**
 * Thrown when a key, ciphertext, seed or randomness buffer does not have the
 * fixed length required by the parameter set.
 */
class InvalidLength : public std::invalid_argument {
public:
    InvalidLength(const std::string& what_buffer, size_t expected, size_t actual)
        : std::invalid_argument("Invalid " + what_buffer + " length: expected " +
                                std::to_string(expected) + " bytes, got " +
                                std::to_string(actual))
        , buffer_(what_buffer)
        , expected_(expected)
        , actual_(actual) {}

    [[nodiscard]] const std::string& buffer() const noexcept { return buffer_; }
    [[nodiscard]] size_t expected() const noexcept { return expected_; }
    [[nodiscard]] size_t actual() const noexcept { return actual_; }

private:
    std::string buffer_;
    size_t expected_;
    size_t actual_;
};

/**
 * Thrown for an unrecognized security-level selector.
 */
class InvalidParameterSet : public std::invalid_argument {
public:
    explicit InvalidParameterSet(const std::string& selector)
        : std::invalid_argument("Unknown ML-KEM parameter set: " + selector)
        , selector_(selector) {}

    [[nodiscard]] const std::string& selector() const noexcept { return selector_; }

private:
    std::string selector_;
};

} // namespace mlkem

#endif // MLKEM_ERRORS_HPP
