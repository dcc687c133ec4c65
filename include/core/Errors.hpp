// Error taxonomy shared by the analytics core.
//
// Structural problems with input records surface as MalformedInputError and
// are never coerced. InsufficientDataError is a "skip" signal used inside the
// forecaster's batch path; it does not escape to callers of summarize().

#ifndef CORE_ERRORS_HPP
#define CORE_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace core
{

/**
 * @brief Raised when an input record cannot be used as given.
 *
 * Typical causes: unparseable timestamp, empty required field,
 * smoothing constant outside (0, 1], duplicate alert id in a batch.
 */
class MalformedInputError : public std::runtime_error
{
public:
    MalformedInputError(std::string field, const std::string& what)
        : std::runtime_error(what),
          m_field(std::move(field))
    {
    }

    MalformedInputError(std::string field, std::string recordId, const std::string& what)
        : std::runtime_error(what),
          m_field(std::move(field)),
          m_recordId(std::move(recordId))
    {
    }

    /// Name of the offending field (e.g. "timestamp", "alpha").
    const std::string& field() const noexcept
    {
        return m_field;
    }

    /// Identifier of the offending record, empty when not applicable.
    const std::string& recordId() const noexcept
    {
        return m_recordId;
    }

private:
    std::string m_field;
    std::string m_recordId;
};

/**
 * @brief A series is too short to be modelled.
 */
class InsufficientDataError : public std::runtime_error
{
public:
    InsufficientDataError(std::size_t available, std::size_t required)
        : std::runtime_error("insufficient data: " + std::to_string(available) +
                             " points, " + std::to_string(required) + " required"),
          m_available(available),
          m_required(required)
    {
    }

    std::size_t available() const noexcept { return m_available; }
    std::size_t required() const noexcept { return m_required; }

private:
    std::size_t m_available;
    std::size_t m_required;
};

} // namespace core

#endif // CORE_ERRORS_HPP
