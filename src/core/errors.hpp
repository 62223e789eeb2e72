#pragma once

/// @file errors.hpp
/// @brief Exception taxonomy for chart construction failures.

#include <stdexcept>
#include <string>
#include <utility>

namespace jyotish::core
{
    /// @brief Classification of a chart construction failure.
    enum class ErrorKind
    {
        Input,
        Configuration,
        Ephemeris,
        CalculationInvariant,
    };

    [[nodiscard]] inline const char* error_kind_name(ErrorKind kind)
    {
        switch (kind)
        {
            case ErrorKind::Input:                return "InputError";
            case ErrorKind::Configuration:        return "ConfigurationError";
            case ErrorKind::Ephemeris:            return "EphemerisError";
            case ErrorKind::CalculationInvariant: return "CalculationInvariantError";
        }
        return "UnknownError";
    }

    /// @brief Base of every error raised by the chart engine.
    class JyotishError : public std::runtime_error
    {
    public:
        JyotishError(ErrorKind kind, const std::string& message)
            : std::runtime_error(message)
            , m_kind(kind)
        {
        }

        [[nodiscard]] ErrorKind kind() const noexcept { return m_kind; }

    private:
        ErrorKind m_kind;
    };

    /// @brief Malformed or out-of-range birth instant or coordinates.
    class InputError : public JyotishError
    {
    public:
        explicit InputError(const std::string& message)
            : JyotishError(ErrorKind::Input, message)
        {
        }
    };

    /// @brief Unknown ayanamsa or house system.
    class ConfigurationError : public JyotishError
    {
    public:
        explicit ConfigurationError(const std::string& message)
            : JyotishError(ErrorKind::Configuration, message)
        {
        }
    };

    /// @brief Position provider failed or returned an unusable longitude.
    class EphemerisError : public JyotishError
    {
    public:
        EphemerisError(const std::string& message, std::string body)
            : JyotishError(ErrorKind::Ephemeris, message)
            , m_body(std::move(body))
        {
        }

        /// @brief Name of the body whose position could not be obtained.
        [[nodiscard]] const std::string& body() const noexcept { return m_body; }

    private:
        std::string m_body;
    };

    /// @brief An internal consistency check failed. Always a defect.
    class CalculationInvariantError : public JyotishError
    {
    public:
        explicit CalculationInvariantError(const std::string& message)
            : JyotishError(ErrorKind::CalculationInvariant, message)
        {
        }
    };

} // namespace jyotish::core
