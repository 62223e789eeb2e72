#pragma once

/// @file table_ephemeris.hpp
/// @brief Fixed lookup-table position provider.

#include "ephemeris/ephemeris_provider.hpp"

#include <array>
#include <optional>

namespace jyotish::ephemeris
{
    /// @brief Returns the same stored position for a body regardless of the instant.
    ///
    /// Used as a deterministic stand-in for a real ephemeris. Stored values are
    /// returned unmodified, so out-of-range entries reach the engine's validation.
    class TableEphemeris final : public EphemerisProvider
    {
    public:
        TableEphemeris() = default;

        /// @brief Store (or replace) the position of one body.
        TableEphemeris& set(Graha body, f64 tropical_longitude_deg, bool is_retrograde = false);

        /// @brief Remove a body so that lookups for it fail.
        TableEphemeris& erase(Graha body);

        /// @throws core::EphemerisError if the body has no entry.
        [[nodiscard]] BodyPosition position(Graha body, f64 jd_utc) const override;

    private:
        std::array<std::optional<BodyPosition>, 9> m_entries{};
    };

} // namespace jyotish::ephemeris
