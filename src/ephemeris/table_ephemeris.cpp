/// @file table_ephemeris.cpp
/// @brief Implementation of the lookup-table provider.

#include "ephemeris/table_ephemeris.hpp"

#include "core/errors.hpp"

#include <spdlog/fmt/fmt.h>

namespace jyotish::ephemeris
{

TableEphemeris& TableEphemeris::set(Graha body, f64 tropical_longitude_deg, bool is_retrograde)
{
    m_entries[index_of(body)] = BodyPosition{
        .tropical_longitude_deg = tropical_longitude_deg,
        .is_retrograde          = is_retrograde,
    };
    return *this;
}

TableEphemeris& TableEphemeris::erase(Graha body)
{
    m_entries[index_of(body)].reset();
    return *this;
}

BodyPosition TableEphemeris::position(Graha body, f64 /*jd_utc*/) const
{
    const auto& entry = m_entries[index_of(body)];
    if (!entry)
    {
        throw core::EphemerisError(
            fmt::format("No table entry for {}", graha_name(body)), graha_name(body));
    }
    return *entry;
}

} // namespace jyotish::ephemeris
