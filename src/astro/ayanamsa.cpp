/// @file ayanamsa.cpp
/// @brief Ayanamsa offsets and name parsing.

#include "astro/ayanamsa.hpp"

#include "core/errors.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace jyotish::astro
{

const char* ayanamsa_name(AyanamsaSystem system)
{
    switch (system)
    {
        case AyanamsaSystem::Lahiri:       return "Lahiri";
        case AyanamsaSystem::Raman:        return "Raman";
        case AyanamsaSystem::Krishnamurti: return "Krishnamurti";
    }
    return "Unknown";
}

AyanamsaSystem parse_ayanamsa(std::string_view name)
{
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const AyanamsaSystem system : kAllAyanamsaSystems)
    {
        std::string candidate(ayanamsa_name(system));
        std::transform(candidate.begin(), candidate.end(), candidate.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (candidate == lowered)
        {
            return system;
        }
    }

    // "KP" is the customary short name of the Krishnamurti system
    if (lowered == "kp")
    {
        return AyanamsaSystem::Krishnamurti;
    }

    throw core::ConfigurationError(fmt::format("Unknown ayanamsa system '{}'", name));
}

f64 Ayanamsa::value_at_j2000(AyanamsaSystem system)
{
    switch (system)
    {
        case AyanamsaSystem::Lahiri:       return 23.85;  // Chitrapaksha
        case AyanamsaSystem::Raman:        return 22.50;
        case AyanamsaSystem::Krishnamurti: return 23.77;
    }
    throw core::ConfigurationError("Ayanamsa system out of range");
}

f64 Ayanamsa::offset(AyanamsaSystem system, f64 jd)
{
    const f64 years = (jd - astro_constants::kJ2000) / astro_constants::kDaysPerYear;
    return value_at_j2000(system) + years * kPrecessionDegPerYear;
}

} // namespace jyotish::astro
