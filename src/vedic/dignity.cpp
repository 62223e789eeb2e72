/// @file dignity.cpp
/// @brief Panchadha Maitri dignity evaluation.

#include "vedic/dignity.hpp"

#include "vedic/bhava.hpp"

namespace jyotish::vedic
{

const char* dignity_status_name(DignityStatus status)
{
    switch (status)
    {
        case DignityStatus::Exalted:      return "Exalted";
        case DignityStatus::Moolatrikona: return "Moolatrikona";
        case DignityStatus::OwnSign:      return "Own Sign";
        case DignityStatus::GreatFriend:  return "Great Friend";
        case DignityStatus::Friend:       return "Friend";
        case DignityStatus::Neutral:      return "Neutral";
        case DignityStatus::Enemy:        return "Enemy";
        case DignityStatus::GreatEnemy:   return "Great Enemy";
        case DignityStatus::Debilitated:  return "Debilitated";
    }
    return "Unknown";
}

const char* compound_relation_name(CompoundRelation relation)
{
    switch (relation)
    {
        case CompoundRelation::GreatFriend: return "Great Friend";
        case CompoundRelation::Friend:      return "Friend";
        case CompoundRelation::Neutral:     return "Neutral";
        case CompoundRelation::Enemy:       return "Enemy";
        case CompoundRelation::GreatEnemy:  return "Great Enemy";
    }
    return "Unknown";
}

i32 DignityEngine::score(DignityStatus status)
{
    switch (status)
    {
        case DignityStatus::Exalted:      return 9;
        case DignityStatus::Moolatrikona: return 8;
        case DignityStatus::OwnSign:      return 7;
        case DignityStatus::GreatFriend:  return 6;
        case DignityStatus::Friend:       return 5;
        case DignityStatus::Neutral:      return 4;
        case DignityStatus::Enemy:        return 3;
        case DignityStatus::GreatEnemy:   return 2;
        case DignityStatus::Debilitated:  return 1;
    }
    return 4;
}

TemporaryRelation DignityEngine::temporary_relation(i32 from_house, i32 to_house)
{
    switch (BhavaCalculator::house_distance(from_house, to_house))
    {
        case 2: case 3: case 4: case 10: case 11: case 12:
            return TemporaryRelation::Friend;
        default:
            return TemporaryRelation::Enemy;
    }
}

// -----------------------------------------------------------------
// Natural + temporary → compound
//
//   natural \ temporary |  Friend       Enemy
//   --------------------+--------------------------
//   Friend              |  GreatFriend  Neutral
//   Neutral             |  Friend       Enemy
//   Enemy               |  Neutral      GreatEnemy
// -----------------------------------------------------------------

CompoundRelation DignityEngine::combine(NaturalRelation natural, TemporaryRelation temporary)
{
    const bool temp_friend = temporary == TemporaryRelation::Friend;
    switch (natural)
    {
        case NaturalRelation::Friend:
            return temp_friend ? CompoundRelation::GreatFriend : CompoundRelation::Neutral;
        case NaturalRelation::Neutral:
            return temp_friend ? CompoundRelation::Friend : CompoundRelation::Enemy;
        case NaturalRelation::Enemy:
            return temp_friend ? CompoundRelation::Neutral : CompoundRelation::GreatEnemy;
    }
    return CompoundRelation::Neutral;
}

// -----------------------------------------------------------------
// Dignity
// -----------------------------------------------------------------

std::optional<Dignity> DignityEngine::fixed_dignity(Graha graha, Rasi rasi,
                                                    std::optional<f64> degree_in_rasi) const
{
    const DignityInfo& info = m_tables.dignity_info(graha);

    if (rasi == info.exaltation)
    {
        return Dignity{DignityStatus::Exalted, score(DignityStatus::Exalted)};
    }
    if (rasi == info.debilitation)
    {
        return Dignity{DignityStatus::Debilitated, score(DignityStatus::Debilitated)};
    }
    if (rasi == info.moolatrikona)
    {
        const bool in_range = !degree_in_rasi
            || (*degree_in_rasi >= info.moolatrikona_start && *degree_in_rasi <= info.moolatrikona_end);
        if (in_range)
        {
            return Dignity{DignityStatus::Moolatrikona, score(DignityStatus::Moolatrikona)};
        }
    }
    if (m_tables.owns(graha, rasi))
    {
        return Dignity{DignityStatus::OwnSign, score(DignityStatus::OwnSign)};
    }
    return std::nullopt;
}

Dignity DignityEngine::dignity(Graha graha, Rasi rasi) const
{
    if (const auto fixed = fixed_dignity(graha, rasi, std::nullopt))
    {
        return *fixed;
    }

    DignityStatus status = DignityStatus::Neutral;
    switch (m_tables.natural_relation(graha, m_tables.ruler(rasi)))
    {
        case NaturalRelation::Friend:  status = DignityStatus::Friend; break;
        case NaturalRelation::Neutral: status = DignityStatus::Neutral; break;
        case NaturalRelation::Enemy:   status = DignityStatus::Enemy; break;
    }
    return Dignity{status, score(status)};
}

Dignity DignityEngine::dignity(Graha graha, Rasi rasi, std::optional<f64> degree_in_rasi,
                               CompoundRelation relation_to_lord) const
{
    if (const auto fixed = fixed_dignity(graha, rasi, degree_in_rasi))
    {
        return *fixed;
    }

    DignityStatus status = DignityStatus::Neutral;
    switch (relation_to_lord)
    {
        case CompoundRelation::GreatFriend: status = DignityStatus::GreatFriend; break;
        case CompoundRelation::Friend:      status = DignityStatus::Friend; break;
        case CompoundRelation::Neutral:     status = DignityStatus::Neutral; break;
        case CompoundRelation::Enemy:       status = DignityStatus::Enemy; break;
        case CompoundRelation::GreatEnemy:  status = DignityStatus::GreatEnemy; break;
    }
    return Dignity{status, score(status)};
}

CompoundMatrix DignityEngine::compound_matrix(const GrahaPositions& positions) const
{
    CompoundMatrix matrix{};
    for (const GrahaPosition& from : positions)
    {
        for (const GrahaPosition& to : positions)
        {
            CompoundRelation relation = CompoundRelation::Neutral;
            if (from.graha != to.graha)
            {
                relation = combine(m_tables.natural_relation(from.graha, to.graha),
                                   temporary_relation(from.house, to.house));
            }
            matrix[index_of(from.graha)][index_of(to.graha)] = relation;
        }
    }
    return matrix;
}

std::array<Dignity, 9> DignityEngine::evaluate(const GrahaPositions& positions) const
{
    const CompoundMatrix matrix = compound_matrix(positions);

    std::array<Dignity, 9> result{};
    for (const GrahaPosition& pos : positions)
    {
        const Graha lord = m_tables.ruler(pos.point.rasi);
        result[index_of(pos.graha)] = dignity(pos.graha, pos.point.rasi, pos.point.degree_in_rasi,
                                              matrix[index_of(pos.graha)][index_of(lord)]);
    }
    return result;
}

} // namespace jyotish::vedic
