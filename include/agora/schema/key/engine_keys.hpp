#pragma once

#include <agora/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema key type: engine keys.
// Governance workflow: Defines canonical key prefixes and key codecs for the
// Initiative Store, Participation Registry, global scalars and history.
namespace agora::schema::key {

inline constexpr std::string_view kInitiativeKeyPrefix{
    "SYS|STATE|INITIATIVE|"};
inline constexpr std::string_view kParticipationKeyPrefix{
    "SYS|STATE|PARTICIPATION|"};
inline constexpr std::string_view kTotalInitiativesKey{
    "SYS|STATE|GOVERNANCE|TOTAL"};
inline constexpr std::string_view kStandardSpanKey{
    "SYS|STATE|GOVERNANCE|STANDARD_SPAN"};
inline constexpr std::string_view kGuardianKey{
    "SYS|STATE|GOVERNANCE|GUARDIAN"};
inline constexpr std::string_view kHistoryPrefix{"SYS|HISTORY|TX|"};
inline constexpr std::string_view kHistoryPositionKey{
    "SYS|HISTORY|NEXT_POSITION"};

agora::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                         const agora::schema::bytes_t& id);

agora::schema::bytes_t make_initiative_key(
    agora::schema::initiative_id_t initiative_id);

/// All participation rows of one initiative share the prefix
/// `make_participation_prefix(initiative_id)`.
agora::schema::bytes_t make_participation_prefix(
    agora::schema::initiative_id_t initiative_id);
agora::schema::bytes_t make_participation_key(
    agora::schema::initiative_id_t initiative_id,
    const agora::schema::account_id_t& participant);

agora::schema::bytes_t make_total_initiatives_key();
agora::schema::bytes_t make_standard_span_key();
agora::schema::bytes_t make_guardian_key();

/// History keys use big-endian height and a store-wide position so that a
/// prefix scan returns rows in execution order. Positions never repeat, so
/// several blocks finalized at the same height keep all of their rows.
agora::schema::bytes_t make_history_key(uint64_t height, uint64_t position);
std::optional<std::pair<uint64_t, uint64_t>> parse_history_key(
    const agora::schema::bytes_view_t& key);
agora::schema::bytes_t make_history_position_key();

}  // namespace agora::schema::key
