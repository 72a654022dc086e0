#include <agora/schema/key/engine_keys.hpp>

#include <agora/schema/encoding/scale/encoder.hpp>

#include <boost/endian/buffers.hpp>

#include <algorithm>
#include <iterator>
#include <tuple>

namespace agora::schema::key {

namespace {

using key_encoder_t = agora::schema::encoding::encoder<
    agora::schema::encoding::scale_encoder_tag>;

// Initiative ids are written big-endian so the participation prefix of one
// initiative never collides with the prefix of another.
agora::schema::bytes_t encode_initiative_id(
    const agora::schema::initiative_id_t initiative_id) {
  auto buffer = boost::endian::big_uint64_buf_t{initiative_id};
  return agora::schema::bytes_t{buffer.data(), buffer.data() + sizeof(buffer)};
}

}  // namespace

agora::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                         const agora::schema::bytes_t& id) {
  auto key = agora::schema::make_bytes(prefix);
  key.reserve(key.size() + id.size());
  key.insert(std::end(key), std::begin(id), std::end(id));
  return key;
}

agora::schema::bytes_t make_initiative_key(
    const agora::schema::initiative_id_t initiative_id) {
  return make_prefixed_key(kInitiativeKeyPrefix,
                           encode_initiative_id(initiative_id));
}

agora::schema::bytes_t make_participation_prefix(
    const agora::schema::initiative_id_t initiative_id) {
  return make_prefixed_key(kParticipationKeyPrefix,
                           encode_initiative_id(initiative_id));
}

agora::schema::bytes_t make_participation_key(
    const agora::schema::initiative_id_t initiative_id,
    const agora::schema::account_id_t& participant) {
  auto key = make_participation_prefix(initiative_id);
  auto encoded = key_encoder_t{}.encode(participant);
  key.insert(std::end(key), std::begin(encoded), std::end(encoded));
  return key;
}

agora::schema::bytes_t make_total_initiatives_key() {
  return agora::schema::make_bytes(kTotalInitiativesKey);
}

agora::schema::bytes_t make_standard_span_key() {
  return agora::schema::make_bytes(kStandardSpanKey);
}

agora::schema::bytes_t make_guardian_key() {
  return agora::schema::make_bytes(kGuardianKey);
}

agora::schema::bytes_t make_history_key(const uint64_t height,
                                        const uint64_t position) {
  auto height_buffer = boost::endian::big_uint64_buf_t{height};
  auto position_buffer = boost::endian::big_uint64_buf_t{position};
  auto suffix = agora::schema::bytes_t{};
  suffix.reserve(sizeof(height_buffer) + sizeof(position_buffer));
  std::copy_n(height_buffer.data(), sizeof(height_buffer),
              std::back_inserter(suffix));
  std::copy_n(position_buffer.data(), sizeof(position_buffer),
              std::back_inserter(suffix));
  return make_prefixed_key(kHistoryPrefix, suffix);
}

std::optional<std::pair<uint64_t, uint64_t>> parse_history_key(
    const agora::schema::bytes_view_t& key) {
  constexpr auto kSuffixSize = sizeof(uint64_t) + sizeof(uint64_t);
  if (key.size() != kHistoryPrefix.size() + kSuffixSize ||
      !agora::schema::make_string_view(key).starts_with(kHistoryPrefix)) {
    return std::nullopt;
  }
  auto height_buffer = boost::endian::big_uint64_buf_t{};
  auto position_buffer = boost::endian::big_uint64_buf_t{};
  auto suffix = key.subspan(kHistoryPrefix.size());
  std::copy_n(suffix.data(), sizeof(height_buffer),
              reinterpret_cast<uint8_t*>(&height_buffer));
  std::copy_n(suffix.data() + sizeof(height_buffer), sizeof(position_buffer),
              reinterpret_cast<uint8_t*>(&position_buffer));
  return std::pair<uint64_t, uint64_t>{height_buffer.value(),
                                       position_buffer.value()};
}

agora::schema::bytes_t make_history_position_key() {
  return agora::schema::make_bytes(kHistoryPositionKey);
}

}  // namespace agora::schema::key
