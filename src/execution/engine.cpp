#include <spdlog/spdlog.h>
#include <agora/blake3/hash.hpp>
#include <agora/common/critical.hpp>
#include <agora/execution/deliberation_window.hpp>
#include <agora/execution/engine.hpp>
#include <agora/schema/deliberation.hpp>
#include <agora/schema/key/engine_keys.hpp>
#include <agora/schema/query_error_code.hpp>
#include <algorithm>
#include <iterator>
#include <limits>
#include <string>
#include <tuple>
#include <utility>

using namespace agora::schema;

namespace {

using encoder_t = agora::schema::encoding::encoder<
    agora::schema::encoding::scale_encoder_tag>;

constexpr auto kFinalizeCodespace = std::string_view{"agora.finalize"};
constexpr auto kGovernanceCodespace = std::string_view{"agora.governance"};
constexpr auto kQueryCodespace = std::string_view{"agora.query"};

// Committed heights are reported as int64_t.
constexpr auto kMaxBlockHeight =
    static_cast<uint64_t>(std::numeric_limits<int64_t>::max());

hash32_t fold_state_root(const hash32_t& seed,
                         const bytes_t& tx,
                         const uint64_t height,
                         const uint64_t index) {
  auto material = bytes_t{};
  material.reserve(seed.size() + tx.size() + 16);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  encoder.encode(std::tuple{height, index}, material);
  return agora::blake3::hash(make_bytes_view(material));
}

std::optional<transaction_t> decode_transaction(const bytes_view_t& raw_tx,
                                                std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<transaction_t>(raw_tx);
  if (!tx) {
    error = "transaction is not valid SCALE";
  }
  return tx;
}

transaction_result_t make_error(const transaction_error_code code,
                                const std::string_view codespace,
                                std::string info) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

transaction_result_t make_governance_error(const transaction_error_code code,
                                           std::string info) {
  return make_error(code, kGovernanceCodespace, std::move(info));
}

transaction_event_t make_event(
    std::string type,
    std::vector<std::pair<std::string, std::string>> attributes) {
  auto event = transaction_event_t{};
  event.type = std::move(type);
  event.attributes.reserve(attributes.size());
  for (auto& [key, value] : attributes) {
    event.attributes.push_back(transaction_event_attribute_t{
        .key = std::move(key), .value = std::move(value), .index = true});
  }
  return event;
}

std::string span_bounds_message() {
  return "deliberation span must be within [" +
         std::to_string(kMinDeliberationSpan) + ", " +
         std::to_string(kMaxDeliberationSpan) + "]";
}

query_result_t make_query_error(const query_error_code code,
                                std::string log,
                                const int64_t height) {
  auto result = query_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.height = height;
  result.codespace = std::string{kQueryCodespace};
  return result;
}

}  // namespace

namespace agora::execution {

engine::engine(
    agora::schema::encoding::encoder<
        agora::schema::encoding::scale_encoder_tag>& encoder,
    agora::storage::storage<agora::storage::rocksdb_storage_tag>& storage,
    governance_options options)
    : encoder_{encoder}, storage_{storage}, options_{std::move(options)} {
  auto lock = std::scoped_lock{mutex_};
  spdlog::info("Initializing governance engine for guardian {}",
               to_hex(options_.guardian));
  load_persisted_state();
  spdlog::info("Governance engine ready at height {} with {} initiative(s)",
               last_committed_height_, load_total());
}

block_result_t engine::finalize_block(const uint64_t height,
                                      const std::vector<bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  if (height < current_block_height_) {
    spdlog::error("Block height {} is below last finalized height {}", height,
                  current_block_height_);
    agora::common::critical("block height must not decrease");
  }
  if (height > kMaxBlockHeight) {
    spdlog::error("Block height {} exceeds {}", height, kMaxBlockHeight);
    agora::common::critical("block height does not fit the committed height");
  }
  current_block_height_ = height;

  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());

  auto rolling_root = pending_state_root_;
  for (size_t i = 0; i < txs.size(); ++i) {
    auto writes = std::vector<agora::storage::key_value_entry_t>{};
    auto tx_result = transaction_result_t{};

    auto decode_error = std::string{};
    auto maybe_tx = decode_transaction(make_bytes_view(txs[i]), decode_error);
    if (!maybe_tx) {
      tx_result = make_error(transaction_error_code::invalid_transaction,
                             kFinalizeCodespace, decode_error);
    } else if (maybe_tx->version != 1) {
      tx_result =
          make_error(transaction_error_code::unsupported_transaction_version,
                     kFinalizeCodespace, "expected version 1");
    } else {
      tx_result = execute_operation(*maybe_tx, height, writes);
    }

    if (tx_result.code != 0) {
      writes.clear();
      spdlog::warn("Rejected tx {} at height {}: {} ({})", i, height,
                   tx_result.log, tx_result.info);
    } else {
      spdlog::debug("Executed tx {} at height {}: {}", i, height,
                    tx_result.info);
    }

    auto entry = history_entry_t{.height = height,
                                 .index = static_cast<uint32_t>(i),
                                 .code = tx_result.code,
                                 .tx = txs[i]};
    stage(writes,
          agora::schema::key::make_history_key(height, next_history_position_),
          entry);
    stage(writes, agora::schema::key::make_history_position_key(),
          next_history_position_ + 1);
    storage_.write_batch(writes);
    ++next_history_position_;

    if (tx_result.code == 0) {
      rolling_root = fold_state_root(rolling_root, txs[i], height, i);
    }
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_) {
    last_committed_height_ = *pending_height_;
    last_committed_state_root_ = pending_state_root_;
    pending_height_.reset();
  }

  storage_.save_committed_state(agora::storage::committed_state{
      .height = last_committed_height_,
      .state_root = last_committed_state_root_});
  spdlog::info("Committed height {}", last_committed_height_);

  auto result = commit_result_t{};
  result.retain_height = 0;
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) const {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = last_committed_height_;
  result.codespace = std::string{kQueryCodespace};

  if (path == "/engine/info") {
    result.value = encoder_.encode(
        std::tuple{last_committed_height_, last_committed_state_root_});
    return result;
  }
  if (path == "/governance/total") {
    result.value = encoder_.encode(load_total());
    return result;
  }
  if (path == "/governance/config") {
    result.value = encoder_.encode(
        std::tuple{options_.guardian, load_standard_span(),
                   kMinDeliberationSpan, kMaxDeliberationSpan});
    return result;
  }
  if (path == "/initiative/status") {
    auto initiative_id = encoder_.try_decode<initiative_id_t>(data);
    if (!initiative_id) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE uint64 initiative id",
                              last_committed_height_);
    }
    result.value =
        encoder_.encode(make_status(*initiative_id, current_block_height_));
    return result;
  }
  if (path == "/participation/signaled") {
    auto decoded =
        encoder_.try_decode<std::tuple<account_id_t, initiative_id_t>>(data);
    if (!decoded) {
      return make_query_error(
          query_error_code::invalid_key,
          "expected SCALE (participant, initiative id) tuple",
          last_committed_height_);
    }
    result.value = encoder_.encode(
        load_signaled(std::get<0>(*decoded), std::get<1>(*decoded)));
    return result;
  }
  if (path == "/history/range") {
    auto decoded = encoder_.try_decode<std::tuple<uint64_t, uint64_t>>(data);
    if (!decoded) {
      return make_query_error(query_error_code::invalid_key,
                              "expected SCALE (from, to) height tuple",
                              last_committed_height_);
    }
    result.value = encoder_.encode(
        load_history(std::get<0>(*decoded), std::get<1>(*decoded)));
    return result;
  }

  spdlog::warn("Unsupported query path '{}'", path);
  return make_query_error(query_error_code::unsupported_path,
                          "unsupported query path", last_committed_height_);
}

std::optional<initiative_status_t> engine::get_status(
    const initiative_id_t initiative_id) const {
  auto lock = std::scoped_lock{mutex_};
  return make_status(initiative_id, current_block_height_);
}

std::optional<initiative_status_t> engine::get_status(
    const initiative_id_t initiative_id,
    const sequence_t sequence) const {
  auto lock = std::scoped_lock{mutex_};
  return make_status(initiative_id, sequence);
}

uint64_t engine::get_total() const {
  auto lock = std::scoped_lock{mutex_};
  return load_total();
}

bool engine::has_signaled(const account_id_t& participant,
                          const initiative_id_t initiative_id) const {
  auto lock = std::scoped_lock{mutex_};
  return load_signaled(participant, initiative_id);
}

sequence_t engine::standard_deliberation_span() const {
  auto lock = std::scoped_lock{mutex_};
  return load_standard_span();
}

const account_id_t& engine::guardian() const {
  return options_.guardian;
}

std::vector<history_entry_t> engine::history(const uint64_t from_height,
                                             const uint64_t to_height) const {
  auto lock = std::scoped_lock{mutex_};
  return load_history(from_height, to_height);
}

transaction_result_t engine::execute_operation(
    const transaction_t& tx,
    const sequence_t sequence,
    std::vector<agora::storage::key_value_entry_t>& writes) {
  return std::visit(
      overloaded{[&](const create_initiative_t& operation) {
                   return create_initiative(tx.signer, operation, sequence,
                                            writes);
                 },
                 [&](const signal_initiative_t& operation) {
                   return signal_initiative(tx.signer, operation, sequence,
                                            writes);
                 },
                 [&](const terminate_initiative_t& operation) {
                   return terminate_initiative(tx.signer, operation, writes);
                 },
                 [&](const configure_default_span_t& operation) {
                   return configure_default_span(tx.signer, operation,
                                                 writes);
                 }},
      tx.payload);
}

transaction_result_t engine::create_initiative(
    const account_id_t& caller,
    const create_initiative_t& operation,
    const sequence_t sequence,
    std::vector<agora::storage::key_value_entry_t>& writes) {
  if (!options_.is_guardian(caller)) {
    return make_governance_error(transaction_error_code::unauthorized_access,
                                 "only the guardian may create initiatives");
  }
  if (!is_valid_title(operation.title)) {
    return make_governance_error(
        transaction_error_code::malformed_input,
        "title length must be within [1, " + std::to_string(kMaxTitleLength) +
            "]");
  }
  if (!is_valid_summary(operation.summary)) {
    return make_governance_error(
        transaction_error_code::malformed_input,
        "summary length must be within [1, " +
            std::to_string(kMaxSummaryLength) + "]");
  }
  auto span = operation.deliberation_span.value_or(load_standard_span());
  if (!is_valid_deliberation_span(span)) {
    return make_governance_error(transaction_error_code::malformed_input,
                                 span_bounds_message());
  }

  auto initiative_id = load_total() + 1;
  auto initiative = initiative_state_t{.initiative_id = initiative_id,
                                       .title = operation.title,
                                       .summary = operation.summary,
                                       .consensus_tally = 0,
                                       .active = true,
                                       .author = caller,
                                       .genesis_sequence = sequence,
                                       .deliberation_span = span};
  stage(writes, agora::schema::key::make_initiative_key(initiative_id),
        initiative);
  stage(writes, agora::schema::key::make_total_initiatives_key(),
        initiative_id);

  auto result = transaction_result_t{};
  result.data = encoder_.encode(initiative_id);
  result.info = "initiative " + std::to_string(initiative_id) + " created";
  result.events.push_back(make_event(
      "initiative_created",
      {{"initiative_id", std::to_string(initiative_id)},
       {"author", to_hex(caller)},
       {"genesis_sequence", std::to_string(sequence)},
       {"deliberation_span", std::to_string(span)}}));
  return result;
}

transaction_result_t engine::signal_initiative(
    const account_id_t& caller,
    const signal_initiative_t& operation,
    const sequence_t sequence,
    std::vector<agora::storage::key_value_entry_t>& writes) {
  auto initiative_id = operation.initiative_id;
  if (initiative_id < 1 || initiative_id > load_total()) {
    return make_governance_error(transaction_error_code::invalid_initiative,
                                 "initiative id is out of range");
  }
  auto initiative = load_initiative(initiative_id);
  if (!initiative) {
    return make_governance_error(transaction_error_code::invalid_initiative,
                                 "initiative is not stored");
  }
  if (!is_active(*initiative, sequence)) {
    return make_governance_error(
        transaction_error_code::deliberation_expired,
        "initiative " + std::to_string(initiative_id) +
            " is not accepting signals");
  }
  auto record = load_participation(initiative_id, caller);
  if (record && record->participated) {
    return make_governance_error(
        transaction_error_code::duplicate_participation,
        "participant already signaled on initiative " +
            std::to_string(initiative_id));
  }

  ++initiative->consensus_tally;
  stage(writes,
        agora::schema::key::make_participation_key(initiative_id, caller),
        participation_record_t{.participated = true,
                               .participation_sequence = sequence});
  stage(writes, agora::schema::key::make_initiative_key(initiative_id),
        *initiative);

  auto result = transaction_result_t{};
  result.info = "signal recorded on initiative " +
                std::to_string(initiative_id);
  result.events.push_back(make_event(
      "signal_recorded",
      {{"initiative_id", std::to_string(initiative_id)},
       {"participant", to_hex(caller)},
       {"consensus_tally", std::to_string(initiative->consensus_tally)}}));
  return result;
}

// Lookup runs before the guardian check and the range check after it, so
// unknown ids report initiative_not_found to every caller.
transaction_result_t engine::terminate_initiative(
    const account_id_t& caller,
    const terminate_initiative_t& operation,
    std::vector<agora::storage::key_value_entry_t>& writes) {
  auto initiative_id = operation.initiative_id;
  auto initiative = load_initiative(initiative_id);
  if (!initiative) {
    return make_governance_error(
        transaction_error_code::initiative_not_found,
        "initiative " + std::to_string(initiative_id) + " does not exist");
  }
  if (!options_.is_guardian(caller)) {
    return make_governance_error(transaction_error_code::unauthorized_access,
                                 "only the guardian may terminate initiatives");
  }
  if (initiative_id < 1 || initiative_id > load_total()) {
    return make_governance_error(transaction_error_code::invalid_initiative,
                                 "initiative id is out of range");
  }

  initiative->active = false;
  stage(writes, agora::schema::key::make_initiative_key(initiative_id),
        *initiative);

  auto result = transaction_result_t{};
  result.info = "initiative " + std::to_string(initiative_id) + " terminated";
  result.events.push_back(
      make_event("initiative_terminated",
                 {{"initiative_id", std::to_string(initiative_id)}}));
  return result;
}

transaction_result_t engine::configure_default_span(
    const account_id_t& caller,
    const configure_default_span_t& operation,
    std::vector<agora::storage::key_value_entry_t>& writes) {
  if (!options_.is_guardian(caller)) {
    return make_governance_error(
        transaction_error_code::unauthorized_access,
        "only the guardian may configure the standard span");
  }
  if (!is_valid_deliberation_span(operation.deliberation_span)) {
    return make_governance_error(transaction_error_code::malformed_input,
                                 span_bounds_message());
  }

  stage(writes, agora::schema::key::make_standard_span_key(),
        operation.deliberation_span);

  auto result = transaction_result_t{};
  result.info = "standard span set to " +
                std::to_string(operation.deliberation_span);
  result.events.push_back(make_event(
      "standard_span_configured",
      {{"deliberation_span", std::to_string(operation.deliberation_span)}}));
  return result;
}

std::optional<initiative_state_t> engine::load_initiative(
    const initiative_id_t initiative_id) const {
  auto key = agora::schema::key::make_initiative_key(initiative_id);
  return storage_.get<initiative_state_t>(encoder_, make_bytes_view(key));
}

std::optional<participation_record_t> engine::load_participation(
    const initiative_id_t initiative_id,
    const account_id_t& participant) const {
  auto key =
      agora::schema::key::make_participation_key(initiative_id, participant);
  return storage_.get<participation_record_t>(encoder_, make_bytes_view(key));
}

uint64_t engine::load_total() const {
  auto key = agora::schema::key::make_total_initiatives_key();
  return storage_.get<uint64_t>(encoder_, make_bytes_view(key)).value_or(0);
}

bool engine::load_signaled(const account_id_t& participant,
                           const initiative_id_t initiative_id) const {
  if (initiative_id < 1 || initiative_id > load_total()) {
    return false;
  }
  auto record = load_participation(initiative_id, participant);
  return record.has_value() && record->participated;
}

std::vector<history_entry_t> engine::load_history(
    const uint64_t from_height,
    const uint64_t to_height) const {
  auto entries = std::vector<history_entry_t>{};
  if (from_height > to_height) {
    return entries;
  }
  auto prefix = make_bytes(agora::schema::key::kHistoryPrefix);
  auto start = agora::schema::key::make_history_key(from_height, 0);
  for (const auto& [key, value] :
       storage_.list_from(make_bytes_view(start), make_bytes_view(prefix))) {
    auto position = agora::schema::key::parse_history_key(make_bytes_view(key));
    if (!position) {
      spdlog::warn("Skipping malformed history key");
      continue;
    }
    if (position->first > to_height) {
      break;
    }
    entries.push_back(encoder_.decode<history_entry_t>(make_bytes_view(value)));
  }
  return entries;
}

sequence_t engine::load_standard_span() const {
  auto key = agora::schema::key::make_standard_span_key();
  auto span = storage_.get<sequence_t>(encoder_, make_bytes_view(key));
  if (!span) {
    agora::common::critical("standard deliberation span is not initialized");
  }
  return *span;
}

std::optional<initiative_status_t> engine::make_status(
    const initiative_id_t initiative_id,
    const sequence_t sequence) const {
  auto initiative = load_initiative(initiative_id);
  if (!initiative) {
    return std::nullopt;
  }
  return initiative_status_t{.initiative = *initiative,
                             .is_active = is_active(*initiative, sequence),
                             .remaining = remaining(*initiative, sequence),
                             .evaluated_at = sequence};
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted governance state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
  }
  pending_state_root_ = last_committed_state_root_;
  current_block_height_ = static_cast<uint64_t>(last_committed_height_);

  auto position_key = agora::schema::key::make_history_position_key();
  next_history_position_ =
      storage_.get<uint64_t>(encoder_, make_bytes_view(position_key))
          .value_or(0);

  auto writes = std::vector<agora::storage::key_value_entry_t>{};
  auto guardian_key = agora::schema::key::make_guardian_key();
  auto stored_guardian =
      storage_.get<account_id_t>(encoder_, make_bytes_view(guardian_key));
  if (!stored_guardian) {
    spdlog::info("Fresh store; recording guardian {}",
                 to_hex(options_.guardian));
    stage(writes, guardian_key, options_.guardian);
  } else if (*stored_guardian != options_.guardian) {
    spdlog::error("Store guardian {} does not match configured guardian {}",
                  to_hex(*stored_guardian), to_hex(options_.guardian));
    agora::common::critical("guardian identity cannot change");
  }

  auto span_key = agora::schema::key::make_standard_span_key();
  if (!storage_.get<sequence_t>(encoder_, make_bytes_view(span_key))) {
    if (!is_valid_deliberation_span(options_.standard_deliberation_span)) {
      spdlog::error("Configured standard span {} is out of bounds",
                    options_.standard_deliberation_span);
      agora::common::critical(span_bounds_message());
    }
    stage(writes, span_key, options_.standard_deliberation_span);
  } else if (options_.standard_deliberation_span !=
             load_standard_span()) {
    spdlog::debug("Store holds a standard span; ignoring configured {}",
                  options_.standard_deliberation_span);
  }
  storage_.write_batch(writes);
}

}  // namespace agora::execution
