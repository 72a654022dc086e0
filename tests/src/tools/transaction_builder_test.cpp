#include <gtest/gtest.h>
#include <agora/blake3/hash.hpp>
#include <agora/schema/encoding/scale/encoder.hpp>
#include <agora/schema/primitives.hpp>
#include <agora/schema/transaction.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>
#include <variant>

#include <sys/wait.h>

#ifndef AGORA_TRANSACTION_BUILDER_PATH
#define AGORA_TRANSACTION_BUILDER_PATH ""
#endif

namespace {

using encoder_t = agora::schema::encoding::encoder<
    agora::schema::encoding::scale_encoder_tag>;

constexpr auto kSigner =
    "aaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaaa";
constexpr auto kParticipant =
    "bbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbbb";

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim_ascii_whitespace(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1) {
    return {-1, output};
  }
  if (WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::string run_command(const std::string& builder,
                        const std::string_view command_name,
                        const std::string_view args) {
  auto command = shell_quote(builder) + " " + std::string{command_name} + " " +
                 std::string{args};
  auto [exit_code, output] = run_capture(command);
  EXPECT_EQ(exit_code, 0) << "command failed: " << command << '\n' << output;
  return trim_ascii_whitespace(output);
}

agora::schema::transaction_t decode_transaction(const std::string& base64) {
  auto encoder = encoder_t{};
  auto bytes = agora::schema::from_base64(base64);
  return encoder.decode<agora::schema::transaction_t>(
      agora::schema::make_bytes_view(bytes));
}

}  // namespace

TEST(transaction_builder, builds_every_governance_payload) {
  auto builder = std::string{AGORA_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "agora_transaction_builder binary not available: "
                 << builder;
  }
  auto signer = agora::schema::make_hash32(std::string{kSigner});
  auto signer_arg = std::string{"--signer "} + kSigner;

  auto create = decode_transaction(run_command(
      builder, "transaction",
      "--payload create_initiative " + signer_arg +
          " --title " + shell_quote("Upgrade") + " --summary " +
          shell_quote("Add feature") + " --span 144"));
  EXPECT_EQ(create.version, 1u);
  EXPECT_EQ(create.signer, signer);
  ASSERT_TRUE(
      std::holds_alternative<agora::schema::create_initiative_t>(create.payload));
  auto& create_payload =
      std::get<agora::schema::create_initiative_t>(create.payload);
  EXPECT_EQ(create_payload.title, "Upgrade");
  EXPECT_EQ(create_payload.summary, "Add feature");
  ASSERT_TRUE(create_payload.deliberation_span.has_value());
  EXPECT_EQ(*create_payload.deliberation_span, 144u);

  auto create_default = decode_transaction(run_command(
      builder, "transaction",
      "--payload create_initiative " + signer_arg +
          " --title T --summary S"));
  EXPECT_FALSE(std::get<agora::schema::create_initiative_t>(
                   create_default.payload)
                   .deliberation_span.has_value());

  auto signal = decode_transaction(run_command(
      builder, "transaction",
      "--payload signal_initiative --initiative-id 7 " + signer_arg));
  ASSERT_TRUE(
      std::holds_alternative<agora::schema::signal_initiative_t>(signal.payload));
  EXPECT_EQ(
      std::get<agora::schema::signal_initiative_t>(signal.payload).initiative_id,
      7u);

  auto terminate = decode_transaction(run_command(
      builder, "transaction",
      "--payload terminate_initiative --initiative-id 3 " + signer_arg));
  ASSERT_TRUE(std::holds_alternative<agora::schema::terminate_initiative_t>(
      terminate.payload));
  EXPECT_EQ(std::get<agora::schema::terminate_initiative_t>(terminate.payload)
                .initiative_id,
            3u);

  auto configure = decode_transaction(run_command(
      builder, "transaction",
      "--payload configure_default_span --span 288 " + signer_arg));
  ASSERT_TRUE(std::holds_alternative<agora::schema::configure_default_span_t>(
      configure.payload));
  EXPECT_EQ(std::get<agora::schema::configure_default_span_t>(
                configure.payload)
                .deliberation_span,
            288u);

  auto versioned = decode_transaction(run_command(
      builder, "transaction",
      "--payload signal_initiative --initiative-id 1 --tx-version 2 " +
          signer_arg));
  EXPECT_EQ(versioned.version, 2u);
}

TEST(transaction_builder, query_key_matches_route_contract) {
  auto builder = std::string{AGORA_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "agora_transaction_builder binary not available: "
                 << builder;
  }
  auto encoder = encoder_t{};

  auto status_actual = run_command(builder, "query-key",
                                   "--path /initiative/status "
                                   "--initiative-id 5");
  EXPECT_EQ(status_actual,
            agora::schema::to_base64(encoder.encode(uint64_t{5})));

  auto expected_signaled = encoder.encode(std::tuple{
      agora::schema::make_hash32(std::string{kParticipant}), uint64_t{2}});
  auto signaled_actual = run_command(
      builder, "query-key",
      "--path /participation/signaled --initiative-id 2 --participant " +
          std::string{kParticipant});
  EXPECT_EQ(signaled_actual, agora::schema::to_base64(expected_signaled));

  auto expected_history =
      encoder.encode(std::tuple{uint64_t{1}, uint64_t{100}});
  auto history_actual = run_command(
      builder, "query-key",
      "--path /history/range --from-height 1 --to-height 100");
  EXPECT_EQ(history_actual, agora::schema::to_base64(expected_history));

  EXPECT_TRUE(
      run_command(builder, "query-key", "--path /governance/total").empty());
  EXPECT_TRUE(
      run_command(builder, "query-key", "--path /engine/info").empty());
}

TEST(transaction_builder, guardian_id_is_blake3_of_seed) {
  auto builder = std::string{AGORA_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "agora_transaction_builder binary not available: "
                 << builder;
  }
  auto actual = run_command(builder, "guardian-id", "--seed council");
  auto expected = agora::blake3::hash(std::string_view{"council"});
  EXPECT_EQ(actual, agora::schema::to_hex(expected));
  EXPECT_EQ(actual.size(), 64u);
}

TEST(transaction_builder, invalid_signer_terminates_without_output) {
  auto builder = std::string{AGORA_TRANSACTION_BUILDER_PATH};
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "agora_transaction_builder binary not available: "
                 << builder;
  }
  auto command = shell_quote(builder) +
                 " transaction --payload signal_initiative --initiative-id 1 "
                 "--signer 1234 2>/dev/null";
  auto [exit_code, output] = run_capture(command);
  EXPECT_NE(exit_code, 0);
  EXPECT_TRUE(trim_ascii_whitespace(output).empty());
}
