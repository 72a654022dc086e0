#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <agora/blake3/hash.hpp>
#include <agora/common/critical.hpp>
#include <agora/schema/encoding/scale/encoder.hpp>
#include <agora/schema/transaction.hpp>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

namespace {

using encoder_t = agora::schema::encoding::encoder<
    agora::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

agora::schema::hash32_t get_hash32(const po::variables_map& vm,
                                   const std::string& name) {
  if (!vm.contains(name)) {
    spdlog::error("missing required argument --{}", name);
    agora::common::critical("missing required hash argument");
  }
  auto value = agora::schema::try_make_hash32(vm[name].as<std::string>());
  if (!value) {
    spdlog::error("--{} must be 64 hex characters", name);
    agora::common::critical("invalid hash argument");
  }
  return *value;
}

std::string get_text(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    spdlog::error("missing required argument --{}", name);
    agora::common::critical("missing required text argument");
  }
  return vm[name].as<std::string>();
}

agora::schema::initiative_id_t get_initiative_id(const po::variables_map& vm) {
  if (!vm.contains("initiative-id")) {
    agora::common::critical("missing required argument --initiative-id");
  }
  return vm["initiative-id"].as<uint64_t>();
}

// No range checks here so that out of bounds values reach the engine and are
// rejected there.
agora::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = vm["payload"].as<std::string>();
  if (payload == "create_initiative") {
    return agora::schema::create_initiative_t{
        .title = get_text(vm, "title"),
        .summary = get_text(vm, "summary"),
        .deliberation_span =
            vm.contains("span")
                ? std::optional<agora::schema::sequence_t>{vm["span"]
                                                               .as<uint64_t>()}
                : std::nullopt};
  }
  if (payload == "signal_initiative") {
    return agora::schema::signal_initiative_t{.initiative_id =
                                                  get_initiative_id(vm)};
  }
  if (payload == "terminate_initiative") {
    return agora::schema::terminate_initiative_t{.initiative_id =
                                                     get_initiative_id(vm)};
  }
  if (payload == "configure_default_span") {
    if (!vm.contains("span")) {
      agora::common::critical("configure_default_span requires --span");
    }
    return agora::schema::configure_default_span_t{
        .deliberation_span = vm["span"].as<uint64_t>()};
  }
  spdlog::error("unsupported payload type '{}'", payload);
  agora::common::critical("unsupported payload type");
}

agora::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = vm["path"].as<std::string>();
  if (path == "/engine/info" || path == "/governance/total" ||
      path == "/governance/config") {
    return {};
  }
  if (path == "/initiative/status") {
    return encoder.encode(get_initiative_id(vm));
  }
  if (path == "/participation/signaled") {
    return encoder.encode(
        std::tuple{get_hash32(vm, "participant"), get_initiative_id(vm)});
  }
  if (path == "/history/range") {
    return encoder.encode(std::tuple{vm["from-height"].as<uint64_t>(),
                                     vm["to-height"].as<uint64_t>()});
  }
  spdlog::error("unsupported query path '{}'", path);
  agora::common::critical("unsupported query path");
}

void configure_logging(const std::string& level) {
  auto logger = spdlog::stderr_color_mt("transaction_builder");
  logger->set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  logger->set_level(spdlog::level::from_str(level));
  spdlog::set_default_logger(logger);
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  agora_transaction_builder transaction [options]\n"
            << "  agora_transaction_builder query-key [options]\n"
            << "  agora_transaction_builder guardian-id --seed <text>\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto log_level = std::string{};
  auto options = po::options_description{"agora_transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|query-key|guardian-id")(
      "log-level", po::value<std::string>(&log_level)->default_value("warn"),
      "trace|debug|info|warn|error|critical|off")(
      "payload", po::value<std::string>(),
      "create_initiative|signal_initiative|terminate_initiative|"
      "configure_default_span")("path", po::value<std::string>(),
                                "query route")(
      "tx-version", po::value<uint16_t>()->default_value(1),
      "transaction envelope version")("signer", po::value<std::string>(),
                                      "signer identity hash32 hex")(
      "title", po::value<std::string>(), "initiative title")(
      "summary", po::value<std::string>(), "initiative summary")(
      "span", po::value<uint64_t>(), "deliberation span in blocks")(
      "initiative-id", po::value<uint64_t>(), "initiative id")(
      "participant", po::value<std::string>(), "participant hash32 hex")(
      "from-height", po::value<uint64_t>()->default_value(1),
      "history range from")("to-height",
                            po::value<uint64_t>()->default_value(1),
                            "history range to")(
      "seed", po::value<std::string>(), "identity seed text");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  configure_logging(log_level);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    if (!vm.contains("payload")) {
      agora::common::critical("transaction mode requires --payload");
    }
    auto transaction =
        agora::schema::transaction_t{.version = vm["tx-version"].as<uint16_t>(),
                                     .signer = get_hash32(vm, "signer"),
                                     .payload = build_payload(vm)};
    auto encoded = encoder_t{}.encode(transaction);
    spdlog::debug("Encoded {} byte transaction", encoded.size());
    std::cout << agora::schema::to_base64(encoded) << '\n';
    return 0;
  }

  if (command == "query-key") {
    if (!vm.contains("path")) {
      agora::common::critical("query-key mode requires --path");
    }
    auto key = build_query_key(vm);
    std::cout << agora::schema::to_base64(key) << '\n';
    return 0;
  }

  if (command == "guardian-id") {
    auto identity = agora::blake3::hash(std::string_view{get_text(vm, "seed")});
    std::cout << agora::schema::to_hex(identity) << '\n';
    return 0;
  }

  spdlog::error("unknown command '{}'", command);
  agora::common::critical(
      "command must be transaction|query-key|guardian-id");
}
