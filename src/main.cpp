#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <onft/chain/chain.hpp>
#include <onft/chain/codec.hpp>
#include <onft/crypto/keypair.hpp>
#include <onft/schema/digest_algorithm.hpp>
#include <onft/schema/primitives.hpp>
#include <iostream>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

void configure_logging(const std::string& log_file, const bool verbose) {
  spdlog::init_thread_pool(8192, 1);

  auto sinks = std::vector<spdlog::sink_ptr>{};
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "onft", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

void print_verification(const std::string_view label,
                        const onft::schema::verify_result& result) {
  if (!result.ok()) {
    std::cout << label << ": error "
              << onft::schema::to_string(result.error->code) << " ("
              << result.error->message << ")" << std::endl;
    return;
  }
  if (result.verified) {
    std::cout << label << ": verified " << result.records_checked
              << " record(s)" << std::endl;
    return;
  }
  std::cout << label << ": NOT verified, " << result.failure_count
            << " bad record(s), first at " << *result.first_failure_index
            << " (" << onft::schema::to_string(result.first_failure) << ")"
            << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto payloads = std::vector<std::string>{};
  auto count = uint64_t{};
  auto max_length = std::numeric_limits<uint64_t>::max();
  auto digest_name = std::string{};
  auto tamper_index = std::optional<uint64_t>{};
  auto log_file = std::string{};

  auto vm = po::variables_map{};
  auto description = po::options_description{"onft demo"};
  description.add_options()("help,h", "Show the help message")(
      "payload,p", po::value<std::vector<std::string>>(&payloads),
      "Payload to append (repeatable)")(
      "count,n", po::value<uint64_t>(&count)->default_value(0),
      "Append payloads \"0\"..\"N-1\" after any --payload values")(
      "max-length", po::value<uint64_t>(&max_length),
      "Maximum number of records, genesis included")(
      "digest,d", po::value<std::string>(&digest_name)->default_value("blake3"),
      ("Digest algorithm (" +
       onft::schema::join_names(onft::schema::kDigestAlgorithmMappings, "|") +
       ")")
          .c_str())("sign,s", "Sign every appended record with a fresh key")(
      "tamper", po::value<uint64_t>(),
      "Flip one payload bit of this record in a copy and verify the copy")(
      "encode,e", "Print the SCALE encoded chain as hex")(
      "log-file", po::value<std::string>(&log_file),
      "Also write logs to this file")("verbose,v", "Enable debug logging");

  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << std::endl << description << std::endl;
    return 2;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }
  if (vm.contains("tamper")) {
    tamper_index = vm["tamper"].as<uint64_t>();
  }

  configure_logging(log_file, vm.contains("verbose"));

  auto algorithm =
      onft::schema::try_from_string<onft::schema::digest_algorithm>(
          digest_name);
  if (!algorithm.has_value()) {
    spdlog::error("Unknown digest algorithm '{}'", digest_name);
    spdlog::shutdown();
    return 2;
  }

  auto owner = std::optional<onft::crypto::ed25519_keypair>{};
  if (vm.contains("sign")) {
    owner = onft::crypto::ed25519_keypair::generate();
    if (!owner.has_value()) {
      spdlog::error("Unable to generate an ed25519 owner key");
      spdlog::shutdown();
      return 1;
    }
    spdlog::info("Signing records with owner {}",
                 onft::schema::to_hex(onft::schema::bytes_view_t{
                     owner->public_key().data(), owner->public_key().size()}));
  }

  for (uint64_t i = 0; i < count; ++i) {
    payloads.push_back(std::to_string(i));
  }

  auto chain = onft::chain::chain{onft::chain::chain_options{
      .max_length = max_length, .algorithm = *algorithm}};
  for (const auto& payload : payloads) {
    auto view = onft::schema::make_bytes_view(payload);
    auto pushed =
        owner.has_value() ? chain.push_signed(view, *owner) : chain.push(view);
    if (!pushed.ok()) {
      spdlog::error("Append stopped at payload '{}': {} ({})", payload,
                    onft::schema::to_string(pushed.error->code),
                    pushed.error->message);
      break;
    }
  }

  std::cout << "length: " << chain.size() << std::endl;
  std::cout << "tail: " << onft::schema::to_hex(chain.back().self_digest)
            << std::endl;
  print_verification("chain", chain.verify());

  auto exit_code = 0;
  if (tamper_index.has_value()) {
    if (*tamper_index >= chain.size() ||
        chain[*tamper_index].payload.empty()) {
      spdlog::error("Record {} does not exist or has an empty payload",
                    *tamper_index);
      exit_code = 2;
    } else {
      auto records = chain.records();
      records[*tamper_index].payload[0] ^= 0x01;
      auto tampered =
          onft::chain::chain::from_records(std::move(records), chain.options());
      print_verification("tampered", tampered.verify());
    }
  }

  if (vm.contains("encode")) {
    auto encoded = onft::chain::encode_chain(chain);
    std::cout << "encoded: " << onft::schema::to_hex(onft::schema::bytes_view_t{
                                    encoded.data(), encoded.size()})
              << std::endl;
  }

  spdlog::shutdown();
  return exit_code;
}
