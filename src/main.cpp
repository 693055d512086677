#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <warden/account/account.hpp>
#include <warden/common/critical.hpp>
#include <warden/crypto/recover.hpp>
#include <warden/schema/account_call.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/storage/rocksdb/storage.hpp>

#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>

namespace {

using encoder_t = warden::schema::encoding::encoder<
    warden::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

void setup_logging(const bool verbose) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("warden.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "warden", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::warn);
}

std::string require(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    warden::common::critical("missing required option --" + name);
  }
  return vm[name].as<std::string>();
}

warden::schema::bytes_t get_bytes(const po::variables_map& vm,
                                  const std::string& name) {
  if (!vm.contains(name)) {
    return {};
  }
  auto decoded = warden::schema::try_from_hex(vm[name].as<std::string>());
  if (!decoded) {
    warden::common::critical("--" + name + " must be hex encoded");
  }
  return *decoded;
}

warden::schema::address_t get_address(const po::variables_map& vm,
                                      const std::string& name) {
  auto address = warden::schema::try_make_address(require(vm, name));
  if (!address) {
    warden::common::critical("--" + name + " must be a 20-byte hex address");
  }
  return *address;
}

warden::schema::hash32_t get_hash32(const po::variables_map& vm,
                                    const std::string& name) {
  auto hash = warden::schema::try_make_hash32(require(vm, name));
  if (!hash) {
    warden::common::critical("--" + name + " must be 32 hex-encoded bytes");
  }
  return *hash;
}

warden::schema::execution_mode_t build_mode(const po::variables_map& vm) {
  auto call_type = warden::schema::try_from_string<warden::schema::call_type_t>(
      vm["call-type"].as<std::string>());
  auto exec_type = warden::schema::try_from_string<warden::schema::exec_type_t>(
      vm["exec-type"].as<std::string>());
  if (!call_type || !exec_type) {
    warden::common::critical(
        "--call-type must be single|batch|delegate_call and --exec-type "
        "default|try");
  }
  return warden::schema::encode_mode(*call_type, *exec_type);
}

warden::schema::module_type_t get_module_type(const po::variables_map& vm) {
  auto type = warden::schema::try_from_string<warden::schema::module_type_t>(
      require(vm, "module-type"));
  if (!type) {
    warden::common::critical("unknown --module-type");
  }
  return *type;
}

warden::schema::account_call_t build_call(const po::variables_map& vm) {
  auto kind = require(vm, "kind");
  if (kind == "execute") {
    return warden::schema::execute_call_t{
        .mode = build_mode(vm), .execution_data = get_bytes(vm, "data")};
  }
  if (kind == "install") {
    return warden::schema::install_module_call_t{
        .module_type = get_module_type(vm),
        .module = get_address(vm, "module"),
        .init_data = get_bytes(vm, "data")};
  }
  if (kind == "uninstall") {
    return warden::schema::uninstall_module_call_t{
        .module_type = get_module_type(vm),
        .module = get_address(vm, "module"),
        .deinit_data = get_bytes(vm, "data")};
  }
  warden::common::critical("--kind must be execute|install|uninstall");
}

void print_bytes(const po::variables_map& vm,
                 const warden::schema::bytes_view_t& bytes) {
  if (vm.contains("base64")) {
    std::cout << warden::schema::to_base64(bytes) << '\n';
  } else {
    std::cout << "0x" << warden::schema::to_hex(bytes) << '\n';
  }
}

void inspect(const po::variables_map& vm) {
  auto store = warden::storage::make_storage<warden::storage::rocksdb_storage_tag>(
      require(vm, "db"));
  if (!vm.contains("account")) {
    for (const auto& account : store.list_accounts()) {
      std::cout << warden::schema::to_hex(account) << '\n';
    }
    return;
  }

  auto account = get_address(vm, "account");
  auto snapshot = store.load_account_snapshot(account);
  if (!snapshot) {
    std::cout << "no snapshot stored for " << warden::schema::to_hex(account)
              << '\n';
    return;
  }
  std::cout << "account " << warden::schema::to_hex(account) << '\n'
            << "initialized " << std::boolalpha << snapshot->initialized
            << '\n';
  for (const auto& [type, modules] : snapshot->modules) {
    for (const auto& module : modules) {
      std::cout << warden::schema::to_string(type) << ' '
                << warden::schema::to_hex(module) << '\n';
    }
  }
  if (snapshot->hook) {
    std::cout << "hook " << warden::schema::to_hex(*snapshot->hook) << '\n';
  }
  for (const auto& [selector, route] : snapshot->fallbacks) {
    std::cout << "fallback 0x"
              << warden::schema::to_hex(
                     warden::schema::bytes_view_t{selector.data(),
                                                  selector.size()})
              << ' ' << warden::schema::to_hex(route.handler) << ' '
              << warden::schema::to_string(route.call_type) << '\n';
  }
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  warden identity\n"
            << "  warden mode --call-type <t> --exec-type <t>\n"
            << "  warden call --kind execute|install|uninstall [options]\n"
            << "  warden address --private-key <hex>\n"
            << "  warden sign --private-key <hex> --challenge <hex>\n"
            << "  warden inspect --db <path> [--account <address>]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"warden options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "identity|mode|call|address|sign|inspect")("verbose,v",
                                                 "enable debug logging")(
      "base64", "print encoded output as base64 instead of hex")(
      "call-type", po::value<std::string>()->default_value("single"),
      "single|batch|delegate_call")(
      "exec-type", po::value<std::string>()->default_value("default"),
      "default|try")("kind", po::value<std::string>(),
                     "execute|install|uninstall")(
      "module-type", po::value<std::string>(),
      "validator|executor|fallback|hook|pre_validation_hook_signature|"
      "pre_validation_hook_operation")("module", po::value<std::string>(),
                                       "module address hex")(
      "data", po::value<std::string>(),
      "execution, init or deinit data hex")(
      "private-key", po::value<std::string>(), "secp256k1 private key hex")(
      "challenge", po::value<std::string>(), "32-byte challenge hex")(
      "validator", po::value<std::string>(),
      "validator address prepended to the signature")(
      "db", po::value<std::string>(), "account store path")(
      "account", po::value<std::string>(), "account address hex");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  setup_logging(vm.contains("verbose"));

  if (command == "identity") {
    std::cout << warden::account::account::account_id() << '\n';
  } else if (command == "mode") {
    auto mode = build_mode(vm);
    print_bytes(vm, warden::schema::bytes_view_t{mode.data(), mode.size()});
  } else if (command == "call") {
    auto encoded = encoder_t{}.encode(build_call(vm));
    print_bytes(vm, warden::schema::make_bytes_view(encoded));
  } else if (command == "address") {
    auto address =
        warden::crypto::address_from_private_key(get_hash32(vm, "private-key"));
    if (!address) {
      warden::common::critical("private key is out of range");
    }
    std::cout << warden::schema::to_hex(*address) << '\n';
  } else if (command == "sign") {
    auto digest =
        warden::crypto::signed_message_hash(get_hash32(vm, "challenge"));
    auto signature =
        warden::crypto::sign_digest(get_hash32(vm, "private-key"), digest);
    if (!signature) {
      warden::common::critical("failed to sign challenge");
    }
    if (vm.contains("validator")) {
      auto validator = get_address(vm, "validator");
      signature->insert(std::begin(*signature), std::begin(validator),
                        std::end(validator));
    }
    print_bytes(vm, warden::schema::make_bytes_view(*signature));
  } else if (command == "inspect") {
    inspect(vm);
  } else {
    warden::common::critical(
        "command must be identity|mode|call|address|sign|inspect");
  }

  spdlog::shutdown();
  return 0;
}
