#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <grpcpp/ext/proto_server_reflection_plugin.h>
#include <grpcpp/grpcpp.h>
#include <grpcpp/health_check_service_interface.h>
#include <iostream>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <accountstore/common/critical.hpp>
#include <accountstore/common/log_level.hpp>
#include <accountstore/contract/server.hpp>
#include <string>
#include <thread>
#include <vector>

std::atomic<bool>& shutdown_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  shutdown_requested() = true;
}

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto grpc_address = std::string{};
  auto db_path = std::string{};
  auto log_file = std::string{};
  auto log_level = std::string{};
  auto config_file = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description =
      boost::program_options::options_description{"Account store"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", boost::program_options::value<std::string>(&config_file),
      "INI file with the options below")(
      "grpc-address,g",
      boost::program_options::value<std::string>(&grpc_address)
          ->default_value("0.0.0.0:50051"),
      "IP:Port for the contract service")(
      "db-path,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "accountstore.db"),
      "RocksDB directory holding the ledger")(
      "log-file,l",
      boost::program_options::value<std::string>(&log_file)->default_value(
          "accountstore.log"),
      "Log file path")(
      "log-level",
      boost::program_options::value<std::string>(&log_level)
          ->default_value("info")
          ->notifier([](const std::string& value) {
            if (!accountstore::common::try_log_level_from_string(value)) {
              throw boost::program_options::validation_error{
                  boost::program_options::validation_error::
                      invalid_option_value,
                  "log-level", value};
            }
          }),
      "trace, debug, info, warn, error or critical");

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    if (vm.contains("config")) {
      auto config_path = vm["config"].as<std::string>();
      auto config = std::ifstream{config_path};
      if (!config) {
        std::cerr << "cannot open config file " << config_path << std::endl;
        return 1;
      }
      // Command line values take precedence over the file.
      boost::program_options::store(
          boost::program_options::parse_config_file(config, description), vm);
    }
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& e) {
    std::cerr << e.what() << std::endl << description << std::endl;
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "main", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_level(
      *accountstore::common::try_log_level_from_string(log_level));

  spdlog::info("Opening ledger at '{}'", db_path);
  auto storage = accountstore::storage::make_storage<
      accountstore::storage::rocksdb_storage_tag>(db_path);
  auto encoder = accountstore::registry::encoder_t{};
  auto engine = accountstore::execution::engine{encoder, storage};

  grpc::EnableDefaultHealthCheckService(true);
  grpc::reflection::InitProtoReflectionServerBuilderPlugin();

  auto grpc_listener = accountstore::contract::listener{engine};
  auto grpc_builder = grpc::ServerBuilder();
  grpc_builder.AddListeningPort(grpc_address,
                                grpc::InsecureServerCredentials());
  grpc_builder.RegisterService(&grpc_listener);
  auto grpc_server = std::unique_ptr<grpc::Server>(grpc_builder.BuildAndStart());
  if (!grpc_server) {
    accountstore::common::critical("failed to start gRPC server on " +
                                   grpc_address);
  }
  spdlog::info("Contract service listening on {}", grpc_address);
  grpc_server->GetHealthCheckService()->SetServingStatus(false);

  auto threads = std::vector<std::thread>{};
  threads.emplace_back([&] { grpc_server->Wait(); });
  threads.emplace_back([&] {
    while (!shutdown_requested()) {
      grpc_server->GetHealthCheckService()->SetServingStatus(true);
      std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    spdlog::info("Shutting down");
    grpc_server->GetHealthCheckService()->SetServingStatus(false);
    grpc_server->Shutdown();
  });

  for (auto& t : threads) {
    t.join();
  }

  spdlog::shutdown();
  return 0;
}
