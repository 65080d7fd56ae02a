#include <grpcpp/grpcpp.h>
#include <boost/program_options.hpp>
#include <accountstore/common/critical.hpp>
#include <accountstore/contract/v1/contract.grpc.pb.h>
#include <accountstore/schema/encoding/scale/encoder.hpp>
#include <accountstore/schema/history_entry.hpp>

#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace {

using encoder_t = accountstore::schema::encoding::encoder<
    accountstore::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;
namespace v1 = accountstore::contract::v1;

void print(const accountstore::schema::participant_t& participant) {
  std::cout << "email=" << participant.email << " name=" << participant.name
            << " surname=" << participant.surname
            << " phone=" << participant.phone << '\n';
}

void print(const accountstore::schema::account_t& account) {
  std::cout << "id=" << account.id << " currency=" << account.currency
            << " balance=" << account.balance << " email=" << account.email
            << '\n';
}

void print(const accountstore::schema::history_entry_t& entry) {
  std::cout << "tx=" << entry.tx_id << " timestamp=" << entry.timestamp << ' ';
  std::visit(
      overloaded{[](const accountstore::schema::account_snapshot& snapshot) {
                   print(snapshot.account);
                 },
                 [](const accountstore::schema::account_tombstone& tombstone) {
                   std::cout << "deleted id=" << tombstone.id << '\n';
                 }},
      entry.record);
}

template <typename T>
T decode_payload(const accountstore::schema::bytes_t& payload) {
  auto decoded = encoder_t{}.try_decode<T>(
      accountstore::schema::bytes_view_t{payload.data(), payload.size()});
  if (!decoded) {
    accountstore::common::critical("payload does not decode as expected type");
  }
  return std::move(*decoded);
}

template <typename T>
void print_list(const accountstore::schema::bytes_t& payload) {
  for (const auto& item : decode_payload<std::vector<T>>(payload)) {
    print(item);
  }
}

/// Render a successful payload according to the function that produced it.
void print_payload(const std::string_view function,
                   const accountstore::schema::bytes_t& payload) {
  if (function == "participant_exists" || function == "account_exists") {
    std::cout << (decode_payload<bool>(payload) ? "true" : "false") << '\n';
  } else if (function == "read_participant") {
    print(decode_payload<accountstore::schema::participant_t>(payload));
  } else if (function == "list_participants") {
    print_list<accountstore::schema::participant_t>(payload);
  } else if (function == "read_account") {
    print(decode_payload<accountstore::schema::account_t>(payload));
  } else if (function == "list_participant_accounts") {
    print_list<accountstore::schema::account_t>(payload);
  } else if (function == "account_history") {
    print_list<accountstore::schema::history_entry_t>(payload);
  } else if (!payload.empty()) {
    std::cout << accountstore::schema::to_hex(
                     accountstore::schema::bytes_view_t{payload.data(),
                                                        payload.size()})
              << '\n';
  }
}

int call(const std::string& command,
         const std::string& address,
         const v1::InvokeRequest& request) {
  auto channel =
      grpc::CreateChannel(address, grpc::InsecureChannelCredentials());
  auto stub = v1::Contract::NewStub(channel);

  auto context = grpc::ClientContext{};
  auto response = v1::InvokeResponse{};
  auto status = command == "query"
                    ? stub->Query(&context, request, &response)
                    : stub->Invoke(&context, request, &response);
  if (!status.ok()) {
    std::cerr << "rpc failed: " << status.error_message() << '\n';
    return 2;
  }

  std::cout << "tx_id=" << response.tx_id() << " code=" << response.code();
  if (response.code() != 0) {
    std::cout << " info=" << response.info() << " log=" << response.log()
              << '\n';
    return 1;
  }
  std::cout << '\n';
  print_payload(request.function(),
                accountstore::schema::make_bytes(response.payload()));
  return 0;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  accountstore_invoke invoke --function NAME [--arg VALUE]...\n"
            << "  accountstore_invoke query --function NAME [--arg VALUE]...\n"
            << "  accountstore_invoke decode --function NAME --payload-hex HEX"
               "\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"accountstore_invoke options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "invoke|query|decode")(
      "address,a", po::value<std::string>()->default_value("127.0.0.1:50051"),
      "contract service address")("function,f", po::value<std::string>(),
                                  "function name")(
      "arg", po::value<std::vector<std::string>>()->composing(),
      "positional function argument, repeatable")(
      "tx-id", po::value<std::string>()->default_value(""),
      "transaction id; generated by the server when empty")(
      "payload-hex", po::value<std::string>(), "payload to decode");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::cerr << e.what() << '\n';
    return 2;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }
  if (!vm.contains("function")) {
    std::cerr << command << " requires --function\n";
    return 2;
  }
  auto function = vm["function"].as<std::string>();

  if (command == "decode") {
    if (!vm.contains("payload-hex")) {
      std::cerr << "decode requires --payload-hex\n";
      return 2;
    }
    auto payload =
        accountstore::schema::try_from_hex(vm["payload-hex"].as<std::string>());
    if (!payload) {
      std::cerr << "payload-hex is not valid hex\n";
      return 2;
    }
    print_payload(function, *payload);
    return 0;
  }

  if (command == "invoke" || command == "query") {
    auto request = v1::InvokeRequest{};
    request.set_function(function);
    if (vm.contains("arg")) {
      for (const auto& arg : vm["arg"].as<std::vector<std::string>>()) {
        request.add_args(arg);
      }
    }
    request.set_tx_id(vm["tx-id"].as<std::string>());
    return call(command, vm["address"].as<std::string>(), request);
  }

  std::cerr << "command must be invoke|query|decode\n";
  return 2;
}
