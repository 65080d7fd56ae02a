#include <spdlog/spdlog.h>
#include <accountstore/contract/server.hpp>
#include <iterator>

using namespace accountstore::contract;
using namespace accountstore::schema;

namespace {

grpc::ServerUnaryReactor* finish_ok(grpc::CallbackServerContext* context) {
  auto* reactor = context->DefaultReactor();
  reactor->Finish(grpc::Status::OK);
  return reactor;
}

}  // namespace

namespace accountstore::contract {

invocation_t make_invocation(const v1::InvokeRequest& request) {
  auto invocation = invocation_t{};
  invocation.function = request.function();
  invocation.args.reserve(request.args_size());
  for (const auto& arg : request.args()) {
    invocation.args.push_back(arg);
  }
  invocation.tx_id = request.tx_id();
  return invocation;
}

void populate_response(const invocation_result_t& result,
                       v1::InvokeResponse* response) {
  response->set_code(result.code);
  response->set_log(result.log);
  response->set_info(result.info);
  response->set_payload(make_string(result.payload));
  response->set_tx_id(result.tx_id);
  response->set_codespace(result.codespace);
}

listener::listener(accountstore::execution::engine& engine)
    : execution_engine_{engine} {}

grpc::ServerUnaryReactor* listener::Invoke(
    grpc::CallbackServerContext* context,
    const v1::InvokeRequest* request,
    v1::InvokeResponse* response) {
  spdlog::debug("Invoke {} with {} argument(s)", request->function(),
                request->args_size());
  auto result = execution_engine_.invoke(make_invocation(*request));
  populate_response(result, response);
  return finish_ok(context);
}

grpc::ServerUnaryReactor* listener::Query(
    grpc::CallbackServerContext* context,
    const v1::InvokeRequest* request,
    v1::InvokeResponse* response) {
  spdlog::debug("Query {} with {} argument(s)", request->function(),
                request->args_size());
  auto result = execution_engine_.query(make_invocation(*request));
  populate_response(result, response);
  return finish_ok(context);
}

}  // namespace accountstore::contract
