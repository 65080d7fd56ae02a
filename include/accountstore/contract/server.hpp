#pragma once

#include <accountstore/contract/v1/contract.grpc.pb.h>
#include <accountstore/execution/engine.hpp>
#include <accountstore/schema/invocation.hpp>
#include <accountstore/schema/invocation_result.hpp>

namespace accountstore::contract {

accountstore::schema::invocation_t make_invocation(
    const accountstore::contract::v1::InvokeRequest& request);

void populate_response(const accountstore::schema::invocation_result_t& result,
                       accountstore::contract::v1::InvokeResponse* response);

/// Callback listener exposing the execution engine over gRPC.
///
/// - Invoke: run a function in a fresh transaction and commit on success.
/// - Query: run a function and discard its writes.
///
/// Function failures are reported in the response body; the RPC status is
/// always OK.
struct listener final
    : public accountstore::contract::v1::Contract::CallbackService {
  explicit listener(accountstore::execution::engine& engine);

  virtual grpc::ServerUnaryReactor* Invoke(
      grpc::CallbackServerContext* context,
      const accountstore::contract::v1::InvokeRequest* request,
      accountstore::contract::v1::InvokeResponse* response) override final;

  virtual grpc::ServerUnaryReactor* Query(
      grpc::CallbackServerContext* context,
      const accountstore::contract::v1::InvokeRequest* request,
      accountstore::contract::v1::InvokeResponse* response) override final;

  accountstore::execution::engine& execution_engine_;
};

}  // namespace accountstore::contract
