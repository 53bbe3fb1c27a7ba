#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>
#include "forge/errors.hpp"
#include "forge/engine.grpc.pb.h"
#include "engine.hpp"

namespace forge {

/**
 * Map an engine error to a gRPC status. A BlockedError carries a serialized
 * BlockedDetail in the status details.
 */
grpc::Status to_grpc_status(const EngineError& error);

std::unique_ptr<FulfillmentEngine::Service> create_engine_service(Engine& engine);

} // namespace forge
