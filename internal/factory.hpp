#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/runtime/engine.hpp"

namespace relay::factory {

/*
  Application

  Everything the process runs: the engine (stores, pipelines, recovery,
  discovery) and the gRPC services handed to runtime::Server.
*/
struct Application {
  std::unique_ptr<runtime::Engine>              engine;
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB and collaborator types.
*/
Application Build(const relay::runtime::config::RuntimeConfig& config);

} // namespace relay::factory
