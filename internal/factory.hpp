#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace sparkscope::core {
class HistorySession;
}

namespace sparkscope::factory {

/*
  Application

  Owns all long-lived objects used by the server. The session outlives every
  service that reads from it.
*/
struct Application {
  std::shared_ptr<sparkscope::core::HistorySession> session;
  std::vector<std::unique_ptr<::grpc::Service>>     grpc_services;
};

/*
  Build

  Composition root: constructs the session and the services over it from
  the runtime config. Invalid classification rules throw
  util::InvalidArgument.
*/
Application Build(const sparkscope::runtime::config::RuntimeConfig& config);

} // namespace sparkscope::factory
