#include "factory.hpp"

#include "internal/core/history_session.hpp"
#include "internal/grpc/history_server.hpp"
#include "internal/service/history_service.hpp"
#include "internal/service/service_context.hpp"

namespace sparkscope::factory {

Application Build(const sparkscope::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Core
  // ------------------------------------------------------------------
  app.session = std::make_shared<core::HistorySession>(config);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.session = app.session;

  auto history_service = std::make_shared<service::HistoryService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::HistoryServer>(history_service));

  return app;
}

} // namespace sparkscope::factory
