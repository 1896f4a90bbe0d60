#pragma once

#include <memory>

namespace sparkscope::core {
class HistorySession;
}

namespace sparkscope::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<sparkscope::core::HistorySession> session;
};

} // namespace sparkscope::service
