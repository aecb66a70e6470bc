#include "app/MetricsServer.hpp"
#include "util/Log.hpp"

namespace rmon::app {

MetricsServer::MetricsServer(const SharedStats& stats, uint16_t port)
    : stats_(stats), port_(port) {}

MetricsServer::~MetricsServer() = default;

void MetricsServer::start() {
  rmon::util::log(rmon::util::LogLevel::Warn, "metrics",
                  "built without io_uring, not serving :%d", port_);
}

void MetricsServer::stop() {}

} // namespace rmon::app
