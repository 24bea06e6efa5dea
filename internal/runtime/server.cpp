#include "server.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace rollout::runtime {

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services)
    : bind_address_(std::move(bind_address)), services_(std::move(services)) {
}

Server::~Server() {
  Stop(std::chrono::milliseconds::zero());
}

void Server::Start() {
  if (grpc_server_) throw std::logic_error("server already started on " + bind_address_);

  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &port_);
  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_ || port_ == 0) {
    grpc_server_.reset();
    throw std::runtime_error("failed to listen on " + bind_address_);
  }

  ROLLOUT_LOG_INFO("gRPC server listening",
                   {observability::StringField("bind_address", bind_address_), observability::IntField("port", port_)});
}

void Server::Stop(std::chrono::milliseconds drain) {
  if (!grpc_server_) return;

  grpc_server_->Shutdown(std::chrono::system_clock::now() + drain);
  grpc_server_.reset();
  ROLLOUT_LOG_INFO("gRPC server stopped", {observability::StringField("bind_address", bind_address_)});
}

} // namespace rollout::runtime
