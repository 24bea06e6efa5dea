#pragma once

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace rollout::runtime {

// Owns the gRPC listener for the daemon's services.
class Server {
 public:
  Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  // Throws when the address cannot be bound.
  void Start();

  // Stops accepting calls and gives in-flight ones `drain` to finish.
  // Upgrade calls still running after that are cancelled; their sessions
  // are picked up by crash recovery on the next start.
  void Stop(std::chrono::milliseconds drain);

  int Port() const {
    return port_;
  }

 private:
  std::string                                   bind_address_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>               grpc_server_;
  int                                           port_ = 0;
};

} // namespace rollout::runtime
