#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <grpcpp/impl/service_type.h>

namespace depgraph::runtime {

// Hosts the registered gRPC services on one listening address.
class Server {
 public:
  Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services);
  ~Server();

  Server(const Server&)            = delete;
  Server& operator=(const Server&) = delete;

  // Throws std::runtime_error when the address cannot be bound.
  void Start();

  // In-flight calls get `grace` to finish before they are cancelled.
  void Stop(std::chrono::milliseconds grace = std::chrono::seconds(5));

  bool IsRunning() const { return grpc_server_ != nullptr; }

  // Port actually bound; differs from the configured one for ":0".
  int SelectedPort() const { return selected_port_; }

 private:
  std::string                                   bind_address_;
  std::vector<std::unique_ptr<::grpc::Service>> services_;
  std::unique_ptr<::grpc::Server>               grpc_server_;
  int                                           selected_port_ = 0;
};

} // namespace depgraph::runtime
