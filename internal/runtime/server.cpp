#include "server.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace depgraph::runtime {

using depgraph::observability::IntField;
using depgraph::observability::StringField;

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services)
    : bind_address_(std::move(bind_address)), services_(std::move(services)) {
}

Server::~Server() {
  Stop(std::chrono::milliseconds(0));
}

void Server::Start() {
  if (grpc_server_) {
    throw std::runtime_error("gRPC server already running on " + bind_address_);
  }

  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &selected_port_);
  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  // selected_port_ stays 0 when the bind failed
  if (!grpc_server_ || selected_port_ == 0) {
    grpc_server_.reset();
    throw std::runtime_error("cannot listen on " + bind_address_);
  }

  DEPGRAPH_LOG_INFO("gRPC server listening",
                    {StringField("bind_address", bind_address_), IntField("port", selected_port_),
                     IntField("services", static_cast<std::int64_t>(services_.size()))});
}

void Server::Stop(std::chrono::milliseconds grace) {
  if (!grpc_server_) {
    return;
  }

  grpc_server_->Shutdown(std::chrono::system_clock::now() + grace);
  grpc_server_.reset();
  DEPGRAPH_LOG_INFO("gRPC server stopped", {StringField("bind_address", bind_address_)});
}

} // namespace depgraph::runtime
