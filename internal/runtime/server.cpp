#include "server.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace acp::runtime {

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services)
    : bind_address_(std::move(bind_address)), services_(std::move(services)) {}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::ServerBuilder builder;

  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &bound_port_);

  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();

  if (!grpc_server_) {
    throw std::runtime_error("Failed to start gRPC server on " + bind_address_);
  }

  ACP_LOG_INFO("gRPC server listening", {observability::StringField("bind_address", bind_address_),
                                         observability::IntField("port", bound_port_)});
}

void Server::Wait() {
  if (grpc_server_)
    grpc_server_->Wait();
}

void Server::Stop() {
  if (grpc_server_) {
    grpc_server_->Shutdown();
    grpc_server_.reset();
    ACP_LOG_INFO("gRPC server stopped", {observability::StringField("bind_address", bind_address_)});
  }
}

} // namespace acp::runtime
