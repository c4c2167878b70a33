// Repository: Encodefarm
// Component: Transport Factory
// Copyright (c) 2025 RetroVue

#include "encodefarm/transfer/TransportFactory.hpp"

#include "encodefarm/transfer/LocalTransport.hpp"

namespace encodefarm::transfer {

std::unique_ptr<ITransport> DefaultTransportFactory::ForWorker(const model::Worker& worker) {
  if (worker.is_local) {
    return std::make_unique<LocalTransport>();
  }
  SshEndpoint endpoint;
  endpoint.host = worker.hostname;
  endpoint.port = worker.port;
  endpoint.user = worker.ssh_username;
  endpoint.key_path = worker.ssh_key_path;
  return std::make_unique<SshTransport>(std::move(endpoint));
}

std::unique_ptr<ITransport> DefaultTransportFactory::ForOrigin() {
  if (!origin_) return nullptr;
  return std::make_unique<SshTransport>(*origin_);
}

}  // namespace encodefarm::transfer
