// Repository: Encodefarm
// Component: Transport Factory
// Purpose: Builds worker and origin transports from Worker records and the
//          configured origin endpoint.
// Copyright (c) 2025 RetroVue

#ifndef ENCODEFARM_TRANSFER_TRANSPORT_FACTORY_HPP_
#define ENCODEFARM_TRANSFER_TRANSPORT_FACTORY_HPP_

#include <optional>

#include "encodefarm/transfer/ITransport.hpp"
#include "encodefarm/transfer/SshTransport.hpp"

namespace encodefarm::transfer {

class DefaultTransportFactory : public ITransportFactory {
 public:
  // origin: SSH endpoint of the media origin; nullopt when it has none.
  explicit DefaultTransportFactory(std::optional<SshEndpoint> origin)
      : origin_(std::move(origin)) {}

  // Local workers get a LocalTransport, remote workers an SshTransport.
  std::unique_ptr<ITransport> ForWorker(const model::Worker& worker) override;
  std::unique_ptr<ITransport> ForOrigin() override;
  bool OriginHasSsh() const override { return origin_.has_value(); }

 private:
  std::optional<SshEndpoint> origin_;
};

}  // namespace encodefarm::transfer

#endif  // ENCODEFARM_TRANSFER_TRANSPORT_FACTORY_HPP_
