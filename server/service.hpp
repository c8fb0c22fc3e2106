#ifndef SERVER_SERVICE_HPP
#define SERVER_SERVICE_HPP

#include "executor/engine.hpp"
#include "grpcpp/grpcpp.h"
#include "proto/sessionbox.grpc.pb.h"
#include "session/registry.hpp"
#include "workspace/inspector.hpp"

namespace server {

// Serves Run requests: resolves the sandbox of the user, runs the code in it
// and attaches the listing of its working directory.
class Service : public proto::SessionBox::Service {
 public:
  Service(session::Registry* registry, executor::Engine* engine,
          workspace::Inspector* inspector)
      : registry_(registry), engine_(engine), inspector_(inspector) {}

  grpc::Status Run(grpc::ServerContext* context,
                   const proto::RunRequest* request,
                   proto::RunResponse* response) override;

 private:
  session::Registry* registry_;
  executor::Engine* engine_;
  workspace::Inspector* inspector_;
};

}  // namespace server

#endif
