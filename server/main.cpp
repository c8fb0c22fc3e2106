#include <pthread.h>

#include <csignal>
#include <cstring>
#include <memory>
#include <string>
#include <thread>

#include "absl/strings/str_cat.h"
#include "absl/time/time.h"
#include "executor/engine.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "grpcpp/grpcpp.h"
#include "sandbox/provisioner.hpp"
#include "sandbox/runtime.hpp"
#include "server/service.hpp"
#include "session/reaper.hpp"
#include "session/registry.hpp"
#include "util/flags.hpp"
#include "workspace/inspector.hpp"

DEFINE_string(address, "0.0.0.0", "address to listen on");
DEFINE_int32(port, 5000, "port to listen on");

int main(int argc, char** argv) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  // SIGINT and SIGTERM are handled by a dedicated thread; they must be
  // blocked before any other thread is created.
  sigset_t shutdown_signals;
  sigemptyset(&shutdown_signals);
  sigaddset(&shutdown_signals, SIGINT);
  sigaddset(&shutdown_signals, SIGTERM);
  CHECK_EQ(pthread_sigmask(SIG_BLOCK, &shutdown_signals, nullptr), 0);

  std::unique_ptr<sandbox::Runtime> runtime =
      sandbox::Runtime::Create(FLAGS_runtime);
  CHECK(runtime) << "No usable sandbox runtime";

  sandbox::ProvisionerOptions provisioner_options;
  provisioner_options.image = FLAGS_image;
  provisioner_options.workdir = FLAGS_workdir;
  provisioner_options.keepalive_command = {
      "sleep", std::to_string(FLAGS_keepalive_seconds)};
  provisioner_options.memory_limit_mb = FLAGS_sandbox_memory_mb;
  provisioner_options.network = FLAGS_sandbox_network;
  sandbox::Provisioner provisioner(runtime.get(), provisioner_options);

  session::Registry registry(&provisioner);

  executor::EngineOptions engine_options;
  engine_options.workdir = FLAGS_workdir;
  engine_options.interpreter = FLAGS_interpreter;
  engine_options.wall_limit_millis = FLAGS_execution_timeout_ms;
  engine_options.max_output_bytes = FLAGS_max_output_bytes;
  executor::Engine engine(runtime.get(), engine_options);

  workspace::Inspector inspector(runtime.get(), FLAGS_workdir);

  session::Reaper reaper(&registry,
                         absl::Seconds(FLAGS_reaper_interval_seconds),
                         absl::Seconds(FLAGS_idle_timeout_seconds));
  reaper.Start();

  std::string server_address = absl::StrCat(FLAGS_address, ":", FLAGS_port);
  server::Service service(&registry, &engine, &inspector);
  grpc::ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  CHECK(server) << "Cannot listen on " << server_address;
  LOG(INFO) << "Server listening on " << server_address;

  std::thread signal_thread([&shutdown_signals, &server]() {
    int signal = 0;
    CHECK_EQ(sigwait(&shutdown_signals, &signal), 0);
    LOG(INFO) << "Received " << strsignal(signal) << ", shutting down";
    server->Shutdown();
  });
  server->Wait();
  signal_thread.join();

  reaper.Stop();
  size_t removed = registry.Clear();
  LOG(INFO) << "Destroyed " << removed << " sandbox(es) on shutdown";
}
