#include "util/flags.hpp"

DEFINE_string(runtime, "",
              "Sandbox runtime to use (docker, podman). If unset, autodetect");
DEFINE_string(image, "python:3.13-alpine", "Base image of the sandboxes");
DEFINE_string(workdir, "/workspace",
              "Working directory of the code inside the sandboxes");
DEFINE_int32(keepalive_seconds, 3600,
             "Lifetime of the placeholder process of each sandbox");
DEFINE_int64(sandbox_memory_mb, 0,
             "Memory limit of each sandbox. 0 means the runtime default");
DEFINE_string(sandbox_network, "",
              "Network mode of each sandbox. If unset, the runtime default");

DEFINE_string(interpreter, "python3", "Interpreter used to run the code");
DEFINE_int64(execution_timeout_ms, 60000,
             "Wall time limit of a single execution. 0 means unlimited");
DEFINE_int64(max_output_bytes, 16 << 20,
             "Bytes of stdout and of stderr kept for each execution. 0 means "
             "unlimited");

DEFINE_int32(reaper_interval_seconds, 10,
             "How often idle sessions are looked for");
DEFINE_int32(idle_timeout_seconds, 60,
             "Inactivity after which a session and its sandbox are destroyed");
