#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

// Sandbox provisioning.
DECLARE_string(runtime);
DECLARE_string(image);
DECLARE_string(workdir);
DECLARE_int32(keepalive_seconds);
DECLARE_int64(sandbox_memory_mb);
DECLARE_string(sandbox_network);

// Code execution.
DECLARE_string(interpreter);
DECLARE_int64(execution_timeout_ms);
DECLARE_int64(max_output_bytes);

// Session reaping.
DECLARE_int32(reaper_interval_seconds);
DECLARE_int32(idle_timeout_seconds);

#endif
