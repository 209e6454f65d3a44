#include <gflags/gflags.h>

DEFINE_int32(worker_threads, 100, "Maximum number of scripts evaluating concurrently");
DEFINE_int32(output_poll_interval_ms, 5, "Upper bound between two output mirrors of a running script");
DEFINE_int32(sweep_interval_seconds, 3600, "Interval between cleanup sweeps of finished scripts");
DEFINE_int32(dispatch_keep_alive_seconds, 60, "Idle time before a dispatch thread exits");
DEFINE_string(interpreter, "/bin/sh", "Interpreter executable that runs submitted scripts");
DEFINE_string(interpreter_args, "", "Comma separated arguments passed before the script path");
DEFINE_string(sandbox_root, "", "Directory for sandbox scratch space; system temp dir when empty");
