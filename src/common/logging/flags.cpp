#include <gflags/gflags.h>

DEFINE_string(log_level, "info", "Minimum log level: trace, debug, info, warn, error, critical or off");
DEFINE_string(log_file, "", "Rotating log file path; console only when empty");
DEFINE_int32(log_max_size, 10485760, "Bytes written to the log file before it rotates");
DEFINE_int32(log_max_files, 3, "Rotated log files kept beside the active one");
DEFINE_int32(log_queue_size, 8192, "Messages buffered by the async logger before callers block");
DEFINE_string(log_pattern, "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v", "spdlog pattern for every sink");
