#ifndef UTIL_FLAGS_HPP
#define UTIL_FLAGS_HPP

#include "gflags/gflags.h"

DECLARE_string(time_binary);
DECLARE_string(temp_directory);
DECLARE_bool(keep_sandboxes);
DECLARE_string(languages_config);
DECLARE_double(tool_time_limit);
DECLARE_double(compilation_time_limit);

#endif
