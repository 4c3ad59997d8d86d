#include "util/flags.hpp"

DEFINE_string(time_binary, "/usr/bin/time",
              "GNU time executable used to measure solutions. If it is not "
              "executable, resource usage is measured by the engine itself");
DEFINE_string(temp_directory, "/tmp",
              "Where the transient working directories should be created");
DEFINE_bool(keep_sandboxes, false,
            "Do not remove the transient working directories after running");
DEFINE_string(languages_config, "",
              "Text-format LanguageTable to use instead of the built-in one");
DEFINE_double(tool_time_limit, 30.0,
              "Wall time limit in seconds for checkers, validators, "
              "generators and interactors");
DEFINE_double(compilation_time_limit, 60.0,
              "Wall time limit in seconds for a single compilation");
