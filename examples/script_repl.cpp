#include <iostream>
#include <string>

#include <gflags/gflags.h>

#include "common/logging/log.hpp"
#include "runtime/runtime.hpp"
#include "runtime/script_api.hpp"

// Reads one JSON request per line from stdin and prints one JSON response per
// line, e.g.
//   {"op":"execute","script":"echo hello","blocking":true}
//   {"op":"list","status":"completed","orderBy":"id"}
int main(int argc, char** argv) {
  gflags::SetUsageMessage("script_repl: run scripts from JSON requests on stdin");
  gflags::ParseCommandLineFlags(&argc, &argv, true);

  int exit_code = 0;
  {
    srunner::runtime::Runtime runtime(srunner::runtime::runtime_config_from_flags());
    srunner::runtime::ScriptApi api(runtime.coordinator());

    std::string line;
    while (std::getline(std::cin, line)) {
      if (line.find_first_not_of(" \t\r") == std::string::npos) {
        continue;
      }
      std::cout << srunner::runtime::to_line(api.handle_text(line)) << std::endl;
    }
    if (!std::cin.eof()) {
      std::cerr << "stdin read error\n";
      exit_code = 1;
    }
  }

  srunner::log::shutdown();
  gflags::ShutDownCommandLineFlags();
  return exit_code;
}
