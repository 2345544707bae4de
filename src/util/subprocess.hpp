#pragma once

#include <atomic>
#include <string>
#include <vector>

namespace panelpress {

struct ProcessResult {
    bool launched = false;
    bool cancelled = false;
    int exit_code = -1;
    std::string output;

    bool ok() const { return launched && !cancelled && exit_code == 0; }
};

// Runs argv[0] from PATH with stdout and stderr captured. When cancel becomes
// true the child is terminated and the result is marked cancelled.
ProcessResult run_process(const std::vector<std::string>& argv,
                          const std::atomic<bool>* cancel = nullptr);

bool command_available(const std::string& command);

}
