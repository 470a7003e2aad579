#include "process.hpp"
#include <array>
#include <cstdio>
#include <cstdlib>
#include <sys/wait.h>

namespace platform {

static int decode_status(int status) {
    if (status == -1) return -1;
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

ProcessResult run_capture(const std::string& command) {
    ProcessResult result{-1, "", ""};
    std::string cmd = command + " 2>&1";

    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) {
        result.stderr_data = "failed to start: " + command;
        return result;
    }

    std::array<char, 512> buffer;
    while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
        result.stdout_data += buffer.data();
    }
    result.exit_code = decode_status(pclose(pipe));
    return result;
}

int run_passthrough(const std::string& command) {
    std::fflush(stdout);
    return decode_status(std::system(command.c_str()));
}

} // namespace platform
