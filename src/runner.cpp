#include "runner.hpp"
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path temp_path(const char* suffix) {
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    std::string name = "amhapy_" + std::to_string(::getpid()) + "_" + std::to_string(stamp) + suffix;
    return fs::temp_directory_path() / name;
}

static std::string quote(const std::string& s) {
    std::string out = "'";
    for (char c : s) {
        if (c == '\'') out += "'\\''";
        else out += c;
    }
    out += "'";
    return out;
}

RunResult run_python(const std::string& code, const std::string& interpreter) {
    const fs::path script = temp_path(".py");
    const fs::path capture = temp_path(".out");

    {
        std::ofstream out(script, std::ios::out | std::ios::binary);
        if (!out) throw std::runtime_error("Failed to create temporary script: " + script.string());
        out << code << "\n";
        if (!out) throw std::runtime_error("Failed to write temporary script: " + script.string());
    }

    const std::string cmd = quote(interpreter) + " " + quote(script.string()) +
                            " > " + quote(capture.string()) + " 2>&1";
    const int status = std::system(cmd.c_str());

    RunResult result;
    if (status == -1) result.exit_code = -1;
    else if (WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
    else result.exit_code = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    // sh reports 127 for command not found and 126 for not executable.
    if (result.exit_code == 126 || result.exit_code == 127) result.launched = false;

    std::ifstream in(capture, std::ios::binary);
    if (in) {
        result.output.assign((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }
    in.close();

    std::error_code ec;
    fs::remove(script, ec);
    fs::remove(capture, ec);
    return result;
}
