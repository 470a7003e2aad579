#pragma once

#include <string>
#include <vector>
#include <functional>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Creates virtual environments and installs packages into them.
class PythonToolchain {
public:
    virtual ~PythonToolchain() = default;

    virtual Result<void> create_venv(const std::string& python, const fs::path& venv_dir) = 0;
    virtual Result<void> install(const fs::path& venv_dir,
                                 const std::vector<std::string>& packages) = 0;

    // Run a shell command with the venv activated
    virtual Result<void> run(const fs::path& venv_dir, const std::string& command) = 0;
};

// python -m venv / pip through a login shell, with the environment's modules
// loaded first in the same shell. Output goes straight to the terminal.
class ShellPythonToolchain : public PythonToolchain {
public:
    using Runner = std::function<int(const std::string&)>;

    explicit ShellPythonToolchain(std::vector<std::string> modules);
    ShellPythonToolchain(std::vector<std::string> modules, Runner runner);

    Result<void> create_venv(const std::string& python, const fs::path& venv_dir) override;
    Result<void> install(const fs::path& venv_dir,
                         const std::vector<std::string>& packages) override;
    Result<void> run(const fs::path& venv_dir, const std::string& command) override;

private:
    std::vector<std::string> modules_;
    Runner run_;

    Result<void> exec(const std::string& what, const std::string& script);
};
