#include <spdlog/spdlog.h>
#include <sys/wait.h>
#include <unistd.h>
#include <quartermaster/insight/analyst.hpp>
#include <quartermaster/insight/snapshot.hpp>
#include <array>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

namespace fs = std::filesystem;

namespace quartermaster::insight {

namespace {

std::string shell_quote(const std::string_view value) {
  auto quoted = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      quoted.append("'\\''");
    } else {
      quoted.push_back(ch);
    }
  }
  quoted.push_back('\'');
  return quoted;
}

fs::path make_snapshot_path() {
  const auto stamp =
      std::chrono::steady_clock::now().time_since_epoch().count();
  return fs::temp_directory_path() /
         ("quartermaster_snapshot_" + std::to_string(::getpid()) + "_" +
          std::to_string(stamp) + ".json");
}

// Removes the snapshot file on every exit path.
struct scoped_file final {
  fs::path path;

  ~scoped_file() {
    auto ec = std::error_code{};
    fs::remove(path, ec);
    if (ec) {
      spdlog::debug("Failed to remove {}: {}", path.string(), ec.message());
    }
  }
};

// Exposes a variable to child processes for the guard's lifetime, then
// restores the previous value or removes it.
class scoped_environment_variable final {
 public:
  scoped_environment_variable(std::string name, const std::string& value)
      : name_{std::move(name)} {
    if (const auto* previous = std::getenv(name_.c_str());
        previous != nullptr) {
      previous_ = std::string{previous};
    }
    if (::setenv(name_.c_str(), value.c_str(), 1) != 0) {
      throw external_service_error{"failed to export the API credential"};
    }
  }

  scoped_environment_variable(const scoped_environment_variable&) = delete;
  scoped_environment_variable& operator=(const scoped_environment_variable&) =
      delete;

  ~scoped_environment_variable() {
    const auto status =
        previous_ ? ::setenv(name_.c_str(), previous_->c_str(), 1)
                  : ::unsetenv(name_.c_str());
    if (status != 0) {
      spdlog::warn("Failed to restore {}", name_);
    }
  }

 private:
  std::string name_;
  std::optional<std::string> previous_;
};

std::string trim_output(std::string output) {
  auto view = schema::trim(output);
  return std::string{view};
}

}  // namespace

command_analyst::command_analyst(std::string command)
    : command_{std::move(command)} {}

std::string command_analyst::analyze(const std::string& snapshot_json,
                                     const std::string& api_key) {
  if (command_.empty()) {
    throw external_service_error{"no analyst command is configured"};
  }

  auto snapshot = scoped_file{make_snapshot_path()};
  {
    auto out = std::ofstream{snapshot.path, std::ios::binary};
    if (!out) {
      throw external_service_error{"failed to write snapshot file " +
                                   snapshot.path.string()};
    }
    out << snapshot_json;
  }

  const auto credential =
      scoped_environment_variable{std::string{kApiKeyVariable}, api_key};

  auto command = command_ + " " + shell_quote(snapshot.path.string());
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    throw external_service_error{"failed to start analyst command"};
  }
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1 || WIFEXITED(status) == 0) {
    throw external_service_error{"analyst command terminated abnormally"};
  }
  if (WEXITSTATUS(status) != 0) {
    throw external_service_error{"analyst command exited with status " +
                                 std::to_string(WEXITSTATUS(status))};
  }
  return trim_output(std::move(output));
}

std::optional<std::string> api_key_from_environment() {
  const auto* value = std::getenv(std::string{kApiKeyVariable}.c_str());
  if (value == nullptr || *value == '\0') {
    return std::nullopt;
  }
  return std::string{value};
}

std::string analyze_asset_health(const store::entity_store& store,
                                 analyst& service,
                                 const std::optional<std::string>& api_key) {
  if (!api_key || api_key->empty()) {
    return std::string{kMissingKeyMessage};
  }
  try {
    auto text = service.analyze(make_snapshot_json(store), *api_key);
    if (text.empty()) {
      return std::string{kEmptyResponseMessage};
    }
    return text;
  } catch (const std::exception& e) {
    spdlog::error("Asset analysis failed: {}", e.what());
    return std::string{kFailureMessage};
  }
}

}  // namespace quartermaster::insight
