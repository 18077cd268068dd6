#pragma once
#include <quartermaster/store/entity_store.hpp>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace quartermaster::insight {

inline constexpr auto kApiKeyVariable = std::string_view{"QUARTERMASTER_API_KEY"};

inline constexpr auto kMissingKeyMessage = std::string_view{
    "API Key not found. Please configure the environment variable."};
inline constexpr auto kEmptyResponseMessage =
    std::string_view{"Unable to generate an analysis right now."};
inline constexpr auto kFailureMessage = std::string_view{
    "An error occurred while analyzing the data. Please try again later."};

/// Raised by analysts when the summarization service fails or is unreachable.
class external_service_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// Free-text summarization collaborator.
class analyst {
 public:
  virtual ~analyst() = default;

  /// Return prose describing `snapshot_json`. Throws external_service_error on
  /// failure.
  virtual std::string analyze(const std::string& snapshot_json,
                              const std::string& api_key) = 0;
};

/// Runs an external command with the path of a file holding the snapshot as
/// its only argument and returns its standard output. The credential is
/// passed through the environment, never on the command line.
class command_analyst final : public analyst {
 public:
  explicit command_analyst(std::string command);

  std::string analyze(const std::string& snapshot_json,
                      const std::string& api_key) override;

 private:
  std::string command_;
};

/// Credential from `QUARTERMASTER_API_KEY`; absent or empty is std::nullopt.
std::optional<std::string> api_key_from_environment();

/// Summarize the store through `service`. Never throws: a missing credential,
/// an empty answer or a service failure each yield a placeholder message.
std::string analyze_asset_health(const store::entity_store& store,
                                 analyst& service,
                                 const std::optional<std::string>& api_key);

}  // namespace quartermaster::insight
