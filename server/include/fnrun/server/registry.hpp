#ifndef FNRUN_SERVER_REGISTRY_HPP
#define FNRUN_SERVER_REGISTRY_HPP

#include <fnrun/sandbox/environment.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace fnrun::server {

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Identifier of a deployment.
  ///
  /// Either a bare function name or the owner/repo/function_name triple.
  /// The string form must match exactly between deploy and execute.
  ////////////////////////////////////////////////////////////////////////////////
  struct DeploymentKey {

    std::string owner;
    std::string repo;
    std::string function_name;

    // Throws common::InvalidArgument on an empty segment.
    static DeploymentKey bare(std::string function_name);

    // Throws common::InvalidArgument on an empty segment.
    static DeploymentKey
    namespaced(std::string owner, std::string repo, std::string function_name);

    // Accepts "name" and "owner/repo/name".
    static DeploymentKey parse(std::string_view key);

    bool is_namespaced() const
    {
      return !owner.empty();
    }

    std::string str() const;

    bool operator==(const DeploymentKey& other) const = default;
  };

  struct Deployment {

    static constexpr int SCHEMA_VERSION = 1;

    int version = SCHEMA_VERSION;

    DeploymentKey key;
    std::string source;
    std::string entry_point;
    sandbox::Environment::values_t env;

    // Incremented on every put of the same key, starting at 1.
    int revision = 1;
    std::chrono::system_clock::time_point created_at;

    // ISO-8601 in UTC, e.g. 2024-05-01T12:00:00Z
    std::string created_at_iso() const;
  };

  using DeploymentPtr = std::shared_ptr<const Deployment>;

  // In-memory store of deployments; contents are lost on restart.
  class Registry {
  public:
    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Stores a deployment, replacing the previous one with the same key.
    ///
    /// @param[in] key deployment key, the function name becomes the entry point
    /// @param[in] source complete source text
    /// @param[in] env variables applied during each invocation
    /// @return the stored record
    ////////////////////////////////////////////////////////////////////////////////
    DeploymentPtr put(const DeploymentKey& key, std::string source, sandbox::Environment::values_t env);

    // Stores the record as given, apart from the revision.
    DeploymentPtr put(Deployment record);

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Looks up a deployment.
    ///
    /// Throws common::FnRunException when the stored record has an unknown
    /// schema version.
    ///
    /// @return record or nullptr if the key is not deployed
    ////////////////////////////////////////////////////////////////////////////////
    DeploymentPtr get(const std::string& key) const;

    std::vector<std::string> list() const;

    std::vector<DeploymentPtr> deployments() const;

    size_t size() const;

  private:
    using lock_t = std::shared_mutex;
    using write_lock_t = std::unique_lock<lock_t>;
    using read_lock_t = std::shared_lock<lock_t>;

    // Listing iterates over all records, so the whole map is guarded by one lock.
    mutable lock_t _mutex;
    std::unordered_map<std::string, DeploymentPtr> _deployments;
  };

} // namespace fnrun::server

#endif
