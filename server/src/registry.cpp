#include <fnrun/server/registry.hpp>

#include <fnrun/common/exceptions.hpp>

#include <ctime>

#include <fmt/format.h>

namespace fnrun::server {

  DeploymentKey DeploymentKey::bare(std::string function_name)
  {
    if (function_name.empty()) {
      throw common::InvalidArgument("Deployment key requires a function name");
    }
    return DeploymentKey{"", "", std::move(function_name)};
  }

  DeploymentKey
  DeploymentKey::namespaced(std::string owner, std::string repo, std::string function_name)
  {
    if (owner.empty() || repo.empty() || function_name.empty()) {
      throw common::InvalidArgument(fmt::format(
          "Deployment key {}/{}/{} has an empty segment", owner, repo, function_name
      ));
    }
    return DeploymentKey{std::move(owner), std::move(repo), std::move(function_name)};
  }

  DeploymentKey DeploymentKey::parse(std::string_view key)
  {
    std::vector<std::string> segments;
    size_t begin = 0;
    while (true) {
      size_t pos = key.find('/', begin);
      segments.emplace_back(key.substr(begin, pos == std::string_view::npos ? pos : pos - begin));
      if (pos == std::string_view::npos) {
        break;
      }
      begin = pos + 1;
    }

    if (segments.size() == 1) {
      return bare(std::move(segments[0]));
    } else if (segments.size() == 3) {
      return namespaced(std::move(segments[0]), std::move(segments[1]), std::move(segments[2]));
    }

    throw common::InvalidArgument(fmt::format("Malformed deployment key {}", key));
  }

  std::string DeploymentKey::str() const
  {
    if (is_namespaced()) {
      return fmt::format("{}/{}/{}", owner, repo, function_name);
    }
    return function_name;
  }

  std::string Deployment::created_at_iso() const
  {
    std::time_t time = std::chrono::system_clock::to_time_t(created_at);
    std::tm utc{};
    gmtime_r(&time, &utc);

    char buffer[32];
    size_t len = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
    return std::string{buffer, len};
  }

  DeploymentPtr
  Registry::put(const DeploymentKey& key, std::string source, sandbox::Environment::values_t env)
  {
    Deployment record;
    record.key = key;
    record.source = std::move(source);
    record.entry_point = key.function_name;
    record.env = std::move(env);
    record.created_at = std::chrono::system_clock::now();
    return put(std::move(record));
  }

  DeploymentPtr Registry::put(Deployment record)
  {
    // Revalidates keys built by hand.
    std::string key = DeploymentKey::parse(record.key.str()).str();

    write_lock_t lock(_mutex);

    auto it = _deployments.find(key);
    record.revision = it == _deployments.end() ? 1 : it->second->revision + 1;

    auto ptr = std::make_shared<const Deployment>(std::move(record));
    _deployments.insert_or_assign(key, ptr);
    return ptr;
  }

  DeploymentPtr Registry::get(const std::string& key) const
  {
    DeploymentPtr ptr;
    {
      read_lock_t lock(_mutex);
      auto it = _deployments.find(key);
      if (it == _deployments.end()) {
        return nullptr;
      }
      ptr = it->second;
    }

    if (ptr->version != Deployment::SCHEMA_VERSION) {
      throw common::FnRunException(fmt::format(
          "Deployment {} has unsupported schema version {}", key, ptr->version
      ));
    }
    return ptr;
  }

  std::vector<std::string> Registry::list() const
  {
    read_lock_t lock(_mutex);

    std::vector<std::string> keys;
    keys.reserve(_deployments.size());
    for (const auto& [key, _] : _deployments) {
      keys.push_back(key);
    }
    return keys;
  }

  std::vector<DeploymentPtr> Registry::deployments() const
  {
    read_lock_t lock(_mutex);

    std::vector<DeploymentPtr> results;
    results.reserve(_deployments.size());
    for (const auto& [_, ptr] : _deployments) {
      results.push_back(ptr);
    }
    return results;
  }

  size_t Registry::size() const
  {
    read_lock_t lock(_mutex);
    return _deployments.size();
  }

} // namespace fnrun::server
