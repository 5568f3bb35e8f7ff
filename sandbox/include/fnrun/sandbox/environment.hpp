#ifndef FNRUN_SANDBOX_ENVIRONMENT_HPP
#define FNRUN_SANDBOX_ENVIRONMENT_HPP

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fnrun::sandbox {

  ////////////////////////////////////////////////////////////////////////////////
  /// @brief Environment of a single sandbox process.
  ///
  /// The sandbox never inherits the server's environment. It receives the base
  /// set from the configuration with the deployment's variables merged over it,
  /// passed explicitly to execve. Nothing here touches the process environment.
  ////////////////////////////////////////////////////////////////////////////////
  class Environment {
  public:
    using values_t = std::map<std::string, std::string>;

    // Owns the strings behind a NULL-terminated envp array.
    class Block {
    public:
      Block(const values_t& values);

      Block(const Block&) = delete;
      Block& operator=(const Block&) = delete;
      Block(Block&&) = default;
      Block& operator=(Block&&) = default;

      char** envp()
      {
        return _pointers.data();
      }

      size_t size() const
      {
        return _storage.size();
      }

    private:
      std::vector<std::string> _storage;
      std::vector<char*> _pointers;
    };

    Environment() = default;

    ////////////////////////////////////////////////////////////////////////////////
    /// @brief Parses a list of NAME=value entries.
    ///
    /// @param[in] entries base environment as written in the configuration
    /// @return environment holding all entries; later duplicates win
    ////////////////////////////////////////////////////////////////////////////////
    static Environment from_entries(const std::vector<std::string>& entries);

    void set(const std::string& name, const std::string& value);

    // Values of the overlay replace existing ones; nothing is merged within a value.
    void overlay(const values_t& values);

    std::optional<std::string> get(const std::string& name) const;

    const values_t& values() const
    {
      return _values;
    }

    Block block() const
    {
      return Block{_values};
    }

    static bool valid_name(std::string_view name);

    static bool valid_value(std::string_view value);

  private:
    values_t _values;
  };

} // namespace fnrun::sandbox

#endif
