#pragma once
/** @file  BackendRegistry.hpp
 *  @brief Runtime registry that maps backend names to creators.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace carpark::core {

  /**
 * @class BackendRegistry
 * @brief Register & instantiate device backends by the string key found in the config.
 *
 *  * Keeps SystemController decoupled from concrete devices.
 *  * Creators are lambdas returning `unique_ptr<Product>`.
 */
  template <typename Product, typename... Args> class BackendRegistry {
  public:
    using Creator = std::function<std::unique_ptr<Product>(Args...)>;

    /// Register a backend under \p name.  Returns false on duplicate.
    bool registerBackend(const std::string& name, Creator maker) {
      return creators_.emplace(name, std::move(maker)).second;
    }

    /// Create a fresh instance or throw `std::out_of_range` if unknown.
    std::unique_ptr<Product> create(const std::string& name, Args... args) const {
      auto it = creators_.find(name);
      if (it == creators_.end())
        throw std::out_of_range("unknown backend '" + name + "'");
      return it->second(std::forward<Args>(args)...);
    }

    std::vector<std::string> names() const {
      std::vector<std::string> out;
      for (const auto& [name, creator] : creators_)
        out.push_back(name);
      return out;
    }

  private:
    std::map<std::string, Creator> creators_;
  };

} // namespace carpark::core
