#pragma once

#include "cloudmover/locator.hpp"
#include "cloudmover/logging.hpp"
#include "cloudmover/memory_storage.hpp"
#include "cloudmover/storage.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>

namespace cloudmover {

using SourceFactory = std::function<std::unique_ptr<SourceHandle>(const Locator &, const Logger &)>;
using DestinationFactory =
    std::function<std::unique_ptr<DestinationHandle>(const Locator &, const Logger &)>;

// Maps a locator's provider to the adapters that can read or write it.
class BackendRegistry {
  public:
    // "file" and "mem" backends; `store` backs every mem:// locator.
    static BackendRegistry with_builtin_backends(std::shared_ptr<MemoryObjectStore> store);

    void register_source(const std::string &provider, SourceFactory factory);

    void register_destination(const std::string &provider, DestinationFactory factory);

    bool has_source(const std::string &provider) const;

    bool has_destination(const std::string &provider) const;

    // Both throw LocatorError when nothing is registered for the provider.
    std::unique_ptr<SourceHandle> open_source(const Locator &locator, const Logger &logger) const;

    std::unique_ptr<DestinationHandle> open_destination(const Locator &locator,
                                                        const Logger &logger) const;

  private:
    std::map<std::string, SourceFactory> sources_;
    std::map<std::string, DestinationFactory> destinations_;
};

} // namespace cloudmover
