#include "cloudmover/backend_registry.hpp"

#include "cloudmover/errors.hpp"
#include "cloudmover/local_storage.hpp"

#include <stdexcept>
#include <utility>

namespace cloudmover {

namespace {

std::string object_name(const Locator &locator) { return locator.container + "/" + locator.key; }

} // namespace

BackendRegistry BackendRegistry::with_builtin_backends(std::shared_ptr<MemoryObjectStore> store) {
    if (!store) {
        throw std::invalid_argument("builtin backends need a memory object store");
    }
    BackendRegistry registry;
    registry.register_source("file", [](const Locator &locator, const Logger &) {
        return std::make_unique<LocalFileSource>(locator.key);
    });
    registry.register_destination("file", [](const Locator &locator, const Logger &logger) {
        return std::make_unique<LocalFileDestination>(locator.key, logger);
    });
    registry.register_source("mem", [store](const Locator &locator, const Logger &) {
        return std::make_unique<MemorySource>(store, object_name(locator));
    });
    registry.register_destination("mem", [store](const Locator &locator, const Logger &logger) {
        return std::make_unique<MemoryDestination>(store, object_name(locator), logger);
    });
    return registry;
}

void BackendRegistry::register_source(const std::string &provider, SourceFactory factory) {
    if (!factory) {
        throw std::invalid_argument("empty source factory for provider " + provider);
    }
    sources_[provider] = std::move(factory);
}

void BackendRegistry::register_destination(const std::string &provider, DestinationFactory factory) {
    if (!factory) {
        throw std::invalid_argument("empty destination factory for provider " + provider);
    }
    destinations_[provider] = std::move(factory);
}

bool BackendRegistry::has_source(const std::string &provider) const {
    return sources_.count(provider) > 0;
}

bool BackendRegistry::has_destination(const std::string &provider) const {
    return destinations_.count(provider) > 0;
}

std::unique_ptr<SourceHandle> BackendRegistry::open_source(const Locator &locator,
                                                           const Logger &logger) const {
    auto it = sources_.find(locator.provider);
    if (it == sources_.end()) {
        throw LocatorError("Unsupported source provider: " + locator.provider + " (" + locator.text + ")");
    }
    return it->second(locator, logger);
}

std::unique_ptr<DestinationHandle> BackendRegistry::open_destination(const Locator &locator,
                                                                     const Logger &logger) const {
    auto it = destinations_.find(locator.provider);
    if (it == destinations_.end()) {
        throw LocatorError("Unsupported destination provider: " + locator.provider + " (" +
                           locator.text + ")");
    }
    return it->second(locator, logger);
}

} // namespace cloudmover
