#pragma once

#include <string>

namespace cloudmover {

struct Locator {
    std::string provider;  // "s3", "gcs", "azure", "file", "mem"
    std::string account;   // azure only, may be empty
    std::string container; // bucket or container; empty for "file"
    std::string key;       // object key, blob name or filesystem path
    std::string text;      // as given by the user
};

// Throws LocatorError for unsupported schemes or missing container/key.
Locator parse_locator(const std::string &text);

// True when both locators address one object. File paths are compared after
// resolving symlinks and "." / ".." components.
bool same_object(const Locator &a, const Locator &b);

} // namespace cloudmover
