#include "cloudmover/locator.hpp"

#include "cloudmover/errors.hpp"

#include <filesystem>
#include <string_view>
#include <system_error>

namespace cloudmover {

namespace {

constexpr std::string_view azure_host_suffix = ".blob.core.windows.net";

bool starts_with(std::string_view text, std::string_view prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(std::string_view text, std::string_view suffix) {
    return text.size() >= suffix.size() &&
           text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// Splits "<container>/<key>"; both halves must be non-empty.
void split_container_key(const std::string &text, std::string_view rest, Locator &locator) {
    const auto slash = rest.find('/');
    if (slash == std::string_view::npos || slash == 0 || slash + 1 == rest.size()) {
        throw LocatorError("locator needs a container and an object name: " + text);
    }
    locator.container = std::string(rest.substr(0, slash));
    locator.key = std::string(rest.substr(slash + 1));
}

bool is_word(std::string_view text) {
    if (text.empty()) {
        return false;
    }
    for (char c : text) {
        const bool alnum = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
        if (!alnum && c != '_') {
            return false;
        }
    }
    return true;
}

} // namespace

Locator parse_locator(const std::string &text) {
    Locator locator;
    locator.text = text;
    std::string_view view(text);

    if (starts_with(view, "s3://")) {
        locator.provider = "s3";
        split_container_key(text, view.substr(5), locator);
        return locator;
    }
    if (starts_with(view, "gs://")) {
        locator.provider = "gcs";
        split_container_key(text, view.substr(5), locator);
        return locator;
    }
    if (starts_with(view, "mem://")) {
        locator.provider = "mem";
        split_container_key(text, view.substr(6), locator);
        return locator;
    }
    if (starts_with(view, "azure://")) {
        locator.provider = "azure";
        auto rest = view.substr(8);
        const auto at = rest.find('@');
        const auto slash = rest.find('/');
        if (at != std::string_view::npos && (slash == std::string_view::npos || at < slash)) {
            const auto account = rest.substr(0, at);
            if (!is_word(account)) {
                throw LocatorError("invalid azure account name in locator: " + text);
            }
            locator.account = std::string(account);
            rest = rest.substr(at + 1);
        }
        split_container_key(text, rest, locator);
        return locator;
    }
    if (starts_with(view, "https://")) {
        auto rest = view.substr(8);
        const auto slash = rest.find('/');
        const auto host = rest.substr(0, slash);
        if (!ends_with(host, azure_host_suffix) || host.size() == azure_host_suffix.size()) {
            throw LocatorError("unsupported locator: " + text);
        }
        locator.provider = "azure";
        locator.account = std::string(host.substr(0, host.find('.')));
        if (slash == std::string_view::npos) {
            throw LocatorError("azure URL missing container/blob information: " + text);
        }
        split_container_key(text, rest.substr(slash + 1), locator);
        return locator;
    }
    if (starts_with(view, "file://")) {
        locator.provider = "file";
        locator.key = std::string(view.substr(7));
        if (locator.key.empty()) {
            throw LocatorError("file locator has an empty path: " + text);
        }
        return locator;
    }
    if (view.find("://") != std::string_view::npos) {
        throw LocatorError("unsupported locator: " + text);
    }
    if (view.empty()) {
        throw LocatorError("empty locator");
    }
    locator.provider = "file";
    locator.key = text;
    return locator;
}

namespace {

std::filesystem::path resolved_path(const std::string &key) {
    std::error_code ec;
    auto path = std::filesystem::weakly_canonical(key, ec);
    if (ec) {
        path = std::filesystem::absolute(key, ec).lexically_normal();
        if (ec) {
            return std::filesystem::path(key).lexically_normal();
        }
    }
    return path;
}

} // namespace

bool same_object(const Locator &a, const Locator &b) {
    if (a.provider != b.provider) {
        return false;
    }
    if (a.provider == "file") {
        return resolved_path(a.key) == resolved_path(b.key);
    }
    return a.account == b.account && a.container == b.container && a.key == b.key;
}

} // namespace cloudmover
