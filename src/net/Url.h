#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// plus_as_space applies to query strings only; paths keep '+' literally.
std::string url_decode(std::string_view s, bool plus_as_space = true);
// RFC 3986 unreserved characters pass through, everything else is %XX.
std::string url_encode(std::string_view s);

class QueryParams {
public:
    QueryParams() = default;
    static QueryParams parse(std::string_view query);

    // Last occurrence wins when a name repeats.
    std::optional<std::string> get(const std::string& name) const;
    bool contains(const std::string& name) const { return get(name).has_value(); }
    void add(std::string name, std::string value);
    bool empty() const { return items_.empty(); }

    // name=value pairs joined by '&', both sides percent-encoded, in insertion order.
    std::string encode() const;

private:
    std::vector<std::pair<std::string, std::string>> items_;
};

// Splits a request target into path and raw query (without '?').
std::pair<std::string, std::string> split_target(std::string_view target);

struct BaseUrl {
    bool tls = true;
    std::string host;
    std::string port;
    // prefix prepended to every upstream target, no trailing slash
    std::string path;

    // "https://host:port" with default ports omitted
    std::string origin() const;
};

// Accepts http:// and https:// URLs. Throws std::invalid_argument otherwise.
BaseUrl parse_base_url(const std::string& url);

// Request target for a redirect Location on the same origin as base, or
// nullopt for an empty or cross-origin location.
std::optional<std::string> resolve_redirect(const BaseUrl& base, std::string_view location, std::string_view current_target);
