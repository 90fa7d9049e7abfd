#include "Url.h"
#include <cctype>
#include <stdexcept>

static int hex_value(char h) {
    if (h >= '0' && h <= '9') return h - '0';
    if (h >= 'a' && h <= 'f') return 10 + (h - 'a');
    if (h >= 'A' && h <= 'F') return 10 + (h - 'A');
    return -1;
}

std::string url_decode(std::string_view s, bool plus_as_space) {
    std::string out; out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        char c = s[i];
        if (c == '%' && i + 2 < s.size()) {
            int hi = hex_value(s[i+1]); int lo = hex_value(s[i+2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(char((hi << 4) | lo)); i += 2;
                continue;
            }
            // malformed escapes are kept literally
            out.push_back(c);
        } else if (c == '+' && plus_as_space) out.push_back(' ');
        else out.push_back(c);
    }
    return out;
}

std::string url_encode(std::string_view s) {
    static const char* hex = "0123456789ABCDEF";
    std::string out; out.reserve(s.size() * 3);
    for (unsigned char c : s) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[(c >> 4) & 0xF]);
            out.push_back(hex[c & 0xF]);
        }
    }
    return out;
}

QueryParams QueryParams::parse(std::string_view query) {
    QueryParams q;
    size_t pos = 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string_view::npos) amp = query.size();
        std::string_view part = query.substr(pos, amp - pos);
        if (!part.empty()) {
            size_t eq = part.find('=');
            if (eq == std::string_view::npos) q.add(url_decode(part), std::string());
            else q.add(url_decode(part.substr(0, eq)), url_decode(part.substr(eq + 1)));
        }
        pos = amp + 1;
    }
    return q;
}

std::optional<std::string> QueryParams::get(const std::string& name) const {
    for (auto it = items_.rbegin(); it != items_.rend(); ++it) {
        if (it->first == name) return it->second;
    }
    return std::nullopt;
}

void QueryParams::add(std::string name, std::string value) {
    items_.emplace_back(std::move(name), std::move(value));
}

std::string QueryParams::encode() const {
    std::string out;
    for (const auto& kv : items_) {
        if (!out.empty()) out.push_back('&');
        out += url_encode(kv.first);
        out.push_back('=');
        out += url_encode(kv.second);
    }
    return out;
}

std::pair<std::string, std::string> split_target(std::string_view target) {
    auto q = target.find('?');
    if (q == std::string_view::npos) return {std::string(target), std::string()};
    return {std::string(target.substr(0, q)), std::string(target.substr(q + 1))};
}

std::string BaseUrl::origin() const {
    std::string out = tls ? "https://" : "http://";
    out += host;
    if ((tls && port != "443") || (!tls && port != "80")) out += ":" + port;
    return out;
}

BaseUrl parse_base_url(const std::string& url) {
    BaseUrl b;
    std::string rest;
    if (url.rfind("https://", 0) == 0) { b.tls = true; rest = url.substr(8); }
    else if (url.rfind("http://", 0) == 0) { b.tls = false; rest = url.substr(7); }
    else throw std::invalid_argument("unsupported upstream url scheme: " + url);

    std::string hostport = rest;
    size_t slash = rest.find('/');
    if (slash != std::string::npos) {
        hostport = rest.substr(0, slash);
        b.path = rest.substr(slash);
        while (!b.path.empty() && b.path.back() == '/') b.path.pop_back();
    }
    size_t colon = hostport.rfind(':');
    if (colon != std::string::npos && hostport.find(']') == std::string::npos) {
        b.host = hostport.substr(0, colon);
        b.port = hostport.substr(colon + 1);
    } else {
        b.host = hostport;
    }
    if (b.port.empty()) b.port = b.tls ? "443" : "80";
    if (b.host.empty()) throw std::invalid_argument("upstream url has no host: " + url);
    for (char c : b.port) {
        if (!std::isdigit(static_cast<unsigned char>(c))) throw std::invalid_argument("invalid upstream port: " + url);
    }
    return b;
}

static std::string lower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::optional<std::string> resolve_redirect(const BaseUrl& base, std::string_view location, std::string_view current_target) {
    auto hash = location.find('#');
    if (hash != std::string_view::npos) location = location.substr(0, hash);
    if (location.empty()) return std::nullopt;

    std::string loc(location);
    if (loc.rfind("//", 0) == 0) loc = (base.tls ? "https:" : "http:") + loc;

    bool tls;
    std::string rest;
    std::string head = lower(loc.substr(0, 8));
    if (head.rfind("https://", 0) == 0) { tls = true; rest = loc.substr(8); }
    else if (head.rfind("http://", 0) == 0) { tls = false; rest = loc.substr(7); }
    else if (loc[0] == '/') return loc;
    else if (loc.find(':') < loc.find('/')) return std::nullopt;
    else {
        // relative reference against the directory of the current path
        std::string path = split_target(current_target).first;
        auto slash = path.rfind('/');
        return (slash == std::string::npos ? std::string("/") : path.substr(0, slash + 1)) + loc;
    }

    auto end = rest.find_first_of("/?");
    std::string hostport = rest.substr(0, end);
    std::string target = end == std::string::npos ? "/" : rest.substr(end);
    if (target[0] == '?') target = "/" + target;

    std::string host = hostport, port = tls ? "443" : "80";
    auto colon = hostport.rfind(':');
    if (colon != std::string::npos && hostport.find(']') == std::string::npos) {
        host = hostport.substr(0, colon);
        if (colon + 1 < hostport.size()) port = hostport.substr(colon + 1);
    }
    if (tls != base.tls || lower(host) != lower(base.host) || port != base.port) return std::nullopt;
    return target;
}
