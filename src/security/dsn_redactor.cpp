#include "security/dsn_redactor.hpp"
#include "core/utils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <format>
#include <regex>
#include <vector>

namespace nlsql {

namespace {

constexpr std::string_view kMask = "***";

bool is_uri_scheme(std::string_view scheme) {
    return scheme == "postgresql" || scheme == "postgres";
}

std::string percent_decode(std::string_view in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%' && i + 2 < in.size()) {
            unsigned int val = 0;
            const auto [ptr, ec] = std::from_chars(in.data() + i + 1, in.data() + i + 3, val, 16);
            if (ec == std::errc{} && ptr == in.data() + i + 3) {
                out += static_cast<char>(val);
                i += 2;
                continue;
            }
        }
        out += in[i];
    }
    return out;
}

std::vector<std::string_view> split_view(std::string_view s, char delim) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (start <= s.size()) {
        const size_t end = s.find(delim, start);
        if (end == std::string_view::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, end - start));
        start = end + 1;
    }
    return parts;
}

// Applies one keyword to Parts; shared by URI query params and keyword/value form
void apply_keyword(DsnRedactor::Parts& parts, std::string_view key, const std::string& value) {
    if (key == "host" || key == "hostaddr") {
        for (const auto h : split_view(value, ',')) {
            if (!h.empty()) parts.hosts.emplace_back(h);
        }
    } else if (key == "port") {
        for (const auto p : split_view(value, ',')) {
            if (!p.empty()) parts.ports.emplace_back(p);
        }
    } else if (key == "user") {
        parts.user = value;
    } else if (key == "password") {
        parts.password = value;
    } else if (key == "dbname") {
        parts.dbname = value;
    }
}

std::optional<DsnRedactor::Parts> parse_uri(std::string_view dsn) {
    const size_t scheme_end = dsn.find("://");
    if (scheme_end == std::string_view::npos) return std::nullopt;

    DsnRedactor::Parts parts;
    parts.uri_form = true;
    parts.scheme = utils::to_lower(dsn.substr(0, scheme_end));
    if (!is_uri_scheme(parts.scheme)) return std::nullopt;

    std::string_view rest = dsn.substr(scheme_end + 3);

    std::string_view query;
    if (const size_t q = rest.find('?'); q != std::string_view::npos) {
        query = rest.substr(q + 1);
        rest = rest.substr(0, q);
    }

    std::string_view authority = rest;
    if (const size_t slash = rest.find('/'); slash != std::string_view::npos) {
        authority = rest.substr(0, slash);
        parts.dbname = percent_decode(rest.substr(slash + 1));
    }

    if (const size_t at = authority.rfind('@'); at != std::string_view::npos) {
        const std::string_view userinfo = authority.substr(0, at);
        authority = authority.substr(at + 1);
        const size_t colon = userinfo.find(':');
        parts.user = percent_decode(userinfo.substr(0, colon));
        if (colon != std::string_view::npos) {
            parts.password = percent_decode(userinfo.substr(colon + 1));
        }
    }

    for (const auto hostport : split_view(authority, ',')) {
        if (hostport.empty()) continue;
        std::string_view host = hostport;
        std::string_view port;
        if (hostport.front() == '[') {
            const size_t close = hostport.find(']');
            if (close == std::string_view::npos) return std::nullopt;
            host = hostport.substr(1, close - 1);
            if (close + 1 < hostport.size() && hostport[close + 1] == ':') {
                port = hostport.substr(close + 2);
            }
        } else if (const size_t colon = hostport.rfind(':'); colon != std::string_view::npos) {
            host = hostport.substr(0, colon);
            port = hostport.substr(colon + 1);
        }
        if (!host.empty()) parts.hosts.push_back(percent_decode(host));
        if (!port.empty()) parts.ports.emplace_back(port);
    }

    for (const auto param : split_view(query, '&')) {
        const size_t eq = param.find('=');
        if (eq == std::string_view::npos) continue;
        apply_keyword(parts, param.substr(0, eq), percent_decode(param.substr(eq + 1)));
    }

    return parts;
}

std::optional<DsnRedactor::Parts> parse_keyword_value(std::string_view dsn) {
    DsnRedactor::Parts parts;
    size_t i = 0;
    size_t pairs = 0;

    const auto skip_ws = [&] {
        while (i < dsn.size() && std::isspace(static_cast<unsigned char>(dsn[i]))) ++i;
    };

    while (true) {
        skip_ws();
        if (i >= dsn.size()) break;

        const size_t key_start = i;
        while (i < dsn.size() && dsn[i] != '=' &&
               !std::isspace(static_cast<unsigned char>(dsn[i]))) {
            ++i;
        }
        const std::string_view key = dsn.substr(key_start, i - key_start);
        skip_ws();
        if (key.empty() || i >= dsn.size() || dsn[i] != '=') return std::nullopt;
        ++i;
        skip_ws();

        std::string value;
        if (i < dsn.size() && dsn[i] == '\'') {
            ++i;
            bool closed = false;
            while (i < dsn.size()) {
                if (dsn[i] == '\\' && i + 1 < dsn.size()) {
                    value += dsn[i + 1];
                    i += 2;
                } else if (dsn[i] == '\'') {
                    ++i;
                    closed = true;
                    break;
                } else {
                    value += dsn[i++];
                }
            }
            if (!closed) return std::nullopt;
        } else {
            while (i < dsn.size() && !std::isspace(static_cast<unsigned char>(dsn[i]))) {
                if (dsn[i] == '\\' && i + 1 < dsn.size()) {
                    value += dsn[i + 1];
                    i += 2;
                } else {
                    value += dsn[i++];
                }
            }
        }

        apply_keyword(parts, key, value);
        ++pairs;
    }

    if (pairs == 0) return std::nullopt;
    return parts;
}

void replace_all(std::string& text, std::string_view token, std::string_view replacement,
                 bool whole_word) {
    if (token.empty()) return;
    size_t pos = 0;
    while ((pos = text.find(token, pos)) != std::string::npos) {
        const size_t after = pos + token.size();
        if (whole_word &&
            ((pos > 0 && utils::is_word_char(text[pos - 1])) ||
             (after < text.size() && utils::is_word_char(text[after])))) {
            pos = after;
            continue;
        }
        text.replace(pos, token.size(), replacement);
        pos += replacement.size();
    }
}

} // anonymous namespace

std::optional<DsnRedactor::Parts> DsnRedactor::parse(std::string_view dsn) {
    if (dsn.find("://") != std::string_view::npos) {
        return parse_uri(dsn);
    }
    return parse_keyword_value(dsn);
}

std::string DsnRedactor::mask_host(std::string_view host) {
    if (host.empty()) return "";
    const size_t dot = host.find('.');
    if (dot == std::string_view::npos || dot == 0) {
        return std::string(kMask);
    }
    return std::format("{}.{}", host.substr(0, dot), kMask);
}

std::string DsnRedactor::redact(std::string_view dsn) {
    if (utils::trim(dsn).empty()) {
        return std::string(kInvalid);
    }

    const auto parsed = parse(dsn);
    if (!parsed) {
        return std::string(kMaskedFallback);
    }
    const Parts& parts = *parsed;

    std::vector<std::string> masked_hosts;
    masked_hosts.reserve(parts.hosts.size());
    for (const auto& h : parts.hosts) {
        masked_hosts.push_back(mask_host(h));
    }

    if (parts.uri_form) {
        std::string out = parts.scheme + "://";
        for (size_t i = 0; i < masked_hosts.size(); ++i) {
            if (i > 0) out += ',';
            out += masked_hosts[i];
            if (i < parts.ports.size()) {
                out += ':';
                out += parts.ports[i];
            }
        }
        if (!parts.dbname.empty()) {
            out += '/';
            out += parts.dbname;
        }
        return out;
    }

    std::string out;
    const auto append = [&out](std::string_view key, const std::string& value) {
        if (value.empty()) return;
        if (!out.empty()) out += ' ';
        out += std::format("{}={}", key, value);
    };

    std::string hosts;
    for (size_t i = 0; i < masked_hosts.size(); ++i) {
        if (i > 0) hosts += ',';
        hosts += masked_hosts[i];
    }
    std::string ports;
    for (size_t i = 0; i < parts.ports.size(); ++i) {
        if (i > 0) ports += ',';
        ports += parts.ports[i];
    }
    append("host", hosts);
    append("port", ports);
    append("dbname", parts.dbname);
    return out.empty() ? std::string(kMaskedFallback) : out;
}

std::string DsnRedactor::scrub(std::string_view message, std::string_view dsn) {
    std::string out(message);

    if (!dsn.empty()) {
        replace_all(out, dsn, redact(dsn), false);

        if (const auto parts = parse(dsn)) {
            replace_all(out, parts->password, kMask, false);

            // Longest hosts first so a short host never splits a longer one
            std::vector<std::string> hosts = parts->hosts;
            std::sort(hosts.begin(), hosts.end(),
                      [](const auto& a, const auto& b) { return a.size() > b.size(); });
            for (const auto& h : hosts) {
                replace_all(out, h, mask_host(h), false);
            }

            replace_all(out, parts->user, kMask, true);
        }
    }

    // Full eight-group form, or compressed with "::". Times (12:30:45) and
    // casts (created_at::date) are left alone.
    static const std::regex kIpv6(
        R"((^|[^\w:.])((?:[0-9a-f]{1,4}:){7}[0-9a-f]{1,4}|(?:[0-9a-f]{1,4}:){0,6}[0-9a-f]{0,4}::(?:[0-9a-f]{1,4}:){0,6}[0-9a-f]{0,4})(?![\w:.]))",
        std::regex::ECMAScript | std::regex::icase);
    out = std::regex_replace(out, kIpv6, "$1***:***");

    static const std::regex kIpv4(R"(\b\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3}\b)");
    out = std::regex_replace(out, kIpv4, "***.***.***.***");
    return out;
}

} // namespace nlsql
