#include <cctype>
#include <cstdio>

#include "./http_client.hpp"

static std::string replace(std::string subject, const std::string& search, const std::string& replace) {
    size_t pos = 0;
    while((pos = subject.find(search, pos)) != std::string::npos) {
        subject.replace(pos, search.length(), replace);
        pos += replace.length();
    }
    return subject;
}

static std::string trim(const std::string &s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::string url_encode(const std::string &value) {
    std::string ret;
    ret.reserve(value.size() * 3);
    for (const auto c : value) {
        const auto u = static_cast<unsigned char>(c);
        if (std::isalnum(u) || c == '-' || c == '_' || c == '.' || c == '~') {
            ret += c;
            continue;
        }
        char buf[4];
        snprintf(buf, sizeof(buf), "%%%02X", u);
        ret += buf;
    }
    return ret;
}

std::string encode_form(const std::vector<std::pair<std::string, std::string>> &fields) {
    std::string ret;
    for (const auto &f : fields) {
        if (!ret.empty()) {
            ret += "&";
        }
        ret += url_encode(f.first) + "=" + url_encode(f.second);
    }
    return ret;
}

std::string append_query(const std::string &url, const std::vector<std::pair<std::string, std::string>> &params) {
    if (params.empty()) {
        return url;
    }
    const auto separator = url.find('?') == std::string::npos ? "?" : "&";
    return url + separator + encode_form(params);
}

std::map<std::string, std::string> url_encode_values(const std::map<std::string, std::string> &values) {
    std::map<std::string, std::string> ret;
    for (const auto &v : values) {
        ret[v.first] = url_encode(v.second);
    }
    return ret;
}

std::string expand_template(std::string subject, const std::map<std::string, std::string> &values) {
    for (const auto &v : values) {
        subject = replace(subject, "{" + v.first + "}", v.second);
    }
    return subject;
}

void parse_set_cookie(const std::string &header_line, std::map<std::string, std::string> &jar) {
    const auto colon = header_line.find(':');
    if (colon == std::string::npos) {
        return;
    }
    std::string name = header_line.substr(0, colon);
    for (auto &c : name) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (trim(name) != "set-cookie") {
        return;
    }
    const auto cookie = trim(header_line.substr(colon + 1));
    const auto pair = cookie.substr(0, cookie.find(';'));
    const auto eq = pair.find('=');
    if (eq == std::string::npos) {
        return;
    }
    jar[trim(pair.substr(0, eq))] = trim(pair.substr(eq + 1));
}

std::string cookie_header_value(const std::map<std::string, std::string> &cookies) {
    std::string ret;
    for (const auto &c : cookies) {
        if (!ret.empty()) {
            ret += "; ";
        }
        ret += c.first + "=" + c.second;
    }
    return ret;
}
