#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <regex>
#include <vector>

#include "./captcha.hpp"

static std::optional<std::string> attribute_value(const std::string &tag, const std::string &name) {
    const std::regex attribute_regex("\\b" + name + "\\s*=\\s*(\"([^\"]*)\"|'([^']*)'|([^\\s>]+))", std::regex::icase);
    std::smatch match;
    if (!std::regex_search(tag, match, attribute_regex)) {
        return std::nullopt;
    }
    for (size_t i = 2; i <= 4; i++) {
        if (match[i].matched) {
            return match[i].str();
        }
    }
    return std::string();
}

std::map<std::string, std::string> extract_hidden_fields(const std::string &html) {
    std::map<std::string, std::string> ret;
    const std::regex input_regex("<input\\b[^>]*>", std::regex::icase);
    for (auto it = std::sregex_iterator(html.begin(), html.end(), input_regex); it != std::sregex_iterator(); ++it) {
        const auto tag = it->str();
        const auto type = attribute_value(tag, "type");
        if (!type.has_value()) {
            continue;
        }
        auto lower_type = type.value();
        std::transform(lower_type.begin(), lower_type.end(), lower_type.begin(), ::tolower);
        if (lower_type != "hidden") {
            continue;
        }
        const auto name = attribute_value(tag, "name");
        if (!name.has_value() || name.value().empty()) {
            continue;
        }
        ret[name.value()] = decode_html_entities(attribute_value(tag, "value").value_or(""));
    }
    return ret;
}

std::string decode_html_entities(const std::string &text) {
    static const std::map<std::string, std::string> named = {
        {"amp", "&"},
        {"lt", "<"},
        {"gt", ">"},
        {"quot", "\""},
        {"apos", "'"},
        {"nbsp", " "}
    };
    std::string ret;
    size_t pos = 0;
    while (pos < text.size()) {
        const auto amp = text.find('&', pos);
        if (amp == std::string::npos) {
            ret += text.substr(pos);
            break;
        }
        ret += text.substr(pos, amp - pos);
        const auto semicolon = text.find(';', amp);
        if (semicolon == std::string::npos || semicolon - amp > 10) {
            ret += '&';
            pos = amp + 1;
            continue;
        }
        const auto entity = text.substr(amp + 1, semicolon - amp - 1);
        if (entity.size() > 1 && entity[0] == '#') {
            try {
                const bool hex = entity[1] == 'x' || entity[1] == 'X';
                const auto code = std::stoul(entity.substr(hex ? 2 : 1), nullptr, hex ? 16 : 10);
                // glyphs are ASCII digits and letters
                if (code < 128) {
                    ret += static_cast<char>(code);
                    pos = semicolon + 1;
                    continue;
                }
            } catch (const std::logic_error &) {
                // not a number, keep the text as is
            }
        } else {
            const auto it = named.find(entity);
            if (it != named.end()) {
                ret += it->second;
                pos = semicolon + 1;
                continue;
            }
        }
        ret += '&';
        pos = amp + 1;
    }
    return ret;
}

struct captcha_glyph_t {
    long offset;
    std::string text;
};

static std::string trim_spaces(const std::string &s) {
    const auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

std::optional<std::string> solve_positional_captcha(const std::string &area_html, const std::string &transform) {
    const std::regex glyph_regex("<span[^>]*padding-left\\s*:\\s*(\\d+)px[^>]*>([^<]*)</span>", std::regex::icase);
    std::vector<captcha_glyph_t> glyphs;
    for (auto it = std::sregex_iterator(area_html.begin(), area_html.end(), glyph_regex); it != std::sregex_iterator(); ++it) {
        const auto text = trim_spaces(decode_html_entities((*it)[2].str()));
        if (text.empty()) {
            continue;
        }
        // offsets that do not fit a long are not real layout values
        errno = 0;
        const auto offset = std::strtol((*it)[1].str().c_str(), nullptr, 10);
        if (errno == ERANGE) {
            continue;
        }
        glyphs.push_back(captcha_glyph_t { offset, text });
    }
    if (glyphs.empty()) {
        return std::nullopt;
    }
    std::stable_sort(glyphs.begin(), glyphs.end(), [](const captcha_glyph_t &a, const captcha_glyph_t &b) {
        return a.offset < b.offset;
    });
    std::string code;
    for (const auto &g : glyphs) {
        code += g.text;
    }
    if (transform == "reverse") {
        std::reverse(code.begin(), code.end());
    } else if (transform == "move_3rd_to_front" && code.size() >= 3) {
        code = code.substr(2, 1) + code.substr(0, 2) + code.substr(3);
    }
    return code;
}
