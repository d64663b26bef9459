#pragma once

#include <map>
#include <optional>
#include <string>

// name -> value of every <input type="hidden"> element
std::map<std::string, std::string> extract_hidden_fields(const std::string &html);

// &#NN; and the few named entities used in login forms
std::string decode_html_entities(const std::string &text);

// The captcha is a row of glyphs, each placed with an inline
// "padding-left:<N>px" style. Reading order is the ascending offset.
// transform is applied to the result: "reverse" or "move_3rd_to_front".
// Returns nullopt if no glyphs are found.
std::optional<std::string> solve_positional_captcha(const std::string &area_html, const std::string &transform);
