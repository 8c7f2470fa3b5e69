/**
 * @file FormStateExtractor.hpp
 * @brief Scrapes the postback/view-state payload of an ASP.NET style form out of raw HTML.
 */

#pragma once
#include <string>
#include "domain/ExportForm.hpp"

namespace tariffharvest::infrastructure {

/**
 * @class FormStateExtractor
 * @brief Side-effect-free HTML -> field map extraction.
 *
 * Collects the named `input`, `select` and `textarea` controls a browser
 * would submit. Inputs without a value attribute map to "". Checkboxes and
 * radios count only when checked; submit, button, image, reset and file
 * inputs are left out. Unnamed controls are omitted; nothing is
 * synthesized. Malformed markup is recovered by the HTML5 parser, so a broken
 * fragment only loses the controls inside it.
 */
class FormStateExtractor {
public:
    static domain::FormFields Extract(const std::string& html);
};

} // namespace tariffharvest::infrastructure
