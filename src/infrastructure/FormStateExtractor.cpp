/**
 * @file FormStateExtractor.cpp
 * @brief Implementation of FormStateExtractor on top of the gumbo HTML5 parser.
 */

#include "infrastructure/FormStateExtractor.hpp"
#include <algorithm>
#include <cctype>
#include <vector>
#include <gumbo.h>

namespace tariffharvest::infrastructure {

namespace {

std::string ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

const char* Attribute(const GumboNode* node, const char* name) {
    const GumboAttribute* attr = gumbo_get_attribute(&node->v.element.attributes, name);
    return attr ? attr->value : nullptr;
}

bool IsTag(const GumboNode* node, GumboTag tag) {
    return node && node->type == GUMBO_NODE_ELEMENT && node->v.element.tag == tag;
}

void TextFromNode(const GumboNode* node, std::string& out) {
    if (!node) return;
    if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_WHITESPACE || node->type == GUMBO_NODE_CDATA) {
        out += node->v.text.text;
        return;
    }
    if (node->type != GUMBO_NODE_ELEMENT) return;
    const GumboVector* children = &node->v.element.children;
    for (unsigned i = 0; i < children->length; ++i) {
        TextFromNode(static_cast<const GumboNode*>(children->data[i]), out);
    }
}

void CollectOptions(const GumboNode* node, std::vector<const GumboNode*>& options) {
    if (!node || node->type != GUMBO_NODE_ELEMENT) return;
    if (IsTag(node, GUMBO_TAG_OPTION)) {
        options.push_back(node);
        return;
    }
    const GumboVector* children = &node->v.element.children;
    for (unsigned i = 0; i < children->length; ++i) {
        CollectOptions(static_cast<const GumboNode*>(children->data[i]), options);
    }
}

std::string OptionValue(const GumboNode* option) {
    if (const char* value = Attribute(option, "value")) return value;
    std::string text;
    TextFromNode(option, text);
    size_t start = text.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = text.find_last_not_of(" \t\r\n");
    return text.substr(start, end - start + 1);
}

bool IsButtonLike(const std::string& type) {
    return type == "submit" || type == "button" || type == "image" || type == "reset" || type == "file";
}

void ReadInput(const GumboNode* node, const std::string& name, domain::FormFields& fields) {
    const char* rawType = Attribute(node, "type");
    std::string type = rawType ? ToLower(rawType) : "text";
    if (IsButtonLike(type)) return;

    const char* rawValue = Attribute(node, "value");
    if (type == "checkbox" || type == "radio") {
        // Only checked controls take part in a browser submission; "on" is the HTML default value.
        if (!Attribute(node, "checked")) return;
        fields[name] = rawValue ? rawValue : "on";
        return;
    }
    fields.emplace(name, rawValue ? rawValue : "");
}

void ReadSelect(const GumboNode* node, const std::string& name, domain::FormFields& fields) {
    std::vector<const GumboNode*> options;
    CollectOptions(node, options);
    if (options.empty()) {
        fields.emplace(name, "");
        return;
    }
    const GumboNode* chosen = options.front();
    for (const GumboNode* option : options) {
        if (Attribute(option, "selected")) {
            chosen = option;
            break;
        }
    }
    fields.emplace(name, OptionValue(chosen));
}

void Walk(const GumboNode* node, domain::FormFields& fields) {
    if (!node || node->type != GUMBO_NODE_ELEMENT) return;

    GumboTag tag = node->v.element.tag;
    if (tag == GUMBO_TAG_INPUT || tag == GUMBO_TAG_SELECT || tag == GUMBO_TAG_TEXTAREA) {
        const char* rawName = Attribute(node, "name");
        if (rawName && *rawName) {
            std::string name = rawName;
            if (tag == GUMBO_TAG_INPUT) {
                ReadInput(node, name, fields);
            } else if (tag == GUMBO_TAG_SELECT) {
                ReadSelect(node, name, fields);
            } else {
                std::string text;
                TextFromNode(node, text);
                fields.emplace(name, text);
            }
        }
        return;
    }

    const GumboVector* children = &node->v.element.children;
    for (unsigned i = 0; i < children->length; ++i) {
        Walk(static_cast<const GumboNode*>(children->data[i]), fields);
    }
}

} // namespace

domain::FormFields FormStateExtractor::Extract(const std::string& html) {
    domain::FormFields fields;
    GumboOutput* output = gumbo_parse_with_options(&kGumboDefaultOptions, html.c_str(), html.size());
    if (!output) return fields;
    Walk(output->root, fields);
    gumbo_destroy_output(&kGumboDefaultOptions, output);
    return fields;
}

} // namespace tariffharvest::infrastructure
