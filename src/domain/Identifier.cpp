#include "domain/Identifier.hpp"
#include <regex>
#include <sstream>
#include <stdexcept>

namespace tariffharvest::domain {

namespace {
const std::regex& TidPattern() {
    static const std::regex pattern(R"(\btid=(\d+))", std::regex::icase | std::regex::optimize);
    return pattern;
}

std::string Trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}
}

std::optional<Identifier> IdentifierParser::FromLinkTarget(const std::string& target) {
    std::smatch match;
    if (!std::regex_search(target, match, TidPattern())) {
        return std::nullopt;
    }
    try {
        Identifier id = std::stoull(match[1].str());
        if (id == 0) return std::nullopt;
        return id;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

IdentifierSet IdentifierParser::FromLinkTargets(const std::vector<std::string>& targets) {
    IdentifierSet ids;
    for (const auto& target : targets) {
        if (auto id = FromLinkTarget(target)) {
            ids.insert(*id);
        }
    }
    return ids;
}

IdentifierSet IdentifierParser::FromList(const std::string& list) {
    IdentifierSet ids;
    std::stringstream ss(list);
    std::string token;
    while (std::getline(ss, token, ',')) {
        token = Trim(token);
        if (token.empty()) continue;
        if (token.find_first_not_of("0123456789") != std::string::npos) {
            throw std::invalid_argument("not a numeric identifier: " + token);
        }
        Identifier id = std::stoull(token);
        if (id == 0) {
            throw std::invalid_argument("identifier must be positive: " + token);
        }
        ids.insert(id);
    }
    return ids;
}

std::string IdentifierParser::ArtifactFilename(Identifier id) {
    return "Tariff_" + std::to_string(id) + ".xml";
}

std::string IdentifierParser::ExpandTemplate(const std::string& urlTemplate, Identifier id) {
    static const std::string kPlaceholder = "{tid}";
    std::string result = urlTemplate;
    const std::string value = std::to_string(id);
    size_t pos = 0;
    while ((pos = result.find(kPlaceholder, pos)) != std::string::npos) {
        result.replace(pos, kPlaceholder.size(), value);
        pos += value.size();
    }
    return result;
}

} // namespace tariffharvest::domain
