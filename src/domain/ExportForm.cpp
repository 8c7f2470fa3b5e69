#include "domain/ExportForm.hpp"
#include <set>

namespace tariffharvest::domain {

std::optional<std::string> ExportFormProfile::validate() const {
    if (statusFields.size() != kStatusCategoryCount) {
        return "expected " + std::to_string(kStatusCategoryCount) + " status fields, got " +
               std::to_string(statusFields.size());
    }
    std::set<std::string> governed;
    for (const auto& name : statusFields) {
        if (name.empty()) return "status field name is empty";
        if (!governed.insert(name).second) return "duplicate status field: " + name;
    }
    if (formatField.empty()) return "format field name is empty";
    if (plainTextValue.empty()) return "plain-text format value is empty";
    if (plainTextValue == binaryValue) return "plain-text and binary format values are identical";
    if (eventTargetField.empty() || eventArgumentField.empty()) return "postback field names are empty";
    if (exportAction.empty()) return "export action is empty";

    for (const auto& name : {formatField, eventTargetField, eventArgumentField}) {
        if (!governed.insert(name).second) return "field governed twice: " + name;
    }
    if (!binaryField.empty() && governed.count(binaryField)) {
        return "binary field collides with another governed field: " + binaryField;
    }
    return std::nullopt;
}

FormFields FormOverlay::Apply(const FormFields& scraped, const ExportFormProfile& profile) {
    FormFields payload = scraped;

    for (const auto& name : profile.statusFields) {
        payload[name] = profile.selectedValue;
    }

    payload[profile.formatField] = profile.plainTextValue;
    if (!profile.binaryField.empty()) {
        // An unchecked control is simply not posted.
        payload.erase(profile.binaryField);
    }

    payload[profile.eventTargetField] = profile.exportAction;
    payload[profile.eventArgumentField] = "";
    return payload;
}

} // namespace tariffharvest::domain
