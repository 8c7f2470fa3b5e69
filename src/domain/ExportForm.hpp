/**
 * @file ExportForm.hpp
 * @brief Hidden field map of the export form and the overlay that turns it into an export request.
 */

#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tariffharvest::domain {

/** @brief Field name -> value as scraped from one export form response. Never reused across identifiers. */
using FormFields = std::map<std::string, std::string>;

/**
 * @struct ExportFormProfile
 * @brief Names and values of the form controls the export submission governs.
 *
 * The status fields cover the seven tariff status categories, in this order:
 * effective, accepted, suspended, pending, conditionally accepted,
 * conditionally effective, tolled.
 */
struct ExportFormProfile {
    static constexpr size_t kStatusCategoryCount = 7;

    std::vector<std::string> statusFields = {
        "ctl00$MainContent$chkEffective",
        "ctl00$MainContent$chkAccepted",
        "ctl00$MainContent$chkSuspended",
        "ctl00$MainContent$chkPending",
        "ctl00$MainContent$chkConditionallyAccepted",
        "ctl00$MainContent$chkConditionallyEffective",
        "ctl00$MainContent$chkTolled"
    };
    std::string selectedValue = "on";

    std::string formatField = "ctl00$MainContent$rblFormat";
    std::string plainTextValue = "PlainText";
    std::string binaryValue = "Binary";
    std::string binaryField; // Set when the binary variant is a separate control instead of a radio value.

    std::string eventTargetField = "__EVENTTARGET";
    std::string eventArgumentField = "__EVENTARGUMENT";
    std::string exportAction = "ctl00$MainContent$btnExport";

    /** @brief Returns a description of the first problem found, or nullopt when usable. */
    std::optional<std::string> validate() const;
};

/**
 * @class FormOverlay
 * @brief Pure transform from a scraped field map to the export POST payload.
 */
class FormOverlay {
public:
    /**
     * @brief Forces every status field to the selected value, selects the plain-text format,
     *        points the postback at the export action and clears its argument.
     *
     * Every field the profile does not govern is copied through unchanged.
     */
    static FormFields Apply(const FormFields& scraped, const ExportFormProfile& profile);
};

} // namespace tariffharvest::domain
