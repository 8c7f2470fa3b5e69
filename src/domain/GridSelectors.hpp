/**
 * @file GridSelectors.hpp
 * @brief CSS selectors locating the controls of the paginated tariff grid.
 */

#pragma once
#include <string>
#include <vector>

namespace tariffharvest::domain {

/**
 * @struct GridSelectors
 * @brief One selector per control. Where markup varies, an ordered candidate list is tried first to last.
 */
struct GridSelectors {
    std::vector<std::string> showAllSelectors = {
        "#MainContent_btnShowAll",
        "input[type='submit'][value*='Show All']"
    };
    std::string busySelector = ".RadAjax .raDiv";
    std::string exportLinkSelector = "a[href*='tid=']";
    std::vector<std::string> nextSelectors = {
        "a[title='Next']",
        "a[aria-label='Next']",
        "input[type='submit'][value*='Next']",
        ".pagination .next a"
    };
    std::string summarySelector = ".rgInfoPart";
    std::string pagerNumberSelector = ".rgNumPart a";
};

} // namespace tariffharvest::domain
