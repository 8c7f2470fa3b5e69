#include <cassert>
#include <iostream>
#include <stdexcept>

#include "domain/Identifier.hpp"

using namespace tariffharvest::domain;

static void TestExtractsExactIdSet() {
    std::vector<std::string> targets = {
        "TariffView.aspx?tid=101",
        "javascript:openExport('TariffXMLExport.aspx?tid=100')",
        "TariffXMLExport.aspx?sid=3&tid=101",
        "TariffXMLExport.aspx?tid=102&format=xml",
        "TariffXMLExport.aspx?tid=100"
    };
    IdentifierSet ids = IdentifierParser::FromLinkTargets(targets);
    assert((ids == IdentifierSet{100, 101, 102}));

    std::vector<std::string> reversed(targets.rbegin(), targets.rend());
    assert(IdentifierParser::FromLinkTargets(reversed) == ids);
}

static void TestRejectsNonIdentifiers() {
    assert(!IdentifierParser::FromLinkTarget("TariffList.aspx"));
    assert(!IdentifierParser::FromLinkTarget("Export.aspx?tid="));
    assert(!IdentifierParser::FromLinkTarget("Export.aspx?tid=0"));
    assert(!IdentifierParser::FromLinkTarget("Export.aspx?xtid=55"));
    assert(!IdentifierParser::FromLinkTarget("Export.aspx?tid=99999999999999999999999"));
    assert(IdentifierParser::FromLinkTarget("Export.aspx?TID=7") == Identifier{7});
    assert(IdentifierParser::FromLinkTarget("a.aspx?tid=12&tid=13") == Identifier{12});
}

static void TestNamesAndTemplates() {
    assert(IdentifierParser::ArtifactFilename(205) == "Tariff_205.xml");
    assert(IdentifierParser::ExpandTemplate("https://host/Export.aspx?tid={tid}", 42) ==
           "https://host/Export.aspx?tid=42");
    assert(IdentifierParser::ExpandTemplate("/x/{tid}/y?tid={tid}", 5) == "/x/5/y?tid=5");
}

static void TestParsesCommandLineList() {
    assert((IdentifierParser::FromList("205, 100,100,,7") == IdentifierSet{7, 100, 205}));
    assert(IdentifierParser::FromList("").empty());

    bool threw = false;
    try {
        IdentifierParser::FromList("12,abc");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        IdentifierParser::FromList("0");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

int main() {
    std::cout << "[Test] Starting Identifier Test..." << std::endl;
    TestExtractsExactIdSet();
    TestRejectsNonIdentifiers();
    TestNamesAndTemplates();
    TestParsesCommandLineList();
    std::cout << "[PASS] Identifier Test." << std::endl;
    return 0;
}
