#include <cassert>
#include <iostream>
#include <memory>

#include "application/GridNavigator.hpp"
#include "domain/Errors.hpp"
#include "fakes/FakeGridSession.hpp"

using namespace tariffharvest;
using tariffharvest::test::FakeGridSession;

static application::GridNavigator::Timing FastTiming() {
    application::GridNavigator::Timing timing;
    timing.stalePause = std::chrono::milliseconds(0);
    return timing;
}

static std::shared_ptr<infrastructure::Logger> QuietLogger() {
    return std::make_shared<infrastructure::Logger>(infrastructure::LogLevel::Error);
}

static void TestActivationReachesReady() {
    auto session = std::make_shared<FakeGridSession>(std::vector<std::vector<std::string>>{
        {"Export.aspx?tid=1"}});
    application::GridNavigator navigator(session, domain::GridSelectors{}, FastTiming(), QuietLogger());

    assert(navigator.state() == application::NavigatorState::Idle);
    navigator.open("https://example.test/TariffList.aspx");
    navigator.activate();
    assert(session->activated);
    assert(navigator.state() == application::NavigatorState::Ready);
    assert(session->navigated.size() == 1);
}

static void TestMissingActivationControlIsFatal() {
    auto session = std::make_shared<FakeGridSession>(std::vector<std::vector<std::string>>{{}});
    session->hasShowAll = false;
    application::GridNavigator navigator(session, domain::GridSelectors{}, FastTiming(), QuietLogger());

    bool fatal = false;
    try {
        navigator.activate();
    } catch (const domain::FatalError&) {
        fatal = true;
    }
    assert(fatal);
}

static void TestExtractionCollapsesDuplicates() {
    auto session = std::make_shared<FakeGridSession>(std::vector<std::vector<std::string>>{
        {"Export.aspx?tid=11", "Export.aspx?tid=10", "Export.aspx?tid=11", "Export.aspx?other=1"}});
    application::GridNavigator navigator(session, domain::GridSelectors{}, FastTiming(), QuietLogger());
    navigator.activate();

    auto ids = navigator.extractIdentifiers();
    assert((ids == domain::IdentifierSet{10, 11}));
    assert(navigator.state() == application::NavigatorState::Ready);
}

static void TestStaleElementRetriedOnce() {
    auto session = std::make_shared<FakeGridSession>(std::vector<std::vector<std::string>>{
        {"Export.aspx?tid=5", "Export.aspx?tid=6"}});
    application::GridNavigator navigator(session, domain::GridSelectors{}, FastTiming(), QuietLogger());
    navigator.activate();

    session->staleReads = 1;
    assert((navigator.extractIdentifiers() == domain::IdentifierSet{5, 6}));

    session->staleReads = 2;
    bool transient = false;
    try {
        navigator.extractIdentifiers();
    } catch (const domain::StaleElementError&) {
        assert(false && "repeated staleness must surface as a plain transient failure");
    } catch (const domain::TransientError&) {
        transient = true;
    }
    assert(transient);
}

static void TestAdvanceUntilDisabled() {
    auto session = std::make_shared<FakeGridSession>(std::vector<std::vector<std::string>>{
        {"Export.aspx?tid=1"}, {"Export.aspx?tid=2"}});
    application::GridNavigator navigator(session, domain::GridSelectors{}, FastTiming(), QuietLogger());
    navigator.activate();

    assert(navigator.hasNextPage());
    assert(navigator.advance() == application::AdvanceResult::Advanced);
    assert(navigator.state() == application::NavigatorState::Loading);
    navigator.waitForReady();
    assert(navigator.state() == application::NavigatorState::Ready);
    assert((navigator.extractIdentifiers() == domain::IdentifierSet{2}));
    assert(session->scripts.back() == "arguments[0].click();");

    assert(!navigator.hasNextPage());
    assert(navigator.advance() == application::AdvanceResult::NoMorePages);
    assert(session->advanceClicks == 1);
}

static void TestSettleTimeoutDoesNotClickAgain() {
    auto session = std::make_shared<FakeGridSession>(std::vector<std::vector<std::string>>{
        {"Export.aspx?tid=1"}, {"Export.aspx?tid=2"}, {"Export.aspx?tid=3"}});
    session->firstAdvanceBusyPolls = 30;
    application::GridNavigator navigator(session, domain::GridSelectors{}, FastTiming(), QuietLogger());
    navigator.activate();

    assert(navigator.advance() == application::AdvanceResult::Advanced);
    bool timedOut = false;
    try {
        navigator.waitForReady();
    } catch (const domain::NavigationTimeout&) {
        timedOut = true;
    }
    assert(timedOut);
    assert(navigator.state() == application::NavigatorState::Loading);

    navigator.waitForReady();
    assert(navigator.state() == application::NavigatorState::Ready);
    assert(session->advanceClicks == 1);
    assert((navigator.extractIdentifiers() == domain::IdentifierSet{2}));
}

static void TestUnchangedSummaryTimesOut() {
    auto session = std::make_shared<FakeGridSession>(std::vector<std::vector<std::string>>{
        {"Export.aspx?tid=1"}, {"Export.aspx?tid=2"}});
    session->freezeSummary = true;
    application::GridNavigator navigator(session, domain::GridSelectors{}, FastTiming(), QuietLogger());
    navigator.activate();

    bool timedOut = false;
    try {
        navigator.advance();
    } catch (const domain::NavigationTimeout&) {
        timedOut = true;
    }
    assert(timedOut);
    assert(navigator.state() == application::NavigatorState::Ready);
}

static void TestTotalPageEstimate() {
    auto session = std::make_shared<FakeGridSession>(std::vector<std::vector<std::string>>{{}});
    application::GridNavigator navigator(session, domain::GridSelectors{}, FastTiming(), QuietLogger());
    assert(navigator.estimateTotalPages() == application::GridNavigator::kFallbackTotalPages);

    session->pagerNumbers = {1, 2, 10, 3};
    assert(navigator.estimateTotalPages() == 10);
}

int main() {
    std::cout << "[Test] Starting Grid Navigator Test..." << std::endl;
    TestActivationReachesReady();
    TestMissingActivationControlIsFatal();
    TestExtractionCollapsesDuplicates();
    TestStaleElementRetriedOnce();
    TestAdvanceUntilDisabled();
    TestSettleTimeoutDoesNotClickAgain();
    TestUnchangedSummaryTimesOut();
    TestTotalPageEstimate();
    std::cout << "[PASS] Grid Navigator Test." << std::endl;
    return 0;
}
