#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include "application/ExtractorService.hpp"
#include "TestSupport.hpp"

using namespace fileextractor;
using application::EngineState;
using application::ExtractionRun;
using application::ExtractorService;
using domain::RunOutcome;

namespace fs = std::filesystem;

namespace {

domain::TerminalResult ConsumeUntilState(ExtractionRun& run) {
    auto channel = run.channel();
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(60);
    while (std::chrono::steady_clock::now() < deadline) {
        auto message = channel->pop(std::chrono::milliseconds(50));
        if (!message) continue;
        if (const auto* state = std::get_if<domain::StateMessage>(&*message)) {
            return state->result;
        }
    }
    assert(false && "State message never arrived");
    return {};
}

// A tree slow enough to still be running when the test reacts.
domain::ExtractionRequest SlowRequest(const fs::path& base) {
    const fs::path root = base / "slow";
    for (int i = 0; i < 40; ++i) {
        test::WriteFile(root / ("big" + std::to_string(i) + ".txt"), std::string(256 * 1024, 'z'));
    }
    auto request = test::MakeRequest(root, base / "slow_out.txt");
    request.chunkSize = 1;
    return request;
}

void TestCompletedRun(const fs::path& base) {
    const fs::path root = base / "small";
    test::WriteFile(root / "one.txt", "1");
    test::WriteFile(root / "two.txt", "2");

    ExtractorService service;
    assert(!service.isRunning());
    assert(!service.lastResult());

    auto run = service.start(test::MakeRequest(root, base / "small_out.txt"));
    auto state = ConsumeUntilState(*run);
    run->wait();

    assert(!run->isRunning());
    assert(!service.isRunning());
    assert(state.outcome == RunOutcome::Completed);
    assert(state.filesProcessed == 2);
    assert(run->state() == EngineState::Completed);

    auto result = run->result();
    assert(result && result->filesProcessed == 2);
    auto last = service.lastResult();
    assert(last && last->outcome == RunOutcome::Completed);
    std::cout << "[PASS] A run completes on its worker and reports through the channel." << std::endl;

    auto again = service.start(test::MakeRequest(root, base / "small_out.txt"));
    assert(ConsumeUntilState(*again).outcome == RunOutcome::Completed);
    assert(again->waitFor(std::chrono::seconds(10)));
    std::cout << "[PASS] A finished service accepts a new run." << std::endl;
}

void TestSingleActiveRunAndCancel(const fs::path& base) {
    ExtractorService service;
    auto request = SlowRequest(base);
    auto run = service.start(request);
    assert(service.isRunning());

    bool threw = false;
    try {
        service.start(request);
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()) == "Extraction already in progress";
    }
    assert(threw);
    std::cout << "[PASS] A second start while running is rejected." << std::endl;

    service.cancel();
    assert(run->isCancellationRequested());
    auto state = ConsumeUntilState(*run);
    assert(state.outcome == RunOutcome::Cancelled);
    assert(state.filesProcessed < state.totalFiles || state.totalFiles == 0);
    assert(run->waitFor(std::chrono::seconds(30)));
    assert(run->state() == EngineState::Cancelled);
    std::cout << "[PASS] Cancellation reaches the worker and ends the run." << std::endl;
}

void TestDestructorJoins(const fs::path& base) {
    std::shared_ptr<ExtractionRun> run;
    {
        ExtractorService service;
        run = service.start(SlowRequest(base));
    }
    // The service cancelled and joined its active run.
    assert(!run->isRunning());
    auto result = run->result();
    assert(result && result->outcome == RunOutcome::Cancelled);
    std::cout << "[PASS] Destroying the service cancels and joins the active run." << std::endl;
}

} // namespace

int main() {
    std::cout << "[Test] Starting ExtractorService Test..." << std::endl;
    test::ScratchDir scratch("fe_service");
    TestCompletedRun(scratch.path());
    TestSingleActiveRunAndCancel(scratch.path());
    TestDestructorJoins(scratch.path());
    std::cout << "[Test] All ExtractorService tests passed." << std::endl;
    return 0;
}
