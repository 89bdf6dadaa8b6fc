#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>

#include "application/AsyncTaskManager.hpp"

using namespace lextable::application;

int main() {
    std::cout << "[Test] Starting AsyncTaskManager Test..." << std::endl;

    AsyncTaskManager tasks;

    auto first = tasks.SubmitTask("job-1", "first", [](const std::shared_ptr<TaskStatus>&) {});
    first->wait();
    assert(!first->failed);
    assert(tasks.FindTask("job-1") == first);

    auto failing = tasks.SubmitTask("job-2", "failing", [](const std::shared_ptr<TaskStatus>&) {
        throw std::runtime_error("template missing");
    });
    assert(failing->waitFor(std::chrono::seconds(5)));
    assert(failing->failed);
    assert(failing->errorMessage == "template missing");
    assert(tasks.FindTask("job-1") == nullptr && "Finished tasks are forgotten on the next submission.");
    std::cout << "[PASS] Failures are recorded and finished keys are dropped." << std::endl;

    for (int i = 0; i < 50; ++i) {
        auto task = tasks.SubmitTask("job-" + std::to_string(100 + i), "burst",
                                     [](const std::shared_ptr<TaskStatus>&) {});
        task->wait();
    }
    assert(tasks.KnownKeyCount() <= 1 && "Keys do not accumulate across many finished jobs.");
    std::cout << "[PASS] Key index stays bounded." << std::endl;

    bool release = false;
    std::mutex gate;
    auto slow = tasks.SubmitTask("job-slow", "slow", [&](const std::shared_ptr<TaskStatus>&) {
        while (true) {
            {
                std::lock_guard<std::mutex> lock(gate);
                if (release) return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    });
    tasks.SubmitTask("job-quick", "quick", [](const std::shared_ptr<TaskStatus>&) {})->wait();
    tasks.SubmitTask("job-next", "next", [](const std::shared_ptr<TaskStatus>&) {})->wait();
    assert(tasks.FindTask("job-slow") == slow && "Running tasks stay resolvable.");
    {
        std::lock_guard<std::mutex> lock(gate);
        release = true;
    }
    tasks.JoinAll();
    assert(slow->isFinished());
    assert(tasks.PendingCount() == 0);
    std::cout << "[PASS] Running tasks are kept until they finish." << std::endl;

    std::cout << "[Test] Completed." << std::endl;
    return 0;
}
