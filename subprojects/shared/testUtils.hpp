// testUtils.hpp - helpers shared by the unit tests
#pragma once

#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace test_utils {

/** Poll pred every few milliseconds until it holds or timeout expires. */
template <typename Pred>
bool wait_until(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

/** Owns argv storage for option parsing tests. */
class Argv {
public:
    explicit Argv(std::vector<std::string> args) : args_(std::move(args)) {
        for (auto& a : args_) ptrs_.push_back(a.data());
        ptrs_.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(args_.size()); }
    char** argv() { return ptrs_.data(); }

private:
    std::vector<std::string> args_;
    std::vector<char*> ptrs_;
};

} // namespace test_utils
