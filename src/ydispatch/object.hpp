#pragma once

#include "result.hpp"
#include <string>
#include <atomic>
#include <random>
#include <sstream>

namespace ydispatch {

// Base class for long-lived ydispatch objects (dispatchers, loops)
class Object {
public:
    Object() : uid_(generate_uid()) {}
    virtual ~Object() = default;

    // Unique identifier, used in log lines
    const std::string& uid() const { return uid_; }

    virtual const char* type_name() const { return "Object"; }

    // Second construction step, run by the create() factories
    virtual Result<void> init() { return Ok(); }

protected:
    std::string uid_;

private:
    // Sequence number plus a random suffix, e.g. "17-k3x9q"
    static std::string generate_uid() {
        static std::atomic<uint64_t> counter{0};
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_int_distribution<> dis(0, 35);

        std::ostringstream oss;
        oss << counter.fetch_add(1, std::memory_order_relaxed) << "-";
        for (int i = 0; i < 5; ++i) {
            int v = dis(gen);
            oss << static_cast<char>(v < 10 ? '0' + v : 'a' + v - 10);
        }
        return oss.str();
    }
};

} // namespace ydispatch
