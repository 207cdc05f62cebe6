//
//  FakeWorker.hpp
//  devagentd
//
//  Created on 17.10.26.
//

#ifndef FakeWorker_hpp
#define FakeWorker_hpp

#include "Plugins/PluginOrchestrator.hpp"
#include "Plugins/PluginWorker.hpp"

#include <atomic>
#include <chrono>
#include <iterator>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>

namespace devagentd::test {

/*
 Scripted worker, no child process behind it
 */
class FakeWorker : public PluginWorker{
public:
    std::atomic<int> starts{0};
    std::atomic<int> stops{0};
    std::atomic<int> healthChecks{0};
    std::atomic<bool> healthy{true};
    std::atomic<bool> startSucceeds{true};
    std::atomic<bool> throwOnHealthCheck{false};

    FakeWorker(std::string id, PluginDefinition definition) : PluginWorker(id, definition) {}

    bool start(const PluginContext &ctx) noexcept override{
        rememberContext(ctx);
        starts++;
        if (!startSucceeds) {
            setState(PLUGIN_STATE_ERROR);
            return false;
        }
        setState(PLUGIN_STATE_RUNNING);
        return true;
    }

    void stop() noexcept override{
        stops++;
        setState(PLUGIN_STATE_STOPPED);
    }

    bool checkHealth() override{
        healthChecks++;
        if (throwOnHealthCheck) throw std::runtime_error("probe exploded");
        return healthy;
    }
};

/*
 Hands out FakeWorkers and remembers every one it created
 */
class FakeWorkerFactory{
    std::mutex _lck;
public:
    std::multimap<std::string, std::shared_ptr<FakeWorker>> created;
    std::set<std::string> failingStarts;

    PluginOrchestrator::worker_factory factory(){
        return [this](const std::string &instanceId, const PluginDefinition &definition) -> std::shared_ptr<PluginWorker>{
            auto w = std::make_shared<FakeWorker>(instanceId, definition);
            if (failingStarts.count(definition.id)) w->startSucceeds = false;
            std::unique_lock<std::mutex> ul(_lck);
            created.emplace(instanceId, w);
            return w;
        };
    }

    std::shared_ptr<FakeWorker> last(const std::string &instanceId){
        std::unique_lock<std::mutex> ul(_lck);
        auto range = created.equal_range(instanceId);
        if (range.first == range.second) return nullptr;
        return std::prev(range.second)->second;
    }

    size_t createdCnt(){
        std::unique_lock<std::mutex> ul(_lck);
        return created.size();
    }

    int totalStarts(const std::string &instanceId){
        int ret = 0;
        std::unique_lock<std::mutex> ul(_lck);
        auto range = created.equal_range(instanceId);
        for (auto it = range.first; it != range.second; it++) ret += it->second->starts;
        return ret;
    }
};

/*
 Manually advanced steady clock
 */
class FakeClock{
    std::mutex _lck;
    std::chrono::steady_clock::time_point _now;
public:
    FakeClock() : _now(std::chrono::steady_clock::time_point(std::chrono::hours(1))) {}

    void advance(std::chrono::milliseconds d){
        std::unique_lock<std::mutex> ul(_lck);
        _now += d;
    }

    PluginOrchestrator::clock_source source(){
        return [this]{
            std::unique_lock<std::mutex> ul(_lck);
            return _now;
        };
    }
};

} // namespace devagentd::test

#endif /* FakeWorker_hpp */
