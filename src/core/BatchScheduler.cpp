#include "BatchScheduler.h"
#include "../utils/Logger.h"

#include <algorithm>
#include <atomic>
#include <system_error>
#include <thread>

namespace Webpify
{
    BatchScheduler::BatchScheduler(unsigned int width)
        : m_width(width == 0 ? defaultWidth() : width)
    {
    }

    unsigned int BatchScheduler::defaultWidth()
    {
        return std::max(1u, std::thread::hardware_concurrency());
    }

    TaskOutcome BatchScheduler::runGuarded(const Job& job, const ConversionTask& task)
    {
        try {
            return job(task);
        } catch (const std::exception& e) {
            return Error{task.sourcePath, e.what()};
        } catch (...) {
            return Error{task.sourcePath, "unknown exception"};
        }
    }

    std::vector<TaskOutcome> BatchScheduler::run(const std::vector<ConversionTask>& tasks, const Job& job) const
    {
        std::vector<TaskOutcome> outcomes(tasks.size());
        if (tasks.empty()) return outcomes;

        // Each index is claimed by exactly one thread, so every slot has a single writer
        std::atomic<std::size_t> next{0};
        std::atomic<std::size_t> finished{0};
        const std::size_t total = tasks.size();

        auto worker = [&]() {
            for (std::size_t i = next.fetch_add(1); i < total; i = next.fetch_add(1)) {
                outcomes[i] = runGuarded(job, tasks[i]);
                std::size_t done = finished.fetch_add(1) + 1;
                if (Logger::isVerbose()) {
                    Logger::debug("[" + std::to_string(done) + "/" + std::to_string(total) + "] " +
                                  tasks[i].sourcePath.string());
                }
            }
        };

        // The calling thread is one of the workers
        std::size_t helpers = std::min<std::size_t>(m_width, total) - 1;
        std::vector<std::thread> pool;
        pool.reserve(helpers);
        for (std::size_t i = 0; i < helpers; ++i) {
            try {
                pool.emplace_back(worker);
            } catch (const std::system_error& e) {
                Logger::warn("Could only start " + std::to_string(pool.size() + 1) +
                             " worker threads: " + e.what());
                break;
            }
        }

        worker();

        for (auto& thread : pool) {
            if (thread.joinable()) {
                thread.join();
            }
        }
        return outcomes;
    }

} // namespace Webpify
