#ifndef TREEWRANGLER_BATCH_H
#define TREEWRANGLER_BATCH_H
// File-level parallelism for the summary tools. Every file is an independent
//  unit of work; results come back in the order of `filenames` so that a
//  single writer can emit them.
#include <algorithm>
#include <atomic>
#include <exception>
#include <functional>
#include <string>
#include <thread>
#include <vector>
#include "twr/twr_base_includes.h"

namespace twr {

// Calls fn on every file using up to numJobs threads (numJobs < 2 runs on the
//  calling thread). The first exception thrown by fn (in file order) is
//  rethrown after all workers have finished.
template<typename R>
std::vector<R> map_files_in_parallel(const std::vector<std::string> & filenames,
                                     unsigned numJobs,
                                     const std::function<R (const std::string &)> & fn) {
    std::vector<R> results(filenames.size());
    if (numJobs < 2 || filenames.size() < 2) {
        for (std::size_t i = 0; i < filenames.size(); ++i) {
            results[i] = fn(filenames[i]);
        }
        return results;
    }
    std::vector<std::exception_ptr> errors(filenames.size());
    std::atomic<std::size_t> next{0};
    auto worker = [&]() {
        for (;;) {
            const std::size_t i = next++;
            if (i >= filenames.size()) {
                return;
            }
            try {
                results[i] = fn(filenames[i]);
            } catch (...) {
                errors[i] = std::current_exception();
            }
        }
    };
    const auto nThreads = std::min<std::size_t>(numJobs, filenames.size());
    LOG(DEBUG) << "processing " << filenames.size() << " files on " << nThreads << " threads";
    std::vector<std::thread> pool;
    pool.reserve(nThreads);
    for (std::size_t t = 0; t < nThreads; ++t) {
        pool.emplace_back(worker);
    }
    for (auto & th : pool) {
        th.join();
    }
    for (const auto & e : errors) {
        if (e) {
            std::rethrow_exception(e);
        }
    }
    return results;
}

} // namespace twr
#endif
