/**
 * Bulk URL downloader on top of blat::Pool
 *
 * Reads one URL per line (blank lines and lines starting with '#' are
 * skipped), downloads them with a fixed number of worker threads and prints
 * one summary line per finished job.
 *
 * Usage: ./blat_fetch [url_file|-] [pool_size] [log_file]
 *
 * Examples:
 *   ./blat_fetch urls.txt                  # 4 workers, console logging
 *   ./blat_fetch urls.txt 16               # 16 workers
 *   cat urls.txt | ./blat_fetch - 8 a.log  # read stdin, log to a.log
 *
 * Environment (used when the argument is absent):
 *   BLAT_POOL_SIZE      number of workers
 *   BLAT_MAX_BODY_SIZE  cap on captured body bytes per response
 *   BLAT_LOG_FILE       log file (SIGHUP reopens it)
 *
 * SIGINT/SIGTERM interrupt the pool: running transfers abort and the
 * program exits with status 130.
 */

#include "blat/Errors.hpp"
#include "blat/job/Job.hpp"
#include "blat/logger/AsyncLogger.hpp"
#include "blat/logger/ConsoleLogger.hpp"
#include "blat/logger/FileLogger.hpp"
#include "blat/threading/CompletionQueue.hpp"
#include "blat/threading/JobList.hpp"
#include "blat/threading/Pool.hpp"
#include "blat/util/SignalWatcher.hpp"

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <optional>
#include <signal.h>
#include <string>
#include <vector>

using namespace blat;

namespace {

std::string envOr(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? value : fallback;
}

std::vector<std::string> readUrls(std::istream& in) {
    std::vector<std::string> urls;
    std::string line;
    while (std::getline(in, line)) {
        auto begin = line.find_first_not_of(" \t\r");
        if (begin == std::string::npos || line[begin] == '#') {
            continue;
        }
        auto end = line.find_last_not_of(" \t\r");
        urls.push_back(line.substr(begin, end - begin + 1));
    }
    return urls;
}

void printSummary(const Job& job) {
    const Result& result = job.result();
    const ResponseProperties& props = result.response_properties;
    std::cout << (result.ok() ? "OK   " : "FAIL ") << props.code << " "
              << props.effective_uri << " " << result.body.size() << "B "
              << props.round_trip_time << "s";
    if (props.truncated) {
        std::cout << " (truncated)";
    }
    if (!result.ok()) {
        std::cout << " : " << result.error->what();
    }
    std::cout << "\n";
}

} // namespace

int main(int argc, char** argv) {
    try {
        // Before any thread exists, so only the watcher ever sees these
        SignalWatcher::blockSignals({SIGINT, SIGTERM, SIGHUP});

        std::string url_source = argc > 1 ? argv[1] : "-";
        long pool_size = std::stol(argc > 2 ? argv[2] : envOr("BLAT_POOL_SIZE", "4"));
        std::string log_file = argc > 3 ? argv[3] : envOr("BLAT_LOG_FILE", "");
        std::string max_body_env = envOr("BLAT_MAX_BODY_SIZE", "");

        std::unique_ptr<AsyncLogger> async_logger;
        FileLogger* file_logger_ptr = nullptr;
        if (!log_file.empty()) {
            auto file_logger = std::make_unique<FileLogger>(log_file, true);
            if (!file_logger->isOpen()) {
                std::cerr << "Cannot open log file " << log_file << std::endl;
                return 1;
            }
            file_logger_ptr = file_logger.get();
            async_logger = std::make_unique<AsyncLogger>(std::move(file_logger));
        } else {
            async_logger = std::make_unique<AsyncLogger>(std::make_unique<ConsoleLogger>());
        }
        Logger::setGlobalLogger(async_logger.get());

        std::vector<std::string> urls;
        if (url_source == "-") {
            urls = readUrls(std::cin);
        } else {
            std::ifstream in(url_source);
            if (!in) {
                std::cerr << "Cannot read " << url_source << std::endl;
                Logger::setGlobalLogger(nullptr);
                return 1;
            }
            urls = readUrls(in);
        }

        JobConfig job_config;
        if (!max_body_env.empty()) {
            job_config.max_body_size = std::stoul(max_body_env);
        }

        JobList pending;
        for (const auto& url : urls) {
            pending.push(Job::forUrl(url, RequestSpec{}, job_config));
        }

        Logger::getInstance().logMessage("Fetching " + std::to_string(urls.size()) + " URLs with " +
                                         std::to_string(pool_size) + " workers");

        CompletionQueue done;
        Pool pool(pool_size, done.sink());

        SignalWatcher watcher({SIGINT, SIGTERM, SIGHUP}, [&](int signo) {
            if (signo == SIGHUP) {
                if (file_logger_ptr) {
                    file_logger_ptr->reopen();
                }
                return;
            }
            pool.interrupt();
        });

        pool.work(pending.dispatcher());

        std::size_t printed = 0;
        while (printed < urls.size() && !pool.interruptRequested()) {
            if (auto job = done.popFor(std::chrono::milliseconds(200))) {
                printSummary(*job);
                ++printed;
            }
        }

        int status = 0;
        try {
            if (!pool.interruptRequested()) {
                pool.waitUntilIdle();
            }
            pool.close();
        } catch (const InterruptSignal& e) {
            Logger::getInstance().logWarning(std::string("Stopped: ") + e.what());
            status = 130;
        }

        for (const auto& job : done.drain()) {
            printSummary(*job);
            ++printed;
        }
        watcher.stop();

        Logger::getInstance().logMessage("Finished " + std::to_string(printed) + " of " +
                                         std::to_string(urls.size()) + " URLs");
        Logger::setGlobalLogger(nullptr);
        return status;
    } catch (const std::exception& e) {
        Logger::setGlobalLogger(nullptr);
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
