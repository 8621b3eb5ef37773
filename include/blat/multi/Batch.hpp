#pragma once

#include "blat/http/CurlExecutor.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace blat {

/**
 * One-call download of a list for smallish tasks: everything is added to a
 * TransferQueue up front and the call returns when all transfers finished.
 */
class Batch {
public:
    using Configure = std::function<void(CurlExecutor&)>;

    /**
     * @param configure Runs on every request before it is queued
     * @return Completed requests, in the order of links
     */
    static std::vector<std::shared_ptr<CurlExecutor>> run(long max_connections,
                                                          const std::vector<std::string>& links,
                                                          bool pipeline = true,
                                                          const Configure& configure = {});

    static std::vector<std::shared_ptr<CurlExecutor>> run(long max_connections,
                                                          std::vector<std::shared_ptr<CurlExecutor>> requests,
                                                          bool pipeline = true,
                                                          const Configure& configure = {});
};

} // namespace blat
