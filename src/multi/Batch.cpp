#include "blat/multi/Batch.hpp"
#include "blat/multi/TransferQueue.hpp"

#include <utility>

namespace blat {

std::vector<std::shared_ptr<CurlExecutor>> Batch::run(long max_connections,
                                                      const std::vector<std::string>& links,
                                                      bool pipeline, const Configure& configure) {
    std::vector<std::shared_ptr<CurlExecutor>> requests;
    requests.reserve(links.size());
    for (const auto& link : links) {
        auto request = std::make_shared<CurlExecutor>();
        RequestSpec spec;
        spec.url = link;
        request->configure(spec);
        requests.push_back(std::move(request));
    }
    return run(max_connections, std::move(requests), pipeline, configure);
}

std::vector<std::shared_ptr<CurlExecutor>> Batch::run(long max_connections,
                                                      std::vector<std::shared_ptr<CurlExecutor>> requests,
                                                      bool pipeline, const Configure& configure) {
    TransferQueue queue(max_connections, pipeline);

    // Pump links in
    for (auto& request : requests) {
        if (configure) {
            configure(*request);
        }
        queue.add(request);
    }

    queue.perform();
    return requests;
}

} // namespace blat
