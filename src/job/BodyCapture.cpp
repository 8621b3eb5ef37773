#include "blat/job/BodyCapture.hpp"

namespace blat {

std::size_t BodyCapture::append(std::string_view chunk) {
    seen_ += chunk.size();

    if (!limit_) {
        body_.append(chunk.data(), chunk.size());
        return chunk.size();
    }

    if (body_.size() < *limit_) {
        std::size_t allowance = *limit_ - body_.size();
        std::size_t take = chunk.size() < allowance ? chunk.size() : allowance;
        body_.append(chunk.data(), take);
    }

    return chunk.size();
}

} // namespace blat
