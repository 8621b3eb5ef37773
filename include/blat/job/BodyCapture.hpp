#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace blat {

/**
 * Size-aware accumulator for response bodies.
 *
 * Chunks are appended until the limit; the chunk that crosses it is sliced to
 * exactly the remaining allowance and everything after is discarded. Every
 * chunk is reported as fully consumed so the transfer itself runs to
 * completion.
 */
class BodyCapture {
public:
    explicit BodyCapture(std::optional<std::size_t> limit = std::nullopt)
        : limit_(limit) {}

    /**
     * @return chunk.size(), always
     */
    std::size_t append(std::string_view chunk);

    bool limited() const { return limit_.has_value(); }

    /**
     * True once the captured body reached the limit. Always false without a
     * limit.
     */
    bool truncated() const { return limit_.has_value() && seen_ >= *limit_; }

    const std::string& body() const { return body_; }
    std::string take() { return std::move(body_); }

    // Bytes delivered by the transfer, captured or not
    std::size_t bytesSeen() const { return seen_; }

private:
    std::optional<std::size_t> limit_;
    std::string body_;
    std::size_t seen_ = 0;
};

} // namespace blat
