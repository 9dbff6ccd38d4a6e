#include "Transport.hpp"
#include "CoreTypes.hpp"

namespace cosmic_connect {

std::pair<std::shared_ptr<MemoryTransport>, std::shared_ptr<MemoryTransport>>
MemoryTransport::createPair() {
    auto aToB = std::make_shared<Channel>();
    auto bToA = std::make_shared<Channel>();
    return {std::make_shared<MemoryTransport>(ConstructionKey{}, bToA, aToB),
            std::make_shared<MemoryTransport>(ConstructionKey{}, aToB, bToA)};
}

MemoryTransport::MemoryTransport(ConstructionKey, std::shared_ptr<Channel> inbound,
    std::shared_ptr<Channel> outbound)
    : inbound_(std::move(inbound)), outbound_(std::move(outbound)) {}

void MemoryTransport::write(std::string_view data) {
    {
        std::lock_guard<std::mutex> lock(outbound_->mutex);
        if (outbound_->closed) {
            throw ProtocolError(ErrorCode::NetworkError, "Transport is closed");
        }
        outbound_->chunks.emplace_back(data);
    }
    outbound_->cv.notify_all();
}

Transport::ReadResult MemoryTransport::read(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(inbound_->mutex);
    bool ready = inbound_->cv.wait_for(lock, timeout, [this] {
        return !inbound_->chunks.empty() || inbound_->closed;
    });

    ReadResult result;
    if (!inbound_->chunks.empty()) {
        result.status = ReadStatus::Data;
        result.data = std::move(inbound_->chunks.front());
        inbound_->chunks.pop_front();
    } else if (ready) {
        result.status = ReadStatus::Closed;
    } else {
        result.status = ReadStatus::Timeout;
    }
    return result;
}

void MemoryTransport::close() {
    // Closing either end closes both directions
    for (const auto& channel : {inbound_, outbound_}) {
        {
            std::lock_guard<std::mutex> lock(channel->mutex);
            channel->closed = true;
        }
        channel->cv.notify_all();
    }
}

bool MemoryTransport::isOpen() const {
    std::lock_guard<std::mutex> lock(outbound_->mutex);
    return !outbound_->closed;
}

} // namespace cosmic_connect
