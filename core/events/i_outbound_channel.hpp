#pragma once

#include <nlohmann/json.hpp>

namespace agentlink {
namespace events {

// Ordered sink for outbound client messages. send() must not block on slow consumers.
class IOutboundChannel {
public:
    virtual ~IOutboundChannel() = default;

    // Returns false if the message could not be delivered to any consumer
    virtual bool send(const nlohmann::json &message) = 0;
};

}  // namespace events
}  // namespace agentlink
