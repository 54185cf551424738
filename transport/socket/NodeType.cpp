#include "NodeType.hpp"

#include <algorithm>
#include <cctype>

namespace transport {

bool node_type_has_receive_timeout(NodeType type) noexcept {
    switch (type) {
        case NodeType::Requester:
        case NodeType::ServiceQueueReader:
            return true;
        case NodeType::Responder:
        case NodeType::Publisher:
        case NodeType::Subscriber:
        case NodeType::ServiceQueue:
        case NodeType::ServiceQueueWriter:
        default:
            return false;
    }
}

std::string to_string(NodeType type) {
    switch (type) {
        case NodeType::Requester:          return "requester";
        case NodeType::Responder:          return "responder";
        case NodeType::Publisher:          return "publisher";
        case NodeType::Subscriber:         return "subscriber";
        case NodeType::ServiceQueue:       return "service-queue";
        case NodeType::ServiceQueueReader: return "service-queue-reader";
        case NodeType::ServiceQueueWriter: return "service-queue-writer";
        default:                           return "unknown";
    }
}

std::optional<NodeType> parse_node_type(const std::string& text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) lower.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    std::replace(lower.begin(), lower.end(), '_', '-');

    for (auto type : {NodeType::Requester, NodeType::Responder, NodeType::Publisher,
                      NodeType::Subscriber, NodeType::ServiceQueue, NodeType::ServiceQueueReader,
                      NodeType::ServiceQueueWriter}) {
        if (to_string(type) == lower) return type;
    }
    return std::nullopt;
}

} // namespace transport
