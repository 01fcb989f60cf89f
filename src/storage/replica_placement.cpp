#include "chunkvault/storage/replica_placement.hpp"

namespace chunkvault::storage {

LocalNodePlacement::LocalNodePlacement(std::string node_id)
    : node_id_(std::move(node_id)) {
}

std::vector<std::string> LocalNodePlacement::place(const std::string& /*file_id*/,
                                                   const ChunkRecord& /*chunk*/,
                                                   std::uint32_t replicas) {
    if (replicas == 0 || node_id_.empty()) {
        return {};
    }
    return {node_id_};
}

}
