#pragma once

#include "file_record.hpp"
#include <string>
#include <vector>
#include <cstdint>

namespace chunkvault::storage {

// Decides which nodes are recorded as holding a persisted chunk. Moving bytes
// to those nodes is outside the storage engine.
class ReplicaPlacement {
public:
    virtual ~ReplicaPlacement() = default;
    
    virtual std::vector<std::string> place(const std::string& file_id,
                                           const ChunkRecord& chunk,
                                           std::uint32_t replicas) = 0;
};

// Records the local node only, whatever the replica target.
class LocalNodePlacement : public ReplicaPlacement {
public:
    explicit LocalNodePlacement(std::string node_id);
    
    std::vector<std::string> place(const std::string& file_id,
                                   const ChunkRecord& chunk,
                                   std::uint32_t replicas) override;
    
    const std::string& node_id() const { return node_id_; }

private:
    std::string node_id_;
};

}
