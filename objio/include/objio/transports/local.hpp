#pragma once

#include "objio/transport.hpp"
#include <filesystem>

namespace objio {

// Local filesystem transport
// Objects live at <root>/<container>/<key>
class LocalTransport : public Transport {
public:
    // Throws ObjError(ConfigError) if root doesn't exist
    explicit LocalTransport(std::filesystem::path root);

    std::string name() const override;
    FetchResult fetch_range(const ObjectId& id, uint64_t offset) override;
    ObjectInfo fetch_metadata(const ObjectId& id) override;

    const std::filesystem::path& root() const { return root_; }

private:
    // Rejects keys that would escape root
    std::filesystem::path resolve(const ObjectId& id) const;
    std::filesystem::path resolve_file(const ObjectId& id) const;

    std::filesystem::path root_;
};

} // namespace objio
