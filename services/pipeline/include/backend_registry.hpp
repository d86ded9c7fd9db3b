#pragma once
#include "transfer_backend.hpp"
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

struct BackendHealth {
    bool online{false};
    std::optional<DiskUsage> disk_usage;
    std::int64_t checked_at{0};
};

BackendDescriptor backend_from_json(const nlohmann::json& j);
nlohmann::json to_json(const BackendDescriptor& d);  // credentials left out
nlohmann::json to_json(const BackendHealth& h);

// Backend descriptors by id, plus one TransferBackend instance per backend
// created on first use.
class BackendRegistry {
public:
    using Factory = std::function<std::unique_ptr<TransferBackend>(const BackendDescriptor&)>;

    explicit BackendRegistry(Factory factory = make_transfer_backend);

    // Reads a JSON array of descriptors. Throws ValidationError on bad entries.
    void load_file(const std::string& path);
    void load_json(const nlohmann::json& arr);

    void add(const BackendDescriptor& desc);
    // Registers a ready-made backend instance for `desc`.
    void add(const BackendDescriptor& desc, std::unique_ptr<TransferBackend> backend);

    bool contains(const std::string& id) const;
    // Throws NotFound.
    BackendDescriptor resolve(const std::string& id) const;
    TransferBackend& backend(const std::string& id);
    std::vector<std::string> ids() const;

    // Probes the backend and records the result as its online status.
    BackendHealth check_health(const std::string& id);
    void set_online(const std::string& id, bool online);

private:
    struct Entry {
        BackendDescriptor desc;
        std::unique_ptr<TransferBackend> backend;
    };

    Factory factory_;
    mutable std::mutex mtx_;
    std::map<std::string, Entry> entries_;
};
