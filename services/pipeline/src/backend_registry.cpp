#include "../include/backend_registry.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <fstream>

using json = nlohmann::json;

namespace {

void validate(const BackendDescriptor& d) {
    if (d.id.empty()) throw ValidationError("backend without id");
    if (d.name.empty()) throw ValidationError("backend " + d.id + " has no name");
    if (d.protocol != Protocol::Nfs && d.host.empty()) throw ValidationError("backend " + d.id + " has no host");
    if (d.max_concurrent_transfers < 1)
        throw ValidationError("backend " + d.id + ": max_concurrent_transfers must be at least 1");
    if (d.bandwidth_limit_bps < 0) throw ValidationError("backend " + d.id + ": negative bandwidth limit");
}

}

BackendDescriptor backend_from_json(const json& j) {
    if (!j.is_object()) throw ValidationError("backend entry must be an object");
    BackendDescriptor d;
    try {
        d.id = j.contains("id") && j["id"].is_number() ? std::to_string(j["id"].get<long long>())
                                                       : j.value("id", std::string());
        d.name = j.value("name", d.id);
        std::string proto = j.value("protocol", std::string());
        auto p = protocol_from_string(proto);
        if (!p) throw ValidationError("backend " + d.id + ": unsupported protocol '" + proto + "'");
        d.protocol = *p;
        d.host = j.value("host", std::string());
        d.port = j.value("port", default_port(d.protocol));
        d.username = j.value("username", std::string());
        d.password = j.value("password", std::string());
        d.ssh_key_path = j.value("ssh_key_path", std::string());
        d.base_path = j.value("base_path", std::string());
        d.share = j.value("share", std::string());
        d.mount_root = j.value("mount_root", std::string("/mnt"));
        d.cleanup_after_transfer = j.value("cleanup_after_transfer", true);
        d.max_concurrent_transfers = j.value("max_concurrent_transfers", 3);
        d.connect_timeout_ms = j.value("connect_timeout_ms", 10000L);
        if (j.contains("bandwidth_limit") && !j["bandwidth_limit"].is_null()) {
            const auto& bw = j["bandwidth_limit"];
            d.bandwidth_limit_bps = bw.is_number() ? bw.get<std::int64_t>() : parse_bandwidth(bw.get<std::string>());
        }
        std::string status = j.value("status", std::string("online"));
        d.online = status == "online";
    } catch (const json::exception& e) {
        throw ValidationError(std::string("bad backend entry: ") + e.what());
    }
    validate(d);
    return d;
}

json to_json(const BackendDescriptor& d) {
    return json{{"id", d.id},
                {"name", d.name},
                {"protocol", to_string(d.protocol)},
                {"host", d.host},
                {"port", d.port},
                {"base_path", d.base_path},
                {"max_concurrent_transfers", d.max_concurrent_transfers},
                {"bandwidth_limit_bps", d.bandwidth_limit_bps},
                {"status", d.online ? "online" : "offline"}};
}

json to_json(const BackendHealth& h) {
    json j{{"online", h.online}, {"checked_at", h.checked_at}};
    if (h.disk_usage) {
        j["disk_usage"] = {{"total", h.disk_usage->total},
                           {"used", h.disk_usage->used},
                           {"available", h.disk_usage->available},
                           {"percent", h.disk_usage->percent}};
    } else {
        j["disk_usage"] = nullptr;
    }
    return j;
}

BackendRegistry::BackendRegistry(Factory factory) : factory_(std::move(factory)) {}

void BackendRegistry::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw ValidationError("cannot open backends file " + path);
    json arr = json::parse(in, nullptr, false);
    if (arr.is_discarded()) throw ValidationError("backends file " + path + " is not valid JSON");
    load_json(arr);
    log_info("backends", "loaded " + std::to_string(arr.size()) + " backends from " + path);
}

void BackendRegistry::load_json(const json& arr) {
    if (!arr.is_array()) throw ValidationError("backends must be a JSON array");
    for (const auto& item : arr) add(backend_from_json(item));
}

void BackendRegistry::add(const BackendDescriptor& desc) {
    validate(desc);
    std::lock_guard<std::mutex> lock(mtx_);
    Entry& e = entries_[desc.id];
    e.desc = desc;
    e.backend.reset();
}

void BackendRegistry::add(const BackendDescriptor& desc, std::unique_ptr<TransferBackend> backend) {
    validate(desc);
    std::lock_guard<std::mutex> lock(mtx_);
    Entry& e = entries_[desc.id];
    e.desc = desc;
    e.backend = std::move(backend);
}

bool BackendRegistry::contains(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    return entries_.count(id) != 0;
}

BackendDescriptor BackendRegistry::resolve(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(id);
    if (it == entries_.end()) throw NotFound("unknown backend " + id);
    return it->second.desc;
}

TransferBackend& BackendRegistry::backend(const std::string& id) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(id);
    if (it == entries_.end()) throw NotFound("unknown backend " + id);
    if (!it->second.backend) it->second.backend = factory_(it->second.desc);
    return *it->second.backend;
}

std::vector<std::string> BackendRegistry::ids() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<std::string> out;
    for (const auto& kv : entries_) out.push_back(kv.first);
    return out;
}

BackendHealth BackendRegistry::check_health(const std::string& id) {
    TransferBackend& b = backend(id);
    BackendHealth h;
    h.online = b.test_connection();
    if (h.online) h.disk_usage = b.probe_disk_usage();
    h.checked_at = system_now_ms();
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = entries_.find(id);
        if (it != entries_.end()) it->second.desc.online = h.online;
    }
    log_info("backends", id + (h.online ? " online" : " offline"));
    return h;
}

void BackendRegistry::set_online(const std::string& id, bool online) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = entries_.find(id);
    if (it == entries_.end()) throw NotFound("unknown backend " + id);
    it->second.desc.online = online;
}
