#pragma once
#include <cstddef>
#include <filesystem>
#include <string>

class StageContext;

// Streaming SHA-256, hex digest in lowercase.
class Sha256 {
public:
    Sha256();
    ~Sha256();
    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void update(const char* data, std::size_t size);
    std::string hex();

private:
    struct evp_md_ctx_st* ctx_{nullptr};
    bool finished_{false};
    std::string digest_;
};

std::string sha256_hex(const std::string& data);

// Hashes a local file. `ctx`, when given, is checked between reads so a
// cancel or stage timeout interrupts hashing of large files.
std::string sha256_file(const std::filesystem::path& p, StageContext* ctx = nullptr);

// Compares digests and throws IntegrityMismatch when they differ.
void verify_digest(const std::string& expected, const std::string& actual);
