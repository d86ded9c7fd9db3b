#include "../include/checksum.hpp"
#include "../include/errors.hpp"
#include "../include/progress.hpp"
#include <openssl/evp.h>
#include <fstream>
#include <sstream>
#include <vector>

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
}

Sha256::~Sha256() {
    if (ctx_) EVP_MD_CTX_free(ctx_);
}

void Sha256::update(const char* data, std::size_t size) {
    if (finished_) throw std::logic_error("Sha256::update after hex()");
    if (size == 0) return;
    if (EVP_DigestUpdate(ctx_, data, size) != 1) throw std::runtime_error("EVP_DigestUpdate failed");
}

std::string Sha256::hex() {
    if (finished_) return digest_;
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_, md, &len) != 1) throw std::runtime_error("EVP_DigestFinal_ex failed");
    std::ostringstream oss;
    for (unsigned int i = 0; i < len; ++i) {
        oss << std::hex << std::nouppercase << ((md[i] >> 4) & 0xF) << (md[i] & 0xF);
    }
    digest_ = oss.str();
    finished_ = true;
    return digest_;
}

std::string sha256_hex(const std::string& data) {
    Sha256 h;
    h.update(data.data(), data.size());
    return h.hex();
}

std::string sha256_file(const std::filesystem::path& p, StageContext* ctx) {
    std::ifstream f(p, std::ios::binary);
    if (!f) throw TransientFailure("cannot open " + p.string() + " for hashing");
    Sha256 h;
    std::vector<char> buf(1 << 16);
    while (f) {
        if (ctx) ctx->check();
        f.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        std::streamsize n = f.gcount();
        if (n > 0) h.update(buf.data(), static_cast<std::size_t>(n));
    }
    if (f.bad()) throw TransientFailure("read error while hashing " + p.string());
    return h.hex();
}

void verify_digest(const std::string& expected, const std::string& actual) {
    if (expected.empty() || expected != actual) throw IntegrityMismatch(expected, actual);
}
