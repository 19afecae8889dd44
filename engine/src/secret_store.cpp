#include "secret_store.hpp"
#include "digest.hpp"
#include "entropy.hpp"
#include "hybrid_error.hpp"
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

// ── FileSecretStore ───────────────────────────────────────────────────────────

FileSecretStore::FileSecretStore(std::string dir) : dir_(std::move(dir)) {}

void FileSecretStore::validate_name(const std::string& name) {
    if (name.empty() || name == "." || name == "..")
        throw HybridError(ErrorKind::CachePath, "invalid cache entry name '" + name + "'");

    fs::path p(name);
    if (p.is_absolute() || p.has_root_path())
        throw HybridError(ErrorKind::CachePath, "absolute cache entry name '" + name + "'");

    size_t segments = static_cast<size_t>(std::distance(p.begin(), p.end()));
    if (segments != 1)
        throw HybridError(ErrorKind::CachePath, segments, 1,
                          "multi-segment cache entry name '" + name + "'");
}

std::string FileSecretStore::path_for(const std::string& name) const {
    validate_name(name);
    return (fs::path(dir_) / name).string();
}

std::optional<std::vector<uint8_t>> FileSecretStore::read(const std::string& name) {
    std::string path = path_for(name);

    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec)
            throw HybridError(ErrorKind::CacheRead, "cannot stat " + path + ": " + ec.message());
        return std::nullopt;
    }

    std::ifstream f(path, std::ios::binary);
    if (!f)
        throw HybridError(ErrorKind::CacheRead, "cannot open " + path);
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)),
                               std::istreambuf_iterator<char>());
    if (!f && !f.eof())
        throw HybridError(ErrorKind::CacheRead, "read error on " + path);
    return bytes;
}

void FileSecretStore::write(const std::string& name, const std::vector<uint8_t>& data) {
    std::string path = path_for(name);

    std::error_code ec;
    if (!fs::exists(dir_, ec)) {
        fs::create_directories(dir_, ec);
        if (ec)
            throw HybridError(ErrorKind::CacheWrite, "cannot create " + dir_ + ": " + ec.message());
        fs::permissions(dir_, fs::perms::owner_all, fs::perm_options::replace, ec);
        if (ec)
            throw HybridError(ErrorKind::CacheWrite, "cannot restrict " + dir_ + ": " + ec.message());
    }

    // Written beside the target and renamed over it, so a reader sees either
    // the old entry or the complete new one.
    uint8_t suffix[4];
    secure_random_bytes(suffix, sizeof(suffix));
    std::string tmp = path + ".tmp-" + hex_encode(suffix, sizeof(suffix));

    auto discard = [&]() {
        std::error_code rm_ec;
        fs::remove(tmp, rm_ec);
    };

    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f)
            throw HybridError(ErrorKind::CacheWrite, "cannot open " + tmp);

        fs::permissions(tmp, fs::perms::owner_read | fs::perms::owner_write,
                        fs::perm_options::replace, ec);
        if (ec) {
            discard();
            throw HybridError(ErrorKind::CacheWrite, "cannot restrict " + tmp + ": " + ec.message());
        }

        f.write(reinterpret_cast<const char*>(data.data()),
                static_cast<std::streamsize>(data.size()));
        f.close();
        if (!f) {
            discard();
            throw HybridError(ErrorKind::CacheWrite, "write error on " + tmp);
        }
    }

    fs::rename(tmp, path, ec);
    if (ec) {
        discard();
        throw HybridError(ErrorKind::CacheWrite, "cannot replace " + path + ": " + ec.message());
    }
}

bool FileSecretStore::erase(const std::string& name) {
    std::string path = path_for(name);
    std::error_code ec;
    bool removed = fs::remove(path, ec);
    if (ec)
        throw HybridError(ErrorKind::CacheWrite, "cannot remove " + path + ": " + ec.message());
    return removed;
}

// ── MemorySecretStore ─────────────────────────────────────────────────────────

std::optional<std::vector<uint8_t>> MemorySecretStore::read(const std::string& name) {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = entries_.find(name);
    if (it == entries_.end())
        return std::nullopt;
    return it->second;
}

void MemorySecretStore::write(const std::string& name, const std::vector<uint8_t>& data) {
    std::lock_guard<std::mutex> lock(mu_);
    entries_[name] = data;
}

bool MemorySecretStore::erase(const std::string& name) {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.erase(name) > 0;
}

size_t MemorySecretStore::size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return entries_.size();
}
