#pragma once
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Key-value storage behind the encrypted secret cache. Names are single
// path segments produced by secret_cache::cache_file_name(); values are
// opaque encrypted blobs.
class SecretStore {
public:
    virtual ~SecretStore() = default;

    // std::nullopt if nothing is stored under name. Throws HybridError
    // {CacheRead} when an entry exists but cannot be read.
    virtual std::optional<std::vector<uint8_t>> read(const std::string& name) = 0;

    // Replaces any existing entry. Throws HybridError{CacheWrite}.
    virtual void write(const std::string& name, const std::vector<uint8_t>& data) = 0;

    // Returns true if an entry was removed.
    virtual bool erase(const std::string& name) = 0;
};

// Files directly under one application-private directory. The directory is
// created (mode 0700) on first write; entries are written with mode 0600 to
// a temporary file in the same directory and renamed into place.
// No locking: concurrent writers of one name race and the last rename wins.
class FileSecretStore : public SecretStore {
public:
    explicit FileSecretStore(std::string dir);

    std::optional<std::vector<uint8_t>> read(const std::string& name) override;
    void write(const std::string& name, const std::vector<uint8_t>& data) override;
    bool erase(const std::string& name) override;

    const std::string& dir() const { return dir_; }

    // Throws HybridError{CachePath} unless name is a single relative path
    // segment other than "." and "..". Checked before every file operation.
    static void validate_name(const std::string& name);

private:
    std::string path_for(const std::string& name) const;

    std::string dir_;
};

// In-process store for tests and embedders that manage persistence
// themselves.
class MemorySecretStore : public SecretStore {
public:
    std::optional<std::vector<uint8_t>> read(const std::string& name) override;
    void write(const std::string& name, const std::vector<uint8_t>& data) override;
    bool erase(const std::string& name) override;

    size_t size() const;

private:
    mutable std::mutex mu_;
    std::map<std::string, std::vector<uint8_t>> entries_;
};
