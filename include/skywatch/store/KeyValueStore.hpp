#pragma once
// include/skywatch/store/KeyValueStore.hpp
//
// Key-addressed JSON blobs shared by every instance of a deployment.
//
// Reads are idempotent and side-effect free. A Set() replaces one key's value as a
// single indivisible write; nothing spans keys. No retry/backoff happens here: a failed
// call is reported to the caller as a StoreError.

#include <nlohmann/json.hpp>

#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace skywatch::store {

using json = nlohmann::json;

struct StoreError {
    enum class Code {
        IoReadFail,
        IoWriteFail,
        ParseError,
        TypeError,
    } code{};
    std::string message;
};

[[nodiscard]] const char* StoreErrorCodeName(StoreError::Code c) noexcept;

class KeyValueStore {
public:
    virtual ~KeyValueStore() = default;

    // nullopt when the key has never been written ("not found" is not an error).
    [[nodiscard]] virtual std::expected<std::optional<json>, StoreError> Get(const std::string& key) const = 0;

    [[nodiscard]] virtual std::expected<void, StoreError> Set(const std::string& key, const json& value) = 0;
};

// Process-local store. Several engines constructed over the same instance behave like
// instances sharing a persisted store.
class MemoryKeyValueStore final : public KeyValueStore {
public:
    [[nodiscard]] std::expected<std::optional<json>, StoreError> Get(const std::string& key) const override;
    [[nodiscard]] std::expected<void, StoreError> Set(const std::string& key, const json& value) override;

    [[nodiscard]] std::size_t size() const noexcept { return m_values.size(); }

private:
    std::map<std::string, json> m_values;
};

// One JSON object document on disk, e.g. settings.json:
//   { "lastWeatherData": {...}, "climate": 0, ... }
//
// Every Get() re-reads the file so writes from other processes are observed. Set() is a
// read-modify-write under an exclusive lock on "<path>.lock", published atomically
// (sibling temp file + rename). Writers never lose each other's keys and a concurrent
// reader sees either the old or the new document, never a torn one.
class JsonFileStore final : public KeyValueStore {
public:
    explicit JsonFileStore(std::filesystem::path path);

    [[nodiscard]] std::expected<std::optional<json>, StoreError> Get(const std::string& key) const override;
    [[nodiscard]] std::expected<void, StoreError> Set(const std::string& key, const json& value) override;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }

private:
    // Empty object when the file does not exist yet.
    [[nodiscard]] std::expected<json, StoreError> LoadDocument() const;

    std::filesystem::path m_path;
};

// Write `bytes` to a uniquely named sibling temp file, flush, then rename over `finalPath`.
[[nodiscard]] bool WriteFileAtomic(const std::filesystem::path& finalPath,
                                   const std::string& bytes,
                                   std::string* err);

} // namespace skywatch::store
