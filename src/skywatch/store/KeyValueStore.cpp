// src/skywatch/store/KeyValueStore.cpp
#include "skywatch/store/KeyValueStore.hpp"

#include <spdlog/spdlog.h>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  include <windows.h>
#else
#  include <fcntl.h>
#  include <sys/file.h>
#  include <unistd.h>
#endif

#include <atomic>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace skywatch::store {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kMaxDocumentBytes = 4u * 1024u * 1024u; // 4 MiB guardrail

// UTF-8 BOM written by some editors; strict JSON parsers reject it.
void StripUtf8Bom(std::string& text) noexcept
{
    if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF
        && static_cast<unsigned char>(text[1]) == 0xBB && static_cast<unsigned char>(text[2]) == 0xBF)
    {
        text.erase(0, 3);
    }
}

unsigned long CurrentProcessId() noexcept
{
#ifdef _WIN32
    return static_cast<unsigned long>(::GetCurrentProcessId());
#else
    return static_cast<unsigned long>(::getpid());
#endif
}

// Exclusive advisory lock on a sidecar "<doc>.lock" file, held for a whole
// read-modify-write. The document itself is replaced by rename, so it cannot carry
// the lock. Blocks until the lock is granted.
class DocumentLock {
public:
    explicit DocumentLock(const fs::path& docPath)
    {
        fs::path lockPath = docPath;
        lockPath += ".lock";

        std::error_code ec;
        if (lockPath.has_parent_path())
            fs::create_directories(lockPath.parent_path(), ec);

#ifdef _WIN32
        m_handle = ::CreateFileW(lockPath.wstring().c_str(), GENERIC_READ | GENERIC_WRITE,
                                 FILE_SHARE_READ | FILE_SHARE_WRITE | FILE_SHARE_DELETE, nullptr,
                                 OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (m_handle == INVALID_HANDLE_VALUE)
        {
            m_error = "CreateFileW failed for " + lockPath.string() + ": " + std::to_string(::GetLastError());
            return;
        }
        OVERLAPPED ov{};
        if (!::LockFileEx(m_handle, LOCKFILE_EXCLUSIVE_LOCK, 0, MAXDWORD, MAXDWORD, &ov))
        {
            m_error = "LockFileEx failed for " + lockPath.string() + ": " + std::to_string(::GetLastError());
            ::CloseHandle(m_handle);
            m_handle = INVALID_HANDLE_VALUE;
            return;
        }
        m_locked = true;
#else
        m_fd = ::open(lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (m_fd < 0)
        {
            m_error = "open failed for " + lockPath.string() + ": " + std::strerror(errno);
            return;
        }
        int rc = 0;
        do {
            rc = ::flock(m_fd, LOCK_EX);
        } while (rc != 0 && errno == EINTR);
        if (rc != 0)
        {
            m_error = "flock failed for " + lockPath.string() + ": " + std::strerror(errno);
            ::close(m_fd);
            m_fd = -1;
            return;
        }
        m_locked = true;
#endif
    }

    ~DocumentLock()
    {
#ifdef _WIN32
        if (m_handle != INVALID_HANDLE_VALUE)
        {
            if (m_locked)
            {
                OVERLAPPED ov{};
                ::UnlockFileEx(m_handle, 0, MAXDWORD, MAXDWORD, &ov);
            }
            ::CloseHandle(m_handle);
        }
#else
        if (m_fd >= 0)
        {
            if (m_locked)
                ::flock(m_fd, LOCK_UN);
            ::close(m_fd);
        }
#endif
    }

    DocumentLock(const DocumentLock&) = delete;
    DocumentLock& operator=(const DocumentLock&) = delete;

    [[nodiscard]] bool Locked() const noexcept { return m_locked; }
    [[nodiscard]] const std::string& Error() const noexcept { return m_error; }

private:
#ifdef _WIN32
    HANDLE m_handle = INVALID_HANDLE_VALUE;
#else
    int m_fd = -1;
#endif
    bool        m_locked = false;
    std::string m_error;
};

} // namespace

const char* StoreErrorCodeName(StoreError::Code c) noexcept
{
    switch (c)
    {
    case StoreError::Code::IoReadFail:  return "IoReadFail";
    case StoreError::Code::IoWriteFail: return "IoWriteFail";
    case StoreError::Code::ParseError:  return "ParseError";
    case StoreError::Code::TypeError:   return "TypeError";
    }
    return "?";
}

// ---------- MemoryKeyValueStore ----------

std::expected<std::optional<json>, StoreError> MemoryKeyValueStore::Get(const std::string& key) const
{
    auto it = m_values.find(key);
    if (it == m_values.end())
        return std::optional<json>{};
    return std::optional<json>{it->second};
}

std::expected<void, StoreError> MemoryKeyValueStore::Set(const std::string& key, const json& value)
{
    m_values[key] = value;
    return {};
}

// ---------- JsonFileStore ----------

JsonFileStore::JsonFileStore(fs::path path)
    : m_path(std::move(path))
{
}

std::expected<json, StoreError> JsonFileStore::LoadDocument() const
{
    std::error_code ec;
    if (!fs::exists(m_path, ec))
    {
        if (ec)
            return std::unexpected(StoreError{StoreError::Code::IoReadFail,
                                              "stat failed for " + m_path.string() + ": " + ec.message()});
        return json::object();
    }

    const auto size = fs::file_size(m_path, ec);
    if (ec)
        return std::unexpected(StoreError{StoreError::Code::IoReadFail,
                                          "file_size failed for " + m_path.string() + ": " + ec.message()});
    if (size > kMaxDocumentBytes)
        return std::unexpected(StoreError{StoreError::Code::IoReadFail,
                                          "store document too large: " + m_path.string()});

    std::ifstream in(m_path, std::ios::binary);
    if (!in)
        return std::unexpected(StoreError{StoreError::Code::IoReadFail, "open failed: " + m_path.string()});

    std::ostringstream oss;
    oss << in.rdbuf();
    std::string text = oss.str();
    StripUtf8Bom(text);

    // Treat an empty file as an empty document.
    if (text.find_first_not_of(" \t\r\n") == std::string::npos)
        return json::object();

    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded())
        return std::unexpected(StoreError{StoreError::Code::ParseError, "invalid JSON in " + m_path.string()});
    if (!doc.is_object())
        return std::unexpected(StoreError{StoreError::Code::TypeError,
                                          "store document is not an object: " + m_path.string()});
    return doc;
}

std::expected<std::optional<json>, StoreError> JsonFileStore::Get(const std::string& key) const
{
    auto doc = LoadDocument();
    if (!doc)
        return std::unexpected(doc.error());

    auto it = doc->find(key);
    if (it == doc->end())
        return std::optional<json>{};
    return std::optional<json>{*it};
}

std::expected<void, StoreError> JsonFileStore::Set(const std::string& key, const json& value)
{
    // Serialises writers across processes so one Set never publishes a document
    // loaded before another writer's rename.
    DocumentLock lock(m_path);
    if (!lock.Locked())
    {
        spdlog::error("JsonFileStore: cannot lock {}: {}", m_path.string(), lock.Error());
        return std::unexpected(StoreError{StoreError::Code::IoWriteFail, lock.Error()});
    }

    auto doc = LoadDocument();
    if (!doc)
        return std::unexpected(doc.error());

    (*doc)[key] = value;

    std::string err;
    if (!WriteFileAtomic(m_path, doc->dump(2), &err))
    {
        spdlog::error("JsonFileStore: write of '{}' to {} failed: {}", key, m_path.string(), err);
        return std::unexpected(StoreError{StoreError::Code::IoWriteFail, err});
    }

    spdlog::debug("JsonFileStore: wrote '{}' to {}", key, m_path.string());
    return {};
}

bool WriteFileAtomic(const fs::path& finalPath, const std::string& bytes, std::string* err)
{
    std::error_code ec;
    if (finalPath.has_parent_path())
    {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec)
        {
            if (err) *err = "create_directories failed: " + ec.message();
            return false;
        }
    }

    // Unique per process and call, so concurrent writers never share a temp file.
    static std::atomic<unsigned long> s_tempCounter{0};
    fs::path tmp = finalPath;
    tmp += "." + std::to_string(CurrentProcessId()) + "." + std::to_string(++s_tempCounter) + ".tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out)
        {
            if (err) *err = "open failed: " + tmp.string();
            return false;
        }
        out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out)
        {
            if (err) *err = "write failed: " + tmp.string();
            out.close();
            fs::remove(tmp, ec);
            return false;
        }
    }

    // rename() replaces the destination atomically on the same filesystem.
    fs::rename(tmp, finalPath, ec);
    if (ec)
    {
        if (err) *err = "rename failed: " + ec.message();
        std::error_code rec;
        fs::remove(tmp, rec);
        return false;
    }
    return true;
}

} // namespace skywatch::store
