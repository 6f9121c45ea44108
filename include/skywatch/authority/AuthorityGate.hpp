#pragma once
// include/skywatch/authority/AuthorityGate.hpp
//
// Decides whether this instance may mutate the shared weather record.
//
// The answer comes from an externally owned role source (session, login, CLI flag) and
// is re-evaluated on every call; the gate never caches it. Mutating operations query the
// gate before writing. Reads never do.

#include <atomic>
#include <functional>
#include <utility>

namespace skywatch::authority {

class IRoleSource {
public:
    virtual ~IRoleSource() = default;

    [[nodiscard]] virtual bool IsAuthoritative() const = 0;
};

// Role fixed by the host, switchable at runtime (e.g. a GM handing over a session).
class StaticRole final : public IRoleSource {
public:
    explicit StaticRole(bool authoritative) noexcept : m_authoritative(authoritative) {}

    [[nodiscard]] bool IsAuthoritative() const override
    {
        return m_authoritative.load(std::memory_order_relaxed);
    }

    void Set(bool authoritative) noexcept { m_authoritative.store(authoritative, std::memory_order_relaxed); }

private:
    std::atomic_bool m_authoritative;
};

// Adapts any callable (e.g. a session query) into a role source.
class CallbackRole final : public IRoleSource {
public:
    explicit CallbackRole(std::function<bool()> query) : m_query(std::move(query)) {}

    [[nodiscard]] bool IsAuthoritative() const override { return m_query && m_query(); }

private:
    std::function<bool()> m_query;
};

class AuthorityGate {
public:
    explicit AuthorityGate(const IRoleSource& role) noexcept : m_role(role) {}

    [[nodiscard]] bool IsAuthoritative() const { return m_role.IsAuthoritative(); }

private:
    const IRoleSource& m_role;
};

} // namespace skywatch::authority
