#pragma once
// include/skywatch/engine/EngineError.hpp

#include "skywatch/store/KeyValueStore.hpp"

#include <string>

namespace skywatch::engine {

struct EngineError {
    enum class Code {
        InvalidTimeInput,      // partial/absent feed value; recovered locally, not surfaced
        UnauthorizedMutation,  // mutation requested by a non-authoritative instance
        StoreWriteFailure,
        StoreReadFailure,
        IncompleteParameters,  // climate, humidity or season missing
        UnknownBiome,
    } code{};
    std::string message;
};

[[nodiscard]] const char* EngineErrorCodeName(EngineError::Code c) noexcept;

[[nodiscard]] EngineError FromStoreWrite(const store::StoreError& e);
[[nodiscard]] EngineError FromStoreRead(const store::StoreError& e);

} // namespace skywatch::engine
