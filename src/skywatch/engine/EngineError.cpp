// src/skywatch/engine/EngineError.cpp
#include "skywatch/engine/EngineError.hpp"

namespace skywatch::engine {

const char* EngineErrorCodeName(EngineError::Code c) noexcept
{
    switch (c)
    {
    case EngineError::Code::InvalidTimeInput:     return "InvalidTimeInput";
    case EngineError::Code::UnauthorizedMutation: return "UnauthorizedMutation";
    case EngineError::Code::StoreWriteFailure:    return "StoreWriteFailure";
    case EngineError::Code::StoreReadFailure:     return "StoreReadFailure";
    case EngineError::Code::IncompleteParameters: return "IncompleteParameters";
    case EngineError::Code::UnknownBiome:         return "UnknownBiome";
    }
    return "?";
}

EngineError FromStoreWrite(const store::StoreError& e)
{
    return EngineError{EngineError::Code::StoreWriteFailure,
                       std::string(store::StoreErrorCodeName(e.code)) + ": " + e.message};
}

EngineError FromStoreRead(const store::StoreError& e)
{
    return EngineError{EngineError::Code::StoreReadFailure,
                       std::string(store::StoreErrorCodeName(e.code)) + ": " + e.message};
}

} // namespace skywatch::engine
