#include "dhole/core/failures.hpp"
#include "dhole/core/constants.hpp"

namespace dhole::protocol {

ProtocolFailure ProtocolFailure::Authentication() {
    return {ProtocolFailureType::Authentication,
            std::string(ErrorMessages::AUTHENTICATION_FAILED)};
}

std::string_view ToString(const ProtocolFailureType type) noexcept {
    switch (type) {
        case ProtocolFailureType::Generic: return "Generic";
        case ProtocolFailureType::InvalidKeyLength: return "InvalidKeyLength";
        case ProtocolFailureType::DegenerateKey: return "DegenerateKey";
        case ProtocolFailureType::UnsupportedVersion: return "UnsupportedVersion";
        case ProtocolFailureType::Authentication: return "Authentication";
        case ProtocolFailureType::SignatureLength: return "SignatureLength";
        case ProtocolFailureType::RandomnessFailure: return "RandomnessFailure";
        case ProtocolFailureType::DeriveKey: return "DeriveKey";
        case ProtocolFailureType::InvalidInput: return "InvalidInput";
    }
    return "Unknown";
}

}
