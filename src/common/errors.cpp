#include "msig/common/errors.hpp"

namespace msig {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kInvalidThreshold:
      return "InvalidThreshold";
    case ErrorCode::kInvalidKeySet:
      return "InvalidKeySet";
    case ErrorCode::kInvalidDerivationPath:
      return "InvalidDerivationPath";
    case ErrorCode::kInvalidBackupPhrase:
      return "InvalidBackupPhrase";
    case ErrorCode::kInvalidIndex:
      return "InvalidIndex";
    case ErrorCode::kInvalidNetwork:
      return "InvalidNetwork";
    case ErrorCode::kUnauthorizedSigner:
      return "UnauthorizedSigner";
    case ErrorCode::kDuplicateSignature:
      return "DuplicateSignature";
    case ErrorCode::kEmptyInputSet:
      return "EmptyInputSet";
    case ErrorCode::kEmptyOutputSet:
      return "EmptyOutputSet";
    case ErrorCode::kNegativeFee:
      return "NegativeFee";
    case ErrorCode::kInsufficientFunds:
      return "InsufficientFunds";
    case ErrorCode::kInvalidDestination:
      return "InvalidDestination";
    case ErrorCode::kNonPositiveOutputAmount:
      return "NonPositiveOutputAmount";
    case ErrorCode::kInvalidSpendableOutput:
      return "InvalidSpendableOutput";
    case ErrorCode::kVerificationFailed:
      return "VerificationFailed";
    case ErrorCode::kAddressDerivationFailure:
      return "AddressDerivationFailure";
    case ErrorCode::kFinalizationFailure:
      return "FinalizationFailure";
    case ErrorCode::kEncodingFailure:
      return "EncodingFailure";
  }
  return "Unknown";
}

WalletError::WalletError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

ErrorCode WalletError::code() const {
  return code_;
}

}  // namespace msig
