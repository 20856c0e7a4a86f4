#pragma once

#include <stdexcept>
#include <string>

namespace msig {

enum class ErrorCode {
  // Configuration
  kInvalidThreshold = 1,
  kInvalidKeySet = 2,
  kInvalidDerivationPath = 3,
  kInvalidBackupPhrase = 4,
  kInvalidIndex = 5,
  kInvalidNetwork = 6,

  // Authorization
  kUnauthorizedSigner = 20,
  kDuplicateSignature = 21,

  // Funds
  kEmptyInputSet = 40,
  kEmptyOutputSet = 41,
  kNegativeFee = 42,
  kInsufficientFunds = 43,
  kInvalidDestination = 44,
  kNonPositiveOutputAmount = 45,
  kInvalidSpendableOutput = 46,

  // Verification
  kVerificationFailed = 60,

  // Fatal encoding
  kAddressDerivationFailure = 80,
  kFinalizationFailure = 81,
  kEncodingFailure = 82,
};

const char* ErrorCodeName(ErrorCode code);

class WalletError : public std::runtime_error {
 public:
  WalletError(ErrorCode code, const std::string& message);

  ErrorCode code() const;

 private:
  ErrorCode code_;
};

class ConfigurationError : public WalletError {
 public:
  using WalletError::WalletError;
};

class AuthorizationError : public WalletError {
 public:
  using WalletError::WalletError;
};

class FundsError : public WalletError {
 public:
  using WalletError::WalletError;
};

class VerificationError : public WalletError {
 public:
  using WalletError::WalletError;
};

class FatalEncodingError : public WalletError {
 public:
  using WalletError::WalletError;
};

}  // namespace msig
