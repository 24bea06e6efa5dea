#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "config/config.pb.h"

namespace rollout::verify {

enum class LookupStatus {
  Verified,
  Unverified,
  Unknown  // the answer could not be obtained (timeout, transparency log down)
};

struct LookupResult {
  LookupStatus status = LookupStatus::Unknown;
  std::string  reason;
};

// Signature lookup keyed by image reference. Never mutates anything.
class SignatureLookup {
 public:
  virtual ~SignatureLookup() = default;

  virtual LookupResult Lookup(const std::string& image_ref, std::chrono::milliseconds timeout) = 0;
};

/*
  `cosign verify` against the public transparency log.

  Keyless mode checks the certificate identity and OIDC issuer; with
  trusted_identities each identity is tried in turn and the first match
  wins. Key mode passes --key.
*/
class CosignLookup final : public SignatureLookup {
 public:
  explicit CosignLookup(const rollout::runtime::config::SignatureConfig& config);

  LookupResult Lookup(const std::string& image_ref, std::chrono::milliseconds timeout) override;

  // Exposed for tests.
  std::vector<std::vector<std::string>> CommandLines(const std::string& image_ref) const;

 private:
  std::string              cosign_path_;
  bool                     keyless_;
  std::string              public_key_path_;
  std::string              identity_regexp_;
  std::string              oidc_issuer_regexp_;
  std::vector<std::string> trusted_identities_;
};

// Classifies cosign's failure output.
LookupResult ClassifyCosignFailure(const std::string& output);

// True when `--output json` stdout holds at least one verified signature.
bool HasVerifiedSignature(const std::string& json);

} // namespace rollout::verify
