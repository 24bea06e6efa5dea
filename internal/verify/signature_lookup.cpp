#include "signature_lookup.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cctype>

#include "internal/util/errors.hpp"
#include "internal/util/process.hpp"
#include "internal/util/time.hpp"

namespace rollout::verify {

namespace {

std::string Lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) { return std::tolower(c); });
  return text;
}

bool ContainsAny(const std::string& haystack, std::initializer_list<const char*> needles) {
  return std::any_of(needles.begin(), needles.end(), [&](const char* n) { return haystack.find(n) != std::string::npos; });
}

} // namespace

LookupResult ClassifyCosignFailure(const std::string& output) {
  const auto text = Lower(output);

  const bool mentions_log = ContainsAny(text, {"rekor", "tlog", "transparency log"});
  const bool unreachable  = ContainsAny(text, {"connection refused", "no such host", "i/o timeout", "dial tcp",
                                               "tls handshake timeout", "network is unreachable", "503 service unavailable"});
  if (mentions_log && unreachable) {
    return {LookupStatus::Unknown, "transparency log unreachable"};
  }
  if (ContainsAny(text, {"no matching signatures", "no signatures found"})) {
    return {LookupStatus::Unverified, "no matching signatures"};
  }
  if (ContainsAny(text, {"manifest unknown", "name unknown", "not found"})) {
    return {LookupStatus::Unknown, "image not found in registry"};
  }

  std::string reason = "signature verification failed";
  if (!output.empty()) {
    util::CommandResult summary;
    summary.err = output;
    reason += ": " + util::Summarize(summary);
  }
  return {LookupStatus::Unverified, reason};
}

bool HasVerifiedSignature(const std::string& json) {
  google::protobuf::ListValue              signatures;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  if (!google::protobuf::util::JsonStringToMessage(json, &signatures, options).ok()) {
    return false;
  }
  return signatures.values_size() > 0;
}

CosignLookup::CosignLookup(const rollout::runtime::config::SignatureConfig& config)
    : cosign_path_(config.cosign_path().empty() ? "cosign" : config.cosign_path()),
      keyless_(config.has_keyless() ? config.keyless() : config.public_key_path().empty()),
      public_key_path_(config.public_key_path()),
      identity_regexp_(config.identity_regexp().empty() ? ".*" : config.identity_regexp()),
      oidc_issuer_regexp_(config.oidc_issuer_regexp().empty() ? ".*" : config.oidc_issuer_regexp()),
      trusted_identities_(config.trusted_identities().begin(), config.trusted_identities().end()) {
}

std::vector<std::vector<std::string>> CosignLookup::CommandLines(const std::string& image_ref) const {
  std::vector<std::vector<std::string>> lines;

  if (!keyless_) {
    lines.push_back({cosign_path_, "verify", "--key", public_key_path_, "--output", "json", image_ref});
    return lines;
  }

  if (trusted_identities_.empty()) {
    lines.push_back({cosign_path_, "verify", "--certificate-identity-regexp", identity_regexp_,
                     "--certificate-oidc-issuer-regexp", oidc_issuer_regexp_, "--output", "json", image_ref});
    return lines;
  }

  for (const auto& identity : trusted_identities_) {
    lines.push_back({cosign_path_, "verify", "--certificate-identity", identity, "--certificate-oidc-issuer-regexp",
                     oidc_issuer_regexp_, "--output", "json", image_ref});
  }
  return lines;
}

LookupResult CosignLookup::Lookup(const std::string& image_ref, std::chrono::milliseconds timeout) {
  const auto deadline = util::Clock::now() + timeout;

  LookupResult last{LookupStatus::Unverified, "no trusted identity matched"};
  for (const auto& argv : CommandLines(image_ref)) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - util::Clock::now());
    if (remaining.count() <= 0) {
      return {LookupStatus::Unknown, "verification timed out after " + std::to_string(timeout.count()) + "ms"};
    }

    util::CommandResult result;
    try {
      result = util::RunCommand(argv, remaining);
    } catch (const util::CommandError& e) {
      return {LookupStatus::Unknown, e.what()};
    }

    if (result.timed_out) {
      return {LookupStatus::Unknown, "verification timed out after " + std::to_string(timeout.count()) + "ms"};
    }
    if (result.exit_code == 0 && HasVerifiedSignature(result.out)) {
      return {LookupStatus::Verified, {}};
    }

    last = result.exit_code == 0 ? LookupResult{LookupStatus::Unverified, "cosign reported no verified signatures"}
                                 : ClassifyCosignFailure(result.err + "\n" + result.out);
    // An unreachable log fails every identity the same way.
    if (last.status == LookupStatus::Unknown) {
      return last;
    }
  }
  return last;
}

} // namespace rollout::verify
