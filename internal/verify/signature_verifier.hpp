#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/util/time.hpp"
#include "rollout/manager/v1/session.pb.h"
#include "signature_lookup.hpp"

namespace rollout::verify {

using rollout::manager::v1::VerificationResult;

struct VerificationVerdict {
  bool                     passed = false;
  std::vector<std::string> failed_refs;
  std::string              message;
};

/*
  Checks every image concurrently, at most `parallelism` at a time.

  Each check has its own timeout and its own result; a failing or slow
  image never affects the others. Results come back in input order.
*/
class SignatureVerifier {
 public:
  SignatureVerifier(std::shared_ptr<SignatureLookup> lookup, std::size_t parallelism, std::chrono::milliseconds timeout);

  // Lookups still running at `deadline` are reported as timed out.
  std::vector<VerificationResult> VerifyAll(const std::vector<std::string>& image_refs, util::TimePoint deadline = {}) const;

  static VerificationVerdict Aggregate(const std::vector<VerificationResult>& results);

 private:
  VerificationResult VerifyOne(const std::string& image_ref, std::chrono::milliseconds timeout) const;

  std::shared_ptr<SignatureLookup> lookup_;
  std::size_t                      parallelism_;
  std::chrono::milliseconds        timeout_;
};

} // namespace rollout::verify
