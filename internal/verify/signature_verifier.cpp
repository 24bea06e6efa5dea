#include "signature_verifier.hpp"

#include <exception>
#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/runtime/worker_pool.hpp"
#include "internal/util/time.hpp"

namespace rollout::verify {

SignatureVerifier::SignatureVerifier(std::shared_ptr<SignatureLookup> lookup, std::size_t parallelism,
                                     std::chrono::milliseconds timeout)
    : lookup_(std::move(lookup)), parallelism_(parallelism == 0 ? 1 : parallelism), timeout_(timeout) {
  if (!lookup_) {
    throw std::invalid_argument("SignatureVerifier requires a lookup");
  }
}

VerificationResult SignatureVerifier::VerifyOne(const std::string& image_ref, std::chrono::milliseconds timeout) const {
  VerificationResult result;
  result.set_image_ref(image_ref);

  const auto start = util::Clock::now();
  try {
    auto lookup = lookup_->Lookup(image_ref, timeout);
    result.set_verified(lookup.status == LookupStatus::Verified);
    result.set_reason(lookup.reason);
  } catch (const std::exception& e) {
    result.set_verified(false);
    result.set_reason(std::string("lookup error: ") + e.what());
  }

  if (util::Clock::now() - start > timeout) {
    result.set_verified(false);
    result.set_reason("verification timed out after " + std::to_string(timeout.count()) + "ms");
  }
  if (!result.verified() && result.reason().empty()) {
    result.set_reason("unverified");
  }
  *result.mutable_checked_at() = util::ToProto(util::Now());

  if (result.verified()) {
    observability::LogInfo("image signature verified", {observability::StringField("image", image_ref)});
  } else {
    observability::LogWarn("image signature rejected", {observability::StringField("image", image_ref),
                                                         observability::StringField("reason", result.reason())});
  }
  return result;
}

std::vector<VerificationResult> SignatureVerifier::VerifyAll(const std::vector<std::string>& image_refs,
                                                             util::TimePoint                 deadline) const {
  std::vector<VerificationResult> results(image_refs.size());

  std::vector<runtime::Task> tasks;
  tasks.reserve(image_refs.size());
  for (std::size_t i = 0; i < image_refs.size(); ++i) {
    // Queued checks start later, so each takes what is left when it runs.
    tasks.emplace_back([this, &results, &image_refs, i, deadline] {
      results[i] = VerifyOne(image_refs[i], util::CapToDeadline(timeout_, deadline));
    });
  }
  runtime::RunBounded(std::move(tasks), parallelism_, "signature-verifier");

  return results;
}

VerificationVerdict SignatureVerifier::Aggregate(const std::vector<VerificationResult>& results) {
  VerificationVerdict verdict;
  for (const auto& result : results) {
    if (!result.verified()) {
      verdict.failed_refs.push_back(result.image_ref());
    }
  }
  verdict.passed = verdict.failed_refs.empty();

  if (verdict.passed) {
    verdict.message = std::to_string(results.size()) + " image(s) verified";
    return verdict;
  }

  verdict.message = "signature verification failed for";
  for (const auto& result : results) {
    if (result.verified()) continue;
    verdict.message += " " + result.image_ref() + " (" + result.reason() + ")";
  }
  return verdict;
}

} // namespace rollout::verify
