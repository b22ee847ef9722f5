#pragma once

// atomledger/permit.hpp - Short-lived execution permits for elevated-risk actions.
//
// An orchestrator asks for a permit before acting on a target. The permit is
// bound to the exact payload it authorizes:
//   subject_hash = H(tags::kSubject || canonical(params))
// and signed by the issuer:
//   sig = Ed25519(tags::kPermit || canonical(permit without sig))
// redeem() checks signature, audience, expiry, subject hash and the policy
// hash in force at issuance, and accepts each jti once.
//
// TTL by risk: L0-L2 2 min, L3 5 min, L4-L5 3 min. L4 and L5 require a
// step-up assertion and an approval reference.

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>

#include "atomledger/crypto.hpp"
#include "atomledger/jsonlite.hpp"
#include "atomledger/pact.hpp"
#include "atomledger/policy.hpp"
#include "atomledger/types.hpp"

namespace atomledger {

struct PermitRequest {
  std::string tenant_id;
  std::string actor_id;
  std::string intent;
  std::string job_type;
  std::string target;
  jsonlite::Value params;
  std::string approval_ref;
  RiskLevel risk{RiskLevel::L0};
  std::string step_up_assertion;
};

struct PermitScopes {
  std::string tenant_id;
  std::string intent;
  std::string job_type;
  std::string target;
  std::string subject_hash;
  std::string policy_hash;
  std::string approval_ref;
};

struct Permit {
  std::string aud;  // "runner:" + target
  std::string jti;
  uint64_t iat_ms{0};
  uint64_t exp_ms{0};
  RiskLevel risk{RiskLevel::L0};
  PermitScopes scopes;
  std::string issuer_pubkey;
  std::string sig;

  // Canonical JSON; the signed form omits sig.
  std::string to_json(bool include_sig = true) const;
};

struct PermitDecision {
  bool allowed{false};
  std::string reason;
  std::optional<Permit> permit;
};

std::string subject_hash_of(const jsonlite::Value& params);
uint64_t permit_ttl_ms(RiskLevel risk);
std::string permit_signing_payload(const Permit& permit);

class PermitIssuer {
 public:
  // Throws std::invalid_argument if the key pair is malformed.
  PermitIssuer(KeyPair issuer, const PolicyEngine& policy);

  PermitDecision request(const PermitRequest& req, uint64_t now_ms);

  // Unknown jti -> not_found. Every other failure -> policy_violation/permit.
  std::optional<Rejection> redeem(const Permit& permit, const jsonlite::Value& params, uint64_t now_ms);

  const std::string& public_key() const { return issuer_.public_key; }

  // Permits still tracked. Expired ones are dropped on the next request(),
  // after which redeeming them reports not_found.
  std::size_t issued_count() const;

 private:
  struct Issued {
    std::string subject_hash;
    uint64_t exp_ms{0};
  };

  void prune_expired(uint64_t now_ms);  // caller holds mu_

  KeyPair issuer_;
  const PolicyEngine& policy_;

  mutable std::mutex mu_;
  std::map<std::string, Issued> issued_;  // by jti
  std::set<std::string> redeemed_;
};

}  // namespace atomledger
