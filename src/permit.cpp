#include "atomledger/permit.hpp"

#include <stdexcept>

#include "atomledger/hash.hpp"

namespace atomledger {

std::string subject_hash_of(const jsonlite::Value& params) {
  return hash_domain(tags::kSubject, jsonlite::to_canonical(params));
}

uint64_t permit_ttl_ms(RiskLevel risk) {
  switch (risk) {
    case RiskLevel::L0:
    case RiskLevel::L1:
    case RiskLevel::L2: return 2ull * 60 * 1000;
    case RiskLevel::L3: return 5ull * 60 * 1000;
    case RiskLevel::L4:
    case RiskLevel::L5: return 3ull * 60 * 1000;
  }
  return 2ull * 60 * 1000;
}

std::string Permit::to_json(bool include_sig) const {
  jsonlite::Object sc;
  sc["tenant_id"] = scopes.tenant_id;
  sc["intent"] = scopes.intent;
  sc["job_type"] = scopes.job_type;
  sc["target"] = scopes.target;
  sc["subject_hash"] = scopes.subject_hash;
  sc["policy_hash"] = scopes.policy_hash;
  sc["approval_ref"] = scopes.approval_ref;

  jsonlite::Object o;
  o["aud"] = aud;
  o["jti"] = jti;
  o["iat"] = iat_ms;
  o["exp"] = exp_ms;
  o["risk"] = to_string(risk);
  o["scopes"] = std::move(sc);
  o["iss"] = issuer_pubkey;
  if (include_sig) o["sig"] = sig;
  return jsonlite::to_canonical(o);
}

std::string permit_signing_payload(const Permit& permit) {
  std::string out(tags::kPermit);
  out += permit.to_json(false);
  return out;
}

PermitIssuer::PermitIssuer(KeyPair issuer, const PolicyEngine& policy)
    : issuer_(std::move(issuer)), policy_(policy) {
  if (!is_public_key_hex(issuer_.public_key) || from_hex(issuer_.secret_key).size() != 64) {
    throw std::invalid_argument("permit issuer requires an Ed25519 key pair");
  }
}

PermitDecision PermitIssuer::request(const PermitRequest& req, uint64_t now_ms) {
  PermitDecision d;
  if (req.tenant_id.empty() || req.actor_id.empty() || req.intent.empty() || req.target.empty() ||
      req.job_type.empty()) {
    d.reason = "tenant_id, actor_id, intent, job_type and target are required";
    return d;
  }
  if (const auto bound = policy_.container_tenant(req.target); bound && *bound != req.tenant_id) {
    d.reason = "target belongs to tenant " + *bound;
    return d;
  }
  if (req.risk >= RiskLevel::L4) {
    if (req.step_up_assertion.empty()) {
      d.reason = to_string(req.risk) + " requires a step-up assertion";
      return d;
    }
    if (req.approval_ref.empty()) {
      d.reason = to_string(req.risk) + " requires an approval reference";
      return d;
    }
  }

  Permit p;
  p.aud = "runner:" + req.target;
  p.jti = random_hex(16);
  p.iat_ms = now_ms;
  p.exp_ms = now_ms + permit_ttl_ms(req.risk);
  p.risk = req.risk;
  p.scopes.tenant_id = req.tenant_id;
  p.scopes.intent = req.intent;
  p.scopes.job_type = req.job_type;
  p.scopes.target = req.target;
  p.scopes.subject_hash = subject_hash_of(req.params);
  p.scopes.policy_hash = policy_.policy_hash();
  p.scopes.approval_ref = req.approval_ref;
  p.issuer_pubkey = issuer_.public_key;
  p.sig = sign_detached(permit_signing_payload(p), issuer_.secret_key);
  if (p.sig.empty()) {
    d.reason = "issuer key cannot sign";
    return d;
  }

  {
    std::lock_guard<std::mutex> lk(mu_);
    prune_expired(now_ms);
    issued_[p.jti] = Issued{p.scopes.subject_hash, p.exp_ms};
  }
  d.allowed = true;
  d.reason = "granted " + to_string(req.risk) + " for " + p.aud;
  d.permit = std::move(p);
  return d;
}

std::optional<Rejection> PermitIssuer::redeem(const Permit& permit, const jsonlite::Value& params,
                                              uint64_t now_ms) {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = issued_.find(permit.jti);
  if (it == issued_.end()) return reject(ErrorCode::not_found, "unknown permit " + permit.jti);

  if (permit.issuer_pubkey != issuer_.public_key ||
      !verify_detached(permit_signing_payload(permit), permit.sig, issuer_.public_key)) {
    return policy_reject(PolicyViolationKind::permit, "permit signature does not verify");
  }
  if (permit.aud != "runner:" + permit.scopes.target) {
    return policy_reject(PolicyViolationKind::permit, "audience does not match target");
  }
  if (now_ms > permit.exp_ms) return policy_reject(PolicyViolationKind::permit, "permit expired");
  const std::string subject = subject_hash_of(params);
  if (subject != permit.scopes.subject_hash || subject != it->second.subject_hash) {
    return policy_reject(PolicyViolationKind::permit, "payload does not match the permitted subject");
  }
  if (permit.scopes.policy_hash != policy_.policy_hash()) {
    return policy_reject(PolicyViolationKind::permit, "policy changed since the permit was issued");
  }
  if (!redeemed_.insert(permit.jti).second) {
    return policy_reject(PolicyViolationKind::permit, "permit already redeemed");
  }
  return std::nullopt;
}

void PermitIssuer::prune_expired(uint64_t now_ms) {
  for (auto it = issued_.begin(); it != issued_.end();) {
    if (now_ms > it->second.exp_ms) {
      redeemed_.erase(it->first);
      it = issued_.erase(it);
    } else {
      ++it;
    }
  }
}

std::size_t PermitIssuer::issued_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return issued_.size();
}

}  // namespace atomledger
