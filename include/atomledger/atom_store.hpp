#pragma once

// atomledger/atom_store.hpp - Content-addressed storage for canonical atoms.
//
// DESIGN INVARIANTS (every backend):
//   1. Key = atom_hash = H(tags::kAtom || canonical bytes). Content-addressed,
//      never location-addressed.
//   2. put() is idempotent: storing the same canonical bytes twice returns the
//      same key; storing different bytes that claim an existing key fails.
//   3. get() verifies integrity before returning. Fail-closed: any mismatch
//      returns nullopt, never corrupted data.
//   4. Atoms are never removed. The ledger references them forever.
//
// EXTENSION_POINT: remote_atom_store
//   A network backend maps the same AB/CD/<hash> hierarchy onto object-store
//   prefixes. The key scheme must not change.

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace atomledger {

struct AtomObjectInfo {
  std::string atom_hash;
  std::string encoding{"identity"};
  std::size_t original_size{0};
  std::size_t stored_size{0};
  std::string stored_blob_hash;  // plain BLAKE3 of the stored (possibly compressed) bytes
  uint64_t created_at_unix_ts{0};
};

class IAtomStore {
 public:
  virtual ~IAtomStore() = default;

  // Store canonical atom bytes. Returns the atom hash, or "" on failure.
  virtual std::string put(const std::string& canonical) = 0;

  virtual std::optional<std::string> get(const std::string& atom_hash) const = 0;
  virtual bool contains(const std::string& atom_hash) const = 0;
  virtual std::optional<AtomObjectInfo> info(const std::string& atom_hash) const = 0;
  virtual std::size_t size() const = 0;
  virtual std::string backend_id() const = 0;
};

// In-process map. Used when no data directory is configured.
class MemoryAtomStore : public IAtomStore {
 public:
  std::string put(const std::string& canonical) override;
  std::optional<std::string> get(const std::string& atom_hash) const override;
  bool contains(const std::string& atom_hash) const override;
  std::optional<AtomObjectInfo> info(const std::string& atom_hash) const override;
  std::size_t size() const override;
  std::string backend_id() const override { return "memory"; }

 private:
  mutable std::mutex mu_;
  std::map<std::string, std::string> objects_;
  std::map<std::string, AtomObjectInfo> meta_;
};

// ---------------------------------------------------------------------------
// FsAtomStore - sharded local filesystem backend
// ---------------------------------------------------------------------------
// Layout:
//   <root>/objects/AB/CD/<64-char atom hash>
//   <root>/objects/AB/CD/<64-char atom hash>.meta
// Writes are atomic (tmp + rename on the same filesystem).
// compression: "off" or "zstd" (effective only when built with ATOMLEDGER_WITH_ZSTD).
class FsAtomStore : public IAtomStore {
 public:
  explicit FsAtomStore(std::string root, std::string compression = "off");

  std::string put(const std::string& canonical) override;
  std::optional<std::string> get(const std::string& atom_hash) const override;
  bool contains(const std::string& atom_hash) const override;
  std::optional<AtomObjectInfo> info(const std::string& atom_hash) const override;
  std::size_t size() const override;
  std::string backend_id() const override { return "local_fs"; }

  const std::string& root() const { return root_; }
  std::string object_path(const std::string& atom_hash) const;

 private:
  std::string meta_path(const std::string& atom_hash) const;
  void load_index() const;

  std::string root_;
  std::string compression_;
  mutable std::mutex index_mu_;
  mutable std::map<std::string, AtomObjectInfo> index_;
  mutable bool index_loaded_{false};
};

std::unique_ptr<IAtomStore> make_atom_store(const std::string& data_dir, const std::string& compression);

}  // namespace atomledger
