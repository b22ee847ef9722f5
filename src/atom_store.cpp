#include "atomledger/atom_store.hpp"

#include <ctime>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <random>

#if defined(ATOMLEDGER_WITH_ZSTD)
#include <zstd.h>
#endif

#include "atomledger/canonical.hpp"
#include "atomledger/hash.hpp"
#include "atomledger/jsonlite.hpp"

namespace fs = std::filesystem;

namespace atomledger {

namespace {
#if defined(ATOMLEDGER_WITH_ZSTD)
std::string compress_zstd(const std::string& data) {
  std::string out;
  out.resize(ZSTD_compressBound(data.size()));
  size_t n = ZSTD_compress(out.data(), out.size(), data.data(), data.size(), 3);
  if (ZSTD_isError(n)) return {};
  out.resize(n);
  return out;
}

std::optional<std::string> decompress_zstd(const std::string& data, std::size_t original_size) {
  std::string out;
  out.resize(original_size);
  size_t n = ZSTD_decompress(out.data(), out.size(), data.data(), data.size());
  if (ZSTD_isError(n) || n != original_size) return std::nullopt;
  return out;
}
#endif

std::string make_tmp_name(const fs::path& dir) {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::uniform_int_distribution<uint64_t> dist;
  return (dir / (".tmp_" + std::to_string(dist(rng)))).string();
}

// Atomic write: temp file, then rename into place.
bool atomic_write(const fs::path& target, const std::string& data) {
  std::error_code ec;
  fs::create_directories(target.parent_path(), ec);
  if (ec) return false;
  const std::string tmp = make_tmp_name(target.parent_path());
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) return false;
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!ofs) {
      std::remove(tmp.c_str());
      return false;
    }
  }
  fs::rename(tmp, target, ec);
  if (ec) {
    std::remove(tmp.c_str());
    return false;
  }
  return true;
}

std::optional<std::string> read_file(const fs::path& p) {
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs) return std::nullopt;
  return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

std::string meta_to_json(const AtomObjectInfo& info) {
  jsonlite::Object o;
  o["atom_hash"] = info.atom_hash;
  o["encoding"] = info.encoding;
  o["original_size"] = info.original_size;
  o["stored_size"] = info.stored_size;
  o["stored_blob_hash"] = info.stored_blob_hash;
  o["created_at"] = info.created_at_unix_ts;
  return jsonlite::to_canonical(o);
}

std::optional<AtomObjectInfo> meta_from_json(const std::string& text) {
  std::optional<jsonlite::JsonError> err;
  const auto o = jsonlite::parse(text, &err);
  if (err) return std::nullopt;
  AtomObjectInfo info;
  info.atom_hash = jsonlite::get_string(o, "atom_hash");
  info.encoding = jsonlite::get_string(o, "encoding", "identity");
  info.original_size = static_cast<std::size_t>(jsonlite::get_i64(o, "original_size"));
  info.stored_size = static_cast<std::size_t>(jsonlite::get_i64(o, "stored_size"));
  info.stored_blob_hash = jsonlite::get_string(o, "stored_blob_hash");
  info.created_at_unix_ts = static_cast<uint64_t>(jsonlite::get_i64(o, "created_at"));
  if (!is_digest_hex(info.atom_hash)) return std::nullopt;
  return info;
}

}  // namespace

// ---------------------------------------------------------------------------
// MemoryAtomStore
// ---------------------------------------------------------------------------

std::string MemoryAtomStore::put(const std::string& canonical) {
  const std::string digest = atom_hash_of(canonical);
  std::lock_guard<std::mutex> lk(mu_);
  auto it = objects_.find(digest);
  if (it != objects_.end()) return it->second == canonical ? digest : std::string{};
  objects_.emplace(digest, canonical);
  AtomObjectInfo info;
  info.atom_hash = digest;
  info.original_size = canonical.size();
  info.stored_size = canonical.size();
  info.stored_blob_hash = blake3_hex(canonical);
  info.created_at_unix_ts = static_cast<uint64_t>(std::time(nullptr));
  meta_.emplace(digest, std::move(info));
  return digest;
}

std::optional<std::string> MemoryAtomStore::get(const std::string& atom_hash) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = objects_.find(atom_hash);
  if (it == objects_.end()) return std::nullopt;
  return it->second;
}

bool MemoryAtomStore::contains(const std::string& atom_hash) const {
  std::lock_guard<std::mutex> lk(mu_);
  return objects_.contains(atom_hash);
}

std::optional<AtomObjectInfo> MemoryAtomStore::info(const std::string& atom_hash) const {
  std::lock_guard<std::mutex> lk(mu_);
  auto it = meta_.find(atom_hash);
  if (it == meta_.end()) return std::nullopt;
  return it->second;
}

std::size_t MemoryAtomStore::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return objects_.size();
}

// ---------------------------------------------------------------------------
// FsAtomStore
// ---------------------------------------------------------------------------

FsAtomStore::FsAtomStore(std::string root, std::string compression)
    : root_(std::move(root)), compression_(std::move(compression)) {
  std::error_code ec;
  fs::create_directories(fs::path(root_) / "objects", ec);
}

std::string FsAtomStore::object_path(const std::string& atom_hash) const {
  return (fs::path(root_) / "objects" / atom_hash.substr(0, 2) / atom_hash.substr(2, 2) / atom_hash)
      .string();
}

std::string FsAtomStore::meta_path(const std::string& atom_hash) const {
  return object_path(atom_hash) + ".meta";
}

void FsAtomStore::load_index() const {
  std::lock_guard<std::mutex> lk(index_mu_);
  if (index_loaded_) return;
  std::error_code ec;
  const fs::path obj_root = fs::path(root_) / "objects";
  for (fs::recursive_directory_iterator it(obj_root, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file() || it->path().extension() != ".meta") continue;
    auto text = read_file(it->path());
    if (!text) continue;
    auto info = meta_from_json(*text);
    if (info) index_[info->atom_hash] = std::move(*info);
  }
  index_loaded_ = true;
}

std::string FsAtomStore::put(const std::string& canonical) {
  const std::string digest = atom_hash_of(canonical);
  const fs::path target = object_path(digest);
  const fs::path meta = meta_path(digest);

  std::error_code ec;
  if (fs::exists(target, ec) && fs::exists(meta, ec)) {
    auto existing = get(digest);
    if (!existing || *existing != canonical) return {};
    return digest;
  }

  std::string stored = canonical;
  std::string encoding = "identity";
#if defined(ATOMLEDGER_WITH_ZSTD)
  if (compression_ == "zstd") {
    auto c = compress_zstd(canonical);
    if (!c.empty()) {
      stored = std::move(c);
      encoding = "zstd";
    }
  }
#endif

  if (!atomic_write(target, stored)) return {};

  AtomObjectInfo info;
  info.atom_hash = digest;
  info.encoding = encoding;
  info.original_size = canonical.size();
  info.stored_size = stored.size();
  info.stored_blob_hash = blake3_hex(stored);
  info.created_at_unix_ts = static_cast<uint64_t>(std::time(nullptr));
  if (!atomic_write(meta, meta_to_json(info))) {
    fs::remove(target, ec);
    return {};
  }

  std::lock_guard<std::mutex> lk(index_mu_);
  index_[digest] = std::move(info);
  return digest;
}

std::optional<AtomObjectInfo> FsAtomStore::info(const std::string& atom_hash) const {
  if (!is_digest_hex(atom_hash)) return std::nullopt;
  load_index();
  {
    std::lock_guard<std::mutex> lk(index_mu_);
    auto it = index_.find(atom_hash);
    if (it != index_.end()) return it->second;
  }
  // Written by another process after the index was loaded.
  auto text = read_file(meta_path(atom_hash));
  if (!text) return std::nullopt;
  auto parsed = meta_from_json(*text);
  if (!parsed || parsed->atom_hash != atom_hash) return std::nullopt;
  std::lock_guard<std::mutex> lk(index_mu_);
  index_[atom_hash] = *parsed;
  return parsed;
}

std::optional<std::string> FsAtomStore::get(const std::string& atom_hash) const {
  if (!is_digest_hex(atom_hash)) return std::nullopt;
  auto data = read_file(object_path(atom_hash));
  if (!data) return std::nullopt;
  auto meta = info(atom_hash);
  if (!meta) return std::nullopt;

  if (blake3_hex(*data) != meta->stored_blob_hash) return std::nullopt;

  if (meta->encoding == "zstd") {
#if defined(ATOMLEDGER_WITH_ZSTD)
    auto plain = decompress_zstd(*data, meta->original_size);
    if (!plain) return std::nullopt;
    data = std::move(plain);
#else
    return std::nullopt;
#endif
  }

  if (atom_hash_of(*data) != atom_hash) return std::nullopt;
  return data;
}

bool FsAtomStore::contains(const std::string& atom_hash) const {
  if (!is_digest_hex(atom_hash)) return false;
  std::error_code ec;
  return fs::exists(object_path(atom_hash), ec);
}

std::size_t FsAtomStore::size() const {
  load_index();
  std::lock_guard<std::mutex> lk(index_mu_);
  return index_.size();
}

std::unique_ptr<IAtomStore> make_atom_store(const std::string& data_dir, const std::string& compression) {
  if (data_dir.empty()) return std::make_unique<MemoryAtomStore>();
  return std::make_unique<FsAtomStore>((fs::path(data_dir) / "atoms").string(), compression);
}

}  // namespace atomledger
