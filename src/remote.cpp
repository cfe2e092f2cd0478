#include "sprig/remote.hpp"

#include "sprig/consts.hpp"
#include "sprig/errors.hpp"
#include "sprig/fs.hpp"
#include "sprig/graph.hpp"
#include "sprig/log.hpp"

#include <filesystem>
#include <set>
#include <string>

namespace stdfs = std::filesystem;

namespace {

[[nodiscard]] std::string short_oid(std::string_view hex) { return std::string(hex.substr(0, 7)); }

} // namespace

namespace sprig::remote {

// ——— FilesystemTransport ———

FilesystemTransport::FilesystemTransport(const stdfs::path &remote_root)
    : objects_(remote_root / consts::kRepoDir / consts::kObjectsDir),
      refs_(remote_root / consts::kRepoDir) {
  if (!stdfs::is_directory(remote_root / consts::kRepoDir)) {
    throw NotARepository(remote_root.string());
  }
}

bool FilesystemTransport::object_exists(std::string_view hex_oid) const {
  return objects_.exists(hex_oid);
}

void FilesystemTransport::copy_object_in(std::string_view hex_oid, const ObjectStore &local) const {
  local.put_raw(hex_oid, objects_.raw(hex_oid));
}

void FilesystemTransport::copy_object_out(std::string_view hex_oid,
                                          const ObjectStore &local) const {
  objects_.put_raw(hex_oid, local.raw(hex_oid));
}

std::map<std::string, std::string> FilesystemTransport::read_refs(std::string_view prefix) const {
  std::map<std::string, std::string> out;
  for (const auto &[name, value] : refs_.list(prefix)) {
    if (!value.symbolic) {
      out.emplace(name, value.value);
    }
  }
  return out;
}

void FilesystemTransport::write_ref(std::string_view name, std::string_view hex_oid) const {
  refs_.update(name, RefValue::direct(std::string(hex_oid)));
}

// ——— fetch / push ———

FetchResult fetch(const Repository &repo, const Transport &transport,
                  std::string_view remote_name) {
  const std::string tracking_prefix =
      std::string(consts::kRemotesPrefix) + std::string(remote_name) + "/";
  validate_ref_name(tracking_prefix + "x");

  FetchResult result;
  std::vector<std::string> tips;
  for (const auto &[name, tip] : transport.read_refs(consts::kHeadsPrefix)) {
    result.branches.emplace(name.substr(consts::kHeadsPrefix.size()), tip);
    tips.push_back(tip);
  }

  // Each object is copied just before the walk reads it.
  const ObjectStore &local = repo.objects();
  graph::for_each_reachable_object(local, tips, [&](const std::string &hex) {
    if (!local.exists(hex)) {
      transport.copy_object_in(hex, local);
      ++result.objects_copied;
    }
  });

  for (const auto &[branch, tip] : result.branches) {
    repo.refs().update(tracking_prefix + branch, RefValue::direct(tip), false);
    log::info("fetch: " + tracking_prefix + branch + " -> " + short_oid(tip));
  }
  log::info("fetch: " + std::to_string(result.objects_copied) + " object(s) copied");
  return result;
}

PushResult push(const Repository &repo, const Transport &transport, std::string_view refname) {
  validate_ref_name(refname);

  PushResult result;
  result.new_tip = repo.refs().get(refname).value;
  if (result.new_tip.empty()) {
    throw NoSuchLocalRef(std::string(refname));
  }

  const auto remote_refs = transport.read_refs({});
  if (const auto it = remote_refs.find(std::string(refname)); it != remote_refs.end()) {
    result.old_tip = it->second;
  }

  const ObjectStore &local = repo.objects();
  if (!result.old_tip.empty()) {
    // A remote tip we have never fetched cannot be an ancestor of ours.
    if (!local.exists(result.old_tip) ||
        !graph::is_ancestor(local, result.old_tip, result.new_tip)) {
      throw NonFastForward(std::string(refname));
    }
  }

  // Objects the remote already has: the closure of every remote tip we know.
  std::vector<std::string> known;
  for (const auto &[_, tip] : remote_refs) {
    if (local.exists(tip)) {
      known.push_back(tip);
    }
  }
  const std::set<std::string> remote_has = graph::objects_reachable_from(local, known);

  for (const auto &hex : graph::objects_reachable_from(local, {result.new_tip})) {
    if (!remote_has.contains(hex) && !transport.object_exists(hex)) {
      transport.copy_object_out(hex, local);
      ++result.objects_copied;
    }
  }

  transport.write_ref(refname, result.new_tip);
  log::info("push: " + std::string(refname) + " " +
            (result.old_tip.empty() ? std::string("(new)") : short_oid(result.old_tip)) + ".." +
            short_oid(result.new_tip) + ", " + std::to_string(result.objects_copied) +
            " object(s) copied");
  return result;
}

} // namespace sprig::remote
