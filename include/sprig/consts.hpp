#pragma once
#include <cstddef>
#include <string_view>

namespace sprig::consts {

// Directory and file names
inline constexpr std::string_view kRepoDir     = ".sprig";
inline constexpr std::string_view kObjectsDir  = "objects";
inline constexpr std::string_view kRefsDir     = "refs";
inline constexpr std::string_view kIndexFile   = "index";
inline constexpr std::string_view kConfigFile  = "config";
inline constexpr std::string_view kDefaultBranch = "master";

// Well-known ref names
inline constexpr std::string_view kHead        = "HEAD";
inline constexpr std::string_view kMergeHead   = "MERGE_HEAD";
inline constexpr std::string_view kHeadsPrefix = "refs/heads/";
inline constexpr std::string_view kTagsPrefix  = "refs/tags/";
inline constexpr std::string_view kRemotesPrefix = "refs/remotes/";

// Object type strings
inline constexpr std::string_view kTypeBlob    = "blob";
inline constexpr std::string_view kTypeTree    = "tree";
inline constexpr std::string_view kTypeCommit  = "commit";

// ——— Object ID sizes ———
inline constexpr std::size_t kOidRawLen = 20;  // 20 bytes (SHA-1)
inline constexpr std::size_t kOidHexLen = 40;  // 40 hex chars (SHA-1)
inline constexpr std::size_t kMinShortOid = 4; // shortest accepted abbreviated oid

// ——— Object store fanout ———
inline constexpr std::size_t kFanoutDirHexLen = 2; // "aa/" + "bbbb..." in .sprig/objects

// ——— Refs ———
inline constexpr std::string_view kRefPrefix = "ref: ";
inline constexpr int kMaxSymrefDepth = 16;

// ——— Commit header prefixes (used in parsing/formatting) ———
inline constexpr std::string_view kTreePrefix      = "tree ";
inline constexpr std::string_view kParentPrefix    = "parent ";
inline constexpr std::string_view kAuthorPrefix    = "author ";
inline constexpr std::string_view kCommitterPrefix = "committer ";

// ——— Diff / merge ———
inline constexpr std::size_t kBinarySniffLen = 8000;
inline constexpr std::size_t kDiffContext = 3;
inline constexpr std::string_view kMarkerOurs   = "<<<<<<<";
inline constexpr std::string_view kMarkerSep    = "=======";
inline constexpr std::string_view kMarkerTheirs = ">>>>>>>";

// ——— Common characters ———
inline constexpr char kSpace = ' ';
inline constexpr char kNul   = '\0';
inline constexpr char kLF    = '\n';

} // namespace sprig::consts
