#pragma once
#include <filesystem>
#include <string>

namespace sprig {

struct Identity {
  std::string name;
  std::string email;
};

// Read identity from .sprig/config (empty fields if missing)
Identity load_identity(const std::filesystem::path& repo_dir);

// Overwrite .sprig/config with the given identity
void save_identity(const std::filesystem::path& repo_dir, const Identity& id);

// Identity used for new commits: $SPRIG_AUTHOR_NAME / $SPRIG_AUTHOR_EMAIL when set,
// otherwise the config file.
Identity commit_identity(const std::filesystem::path& repo_dir);

} // namespace sprig
