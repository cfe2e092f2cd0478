#include "sprig/config.hpp"

#include "sprig/consts.hpp"
#include "sprig/fs.hpp"
#include "sprig/util.hpp"

#include <cstdlib>
#include <sstream>
#include <string_view>

namespace sprig {

static std::filesystem::path cfg_path(const std::filesystem::path &repo_dir) {
  return repo_dir / consts::kConfigFile;
}

auto load_identity(const std::filesystem::path &repo_dir) -> Identity {
  Identity out{};
  const auto path = cfg_path(repo_dir);
  if (!fs::exists(path))
    return out;

  std::istringstream iss(fs::read_text(path));

  constexpr std::string_view k_author = "author:";
  constexpr std::string_view k_email = "email:";

  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    if (sv.starts_with(k_author)) {
      out.name = strutil::trim(sv.substr(k_author.size()));
    } else if (sv.starts_with(k_email)) {
      out.email = strutil::trim(sv.substr(k_email.size()));
    }
  }
  return out;
}

void save_identity(const std::filesystem::path &repo_dir, const Identity &id) {
  std::ostringstream os;
  os << "author: " << id.name << '\n' << "email: " << id.email << '\n';
  fs::write_text_atomic(cfg_path(repo_dir), os.str());
}

Identity commit_identity(const std::filesystem::path &repo_dir) {
  Identity id = load_identity(repo_dir);
  if (const char *name = std::getenv("SPRIG_AUTHOR_NAME"); name != nullptr && *name != '\0') {
    id.name = name;
  }
  if (const char *email = std::getenv("SPRIG_AUTHOR_EMAIL"); email != nullptr && *email != '\0') {
    id.email = email;
  }
  return id;
}

} // namespace sprig
