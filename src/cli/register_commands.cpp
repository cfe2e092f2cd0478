#include "cli/registry.hpp"

int cmd_init(int argc, char **argv);
int cmd_add(int argc, char **argv);
int cmd_commit(int argc, char **argv);
int cmd_hash_object(int, char **);
int cmd_cat_file(int, char **);
int cmd_write_tree(int, char **);
int cmd_read_tree(int, char **);
int cmd_status(int, char **);
int cmd_checkout(int, char **);
int cmd_branch(int, char **);
int cmd_tag(int, char **);
int cmd_log(int, char **);
int cmd_show(int, char **);
int cmd_diff(int, char **);
int cmd_reset(int, char **);
int cmd_merge(int, char **);
int cmd_merge_base(int, char **);
int cmd_fetch(int, char **);
int cmd_push(int, char **);

namespace sprig::cli {

void register_all_commands() {
  register_command("init", ::cmd_init, "Initialize a new repository");
  register_command("add", ::cmd_add, "Add file(s) to the index: sprig add <path>...");
  register_command("commit", ::cmd_commit, "Commit staged changes: sprig commit -m <message>");
  register_command("hash-object", ::cmd_hash_object,
                   "Store a file as an object: sprig hash-object [-t type] <file>");
  register_command("cat-file", ::cmd_cat_file, "Print an object: sprig cat-file [-t] <rev>");
  register_command("write-tree", ::cmd_write_tree, "Write the index as a tree object");
  register_command("read-tree", ::cmd_read_tree,
                   "Load a tree into the index and working directory: sprig read-tree <rev>");
  register_command("status", ::cmd_status, "Show staged/unstaged/untracked changes");
  register_command("checkout", ::cmd_checkout,
                   "Switch to branch/commit: sprig checkout <name|oid>");
  register_command("branch", ::cmd_branch, "List or create branches: sprig branch [name [rev]]");
  register_command("tag", ::cmd_tag, "Create a tag: sprig tag <name> [rev]");
  register_command("log", ::cmd_log, "Show commit history: sprig log [rev]");
  register_command("show", ::cmd_show, "Show a commit and its changes: sprig show [rev]");
  register_command("diff", ::cmd_diff, "Show diffs: sprig diff [--cached] [rev]");
  register_command("reset", ::cmd_reset, "Move HEAD: sprig reset [--hard] <rev>");
  register_command("merge", ::cmd_merge, "Merge into current: sprig merge <rev> | --abort");
  register_command("merge-base", ::cmd_merge_base,
                   "Print a common ancestor: sprig merge-base <a> <b>");
  register_command("fetch", ::cmd_fetch, "Fetch from a local path: sprig fetch <path> [name]");
  register_command("push", ::cmd_push, "Push to a local path: sprig push <path> [branch]");
}

} // namespace sprig::cli
