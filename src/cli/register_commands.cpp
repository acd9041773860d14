#include "cli/registry.hpp"

int cmd_init(const strata::cli::Options &, int, char **);
int cmd_commit(const strata::cli::Options &, int, char **);
int cmd_tag(const strata::cli::Options &, int, char **);
int cmd_info(const strata::cli::Options &, int, char **);
int cmd_ls_tags(const strata::cli::Options &, int, char **);
int cmd_log(const strata::cli::Options &, int, char **);
int cmd_diff(const strata::cli::Options &, int, char **);
int cmd_runtime(const strata::cli::Options &, int, char **);
int cmd_push(const strata::cli::Options &, int, char **);
int cmd_pull(const strata::cli::Options &, int, char **);
int cmd_check(const strata::cli::Options &, int, char **);
int cmd_clean(const strata::cli::Options &, int, char **);
int cmd_prune(const strata::cli::Options &, int, char **);

namespace strata::cli {

void register_all_commands() {
  register_command("init", ::cmd_init, "Initialize the local repository: strata init [dir]");
  register_command("commit", ::cmd_commit,
                   "Commit the active runtime or a directory: "
                   "strata commit [--path DIR] [--kind layer|platform] [-t TAG]");
  register_command("tag", ::cmd_tag, "Push a tag version: strata tag <tag> <ref>");
  register_command("info", ::cmd_info, "Describe an object: strata info <ref>");
  register_command("ls-tags", ::cmd_ls_tags, "List tags under a directory: strata ls-tags [dir]");
  register_command("log", ::cmd_log, "Show the history of a tag: strata log <tag>");
  register_command("diff", ::cmd_diff, "Compare two refs or a ref and the runtime: "
                                       "strata diff <base> [top]");
  register_command("runtime", ::cmd_runtime,
                   "Manage runtimes: strata runtime create|ls|rm|push|edit|reset|status");
  register_command("push", ::cmd_push, "Copy a ref to a remote: strata push <ref> <remote>");
  register_command("pull", ::cmd_pull, "Copy a ref from the remotes: strata pull <ref>");
  register_command("check", ::cmd_check, "Verify repository integrity");
  register_command("clean", ::cmd_clean, "Remove unreachable data: strata clean [--dry-run]");
  register_command("prune", ::cmd_prune, "Remove old tag versions: strata prune [policy] [--yes]");
}

} // namespace strata::cli
