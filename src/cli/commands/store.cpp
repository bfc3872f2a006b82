#include "../wc_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <optional>
#include <fmt/format.h>
#include <wc/metadata_store.hpp>
#include <wc/wc_classifier.hpp>
#include <wc/wc_context.hpp>
#include <wc/wc_init.hpp>
#include <wc/wc_lock.hpp>

namespace fs = std::filesystem;

static MetadataEntry entry_arg(const std::string& text, const char* usage) {
    MetadataEntry entry;
    if (!parse_metadata_entry(text, entry)) {
        throw UsageError(fmt::format("Unknown entry '{}' (apiurl, project, package, packages, files). {}",
                                     text, usage));
    }
    return entry;
}

// Value of "--flag value"; advances i past the value.
static std::string flag_value(const WCCLI::Args& args, size_t& i, const char* usage) {
    if (i + 1 >= args.size()) {
        throw UsageError(fmt::format("{} needs a value. {}", args[i], usage));
    }
    return args[++i];
}

static void do_init(WCCLI& cli, const WCCLI::Args& args) {
    const char* usage =
        "Usage: wcstore init <path> [--external <dir>] [--apiurl <url> --project <name> [--package <name>]]";

    std::optional<fs::path> root;
    std::optional<fs::path> external;
    std::string apiurl, project, package;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& a = args[i];
        if (a == "--external") {
            external = flag_value(args, i, usage);
        } else if (a == "--apiurl") {
            apiurl = flag_value(args, i, usage);
        } else if (a == "--project") {
            project = flag_value(args, i, usage);
        } else if (a == "--package") {
            package = flag_value(args, i, usage);
        } else if (!a.empty() && a[0] == '-') {
            throw UsageError(fmt::format("Unknown option {}. {}", a, usage));
        } else if (!root) {
            root = a;
        } else {
            throw UsageError(usage);
        }
    }
    if (!root) throw UsageError(usage);
    bool has_identity = !apiurl.empty() || !project.empty() || !package.empty();
    if (has_identity && (apiurl.empty() || project.empty())) {
        throw UsageError(fmt::format("--apiurl and --project go together. {}", usage));
    }

    const MetadataStore& store = cli.store();
    wc_init(store, *root, external);
    std::cout << theme::ok("Initialized " + root->string());
    if (external) {
        std::cout << theme::info("Store shared with " + external->string());
    }

    if (!has_identity) {
        std::cout << theme::step("No entries written yet. Use 'wcstore set'.");
        return;
    }

    WCLock lock(store, *root);
    WCLockGuard guard(lock);
    store.write_apiurl(*root, apiurl);
    store.write_project(*root, project);
    if (!package.empty()) store.write_package(*root, package);
    std::cout << theme::ok(fmt::format("Recorded {} working copy", package.empty() ? "project" : "package"));
}

static void do_status(WCCLI& cli, const WCCLI::Args& args) {
    if (args.size() > 1) throw UsageError("Usage: wcstore status [path]");
    fs::path root = args.empty() ? fs::current_path() : fs::path(args[0]);

    WCContext ctx = load_wc_context(cli.store(), root);

    std::cout << theme::section("Working copy");
    std::cout << theme::kv("Path", root.string());
    std::cout << theme::kv("Kind", wc_kind_name(ctx.kind));
    std::cout << theme::kv("API", ctx.apiurl);
    std::cout << theme::kv("Project", ctx.project);
    if (ctx.kind == WCKind::Package) {
        std::cout << theme::kv("Package", ctx.package);
    }

    std::error_code ec;
    if (fs::is_symlink(cli.store().store_dir(root), ec)) {
        std::cout << theme::kv("Store", fs::read_symlink(cli.store().store_dir(root)).string());
    }
    std::cout << "\n";
}

static void do_get(WCCLI& cli, const WCCLI::Args& args) {
    const char* usage = "Usage: wcstore get <entry> [path]";
    if (args.empty() || args.size() > 2) throw UsageError(usage);
    MetadataEntry entry = entry_arg(args[0], usage);
    fs::path root = args.size() > 1 ? fs::path(args[1]) : fs::current_path();

    std::cout << cli.store().read(root, entry) << "\n";
}

static void do_set(WCCLI& cli, const WCCLI::Args& args) {
    const char* usage = "Usage: wcstore set <entry> <value> [path]";
    if (args.size() < 2 || args.size() > 3) throw UsageError(usage);
    MetadataEntry entry = entry_arg(args[0], usage);
    fs::path root = args.size() > 2 ? fs::path(args[2]) : fs::current_path();

    WCLock lock(cli.store(), root);
    WCLockGuard guard(lock);
    cli.store().write(root, entry, args[1]);
    std::cout << theme::ok(fmt::format("{} updated", cli.store().entry_name(entry)));
}

static void do_missing(WCCLI& cli, const WCCLI::Args& args) {
    const char* usage = "Usage: wcstore missing <path> [--dirs] [--data] <name>...";
    MissingOptions opts;
    std::optional<fs::path> root;
    std::vector<std::string> names;

    for (const auto& a : args) {
        if (a == "--dirs") {
            opts.dirs = true;
        } else if (a == "--data") {
            opts.data = true;
        } else if (!a.empty() && a[0] == '-') {
            throw UsageError(fmt::format("Unknown option {}. {}", a, usage));
        } else if (!root) {
            root = a;
        } else {
            names.push_back(a);
        }
    }
    if (!root || names.empty()) throw UsageError(usage);

    for (const auto& name : cli.store().missing(*root, names, opts)) {
        std::cout << name << "\n";
    }
}

void register_store_commands(WCCLI& cli) {
    cli.add_command("init", do_init, "Create a working copy store (optionally shared)");
    cli.add_command("status", do_status, "Show kind, API url, project and package");
    cli.add_command("get", do_get, "Print one metadata entry");
    cli.add_command("set", do_set, "Write one metadata entry under the working-copy lock");
    cli.add_command("missing", do_missing, "List store files that do not exist");
}
