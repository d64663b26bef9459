#include <algorithm>
#include <atomic>
#include <csignal>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>

#include <cxxopts.hpp>
#include <sqlite3.h>

#include "./account/host_account.hpp"
#include "./config/engine_config.hpp"
#include "./curl/curl.hpp"
#include "./db/sqlite.hpp"
#include "./engine/upload_engine.hpp"
#include "./hosts/host_registry.hpp"
#include "./path/path_utils.hpp"
#include "./token_store/token_store.hpp"

#define STRING(x) #x
#define XSTRING(x) STRING(x)

#define APP_NAME XSTRING(CMAKE_PROJECT_NAME)
#define APP_VERSION XSTRING(CMAKE_PROJECT_VERSION)

#define CONFIG_FILE_NAME "hostup.json"

static std::atomic<bool> cancel_requested {false};

static void handle_interrupt(int) {
    cancel_requested.store(true);
}

static void print_usage(const cxxopts::Options &options) {
    fprintf(stderr, "%s", options.help().c_str());
}

// splits "<host>=<value>", false if either side is empty
static bool split_host_pair(const std::string &pair, std::string &host_id, std::string &value) {
    const auto eq = pair.find('=');
    if (eq == std::string::npos || eq == 0 || eq + 1 == pair.size()) {
        return false;
    }
    host_id = pair.substr(0, eq);
    value = pair.substr(eq + 1);
    return true;
}

static credential_t host_credential(const engine_config_t &config, const std::string &host_id) {
    const auto it = config.hosts.find(host_id);
    if (it == config.hosts.end()) {
        return credential_t {};
    }
    return credential_t::from_string(it->second.credential);
}

static double gigabytes(std::int64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0 * 1024.0);
}

static int check_hosts(HostAccount &account, const engine_config_t &config, const std::vector<std::string> &host_ids) {
    bool failed = false;
    for (const auto &id : host_ids) {
        const auto check = account.test_credentials(id, host_credential(config, id));
        fprintf(stdout, "%s: %s\n", id.c_str(), check.message.c_str());
        if (check.info.has_value()) {
            const auto &info = check.info.value();
            if (info.storage_left.has_value() && info.storage_total.has_value()) {
                fprintf(stdout, "  storage: %.2f GB left of %.2f GB\n", gigabytes(info.storage_left.value()), gigabytes(info.storage_total.value()));
            }
            if (info.premium.has_value()) {
                fprintf(stdout, "  premium: %s\n", info.premium.value() ? "yes" : "no");
            }
        }
        failed = failed || !check.success;
    }
    return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}

static int delete_files(HostAccount &account, const engine_config_t &config, const std::vector<std::string> &pairs) {
    bool failed = false;
    for (const auto &pair : pairs) {
        std::string host_id;
        std::string file_id;
        if (!split_host_pair(pair, host_id, file_id)) {
            fprintf(stderr, "File to delete must be set as <host>=<file id>, got \"%s\".\n", pair.c_str());
            failed = true;
            continue;
        }
        const auto error = account.delete_file(host_id, host_credential(config, host_id), file_id);
        if (error.has_value()) {
            fprintf(stderr, "%s\n", describe_error(error.value()).c_str());
            failed = true;
        }
    }
    return failed ? EXIT_FAILURE : EXIT_SUCCESS;
}

int main(int argc, char const* argv[]) {
    cxxopts::Options options(APP_NAME);

    options.add_options()
           ("c,config", std::string("Configuration file. Default is ./") + CONFIG_FILE_NAME, cxxopts::value<std::string>())
           ("f,folder", "Folder with the gallery images", cxxopts::value<std::string>())
           ("o,hosts", "Hosts to upload to, comma separated. Default is every enabled host", cxxopts::value<std::vector<std::string>>())
           ("p,parallelism", "Parallel upload workers", cxxopts::value<unsigned int>())
           ("r,retries", "Retry passes over failed files", cxxopts::value<unsigned int>())
           ("s,skip", "File names uploaded before, comma separated", cxxopts::value<std::vector<std::string>>())
           ("g,gallery-id", "Existing gallery as <host>=<id>, comma separated", cxxopts::value<std::vector<std::string>>())
           ("check", "Check credentials of the hosts and show their storage quota")
           ("delete", "Delete uploaded files given as <host>=<file id>, comma separated", cxxopts::value<std::vector<std::string>>())
           ("v,version", "Show version")
           ("h,help", "Show help");

    cxxopts::ParseResult args;

    try {
        args = options.parse(argc, argv);
    } catch (const cxxopts::exceptions::exception &x) {
        fprintf(stderr, "%s: %s\n", APP_NAME, x.what());
        print_usage(options);
        return EXIT_FAILURE;
    }

    if (args.count("help")) {
        print_usage(options);
        return EXIT_SUCCESS;
    }

    if (args.count("version")) {
        fprintf(stderr, "%s: %s\n", APP_NAME, APP_VERSION);
        return EXIT_SUCCESS;
    }

    std::string config_path = CONFIG_FILE_NAME;
    if (args.count("config")) {
        config_path = args["config"].as<std::string>();
    }
    const auto config_ret = load_engine_config(config_path);
    if (std::holds_alternative<std::string>(config_ret)) {
        fprintf(stderr, "Failed to load configuration: %s\n", std::get<std::string>(config_ret).c_str());
        return EXIT_FAILURE;
    }
    auto config = std::get<engine_config_t>(config_ret);
    if (args.count("parallelism")) {
        config.parallelism = std::max(args["parallelism"].as<unsigned int>(), 1u);
    }
    if (args.count("retries")) {
        config.max_retries = args["retries"].as<unsigned int>();
    }
    if (config.builtin_hosts_dir.empty()) {
        config.builtin_hosts_dir = BUILTIN_HOSTS_DIR;
    }

    const bool account_mode = args.count("check") || args.count("delete");

    gallery_upload_request_t request;
    if (args.count("hosts")) {
        request.enabled_hosts = args["hosts"].as<std::vector<std::string>>();
    }
    if (!account_mode) {
        if (!args.count("folder")) {
            fprintf(stderr, "Gallery folder is not set.\n");
            print_usage(options);
            return EXIT_FAILURE;
        }
        const auto folder = std::filesystem::path(args["folder"].as<std::string>());
        if (!std::filesystem::is_directory(folder)) {
            fprintf(stderr, "Gallery folder is not found at %s.\n", folder.string().c_str());
            return EXIT_FAILURE;
        }
        request.files = list_gallery_files(folder);
        if (request.files.empty()) {
            fprintf(stderr, "No images found in %s.\n", folder.string().c_str());
            return EXIT_FAILURE;
        }
    }
    if (args.count("skip")) {
        for (const auto &name : args["skip"].as<std::vector<std::string>>()) {
            request.already_uploaded.insert(name);
        }
    }
    if (args.count("gallery-id")) {
        for (const auto &pair : args["gallery-id"].as<std::vector<std::string>>()) {
            std::string host_id;
            std::string gallery_id;
            if (!split_host_pair(pair, host_id, gallery_id)) {
                fprintf(stderr, "Gallery id must be set as <host>=<id>, got \"%s\".\n", pair.c_str());
                return EXIT_FAILURE;
            }
            request.existing_gallery_ids[host_id] = gallery_id;
        }
    }

    const auto registry = HostRegistry::load(config.builtin_hosts_dir, config.user_hosts_dir);
    const auto host_ids = request.enabled_hosts.empty() ? enabled_host_ids(config) : request.enabled_hosts;
    if (host_ids.empty() && !args.count("delete")) {
        fprintf(stderr, "No hosts are enabled in %s.\n", config_path.c_str());
        return EXIT_FAILURE;
    }

    const auto db_open_ret = db_open(config.token_store_path.string());
    if (std::holds_alternative<std::string>(db_open_ret)) {
        fprintf(stderr, "Failed to open SQLite database: %s\n", std::get<std::string>(db_open_ret).c_str());
        return EXIT_FAILURE;
    }
    const auto db = std::get<std::shared_ptr<sqlite3>>(db_open_ret);

    fprintf(stdout, "%s starting\n", APP_NAME);

    std::signal(SIGINT, handle_interrupt);

    CurlHttpClient http;
    try {
        TokenStore tokens(db);
        if (account_mode) {
            AuthenticationProvider auth(registry, tokens, http, make_auth_settings(config));
            HostAccount account(registry, auth, http);
            if (args.count("check")) {
                return check_hosts(account, config, host_ids);
            }
            return delete_files(account, config, args["delete"].as<std::vector<std::string>>());
        }

        UploadEngine engine(config, registry, tokens, http);

        upload_callbacks_t callbacks;
        callbacks.on_gallery_progress = [](unsigned int completed, unsigned int total, unsigned int percent, const std::string &file_name) {
            fprintf(stdout, "[%3u%%] %u/%u %s\n", percent, completed, total, file_name.c_str());
        };
        callbacks.on_file_complete = [](const upload_result_t &result) {
            if (result.state == task_state_t::completed) {
                fprintf(stdout, "%s [%s] %s\n", result.file_name.c_str(), result.host_id.c_str(), result.download_url.c_str());
            }
        };

        const auto report = engine.start_gallery_upload(request, callbacks, cancel_requested);
        print_report(stdout, report);
        if (report.aborted || report.failed > 0) {
            return EXIT_FAILURE;
        }
    } catch (const std::runtime_error &e) {
        fprintf(stderr, "Upload failed: %s\n", e.what());
        return EXIT_FAILURE;
    }

    fprintf(stdout, "%s completed\n", APP_NAME);
    return EXIT_SUCCESS;
}
