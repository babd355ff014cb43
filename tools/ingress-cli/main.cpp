// ─────────────────────────────────────────────────────────────────────────────
// ingress-cli - Secure ingress and credential store tool
// ─────────────────────────────────────────────────────────────────────────────
// Runs the library's checks from a shell, with the same settings the server
// reads from the environment.
//
// Usage:
//   ingress-cli check-url "https://pbs.twimg.com/media/abc.jpg"
//   ingress-cli check-url "https://i.imgur.com/x.png" --download --out-dir /tmp
//   ingress-cli check-upload ./report.pdf --max-mb 20
//   ingress-cli config set openai_api_key sk-...
//   ingress-cli config get openai_api_key --reveal
//   ingress-cli config show --json
//   ingress-cli generate-key
//
// Exit status: 0 accepted / done, 1 usage or internal error, 2 rejected.

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "ingress/config/secure_config_store.hpp"
#include "ingress/crypto/credential_cipher.hpp"
#include "ingress/fetch/image_download.hpp"
#include "ingress/log/redaction.hpp"
#include "ingress/log/spdlog_logger.hpp"
#include "ingress/security/url_validator.hpp"
#include "ingress/settings.hpp"
#include "ingress/upload/file_validator.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

using namespace ingress;
using Json = nlohmann::json;

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitRejected = 2;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset  = "\033[0m";
    const char* bold   = "\033[1m";
    const char* dim    = "\033[2m";
    const char* red    = "\033[31m";
    const char* green  = "\033[32m";
    const char* yellow = "\033[33m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_rejected(std::string_view kind, const std::string& msg) {
    std::cout << color::c(color::red) << "✗ " << kind << color::c(color::reset) << ": " << msg << "\n";
}

void print_success(const std::string& msg) {
    std::cout << color::c(color::green) << "✓ " << color::c(color::reset) << msg << "\n";
}

void print_warning(const std::string& msg) {
    std::cout << color::c(color::yellow) << "! " << color::c(color::reset) << msg << "\n";
}

void print_json(const Json& j) {
    std::cout << j.dump(2, ' ', false, Json::error_handler_t::replace) << "\n";
}

// ═══════════════════════════════════════════════════════════════════════════
// Command Handlers
// ═══════════════════════════════════════════════════════════════════════════

int cmd_check_url(const IngressSettings& settings, const std::string& url, bool download,
                  const std::filesystem::path& out_dir, bool json_output) {
    const auto allow_list = settings.make_allow_list();
    security::AsioHostResolver resolver;

    auto validated = security::validate_url(url, allow_list, resolver, settings.url_config());
    if (!validated) {
        const auto& err = validated.error();
        if (json_output) {
            Json out = {{"accepted", false},
                        {"error", security::to_string(err.code)},
                        {"message", err.message}};
            if (err.host) out["host"] = *err.host;
            if (err.address) out["address"] = *err.address;
            print_json(out);
        } else {
            print_rejected(security::to_string(err.code), err.message);
        }
        return kExitRejected;
    }

    Json addresses = Json::array();
    for (const auto& address : validated->addresses()) {
        addresses.push_back(address.to_string());
    }

    if (json_output && !download) {
        print_json({{"accepted", true},
                    {"url", validated->href()},
                    {"host", validated->host()},
                    {"port", validated->port()},
                    {"addresses", addresses}});
    } else if (!json_output) {
        print_success(validated->href());
        std::cout << color::c(color::dim) << "  host " << validated->host() << ":" << validated->port()
                  << " -> " << addresses.dump() << color::c(color::reset) << "\n";
    }

    if (!download) {
        return kExitOk;
    }

    auto fetcher = fetch::make_http_fetcher();
    auto image = fetch::download_image(*fetcher, *validated);
    if (!image) {
        if (json_output) {
            print_json({{"accepted", true},
                        {"downloaded", false},
                        {"error", fetch::to_string(image.error().code)},
                        {"message", image.error().message}});
        } else {
            print_rejected(fetch::to_string(image.error().code), image.error().message);
        }
        return kExitRejected;
    }

    const auto target = out_dir / image->storage_name;
    std::ofstream out(target, std::ios::binary);
    if (!out.write(image->body.data(), static_cast<std::streamsize>(image->body.size()))) {
        print_error("Cannot write " + target.string());
        return kExitError;
    }

    if (json_output) {
        print_json({{"accepted", true},
                    {"downloaded", true},
                    {"path", target.string()},
                    {"bytes", image->body.size()},
                    {"media_type", image->media_type}});
    } else {
        print_success("Saved " + std::to_string(image->body.size()) + " bytes to " + target.string());
    }
    return kExitOk;
}

int cmd_check_upload(const IngressSettings& settings, const std::filesystem::path& path, bool json_output) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        print_error("Cannot read " + path.string());
        return kExitError;
    }
    const std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto validated = upload::validate_upload(path.filename().string(), content,
                                             settings.max_upload_mb, settings.allowed_extensions);
    if (!validated) {
        const auto& err = validated.error();
        if (json_output) {
            Json out = {{"accepted", false},
                        {"error", upload::to_string(err.code)},
                        {"message", err.message}};
            if (err.actual_bytes) out["actual_bytes"] = *err.actual_bytes;
            if (err.max_bytes) out["max_bytes"] = *err.max_bytes;
            print_json(out);
        } else {
            print_rejected(upload::to_string(err.code), err.message);
        }
        return kExitRejected;
    }

    const auto storage_name = upload::make_storage_name(validated->filename);
    if (json_output) {
        print_json({{"accepted", true},
                    {"filename", validated->filename.value()},
                    {"size_bytes", validated->size_bytes},
                    {"size_mb", validated->size_mb},
                    {"missing_eof_marker", validated->missing_eof_marker},
                    {"storage_name", storage_name}});
    } else {
        print_success(validated->filename.value() + " (" + std::to_string(validated->size_bytes) + " bytes)");
        if (validated->missing_eof_marker) {
            print_warning("No %%EOF marker; the file may be truncated");
        }
        std::cout << color::c(color::dim) << "  would be stored as " << storage_name
                  << color::c(color::reset) << "\n";
    }
    return kExitOk;
}

int cmd_config(const IngressSettings& settings, const std::filesystem::path& store_path,
               const std::vector<std::string>& args, bool reveal, bool json_output) {
    if (args.empty()) {
        print_error("Usage: config set <key> <value> | config get <key> | config show");
        return kExitError;
    }

    auto key = crypto::load_encryption_key(settings);
    if (!key) {
        print_error(key.error().message);
        return kExitError;
    }
    const crypto::CredentialCipher cipher(std::move(*key));
    config::JsonFileConfigRepository repository(store_path);
    config::SecureConfigStore store(cipher, repository);

    const auto& action = args[0];
    if (action == "set") {
        if (args.size() != 3) {
            print_error("Usage: config set <key> <value>");
            return kExitError;
        }
        auto result = store.set_config(args[1], args[2]);
        if (!result) {
            print_error(result.error().message);
            return kExitError;
        }
        print_success(args[1] + (config::is_sensitive_key(args[1]) ? " stored (encrypted)" : " stored"));
        return kExitOk;
    }

    if (action == "get") {
        if (args.size() != 2) {
            print_error("Usage: config get <key>");
            return kExitError;
        }
        if (!reveal) {
            const auto value = store.get_config_for_display(args[1]);
            if (json_output) {
                print_json({{args[1], value}});
            } else {
                std::cout << value << "\n";
            }
            return kExitOk;
        }
        auto value = store.read_config_value(args[1]);
        if (!value) {
            print_error(value.error().message);
            return kExitError;
        }
        if (json_output) {
            print_json({{args[1], *value}});
        } else {
            std::cout << *value << "\n";
        }
        return kExitOk;
    }

    if (action == "show") {
        const auto all = store.get_all_for_display();
        if (json_output) {
            print_json(all);
        } else {
            for (const auto& [k, v] : all.items()) {
                std::cout << color::c(color::bold) << k << color::c(color::reset) << " = "
                          << v.get<std::string>() << "\n";
            }
        }
        return kExitOk;
    }

    print_error("Unknown config action: " + action);
    return kExitError;
}

int cmd_generate_key(bool json_output) {
    auto key = crypto::generate_key();
    if (!key) {
        print_error(key.error().message);
        return kExitError;
    }
    if (json_output) {
        print_json({{"encryption_key", *key}});
    } else {
        std::cout << "ENCRYPTION_KEY=" << *key << "\n";
    }
    return kExitOk;
}

void install_logger(const IngressSettings& settings, bool verbose, const std::string& log_file) {
    const auto level = verbose ? LogLevel::Debug : settings.log_level;
    std::unique_ptr<ILogger> backend;
    if (!log_file.empty()) {
        backend = make_spdlog_console_file_logger(log_file, level);
    } else {
        backend = make_spdlog_console_logger(level);
    }
    set_logger(std::make_unique<RedactingLogger>(std::move(backend)));
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("ingress-cli", "Secure ingress and credential store tool");

    options.add_options()
        ("command", "check-url | check-upload | config | generate-key", cxxopts::value<std::string>())
        ("args", "Command arguments", cxxopts::value<std::vector<std::string>>())

        // check-url
        ("download", "Also download the image after validation")
        ("out-dir", "Directory for downloaded images", cxxopts::value<std::string>()->default_value("."))

        // check-upload
        ("max-mb", "Upload size limit in MB (overrides INGRESS_MAX_UPLOAD_MB)", cxxopts::value<std::size_t>())
        ("ext", "Allowed extension (can be repeated, replaces the default .pdf)",
            cxxopts::value<std::vector<std::string>>())

        // config
        ("store", "Config store file", cxxopts::value<std::string>()->default_value("ingress-config.json"))
        ("reveal", "config get: print the decrypted value")

        // Output options
        ("j,json", "Output results as JSON")
        ("no-color", "Disable colored output")
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>()->default_value(""))
        ("v,verbose", "Enable debug logging")
        ("h,help", "Print usage");

    options.parse_positional({"command", "args"});
    options.positional_help("<command> [args...]");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Examples:\n\n";
            std::cout << "    ingress-cli check-url 'https://pbs.twimg.com/media/x.jpg'\n";
            std::cout << "    ingress-cli check-upload ./report.pdf --json\n";
            std::cout << "    ingress-cli config set openai_api_key sk-...\n";
            std::cout << "    ingress-cli config show\n";
            std::cout << "    ingress-cli generate-key\n";
            return result.count("help") ? kExitOk : kExitError;
        }

        color::enabled = !result.count("no-color");
        const bool json_output = result.count("json") > 0;

        auto settings = IngressSettings::from_environment();
        if (result.count("max-mb")) {
            settings.with_max_upload_mb(result["max-mb"].as<std::size_t>());
        }
        if (result.count("ext")) {
            settings.allowed_extensions.clear();
            for (const auto& ext : result["ext"].as<std::vector<std::string>>()) {
                settings.with_allowed_extension(ext);
            }
        }
        if (const auto error = settings.validation_error(); !error.empty()) {
            print_error("Invalid settings: " + error);
            return kExitError;
        }

        install_logger(settings, result.count("verbose") > 0, result["log-file"].as<std::string>());

        const auto command = result["command"].as<std::string>();
        std::vector<std::string> args;
        if (result.count("args")) {
            args = result["args"].as<std::vector<std::string>>();
        }

        if (command == "check-url") {
            if (args.size() != 1) {
                print_error("Usage: check-url <url>");
                return kExitError;
            }
            return cmd_check_url(settings, args[0], result.count("download") > 0,
                                 result["out-dir"].as<std::string>(), json_output);
        }
        if (command == "check-upload") {
            if (args.size() != 1) {
                print_error("Usage: check-upload <path>");
                return kExitError;
            }
            return cmd_check_upload(settings, args[0], json_output);
        }
        if (command == "config") {
            return cmd_config(settings, result["store"].as<std::string>(), args,
                              result.count("reveal") > 0, json_output);
        }
        if (command == "generate-key") {
            return cmd_generate_key(json_output);
        }

        print_error("Unknown command: " + command);
        return kExitError;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return kExitError;
    } catch (const std::runtime_error& e) {
        print_error(e.what());
        return kExitError;
    }
}
