#include <atomic>
#include <chrono>
#include <cctype>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "config/network.hpp"
#include "core/error.hpp"
#include "identity/credentials.hpp"
#include "ledger/identity_store.hpp"
#include "rpc/http_server.hpp"
#include "rpc/server.hpp"
#include "storage/blob_store.hpp"
#include "util/logging.hpp"

namespace {

using sealnode::util::LogDebug;
using sealnode::util::LogInfo;
using sealnode::util::LogWarn;

std::atomic<bool> g_shutdown_requested{false};

void HandleSignal(int) {
  // Keep signal handler minimal and async-signal-safe.
  g_shutdown_requested.store(true);
}

void InstallSignalHandlers() {
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);
#ifdef SIGPIPE
  std::signal(SIGPIPE, SIG_IGN);
#endif
}

struct Options {
  std::string network{"bitcoin"};
  std::string data_dir;
  std::string bind{"127.0.0.1"};
  std::uint16_t port{0};
  bool port_explicit{false};
  std::vector<std::string> allow_ip;
  std::string blob_dir;
  bool blob_dir_explicit{false};
  std::string key_file;
  std::string key_pass_env{"SEALNODE_KEY_PASSPHRASE"};
  std::size_t threads{4};
  std::size_t max_body_bytes{8 * 1024 * 1024};
  int socket_timeout_ms{5000};
  std::string debug_log_path;
  std::string log_level{"info"};
  std::size_t log_max_size_mb{0};
  std::size_t log_max_files{0};
  std::string config_path;
  bool disable_config_file{false};
};

void PrintUsage() {
  std::cout << "Usage: sealnoded [options]\n"
            << "  --network <name>           bitcoin, testnet, signet or regtest (default: bitcoin)\n"
            << "  --data-dir <path>          Ledger and key directory (default: ~/.sealnode/<network>)\n"
            << "  --bind <addr>              REST bind address (default: 127.0.0.1)\n"
            << "  --port <port>              REST port (default: 7070)\n"
            << "  --allow-ip <addr>          Accept REST clients from <addr> (repeatable)\n"
            << "  --blob-dir <path>          Blob root (default: <data-dir>/carbonado; empty keeps blobs in memory)\n"
            << "  --key-file <path>          Server identity key (default: <data-dir>/identity.key)\n"
            << "  --key-pass-env <name>      Environment variable holding the key file passphrase\n"
            << "                             (default: SEALNODE_KEY_PASSPHRASE)\n"
            << "  --threads <n>              REST worker threads (default: 4)\n"
            << "  --max-body-bytes <n>       Largest accepted request body (default: 8388608)\n"
            << "  --socket-timeout-ms <ms>   Per-connection read/write timeout (default: 5000)\n"
            << "  --debug-log <path>         Write a debug log to <path>\n"
            << "  --log-level <lvl>          Log level: debug, info, warn, error (default: info)\n"
            << "  --log-max-size-mb <mb>     Rotate debug log after approximately <mb> megabytes (0=disable)\n"
            << "  --log-max-files <n>        Number of rotated debug log files to keep (default: 0)\n"
            << "  --conf <path>              Load options from sealnode.conf (default: ./sealnode.conf)\n"
            << "  --no-conf                  Disable config file loading\n";
}

std::string Trim(const std::string& input) {
  const std::string whitespace = " \t\r\n";
  const auto first = input.find_first_not_of(whitespace);
  if (first == std::string::npos) {
    return {};
  }
  const auto last = input.find_last_not_of(whitespace);
  return input.substr(first, last - first + 1);
}

std::optional<std::string> GetEnvValue(std::string_view name) {
  std::string key(name);
  const char* value = std::getenv(key.c_str());
  if (!value || value[0] == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::uint16_t ParsePort(const std::string& value) {
  unsigned long parsed = 0;
  try {
    parsed = std::stoul(value);
  } catch (const std::exception&) {
    throw std::runtime_error("invalid port (expected 0-65535): " + value);
  }
  if (parsed > 65535) {
    throw std::runtime_error("invalid port (out of range): " + value);
  }
  return static_cast<std::uint16_t>(parsed);
}

std::size_t ParseSize(const std::string& value) {
  try {
    std::size_t consumed = 0;
    const auto parsed = std::stoull(value, &consumed);
    if (consumed != value.size()) {
      throw std::invalid_argument(value);
    }
    return static_cast<std::size_t>(parsed);
  } catch (const std::exception&) {
    throw std::runtime_error("invalid number: " + value);
  }
}

std::string NormalizeKey(std::string key) {
  std::string out;
  out.reserve(key.size());
  for (char c : key) {
    if (c == '-' || c == '_') {
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

void ApplyConfigOption(const std::string& raw_key, const std::string& value, Options* opts) {
  const std::string key = NormalizeKey(raw_key);
  if (key == "network") {
    opts->network = value;
  } else if (key == "datadir") {
    opts->data_dir = value;
  } else if (key == "bind") {
    opts->bind = value;
  } else if (key == "port") {
    opts->port = ParsePort(value);
    opts->port_explicit = true;
  } else if (key == "allowip") {
    opts->allow_ip.push_back(value);
  } else if (key == "blobdir") {
    opts->blob_dir = value;
    opts->blob_dir_explicit = true;
  } else if (key == "keyfile") {
    opts->key_file = value;
  } else if (key == "keypassenv") {
    opts->key_pass_env = value;
  } else if (key == "threads") {
    opts->threads = ParseSize(value);
  } else if (key == "maxbodybytes") {
    opts->max_body_bytes = ParseSize(value);
  } else if (key == "sockettimeoutms") {
    opts->socket_timeout_ms = static_cast<int>(ParseSize(value));
  } else if (key == "debuglog") {
    opts->debug_log_path = value;
  } else if (key == "loglevel") {
    opts->log_level = value;
  } else if (key == "logmaxsizemb") {
    opts->log_max_size_mb = ParseSize(value);
  } else if (key == "logmaxfiles") {
    opts->log_max_files = ParseSize(value);
  } else {
    std::cerr << "[sealnoded] warn: unknown config key '" << raw_key << "'\n";
  }
}

void ApplyEnvironmentOverrides(Options* opts) {
  struct EnvKey {
    std::string_view env;
    std::string_view option;
  };
  static constexpr EnvKey kKeys[] = {
      {"SEALNODE_NETWORK", "network"},
      {"SEALNODE_DATA_DIR", "data-dir"},
      {"SEALNODE_BIND", "bind"},
      {"SEALNODE_PORT", "port"},
      {"SEALNODE_ALLOW_IP", "allow-ip"},
      {"SEALNODE_BLOB_DIR", "blob-dir"},
      {"SEALNODE_KEY_FILE", "key-file"},
      {"SEALNODE_KEY_PASS_ENV", "key-pass-env"},
      {"SEALNODE_THREADS", "threads"},
      {"SEALNODE_MAX_BODY_BYTES", "max-body-bytes"},
      {"SEALNODE_SOCKET_TIMEOUT_MS", "socket-timeout-ms"},
      {"SEALNODE_DEBUG_LOG", "debug-log"},
      {"SEALNODE_LOG_LEVEL", "log-level"},
      {"SEALNODE_LOG_MAX_SIZE_MB", "log-max-size-mb"},
      {"SEALNODE_LOG_MAX_FILES", "log-max-files"},
  };
  for (const auto& entry : kKeys) {
    if (auto value = GetEnvValue(entry.env)) {
      try {
        ApplyConfigOption(std::string(entry.option), *value, opts);
      } catch (const std::exception& ex) {
        throw std::runtime_error(std::string(entry.env) + ": " + ex.what());
      }
    }
  }
}

void LoadConfigFile(const std::filesystem::path& path, Options* opts) {
  if (path.empty()) {
    return;
  }
  if (!std::filesystem::exists(path)) {
    return;
  }
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("failed to open config file: " + path.string());
  }
  std::string line;
  std::size_t lineno = 0;
  while (std::getline(in, line)) {
    ++lineno;
    const auto comment_pos = line.find('#');
    if (comment_pos != std::string::npos) {
      line.resize(comment_pos);
    }
    line = Trim(line);
    if (line.empty()) {
      continue;
    }
    std::string key;
    std::string value;
    const auto eq_pos = line.find_first_of("= ");
    if (eq_pos == std::string::npos) {
      key = line;
      value = "1";
    } else {
      key = Trim(line.substr(0, eq_pos));
      value = Trim(line.substr(eq_pos + 1));
      if (!value.empty() && value.front() == '=') {
        value = Trim(value.substr(1));
      }
    }
    try {
      ApplyConfigOption(key, value, opts);
    } catch (const std::exception& ex) {
      throw std::runtime_error(path.string() + ":" + std::to_string(lineno) + ": " + ex.what());
    }
  }
}

Options ParseOptions(int argc, char** argv) {
  Options opts;
  std::vector<std::string> args;
  args.reserve(static_cast<std::size_t>(argc));
  for (int i = 1; i < argc; ++i) {
    std::string token = argv[i];
    auto eq_pos = token.find('=');
    if (eq_pos != std::string::npos && token.rfind("--", 0) == 0) {
      args.push_back(token.substr(0, eq_pos));
      args.push_back(token.substr(eq_pos + 1));
    } else {
      args.push_back(std::move(token));
    }
  }
  auto ensure_value = [&](std::size_t& idx) -> std::string {
    if (idx + 1 >= args.size()) {
      throw std::runtime_error("missing value for argument " + args[idx]);
    }
    return args[++idx];
  };

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == "--help" || arg == "-h") {
      PrintUsage();
      std::exit(0);
    }
    if (arg == "--conf") {
      opts.config_path = ensure_value(i);
    } else if (arg == "--no-conf") {
      opts.disable_config_file = true;
    }
  }

  if (!opts.disable_config_file) {
    std::filesystem::path config_path =
        opts.config_path.empty() ? std::filesystem::path("sealnode.conf")
                                 : std::filesystem::path(opts.config_path);
    LoadConfigFile(config_path, &opts);
  }

  ApplyEnvironmentOverrides(&opts);

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string arg = args[i];
    if (arg == "--conf") {
      ++i;
      continue;
    }
    if (arg == "--no-conf") {
      continue;
    }
    if (arg.rfind("--", 0) != 0) {
      throw std::runtime_error("unknown option: " + arg);
    }
    const std::string key = NormalizeKey(arg.substr(2));
    if (key == "network" || key == "datadir" || key == "bind" || key == "port" ||
        key == "allowip" || key == "blobdir" || key == "keyfile" || key == "keypassenv" ||
        key == "threads" || key == "maxbodybytes" || key == "sockettimeoutms" ||
        key == "debuglog" || key == "loglevel" || key == "logmaxsizemb" ||
        key == "logmaxfiles") {
      ApplyConfigOption(arg.substr(2), ensure_value(i), &opts);
    } else {
      throw std::runtime_error("unknown option: " + arg);
    }
  }

  const auto net_type = sealnode::config::NetworkFromString(opts.network);
  if (!net_type) {
    throw std::runtime_error("unknown network: " + opts.network);
  }
  sealnode::config::SelectNetwork(*net_type);
  const auto& net_config = sealnode::config::GetNetworkConfig();
  if (!opts.port_explicit) {
    opts.port = net_config.rpc_port;
  }
  if (opts.data_dir.empty()) {
    std::filesystem::path base;
    if (const char* xdg_data = std::getenv("XDG_DATA_HOME")) {
      base = std::filesystem::path(xdg_data) / "sealnode";
    } else if (const char* home = std::getenv("HOME")) {
      base = std::filesystem::path(home) / ".sealnode";
    } else {
      base = std::filesystem::path("data");
    }
    if (!net_config.data_subdir.empty()) {
      base /= net_config.data_subdir;
    }
    opts.data_dir = base.string();
  }
  const std::filesystem::path data_root(opts.data_dir);
  if (!opts.blob_dir_explicit) {
    opts.blob_dir = (data_root / "carbonado").string();
  }
  if (opts.key_file.empty()) {
    opts.key_file = (data_root / "identity.key").string();
  }
  if (opts.threads == 0) {
    throw std::runtime_error("--threads must be at least 1");
  }
  return opts;
}

void ConfigureLogger(const Options& opts) {
  using sealnode::util::LogLevel;
  LogLevel level = LogLevel::kInfo;
  try {
    level = sealnode::util::ParseLogLevel(opts.log_level);
  } catch (const std::exception& ex) {
    std::cerr << "[sealnoded] warn: " << ex.what() << " (falling back to info level)\n";
  }
  std::uintmax_t max_bytes = 0;
  if (opts.log_max_size_mb > 0) {
    max_bytes = static_cast<std::uintmax_t>(opts.log_max_size_mb) * 1024ULL * 1024ULL;
  }
  auto& logger = sealnode::util::GlobalLogger();
  logger.Configure(level, max_bytes, opts.log_max_files);
  logger.Enable(opts.debug_log_path);
  LogDebug("Debug log enabled at " + opts.debug_log_path);
}

// Missing passphrase is not fatal: the daemon then serves without its own
// identity and GET /key/:pk answers 404.
std::unique_ptr<sealnode::identity::KeyFileCredentials> LoadServerIdentity(const Options& opts) {
  const auto passphrase = GetEnvValue(opts.key_pass_env);
  if (!passphrase) {
    LogWarn("sealnoded", "no passphrase in $" + opts.key_pass_env +
                             "; running without a server identity");
    return nullptr;
  }
  auto credentials = sealnode::identity::KeyFileCredentials::Load(opts.key_file, *passphrase,
                                                                  /*create_if_missing=*/true);
  LogInfo("server identity " + credentials.Acquire().public_key);
  return std::make_unique<sealnode::identity::KeyFileCredentials>(std::move(credentials));
}

}  // namespace

int main(int argc, char** argv) {
  try {
    auto opts = ParseOptions(argc, argv);
    if (!opts.debug_log_path.empty()) {
      try {
        ConfigureLogger(opts);
      } catch (const std::exception& ex) {
        std::cerr << "[sealnoded] fatal: " << ex.what() << "\n";
        return 1;
      }
    }

    InstallSignalHandlers();

    LogInfo("sealnoded starting on network=" + opts.network + ", data_dir=" + opts.data_dir +
            ", rest=" + opts.bind + ":" + std::to_string(opts.port) + ", blob_dir=" +
            (opts.blob_dir.empty() ? std::string("<memory>") : opts.blob_dir));

    std::filesystem::create_directories(opts.data_dir);
    sealnode::ledger::IdentityStore store(opts.data_dir);

    std::unique_ptr<sealnode::storage::BlobStore> blobs;
    if (opts.blob_dir.empty()) {
      blobs = std::make_unique<sealnode::storage::MemoryBlobStore>();
    } else {
      blobs = std::make_unique<sealnode::storage::FileBlobStore>(opts.blob_dir);
    }

    const auto server_identity = LoadServerIdentity(opts);
    sealnode::rpc::RpcServer rpc(store, *blobs, server_identity.get());

    sealnode::rpc::HttpServer::Options http_options;
    http_options.bind_address = opts.bind;
    http_options.port = opts.port;
    http_options.allowed_hosts = opts.allow_ip;
    http_options.max_body_bytes = opts.max_body_bytes;
    http_options.socket_timeout_ms = opts.socket_timeout_ms;
    http_options.threads = opts.threads;
    sealnode::rpc::HttpServer http(
        http_options,
        [&rpc](const sealnode::rpc::HttpRequest& request) { return rpc.Handle(request); });
    http.Start();
    std::cout << "[sealnoded] REST listening on " << opts.bind << ":" << http.Port() << "\n";
    if (!opts.allow_ip.empty()) {
      LogWarn("sealnoded", "accepting REST clients beyond loopback; bearer keys travel unencrypted");
    }

    while (!g_shutdown_requested.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    LogInfo("Shutdown requested");
    http.Stop();
    LogInfo("sealnoded stopped");
    return 0;
  } catch (const sealnode::Error& ex) {
    std::cerr << "[sealnoded] fatal: " << sealnode::ErrorKindName(ex.kind) << ": " << ex.what()
              << "\n";
    return 1;
  } catch (const std::exception& ex) {
    std::cerr << "[sealnoded] fatal: " << ex.what() << "\n";
    return 1;
  }
}
