#include <array>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "config/network.hpp"
#include "net/socket.hpp"
#include "nlohmann/json.hpp"

namespace {

struct CliOptions {
  std::string host{"127.0.0.1"};
  std::uint16_t port{0};
  bool port_explicit{false};
  std::string network{"bitcoin"};
  bool wait{false};
  std::uint32_t wait_seconds{30};
  bool raw{false};
  std::vector<std::string> args;
};

struct HttpResult {
  int status{0};
  std::string body;
};

bool HasFlag(const std::vector<std::string>& args, std::string_view flag) {
  for (const auto& arg : args) {
    if (arg == flag) {
      return true;
    }
  }
  return false;
}

std::optional<std::string> FindPrefixedOptionValue(const std::vector<std::string>& args,
                                                   std::string_view prefix) {
  for (std::size_t i = 1; i < args.size(); ++i) {
    const auto& arg = args[i];
    if (arg.rfind(prefix, 0) == 0) {
      return arg.substr(prefix.size());
    }
  }
  return std::nullopt;
}

std::vector<std::string> Positionals(const std::vector<std::string>& args) {
  std::vector<std::string> out;
  for (std::size_t i = 1; i < args.size(); ++i) {
    if (args[i].rfind("-", 0) != 0) {
      out.push_back(args[i]);
    }
  }
  return out;
}

std::string TrimTrailingNewlines(std::string input) {
  while (!input.empty() && (input.back() == '\n' || input.back() == '\r')) {
    input.pop_back();
  }
  return input;
}

std::string ReadFirstLineFromFile(const std::string& path, std::string_view label) {
  std::ifstream in(path, std::ios::in);
  if (!in) {
    throw std::runtime_error("unable to read " + std::string(label) + " file: " + path);
  }
  std::string line;
  std::getline(in, line);
  return TrimTrailingNewlines(std::move(line));
}

std::string ReadFileBytes(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("unable to read " + path);
  }
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

std::optional<std::string> GetEnvValue(std::string_view name) {
  std::string key(name);
  const char* value = std::getenv(key.c_str());
  if (!value || value[0] == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

// The identity key comes from exactly one of -key-stdin, -key-file=<path> or
// $SEALNODE_KEY. It is never accepted inline on the command line.
std::string ReadIdentityKey(const std::vector<std::string>& args) {
  std::optional<std::string> value;
  int sources = 0;
  if (HasFlag(args, "-key-stdin")) {
    ++sources;
    std::string line;
    if (!std::getline(std::cin, line)) {
      throw std::runtime_error("failed to read key from stdin");
    }
    value = TrimTrailingNewlines(std::move(line));
  }
  if (auto file = FindPrefixedOptionValue(args, "-key-file=")) {
    ++sources;
    value = ReadFirstLineFromFile(*file, "key");
  }
  if (sources > 1) {
    throw std::runtime_error("specify only one of -key-stdin or -key-file=<path>");
  }
  if (!value) {
    value = GetEnvValue("SEALNODE_KEY");
  }
  if (!value || value->empty()) {
    throw std::runtime_error("identity key required (-key-stdin, -key-file=<path> or SEALNODE_KEY)");
  }
  return *value;
}

void PrintUsage() {
  std::cout << "Usage: sealnode-cli [options] <command> [params]\n"
            << "Commands:\n"
            << "  health\n"
            << "  interfaces\n"
            << "  schemas\n"
            << "  contracts\n"
            << "  transfers\n"
            << "  issue --ticker=<T> --name=<name> --precision=<n> --supply=<atoms> --seal=<seal>\n"
            << "        [--description=<text>] [--iface=RGB20]\n"
            << "  import <genesis.json>\n"
            << "  genesis <contract_id>\n"
            << "  invoice --contract=<id> --amount=<amount> --seal=<seal> [--expiry=<unix>] [--iface=RGB20]\n"
            << "  psbt <invoice>\n"
            << "  pay <psbt_base64>\n"
            << "  accept <consignment> [--seal=<seal>]\n"
            << "  abandon <txid>\n"
            << "  derive <public_key>\n"
            << "  key <public_key>\n"
            << "  blob-put <owner_pk> <name> <file>\n"
            << "  blob-get <owner_pk> <name> [--out=<file>]\n"
            << "Key options (commands that act for an identity):\n"
            << "  -key-stdin              Read the hex private key from stdin\n"
            << "  -key-file=<path>        Read the hex private key from the first line of <path>\n"
            << "                          (otherwise $SEALNODE_KEY)\n"
            << "Options:\n"
            << "  --network <net>     bitcoin, testnet, signet, regtest (default bitcoin)\n"
            << "  --host <host>       Daemon host (default 127.0.0.1)\n"
            << "  --port <port>       Daemon port (default depends on network)\n"
            << "  --wait              Wait for the daemon to be reachable\n"
            << "  --wait-seconds <n>  Max seconds to wait when --wait is set (default: 30)\n"
            << "  --raw               Print the raw response body\n";
}

CliOptions ParseOptions(int argc, char** argv) {
  CliOptions opts;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--network") {
      if (++i >= argc) throw std::runtime_error("missing value for --network");
      opts.network = argv[i];
    } else if (arg == "--host") {
      if (++i >= argc) throw std::runtime_error("missing value for --host");
      opts.host = argv[i];
    } else if (arg == "--port") {
      if (++i >= argc) throw std::runtime_error("missing value for --port");
      const unsigned long parsed = std::stoul(argv[i]);
      if (parsed == 0 || parsed > 65535) {
        throw std::runtime_error("--port out of range");
      }
      opts.port = static_cast<std::uint16_t>(parsed);
      opts.port_explicit = true;
    } else if (arg == "--wait") {
      opts.wait = true;
    } else if (arg == "--wait-seconds") {
      if (++i >= argc) throw std::runtime_error("missing value for --wait-seconds");
      const unsigned long parsed = std::stoul(argv[i]);
      if (parsed > 3600) {
        throw std::runtime_error("--wait-seconds out of range (max 3600)");
      }
      opts.wait_seconds = static_cast<std::uint32_t>(parsed);
      opts.wait = true;
    } else if (arg == "--raw") {
      opts.raw = true;
    } else if (arg == "--help" || arg == "-h") {
      PrintUsage();
      std::exit(0);
    } else {
      opts.args.emplace_back(arg);
    }
  }
  return opts;
}

std::optional<std::size_t> FindHeaderEnd(const std::string& data) {
  auto pos = data.find("\r\n\r\n");
  if (pos == std::string::npos) {
    return std::nullopt;
  }
  return pos + 4;
}

std::optional<std::size_t> ParseContentLength(std::string_view headers) {
  std::size_t offset = 0;
  while (offset < headers.size()) {
    auto end = headers.find("\r\n", offset);
    if (end == std::string_view::npos) {
      end = headers.size();
    }
    auto line = headers.substr(offset, end - offset);
    auto colon = line.find(':');
    if (colon != std::string_view::npos) {
      std::string key(line.substr(0, colon));
      for (auto& c : key) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      }
      auto value = line.substr(colon + 1);
      if (key == "content-length") {
        while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
          value.remove_prefix(1);
        }
        try {
          return static_cast<std::size_t>(std::stoull(std::string(value)));
        } catch (const std::exception&) {
          return std::nullopt;
        }
      }
    }
    if (end >= headers.size()) {
      break;
    }
    offset = end + 2;
  }
  return std::nullopt;
}

sealnode::net::TcpSocket ConnectToDaemon(const CliOptions& opts) {
  using clock = std::chrono::steady_clock;
  const auto deadline = clock::now() + std::chrono::seconds(opts.wait_seconds);

  while (true) {
    sealnode::net::TcpSocket socket;
    if (socket.Connect(opts.host, opts.port)) {
      return socket;
    }
    if (!opts.wait || clock::now() >= deadline) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::seconds(1));
  }
  throw std::runtime_error("failed to connect to sealnoded at " + opts.host + ":" +
                           std::to_string(opts.port));
}

HttpResult Call(const CliOptions& opts, std::string_view method, const std::string& path,
                const std::optional<std::string>& bearer, const std::string& body,
                std::string_view content_type = "application/json") {
  auto socket = ConnectToDaemon(opts);
  std::ostringstream oss;
  oss << method << " " << path << " HTTP/1.1\r\n";
  oss << "Host: " << opts.host << ":" << opts.port << "\r\n";
  if (bearer) {
    oss << "Authorization: Bearer " << *bearer << "\r\n";
  }
  if (method == "POST") {
    oss << "Content-Type: " << content_type << "\r\n";
    oss << "Content-Length: " << body.size() << "\r\n";
  }
  oss << "Connection: close\r\n\r\n";
  oss << body;
  if (!socket.SendAll(oss.str())) {
    throw std::runtime_error("failed to send request");
  }

  std::string response;
  std::array<std::uint8_t, 4096> chunk{};
  std::optional<std::size_t> body_offset;
  std::optional<std::size_t> content_length;
  while (true) {
    const auto bytes = socket.Recv(chunk.data(), chunk.size());
    if (bytes <= 0) {
      break;
    }
    response.append(reinterpret_cast<const char*>(chunk.data()), static_cast<std::size_t>(bytes));
    if (!body_offset) {
      body_offset = FindHeaderEnd(response);
      if (body_offset) {
        content_length = ParseContentLength(std::string_view(response.data(), *body_offset - 4));
        if (!content_length) {
          throw std::runtime_error("missing Content-Length");
        }
      }
    }
    if (body_offset && response.size() >= *body_offset + *content_length) {
      break;
    }
  }
  if (!body_offset || response.size() < *body_offset + *content_length) {
    throw std::runtime_error("truncated response from sealnoded");
  }
  HttpResult result;
  const auto space = response.find(' ');
  if (space == std::string::npos) {
    throw std::runtime_error("invalid status line");
  }
  result.status = std::stoi(response.substr(space + 1, 3));
  result.body = response.substr(*body_offset, *content_length);
  return result;
}

std::string RequireOption(const std::vector<std::string>& args, std::string_view name) {
  const std::string prefix = "--" + std::string(name) + "=";
  auto value = FindPrefixedOptionValue(args, prefix);
  if (!value || value->empty()) {
    throw std::runtime_error("missing " + prefix + "<value>");
  }
  return *value;
}

std::string RequirePositional(const std::vector<std::string>& args, std::size_t index,
                              std::string_view label) {
  const auto positionals = Positionals(args);
  if (index >= positionals.size()) {
    throw std::runtime_error("missing <" + std::string(label) + ">");
  }
  return positionals[index];
}

// An amount with a decimal point (or quotes stripped by the shell) goes to the
// daemon as a string; plain digits are atomic units.
nlohmann::json AmountField(const std::string& text) {
  if (text.find('.') != std::string::npos) {
    return text;
  }
  return static_cast<std::uint64_t>(std::stoull(text));
}

int PrintResult(const CliOptions& opts, const HttpResult& result) {
  if (opts.raw) {
    std::cout << result.body << "\n";
  } else {
    try {
      std::cout << nlohmann::json::parse(result.body).dump(2) << "\n";
    } catch (const nlohmann::json::exception&) {
      std::cout << result.body << "\n";
    }
  }
  if (result.status >= 400) {
    std::cerr << "sealnode-cli: request failed with HTTP " << result.status << "\n";
    return 1;
  }
  return 0;
}

int RunCommand(const CliOptions& opts) {
  if (opts.args.empty()) {
    PrintUsage();
    return 1;
  }
  const auto& args = opts.args;
  const std::string& command = args.front();
  nlohmann::json body = nlohmann::json::object();

  if (command == "health" || command == "interfaces" || command == "schemas") {
    return PrintResult(opts, Call(opts, "GET", "/" + command, std::nullopt, ""));
  }
  if (command == "contracts" || command == "transfers") {
    return PrintResult(opts, Call(opts, "GET", "/" + command, ReadIdentityKey(args), ""));
  }
  if (command == "genesis") {
    const auto id = RequirePositional(args, 0, "contract_id");
    return PrintResult(opts, Call(opts, "GET", "/contracts/" + id + "/genesis",
                                  ReadIdentityKey(args), ""));
  }
  if (command == "key") {
    const auto pk = RequirePositional(args, 0, "public_key");
    return PrintResult(opts, Call(opts, "GET", "/key/" + pk, std::nullopt, ""));
  }
  if (command == "blob-get") {
    const auto owner = RequirePositional(args, 0, "owner_pk");
    const auto name = RequirePositional(args, 1, "name");
    const auto result = Call(opts, "GET", "/carbonado/" + owner + "/" + name, std::nullopt, "");
    if (result.status >= 400) {
      return PrintResult(opts, result);
    }
    if (auto out = FindPrefixedOptionValue(args, "--out=")) {
      std::ofstream file(*out, std::ios::binary | std::ios::trunc);
      if (!file || !file.write(result.body.data(), static_cast<std::streamsize>(result.body.size()))) {
        throw std::runtime_error("unable to write " + *out);
      }
    } else {
      std::cout.write(result.body.data(), static_cast<std::streamsize>(result.body.size()));
    }
    return 0;
  }
  if (command == "blob-put") {
    const auto owner = RequirePositional(args, 0, "owner_pk");
    const auto name = RequirePositional(args, 1, "name");
    const auto payload = ReadFileBytes(RequirePositional(args, 2, "file"));
    return PrintResult(opts, Call(opts, "POST", "/carbonado/" + owner + "/" + name,
                                  ReadIdentityKey(args), payload, "application/octet-stream"));
  }

  std::string path;
  if (command == "issue") {
    path = "/issue";
    body["ticker"] = RequireOption(args, "ticker");
    body["name"] = RequireOption(args, "name");
    body["precision"] = std::stoll(RequireOption(args, "precision"));
    body["supply"] = static_cast<std::uint64_t>(std::stoull(RequireOption(args, "supply")));
    body["seal"] = RequireOption(args, "seal");
    if (auto description = FindPrefixedOptionValue(args, "--description=")) {
      body["description"] = *description;
    }
    if (auto iface = FindPrefixedOptionValue(args, "--iface=")) {
      body["iface"] = *iface;
    }
  } else if (command == "import") {
    path = "/import";
    body = nlohmann::json::parse(ReadFileBytes(RequirePositional(args, 0, "genesis.json")));
  } else if (command == "invoice") {
    path = "/invoice";
    body["contract_id"] = RequireOption(args, "contract");
    body["amount"] = AmountField(RequireOption(args, "amount"));
    body["seal"] = RequireOption(args, "seal");
    if (auto expiry = FindPrefixedOptionValue(args, "--expiry=")) {
      body["expiry"] = std::stoll(*expiry);
    }
    if (auto iface = FindPrefixedOptionValue(args, "--iface=")) {
      body["iface"] = *iface;
    }
  } else if (command == "psbt") {
    path = "/psbt";
    body["invoice"] = RequirePositional(args, 0, "invoice");
  } else if (command == "pay") {
    path = "/pay";
    body["psbt"] = RequirePositional(args, 0, "psbt_base64");
  } else if (command == "accept") {
    path = "/accept";
    body["consignment"] = RequirePositional(args, 0, "consignment");
    if (auto seal = FindPrefixedOptionValue(args, "--seal=")) {
      body["seal"] = *seal;
    }
  } else if (command == "abandon") {
    path = "/abandon";
    body["txid"] = RequirePositional(args, 0, "txid");
  } else if (command == "derive") {
    path = "/derive";
    body["public_key"] = RequirePositional(args, 0, "public_key");
  } else {
    throw std::runtime_error("unknown command: " + command);
  }
  return PrintResult(opts, Call(opts, "POST", path, ReadIdentityKey(args), body.dump()));
}

}  // namespace

int main(int argc, char** argv) {
  try {
    auto opts = ParseOptions(argc, argv);
    const auto net = sealnode::config::NetworkFromString(opts.network);
    if (!net) {
      throw std::runtime_error("unknown network: " + opts.network);
    }
    sealnode::config::SelectNetwork(*net);
    if (!opts.port_explicit) {
      opts.port = sealnode::config::GetNetworkConfig().rpc_port;
    }
    return RunCommand(opts);
  } catch (const std::exception& ex) {
    std::cerr << "sealnode-cli: " << ex.what() << "\n";
    return 1;
  }
}
